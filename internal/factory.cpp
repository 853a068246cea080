#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/content/content_store.hpp"
#include "internal/core/install_orchestrator.hpp"
#include "internal/download/file_download_gateway.hpp"
#include "internal/expansion/expansion_coordinator.hpp"
#include "internal/installer/directory_installer.hpp"
#include "internal/installer/package_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/host.hpp"
#include "internal/runtime/request_spool.hpp"
#include "internal/status/status_registry.hpp"

namespace install::factory {

using install::observability::BoolField;
using install::observability::StringField;
using install::observability::UintField;

Application Build(const install::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.store    = std::make_shared<content::ContentStore>(config.cache().root_path());
  app.registry = std::make_shared<status::StatusRegistry>();

  // ------------------------------------------------------------------
  // External systems
  // ------------------------------------------------------------------
  app.gateway = std::make_shared<download::FileDownloadGateway>(app.store, config.downloads().workers(), config.downloads().chunk_size_bytes());

  app.installer = std::make_shared<installer::DirectoryInstaller>(config.installer().install_root(), config.installer().require_confirmation());
  app.packages  = std::make_shared<installer::DirectoryPackageRegistry>(config.installer().install_root());

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.expansion    = std::make_shared<expansion::ExpansionCoordinator>(app.gateway, app.registry);
  app.orchestrator = std::make_shared<core::InstallOrchestrator>(app.store, app.gateway, app.installer, app.packages, app.registry,
                                                                 app.expansion, config.installer().installer_name());

  // ------------------------------------------------------------------
  // Host
  // ------------------------------------------------------------------
  app.spool = std::make_shared<runtime::RequestSpool>(config.spool().root_path());
  app.host  = std::make_shared<runtime::Host>(config.spool().root_path(), std::chrono::milliseconds(config.spool().poll_interval_ms()),
                                              app.orchestrator, app.registry, app.spool);

  INSTALL_LOG_INFO("Application built", {StringField("cache_root", config.cache().root_path()),
                                         StringField("install_root", config.installer().install_root()),
                                         StringField("spool_root", config.spool().root_path()),
                                         UintField("download_workers", config.downloads().workers()),
                                         BoolField("require_confirmation", config.installer().require_confirmation())});
  return app;
}

void Application::Start() {
  gateway->Start();
  installer->Start();
  host->Start();
}

void Application::Stop() {
  if (host) host->Stop();
  if (gateway) gateway->Stop();
  if (installer) installer->Stop();
}

} // namespace install::factory
