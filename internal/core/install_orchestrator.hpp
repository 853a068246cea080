#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "install/manager/v1.hpp"
#include "internal/core/recovery_scanner.hpp"
#include "internal/download/download_event.hpp"
#include "internal/events/keyed_serial_executor.hpp"
#include "internal/events/subscription.hpp"
#include "internal/installer/install_event.hpp"

namespace install::content {
class ContentStore;
}
namespace install::download {
class DownloadGateway;
}
namespace install::installer {
class Installer;
class PackageRegistry;
}
namespace install::status {
class StatusRegistry;
}
namespace install::expansion {
class ExpansionCoordinator;
}

namespace install::core {

/*
  Drives one state machine per artifact identity:

    Unknown -> Downloading -> ReadyToInstall -> Installing -> Installed
                                          \-> Error / removed

  Inputs are install/cancel requests, download events, installer events and
  package-added signals. All of them are funnelled through a per-identity
  mailbox, so events for one identity are handled one at a time in arrival
  order while different identities proceed in parallel. Nothing here blocks
  on the gateway or the installer.

  Listeners on the gateway and installer are held as Subscriptions per
  identity and released on every terminal path.

  Collaborators must be stopped before the orchestrator is destroyed.
*/
class InstallOrchestrator final : public InstallWatcher {
 public:
  enum class Delivery {
    kFirst,
    // the host handed the same request over again after a restart
    kRedelivery,
  };

  InstallOrchestrator(std::shared_ptr<install::content::ContentStore> store, std::shared_ptr<install::download::DownloadGateway> gateway,
                      std::shared_ptr<install::installer::Installer> installer,
                      std::shared_ptr<install::installer::PackageRegistry> packages,
                      std::shared_ptr<install::status::StatusRegistry> registry,
                      std::shared_ptr<install::expansion::ExpansionCoordinator> expansion, std::string installer_name);
  ~InstallOrchestrator() override;

  InstallOrchestrator(const InstallOrchestrator&)            = delete;
  InstallOrchestrator& operator=(const InstallOrchestrator&) = delete;

  // Returns false when the request is malformed; it is logged and dropped.
  // Runs on the calling thread unless the identity is already busy.
  bool RequestInstall(const install::manager::v1::InstallRequest& request, Delivery delivery = Delivery::kFirst);

  void Cancel(const std::string& identity);

  std::size_t RecoverPendingInstalls();

  // Package registry signal: the package showed up outside this flow.
  void OnPackageAdded(const std::string& package_name);

  void Confirm(const std::string& identity);
  void Decline(const std::string& identity);

  // Clears an Installed or Error record.
  void Dismiss(const std::string& identity);

  void OnDownloadEvent(const std::string& identity, const install::download::DownloadEvent& event);
  void OnInstallEvent(const std::string& identity, const install::installer::InstallEvent& event);

  void WatchInstaller(const std::string& identity) override;

  bool IsWatchingDownload(const std::string& identity) const;
  bool IsWatchingInstaller(const std::string& identity) const;

 private:
  enum class CacheState {
    kMissing,
    kPartial,
    kValid,
    kCorrupt,
  };

  void HandleRequest(const install::manager::v1::InstallRequest& request, Delivery delivery);
  void HandleCancel(const std::string& identity);
  void HandleDownloadEvent(const std::string& identity, const install::download::DownloadEvent& event);
  void HandleInstallEvent(const std::string& identity, const install::installer::InstallEvent& event);
  void HandlePackageAdded(const std::string& identity);
  void HandleDismiss(const std::string& identity);

  CacheState Inspect(const install::manager::v1::InstallRequest& request) const;

  bool Transition(const std::string& identity, install::manager::v1::InstallStatus to,
                  const std::optional<install::manager::v1::PendingAction>& action = std::nullopt);

  void WatchDownload(const std::string& identity);
  void ReleaseDownloadWatch(const std::string& identity);
  void ReleaseInstallWatch(const std::string& identity);

  std::shared_ptr<install::content::ContentStore>           store_;
  std::shared_ptr<install::download::DownloadGateway>       gateway_;
  std::shared_ptr<install::installer::Installer>            installer_;
  std::shared_ptr<install::installer::PackageRegistry>      packages_;
  std::shared_ptr<install::status::StatusRegistry>          registry_;
  std::shared_ptr<install::expansion::ExpansionCoordinator> expansion_;
  std::string                                               installer_name_;

  RecoveryScanner                      scanner_;
  install::events::KeyedSerialExecutor executor_;

  mutable std::mutex                                             watches_mutex_;
  std::unordered_map<std::string, install::events::Subscription> download_watches_;
  std::unordered_map<std::string, install::events::Subscription> install_watches_;
};

const char* ToString(InstallOrchestrator::Delivery delivery);

} // namespace install::core
