#include "install_orchestrator.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/content/content_store.hpp"
#include "internal/content/path_utils.hpp"
#include "internal/download/download_gateway.hpp"
#include "internal/expansion/expansion_coordinator.hpp"
#include "internal/installer/installer.hpp"
#include "internal/installer/package_registry.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_registry.hpp"
#include "internal/util/errors.hpp"

namespace install::core {

using namespace install::manager::v1;
using install::download::DownloadEvent;
using install::download::DownloadEventKind;
using install::installer::InstallEvent;
using install::installer::InstallEventKind;
using install::observability::IntField;
using install::observability::StringField;
using install::observability::UintField;

namespace {

void ValidateRequest(const InstallRequest& request, const install::content::ContentStore& store) {
  if (request.identity().empty()) {
    throw install::util::MalformedRequest("identity is empty");
  }
  if (request.package_name().empty()) {
    throw install::util::MalformedRequest("package name is empty");
  }
  if (request.size_bytes() == 0) {
    throw install::util::MalformedRequest("expected size is missing");
  }
  if (request.sha256().empty()) {
    throw install::util::MalformedRequest("expected hash is missing");
  }

  try {
    install::content::ValidatePackageName(request.package_name());
    (void)store.ResolvePath(request.identity());
  } catch (const std::invalid_argument& e) {
    throw install::util::MalformedRequest(e.what());
  }
}

PendingAction CancelAction(const std::string& identity) {
  PendingAction action;
  action.set_kind(ACTION_KIND_CANCEL);
  action.set_identity(identity);
  return action;
}

} // namespace

const char* ToString(InstallOrchestrator::Delivery delivery) {
  return delivery == InstallOrchestrator::Delivery::kRedelivery ? "redelivery" : "first";
}

InstallOrchestrator::InstallOrchestrator(std::shared_ptr<install::content::ContentStore>           store,
                                         std::shared_ptr<install::download::DownloadGateway>       gateway,
                                         std::shared_ptr<install::installer::Installer>            installer,
                                         std::shared_ptr<install::installer::PackageRegistry>      packages,
                                         std::shared_ptr<install::status::StatusRegistry>          registry,
                                         std::shared_ptr<install::expansion::ExpansionCoordinator> expansion, std::string installer_name)
    : store_(std::move(store)),
      gateway_(std::move(gateway)),
      installer_(std::move(installer)),
      packages_(std::move(packages)),
      registry_(std::move(registry)),
      expansion_(std::move(expansion)),
      installer_name_(std::move(installer_name)),
      scanner_(registry_) {
}

InstallOrchestrator::~InstallOrchestrator() {
  std::lock_guard lock(watches_mutex_);
  download_watches_.clear();
  install_watches_.clear();
}

// ------------------------------------------------------------
// Public entry points
// ------------------------------------------------------------

bool InstallOrchestrator::RequestInstall(const InstallRequest& request, Delivery delivery) {
  try {
    ValidateRequest(request, *store_);
  } catch (const install::util::MalformedRequest& e) {
    INSTALL_LOG_WARN("Dropping malformed install request", {StringField("identity", request.identity()),
                                                            StringField("package", request.package_name()), StringField("error", e.what())});
    return false;
  }

  executor_.Post(request.identity(), [this, request, delivery] { HandleRequest(request, delivery); });
  return true;
}

void InstallOrchestrator::Cancel(const std::string& identity) {
  if (identity.empty()) return;
  executor_.Post(identity, [this, identity] { HandleCancel(identity); });
}

std::size_t InstallOrchestrator::RecoverPendingInstalls() {
  return scanner_.Rescan(*this);
}

void InstallOrchestrator::OnPackageAdded(const std::string& package_name) {
  const auto records = registry_->GetByPackageName(package_name);
  INSTALL_LOG_INFO("Package added", {StringField("package", package_name), UintField("records", records.size())});

  for (const auto& record : records) {
    const auto identity = record.identity();
    executor_.Post(identity, [this, identity] { HandlePackageAdded(identity); });
  }
}

void InstallOrchestrator::Confirm(const std::string& identity) {
  installer_->Confirm(identity);
}

void InstallOrchestrator::Decline(const std::string& identity) {
  installer_->Decline(identity);
}

void InstallOrchestrator::Dismiss(const std::string& identity) {
  executor_.Post(identity, [this, identity] { HandleDismiss(identity); });
}

void InstallOrchestrator::OnDownloadEvent(const std::string& identity, const DownloadEvent& event) {
  executor_.Post(identity, [this, identity, event] { HandleDownloadEvent(identity, event); });
}

void InstallOrchestrator::OnInstallEvent(const std::string& identity, const InstallEvent& event) {
  executor_.Post(identity, [this, identity, event] { HandleInstallEvent(identity, event); });
}

// ------------------------------------------------------------
// Request intake
// ------------------------------------------------------------

InstallOrchestrator::CacheState InstallOrchestrator::Inspect(const InstallRequest& request) const {
  const auto path = store_->ResolvePath(request.identity());
  if (!store_->Exists(path)) return CacheState::kMissing;
  if (store_->SizeOf(path) < request.size_bytes()) return CacheState::kPartial;
  return store_->IsValid(path, request.size_bytes(), request.sha256()) ? CacheState::kValid : CacheState::kCorrupt;
}

void InstallOrchestrator::HandleRequest(const InstallRequest& request, Delivery delivery) {
  const auto& identity = request.identity();
  const auto  path     = store_->ResolvePath(identity);
  const auto  cache    = Inspect(request);

  INSTALL_LOG_DEBUG("Install requested", {StringField("identity", identity), StringField("package", request.package_name()),
                                          IntField("version_code", request.version_code()), StringField("delivery", ToString(delivery))});

  // A redelivered request with nothing in flight and no complete file means
  // the earlier attempt ended while we were not running. Drop it instead of
  // starting over.
  if (delivery == Delivery::kRedelivery && !gateway_->IsQueuedOrActive(identity) && cache != CacheState::kValid) {
    INSTALL_LOG_INFO("Abandoning redelivered request", {StringField("identity", identity)});
    ReleaseDownloadWatch(identity);
    ReleaseInstallWatch(identity);
    expansion_->Cancel(identity);
    registry_->Remove(identity);
    return;
  }

  const auto existing = registry_->Get(identity);
  if (!existing || install::model::IsTerminal(existing->status())) {
    registry_->Upsert(request, INSTALL_STATUS_UNKNOWN);
  } else if (existing->status() == INSTALL_STATUS_READY_TO_INSTALL || existing->status() == INSTALL_STATUS_INSTALLING) {
    INSTALL_LOG_DEBUG("Artifact already with the installer", {StringField("identity", identity),
                                                              StringField("status", InstallStatus_Name(existing->status()))});
    WatchInstaller(identity);
    return;
  }

  WatchDownload(identity);
  expansion_->Fetch(request);

  switch (cache) {
    case CacheState::kMissing:
    case CacheState::kPartial:
      if (gateway_->IsQueuedOrActive(identity)) {
        INSTALL_LOG_DEBUG("Download already in flight", {StringField("identity", identity)});
        return;
      }
      INSTALL_LOG_INFO("Queueing download", {StringField("identity", identity), StringField("path", path.string())});
      gateway_->Queue(identity);
      return;

    case CacheState::kValid:
      // the gateway still owes us its own completed event
      if (gateway_->IsQueuedOrActive(identity)) {
        INSTALL_LOG_DEBUG("Download finishing, waiting for its completion", {StringField("identity", identity)});
        return;
      }
      INSTALL_LOG_INFO("Artifact cached, skipping download", {StringField("identity", identity), StringField("path", path.string())});
      HandleDownloadEvent(identity, install::download::Started());
      HandleDownloadEvent(identity, install::download::Completed(path.string()));
      return;

    case CacheState::kCorrupt:
      INSTALL_LOG_WARN("Cached artifact failed verification, downloading again", {StringField("identity", identity),
                                                                                  StringField("path", path.string())});
      store_->Remove(path);
      gateway_->Queue(identity);
      return;
  }
}

void InstallOrchestrator::HandleCancel(const std::string& identity) {
  gateway_->Cancel(identity);

  if (const auto record = registry_->Get(identity)) {
    const auto& request = record->request();
    if (!request.main_expansion().url().empty()) gateway_->Cancel(request.main_expansion().url());
    if (!request.patch_expansion().url().empty()) gateway_->Cancel(request.patch_expansion().url());
  }
  expansion_->Cancel(identity);

  ReleaseDownloadWatch(identity);
  ReleaseInstallWatch(identity);
  registry_->Remove(identity);

  INSTALL_LOG_INFO("Install cancelled", {StringField("identity", identity)});
}

void InstallOrchestrator::HandlePackageAdded(const std::string& identity) {
  if (!Transition(identity, INSTALL_STATUS_INSTALLED)) return;
  ReleaseDownloadWatch(identity);
  ReleaseInstallWatch(identity);
}

void InstallOrchestrator::HandleDismiss(const std::string& identity) {
  const auto record = registry_->Get(identity);
  if (!record) return;
  if (!install::model::IsTerminal(record->status())) {
    INSTALL_LOG_WARN("Refusing to dismiss an install in progress", {StringField("identity", identity),
                                                                     StringField("status", InstallStatus_Name(record->status()))});
    return;
  }
  registry_->Remove(identity);
}

// ------------------------------------------------------------
// Event handling
// ------------------------------------------------------------

bool InstallOrchestrator::Transition(const std::string& identity, InstallStatus to, const std::optional<PendingAction>& action) {
  const auto record = registry_->Get(identity);
  if (!record) return false;

  const auto from = record->status();
  if (!install::model::CanTransition(from, to)) {
    INSTALL_LOG_DEBUG("Dropping stale transition", {StringField("identity", identity), StringField("from", InstallStatus_Name(from)),
                                                    StringField("to", InstallStatus_Name(to))});
    return false;
  }

  registry_->Update(identity, to, action);
  if (from != to) {
    INSTALL_LOG_INFO("Status changed", {StringField("identity", identity), StringField("from", InstallStatus_Name(from)),
                                        StringField("to", InstallStatus_Name(to))});
  }
  return true;
}

void InstallOrchestrator::HandleDownloadEvent(const std::string& identity, const DownloadEvent& event) {
  const auto record = registry_->Get(identity);
  if (!record) {
    INSTALL_LOG_DEBUG("Ignoring download event for untracked identity", {StringField("identity", identity),
                                                                         StringField("event", install::download::ToString(event.kind))});
    return;
  }

  switch (event.kind) {
    case DownloadEventKind::kStarted:
      Transition(identity, INSTALL_STATUS_DOWNLOADING, CancelAction(identity));
      return;

    case DownloadEventKind::kProgress:
      registry_->UpdateProgress(identity, event.total_bytes, event.bytes_read);
      return;

    case DownloadEventKind::kCompleted: {
      if (!Transition(identity, INSTALL_STATUS_READY_TO_INSTALL)) return;
      ReleaseDownloadWatch(identity);
      WatchInstaller(identity);

      const std::filesystem::path local_file = event.local_path.empty() ? store_->ResolvePath(identity) : std::filesystem::path(event.local_path);
      INSTALL_LOG_INFO("Handing artifact to installer", {StringField("identity", identity), StringField("path", local_file.string())});
      installer_->Install(local_file, identity, record->request());
      return;
    }

    case DownloadEventKind::kInterrupted:
      INSTALL_LOG_WARN("Download interrupted", {StringField("identity", identity), StringField("message", event.message)});
      Transition(identity, INSTALL_STATUS_UNKNOWN);
      ReleaseDownloadWatch(identity);
      return;
  }

  throw install::util::InvalidState("unhandled download event kind " + std::to_string(static_cast<int>(event.kind)));
}

void InstallOrchestrator::HandleInstallEvent(const std::string& identity, const InstallEvent& event) {
  const auto record = registry_->Get(identity);
  if (!record) {
    INSTALL_LOG_DEBUG("Ignoring installer event for untracked identity", {StringField("identity", identity),
                                                                          StringField("event", install::installer::ToString(event.kind))});
    return;
  }

  switch (event.kind) {
    case InstallEventKind::kStarted:
      Transition(identity, INSTALL_STATUS_INSTALLING);
      return;

    case InstallEventKind::kComplete: {
      if (!Transition(identity, INSTALL_STATUS_INSTALLED)) return;
      ReleaseInstallWatch(identity);

      const auto& package_name = record->request().package_name();
      try {
        packages_->SetInstaller(package_name, installer_name_);
      } catch (const std::exception& e) {
        INSTALL_LOG_WARN("Failed to record installer", {StringField("package", package_name), StringField("error", e.what())});
      }
      return;
    }

    case InstallEventKind::kInterrupted:
      if (!install::model::CanTransition(record->status(), INSTALL_STATUS_ERROR)) {
        INSTALL_LOG_DEBUG("Ignoring install interruption for finished install", {StringField("identity", identity),
                                                                                StringField("status", InstallStatus_Name(record->status()))});
        return;
      }
      ReleaseInstallWatch(identity);
      if (!event.error_message.empty()) {
        INSTALL_LOG_WARN("Install failed", {StringField("identity", identity), StringField("error", event.error_message)});
        registry_->SetError(identity, event.error_message);
      } else {
        INSTALL_LOG_INFO("Install aborted without error", {StringField("identity", identity)});
        registry_->Remove(identity);
      }
      return;

    case InstallEventKind::kUserInteractionRequired:
      if (!install::model::CanAwaitUser(record->status())) {
        INSTALL_LOG_DEBUG("Dropping user prompt outside an install", {StringField("identity", identity),
                                                                      StringField("status", InstallStatus_Name(record->status()))});
        return;
      }
      registry_->Update(identity, INSTALL_STATUS_READY_TO_INSTALL, event.action);
      INSTALL_LOG_INFO("Waiting for user", {StringField("identity", identity), StringField("from", InstallStatus_Name(record->status()))});
      return;
  }

  throw install::util::InvalidState("unhandled installer event kind " + std::to_string(static_cast<int>(event.kind)));
}

// ------------------------------------------------------------
// Listener bookkeeping
// ------------------------------------------------------------

void InstallOrchestrator::WatchDownload(const std::string& identity) {
  std::lock_guard lock(watches_mutex_);
  if (download_watches_.count(identity) > 0) return;

  download_watches_.emplace(identity, gateway_->Subscribe(identity, [this](const std::string& key, const DownloadEvent& event) {
    OnDownloadEvent(key, event);
  }));
}

void InstallOrchestrator::WatchInstaller(const std::string& identity) {
  std::lock_guard lock(watches_mutex_);
  if (install_watches_.count(identity) > 0) return;

  install_watches_.emplace(identity, installer_->Subscribe(identity, [this](const std::string& key, const InstallEvent& event) {
    OnInstallEvent(key, event);
  }));
}

void InstallOrchestrator::ReleaseDownloadWatch(const std::string& identity) {
  install::events::Subscription released;
  {
    std::lock_guard lock(watches_mutex_);
    auto            it = download_watches_.find(identity);
    if (it == download_watches_.end()) return;
    released = std::move(it->second);
    download_watches_.erase(it);
  }
  released.Reset();
}

void InstallOrchestrator::ReleaseInstallWatch(const std::string& identity) {
  install::events::Subscription released;
  {
    std::lock_guard lock(watches_mutex_);
    auto            it = install_watches_.find(identity);
    if (it == install_watches_.end()) return;
    released = std::move(it->second);
    install_watches_.erase(it);
  }
  released.Reset();
}

bool InstallOrchestrator::IsWatchingDownload(const std::string& identity) const {
  std::lock_guard lock(watches_mutex_);
  return download_watches_.count(identity) > 0;
}

bool InstallOrchestrator::IsWatchingInstaller(const std::string& identity) const {
  std::lock_guard lock(watches_mutex_);
  return install_watches_.count(identity) > 0;
}

} // namespace install::core
