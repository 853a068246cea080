#include "recovery_scanner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/status/status_registry.hpp"

namespace install::core {

using install::observability::StringField;
using install::observability::UintField;

RecoveryScanner::RecoveryScanner(std::shared_ptr<install::status::StatusRegistry> registry) : registry_(std::move(registry)) {
}

std::vector<std::string> RecoveryScanner::PendingInstalls() const {
  std::vector<std::string> identities;
  for (const auto& record : registry_->ListByStatus(install::manager::v1::INSTALL_STATUS_READY_TO_INSTALL)) {
    identities.push_back(record.identity());
  }
  return identities;
}

std::size_t RecoveryScanner::Rescan(InstallWatcher& watcher) const {
  const auto identities = PendingInstalls();
  for (const auto& identity : identities) {
    INSTALL_LOG_DEBUG("Re-attaching installer listener", {StringField("identity", identity)});
    watcher.WatchInstaller(identity);
  }

  INSTALL_LOG_INFO("Recovery scan finished", {UintField("ready_to_install", identities.size())});
  return identities.size();
}

} // namespace install::core
