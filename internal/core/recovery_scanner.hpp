#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace install::status {
class StatusRegistry;
}

namespace install::core {

// Something that can start listening for installer events of an identity.
class InstallWatcher {
 public:
  virtual ~InstallWatcher() = default;

  virtual void WatchInstaller(const std::string& identity) = 0;
};

/*
  Cold-start pass over the status table.

  Artifacts that finished downloading in an earlier process lifetime sit in
  ReadyToInstall with nobody listening for the installer; this re-attaches
  a listener for each so a later install (or user action) still lands.
  Runs only when asked.
*/
class RecoveryScanner {
 public:
  explicit RecoveryScanner(std::shared_ptr<install::status::StatusRegistry> registry);

  std::vector<std::string> PendingInstalls() const;

  // Returns the number of identities handed to the watcher.
  std::size_t Rescan(InstallWatcher& watcher) const;

 private:
  std::shared_ptr<install::status::StatusRegistry> registry_;
};

} // namespace install::core
