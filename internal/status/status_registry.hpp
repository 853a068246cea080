#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "install/manager/v1/request.pb.h"
#include "install/manager/v1/status.pb.h"

namespace install::status {

struct StatusChange {
  enum class Kind : uint8_t {
    kUpdated = 0,
    kRemoved = 1,
  };

  Kind                                  kind = Kind::kUpdated;
  install::manager::v1::StatusRecord record;
};

/*
  Process-wide identity -> StatusRecord table.

  The only mutable state shared between components. Callers never hold a
  private copy; every mutation goes through this API and is linearized by
  the table lock. Listeners are called after the lock is released, on the
  mutating thread.

  Update/UpdateProgress/SetError only touch an existing record and return
  false otherwise, so events for a removed identity are no-ops.
*/
class StatusRegistry {
 public:
  using Listener = std::function<void(const StatusChange&)>;

  // Creates the record when absent; otherwise replaces request, status and
  // action and resets progress.
  install::manager::v1::StatusRecord Upsert(const install::manager::v1::InstallRequest& request, install::manager::v1::InstallStatus status,
                                            const std::optional<install::manager::v1::PendingAction>& action = std::nullopt);

  bool Update(const std::string& identity, install::manager::v1::InstallStatus status,
              const std::optional<install::manager::v1::PendingAction>& action = std::nullopt);

  bool UpdateProgress(const std::string& identity, uint64_t total_bytes, uint64_t bytes_read);

  bool SetError(const std::string& identity, const std::string& message);

  bool Remove(const std::string& identity);

  std::optional<install::manager::v1::StatusRecord> Get(const std::string& identity) const;

  std::vector<install::manager::v1::StatusRecord> ListAll() const;
  std::vector<install::manager::v1::StatusRecord> ListByStatus(install::manager::v1::InstallStatus status) const;
  std::vector<install::manager::v1::StatusRecord> GetByPackageName(const std::string& package_name) const;

  install::manager::v1::StatusSnapshot Snapshot() const;

  uint64_t AddListener(Listener listener);
  void     RemoveListener(uint64_t id);

 private:
  void Notify(const StatusChange& change);

  mutable std::shared_mutex                                           mutex_;
  std::unordered_map<std::string, install::manager::v1::StatusRecord> records_;

  std::mutex                             listeners_mutex_;
  uint64_t                               next_listener_id_ = 0;
  std::unordered_map<uint64_t, Listener> listeners_;
};

// Fraction of the current download, 0 when the total is unknown.
double ProgressFraction(const install::manager::v1::StatusRecord& record);

} // namespace install::status
