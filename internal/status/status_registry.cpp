#include "status_registry.hpp"

#include <algorithm>

#include "internal/util/time.hpp"

namespace install::status {

using namespace install::manager::v1;

namespace {

void Touch(StatusRecord* record) {
  *record->mutable_updated_at() = install::util::NowProto();
}

void SortByIdentity(std::vector<StatusRecord>* records) {
  std::sort(records->begin(), records->end(), [](const StatusRecord& a, const StatusRecord& b) { return a.identity() < b.identity(); });
}

} // namespace

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

StatusRecord StatusRegistry::Upsert(const InstallRequest& request, InstallStatus status, const std::optional<PendingAction>& action) {
  StatusChange change;
  {
    std::unique_lock lock(mutex_);

    auto& record = records_[request.identity()];
    record.set_identity(request.identity());
    *record.mutable_request() = request;
    record.set_status(status);
    record.clear_error_message();
    record.set_bytes_read(0);
    record.set_total_bytes(0);
    if (action) {
      *record.mutable_action() = *action;
    } else {
      record.clear_action();
    }
    Touch(&record);

    change.record = record;
  }
  Notify(change);
  return change.record;
}

bool StatusRegistry::Update(const std::string& identity, InstallStatus status, const std::optional<PendingAction>& action) {
  StatusChange change;
  {
    std::unique_lock lock(mutex_);

    auto it = records_.find(identity);
    if (it == records_.end()) return false;

    auto& record = it->second;
    record.set_status(status);
    if (status != INSTALL_STATUS_ERROR) record.clear_error_message();
    if (action) {
      *record.mutable_action() = *action;
    } else {
      record.clear_action();
    }
    Touch(&record);

    change.record = record;
  }
  Notify(change);
  return true;
}

bool StatusRegistry::UpdateProgress(const std::string& identity, uint64_t total_bytes, uint64_t bytes_read) {
  StatusChange change;
  {
    std::unique_lock lock(mutex_);

    auto it = records_.find(identity);
    if (it == records_.end()) return false;

    it->second.set_total_bytes(total_bytes);
    it->second.set_bytes_read(bytes_read);
    Touch(&it->second);

    change.record = it->second;
  }
  Notify(change);
  return true;
}

bool StatusRegistry::SetError(const std::string& identity, const std::string& message) {
  StatusChange change;
  {
    std::unique_lock lock(mutex_);

    auto it = records_.find(identity);
    if (it == records_.end()) return false;

    it->second.set_status(INSTALL_STATUS_ERROR);
    it->second.set_error_message(message);
    it->second.clear_action();
    Touch(&it->second);

    change.record = it->second;
  }
  Notify(change);
  return true;
}

bool StatusRegistry::Remove(const std::string& identity) {
  StatusChange change;
  change.kind = StatusChange::Kind::kRemoved;
  {
    std::unique_lock lock(mutex_);

    auto it = records_.find(identity);
    if (it == records_.end()) return false;

    change.record = std::move(it->second);
    records_.erase(it);
  }
  Notify(change);
  return true;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<StatusRecord> StatusRegistry::Get(const std::string& identity) const {
  std::shared_lock lock(mutex_);

  auto it = records_.find(identity);
  if (it == records_.end()) return std::nullopt;

  return it->second;
}

std::vector<StatusRecord> StatusRegistry::ListAll() const {
  std::vector<StatusRecord> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(records_.size());
    for (const auto& [identity, record] : records_) out.push_back(record);
  }
  SortByIdentity(&out);
  return out;
}

std::vector<StatusRecord> StatusRegistry::ListByStatus(InstallStatus status) const {
  std::vector<StatusRecord> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [identity, record] : records_) {
      if (record.status() == status) out.push_back(record);
    }
  }
  SortByIdentity(&out);
  return out;
}

std::vector<StatusRecord> StatusRegistry::GetByPackageName(const std::string& package_name) const {
  std::vector<StatusRecord> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [identity, record] : records_) {
      if (record.request().package_name() == package_name) out.push_back(record);
    }
  }
  SortByIdentity(&out);
  return out;
}

StatusSnapshot StatusRegistry::Snapshot() const {
  StatusSnapshot snapshot;
  for (auto& record : ListAll()) *snapshot.add_records() = std::move(record);
  *snapshot.mutable_taken_at() = install::util::NowProto();
  return snapshot;
}

// ------------------------------------------------------------
// Listeners
// ------------------------------------------------------------

uint64_t StatusRegistry::AddListener(Listener listener) {
  std::lock_guard lock(listeners_mutex_);
  const auto      id = ++next_listener_id_;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void StatusRegistry::RemoveListener(uint64_t id) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.erase(id);
}

void StatusRegistry::Notify(const StatusChange& change) {
  std::vector<Listener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) listeners.push_back(listener);
  }

  for (const auto& listener : listeners) listener(change);
}

double ProgressFraction(const StatusRecord& record) {
  if (record.total_bytes() == 0) return 0.0;
  const auto read = std::min(record.bytes_read(), record.total_bytes());
  return static_cast<double>(read) / static_cast<double>(record.total_bytes());
}

} // namespace install::status
