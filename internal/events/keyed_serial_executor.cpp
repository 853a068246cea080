#include "keyed_serial_executor.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace install::events {

using install::observability::StringField;

void KeyedSerialExecutor::Post(const std::string& key, Task task) {
  {
    std::lock_guard lock(mutex_);
    auto [it, idle] = mailboxes_.try_emplace(key);
    it->second.push_back(std::move(task));
    if (!idle) return;
  }
  Drain(key);
}

std::size_t KeyedSerialExecutor::PendingKeys() const {
  std::lock_guard lock(mutex_);
  return mailboxes_.size();
}

void KeyedSerialExecutor::Drain(const std::string& key) {
  for (;;) {
    Task task;
    {
      std::lock_guard lock(mutex_);
      auto            it = mailboxes_.find(key);
      if (it == mailboxes_.end()) return;
      if (it->second.empty()) {
        mailboxes_.erase(it);
        return;
      }
      task = std::move(it->second.front());
      it->second.pop_front();
    }

    try {
      task();
    } catch (const std::exception& e) {
      INSTALL_LOG_ERROR("Event handling aborted", {StringField("identity", key), StringField("error", e.what())});
    } catch (...) {
      // the mailbox must keep draining or the key stays busy forever
      INSTALL_LOG_ERROR("Event handling aborted", {StringField("identity", key), StringField("error", "non-standard exception")});
    }
  }
}

} // namespace install::events
