#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace install::events {

/*
  Per-key mailbox.

  Tasks posted for the same key run one at a time, in arrival order, on
  whichever thread found the mailbox idle. Different keys never wait on
  each other. A task posted from inside a running task for the same key is
  queued behind it rather than run re-entrantly.

  An exception escaping a task is logged and only that task is abandoned.
*/
class KeyedSerialExecutor {
 public:
  using Task = std::function<void()>;

  void Post(const std::string& key, Task task);

  std::size_t PendingKeys() const;

 private:
  void Drain(const std::string& key);

  mutable std::mutex                                 mutex_;
  std::unordered_map<std::string, std::deque<Task>> mailboxes_;
};

} // namespace install::events
