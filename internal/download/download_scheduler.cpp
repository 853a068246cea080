#include "download_scheduler.hpp"

#include <algorithm>

namespace install::download {

void DownloadScheduler::Enqueue(const DownloadTask& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(task);
  }
  cv_.notify_one();
}

std::optional<DownloadTask> DownloadScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  DownloadTask task = queue_.front();
  queue_.pop_front();
  return task;
}

bool DownloadScheduler::Remove(const std::string& identity) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(), [&](const DownloadTask& task) { return task.identity == identity; });
  if (it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

void DownloadScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace install::download
