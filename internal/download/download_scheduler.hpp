#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace install::download {

struct DownloadTask {
  std::string identity;
};

/*
  Thread-safe blocking FIFO for download workers.
*/
class DownloadScheduler {
 public:
  void Enqueue(const DownloadTask& task);

  // blocking wait; nullopt once shut down
  std::optional<DownloadTask> Dequeue();

  // Drops a task that has not been picked up yet.
  bool Remove(const std::string& identity);

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::deque<DownloadTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace install::download
