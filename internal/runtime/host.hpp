#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace install::core {
class InstallOrchestrator;
}
namespace install::status {
class StatusRegistry;
}

namespace install::runtime {

class RequestSpool;

/*
  Drives the orchestrator from a spool directory.

    <spool>/inbox/*.json            protobuf-JSON InstallRequest
    <spool>/inbox/*.cancel          identity
    <spool>/inbox/*.confirm         identity
    <spool>/inbox/*.decline         identity
    <spool>/inbox/*.dismiss         identity
    <spool>/inbox/*.package-added   package name
    <spool>/status.json             StatusSnapshot, rewritten every tick

  Inbox files are consumed in name order and deleted; unparseable ones are
  renamed to *.rejected. Accepted requests go to the RequestSpool and leave
  it when their record turns terminal or disappears.

  Start() redelivers the spool, then re-attaches installer listeners, then
  begins polling.
*/
class Host {
 public:
  Host(std::filesystem::path spool_root, std::chrono::milliseconds poll_interval, std::shared_ptr<install::core::InstallOrchestrator> orchestrator,
       std::shared_ptr<install::status::StatusRegistry> registry, std::shared_ptr<RequestSpool> spool);
  ~Host();

  Host(const Host&)            = delete;
  Host& operator=(const Host&) = delete;

  void Start();
  void Stop();

  // Number of spooled requests handed back to the orchestrator.
  std::size_t Redeliver();

  // One pass over the inbox followed by a status export. Returns the number
  // of inbox files consumed.
  std::size_t PollOnce();

  void WriteStatus() const;

  const std::filesystem::path& InboxDir() const {
    return inbox_dir_;
  }
  const std::filesystem::path& StatusPath() const {
    return status_path_;
  }

 private:
  void Run();
  bool Consume(const std::filesystem::path& file);
  void Reject(const std::filesystem::path& file, const std::string& reason);

  std::filesystem::path     inbox_dir_;
  std::filesystem::path     status_path_;
  std::chrono::milliseconds poll_interval_;

  std::shared_ptr<install::core::InstallOrchestrator> orchestrator_;
  std::shared_ptr<install::status::StatusRegistry>    registry_;
  std::shared_ptr<RequestSpool>                       spool_;

  uint64_t listener_id_ = 0;
  bool     listening_   = false;

  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace install::runtime
