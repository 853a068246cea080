#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/download/download_gateway.hpp"
#include "internal/download/download_scheduler.hpp"

namespace install::content {
class ContentStore;
}

namespace install::download {

/*
  Transfer engine for file:// identities.

  Worker threads pull identities from the scheduler and copy the source
  into <ContentStore path>.part in fixed chunks, publishing progress per
  chunk. The finished file is renamed onto the ContentStore path before
  completed is published. Any other scheme is reported as interrupted.
*/
class FileDownloadGateway final : public DownloadGateway {
 public:
  FileDownloadGateway(std::shared_ptr<install::content::ContentStore> store, uint32_t workers, uint64_t chunk_size_bytes);
  ~FileDownloadGateway() override;

  FileDownloadGateway(const FileDownloadGateway&)            = delete;
  FileDownloadGateway& operator=(const FileDownloadGateway&) = delete;

  void Start();
  void Stop();

  void Queue(const std::string& identity) override;
  void Cancel(const std::string& identity) override;
  bool IsQueuedOrActive(const std::string& identity) const override;

  install::events::Subscription Subscribe(const std::string& identity, Handler handler) override;

 private:
  struct Transfer {
    bool              active = false;
    std::atomic<bool> cancelled{false};
  };

  void Run();
  void Execute(const std::string& identity, const std::shared_ptr<Transfer>& transfer);
  void Copy(const std::string& identity, const std::filesystem::path& source, const std::filesystem::path& destination,
            const std::shared_ptr<Transfer>& transfer);
  void Finish(const std::string& identity, const std::shared_ptr<Transfer>& transfer, const DownloadEvent& event);

  std::shared_ptr<install::content::ContentStore> store_;
  uint32_t                                        worker_count_;
  uint64_t                                        chunk_size_bytes_;

  DownloadScheduler                        scheduler_;
  install::events::EventBus<DownloadEvent> bus_;

  mutable std::mutex                                         transfers_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Transfer>> transfers_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace install::download
