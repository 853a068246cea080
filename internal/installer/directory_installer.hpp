#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/installer/installer.hpp"

namespace install::installer {

/*
  Installs an artifact by copying it to <install_root>/<package>/<file>.

  A single worker thread runs jobs in order. With confirmation required,
  each job stops after install-started with a user-interaction-required
  event and waits for Confirm() or Decline().
*/
class DirectoryInstaller final : public Installer {
 public:
  DirectoryInstaller(std::filesystem::path install_root, bool require_confirmation);
  ~DirectoryInstaller() override;

  DirectoryInstaller(const DirectoryInstaller&)            = delete;
  DirectoryInstaller& operator=(const DirectoryInstaller&) = delete;

  void Start();
  void Stop();

  void Install(const std::filesystem::path& local_file, const std::string& identity,
               const install::manager::v1::InstallRequest& request) override;

  void Confirm(const std::string& identity) override;
  void Decline(const std::string& identity) override;

  install::events::Subscription Subscribe(const std::string& identity, Handler handler) override;

 private:
  struct Job {
    std::string                         identity;
    std::filesystem::path               local_file;
    install::manager::v1::InstallRequest request;
    bool                                confirmed = false;
  };

  void Run();
  void Execute(const Job& job);
  void CopyIntoPlace(const Job& job);

  std::filesystem::path install_root_;
  bool                  require_confirmation_;

  install::events::EventBus<InstallEvent> bus_;

  std::mutex                           mutex_;
  std::condition_variable              cv_;
  std::deque<Job>                      queue_;
  std::unordered_map<std::string, Job> awaiting_user_;
  bool                                 shutdown_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace install::installer
