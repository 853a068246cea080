#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "install/manager/v1/request.pb.h"
#include "internal/download/download_gateway.hpp"
#include "internal/installer/installer.hpp"
#include "internal/installer/package_registry.hpp"
#include "internal/util/sha256.hpp"

namespace install::testing {

inline std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "install_manager_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

inline install::manager::v1::InstallRequest MakeRequest(const std::string& identity, const std::string& package_name,
                                                        const std::string& content) {
  install::manager::v1::InstallRequest request;
  request.set_identity(identity);
  request.set_package_name(package_name);
  request.set_version_code(1);
  request.set_size_bytes(content.size());
  request.set_sha256(install::util::Sha256Hex(content));
  return request;
}

/*
  Scriptable transfer engine: records queue/cancel calls and lets the test
  publish events by hand.
*/
class FakeDownloadGateway final : public install::download::DownloadGateway {
 public:
  void Queue(const std::string& identity) override {
    std::lock_guard lock(mutex_);
    if (!active_.insert(identity).second) return;
    ++queue_count_[identity];
  }

  void Cancel(const std::string& identity) override {
    std::lock_guard lock(mutex_);
    if (active_.erase(identity) > 0) ++cancel_count_[identity];
  }

  bool IsQueuedOrActive(const std::string& identity) const override {
    std::lock_guard lock(mutex_);
    return active_.count(identity) > 0;
  }

  install::events::Subscription Subscribe(const std::string& identity, Handler handler) override {
    return bus_.Subscribe(identity, std::move(handler));
  }

  // Completed/interrupted end the transfer, as a real engine would.
  void Emit(const std::string& identity, const install::download::DownloadEvent& event) {
    if (event.kind == install::download::DownloadEventKind::kCompleted || event.kind == install::download::DownloadEventKind::kInterrupted) {
      std::lock_guard lock(mutex_);
      active_.erase(identity);
    }
    bus_.Publish(identity, event);
  }

  // Marks the identity in flight without counting a queue call.
  void SetActive(const std::string& identity) {
    std::lock_guard lock(mutex_);
    active_.insert(identity);
  }

  int QueueCount(const std::string& identity) const {
    std::lock_guard lock(mutex_);
    auto            it = queue_count_.find(identity);
    return it == queue_count_.end() ? 0 : it->second;
  }

  int CancelCount(const std::string& identity) const {
    std::lock_guard lock(mutex_);
    auto            it = cancel_count_.find(identity);
    return it == cancel_count_.end() ? 0 : it->second;
  }

  std::size_t SubscriberCount(const std::string& identity) const {
    return bus_.SubscriberCount(identity);
  }

 private:
  mutable std::mutex         mutex_;
  std::set<std::string>      active_;
  std::map<std::string, int> queue_count_;
  std::map<std::string, int> cancel_count_;

  install::events::EventBus<install::download::DownloadEvent> bus_;
};

class FakeInstaller final : public install::installer::Installer {
 public:
  struct Call {
    std::filesystem::path                local_file;
    std::string                          identity;
    install::manager::v1::InstallRequest request;
  };

  void Install(const std::filesystem::path& local_file, const std::string& identity,
               const install::manager::v1::InstallRequest& request) override {
    std::lock_guard lock(mutex_);
    calls_.push_back(Call{local_file, identity, request});
  }

  void Confirm(const std::string& identity) override {
    std::lock_guard lock(mutex_);
    confirmed_.push_back(identity);
  }

  void Decline(const std::string& identity) override {
    std::lock_guard lock(mutex_);
    declined_.push_back(identity);
  }

  install::events::Subscription Subscribe(const std::string& identity, Handler handler) override {
    return bus_.Subscribe(identity, std::move(handler));
  }

  void Emit(const std::string& identity, install::installer::InstallEventKind kind, const std::string& error_message = {}) {
    install::installer::InstallEvent event;
    event.kind          = kind;
    event.error_message = error_message;
    bus_.Publish(identity, event);
  }

  void Emit(const std::string& identity, const install::installer::InstallEvent& event) {
    bus_.Publish(identity, event);
  }

  std::vector<Call> Calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  std::vector<std::string> Confirmed() const {
    std::lock_guard lock(mutex_);
    return confirmed_;
  }

  std::vector<std::string> Declined() const {
    std::lock_guard lock(mutex_);
    return declined_;
  }

  std::size_t SubscriberCount(const std::string& identity) const {
    return bus_.SubscriberCount(identity);
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<Call>        calls_;
  std::vector<std::string> confirmed_;
  std::vector<std::string> declined_;

  install::events::EventBus<install::installer::InstallEvent> bus_;
};

class FakePackageRegistry final : public install::installer::PackageRegistry {
 public:
  void SetInstaller(const std::string& package_name, const std::string& installer_name) override {
    std::lock_guard lock(mutex_);
    installers_[package_name] = installer_name;
  }

  std::optional<std::string> InstallerOf(const std::string& package_name) const override {
    std::lock_guard lock(mutex_);
    auto            it = installers_.find(package_name);
    if (it == installers_.end()) return std::nullopt;
    return it->second;
  }

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> installers_;
};

} // namespace install::testing
