#include "directory_installer.hpp"

#include "internal/content/path_utils.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace install::installer {

using install::observability::StringField;

namespace {

InstallEvent MakeEvent(InstallEventKind kind) {
  InstallEvent event;
  event.kind = kind;
  return event;
}

} // namespace

DirectoryInstaller::DirectoryInstaller(std::filesystem::path install_root, bool require_confirmation)
    : install_root_(std::move(install_root)), require_confirmation_(require_confirmation) {
}

DirectoryInstaller::~DirectoryInstaller() {
  Stop();
}

void DirectoryInstaller::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&DirectoryInstaller::Run, this);
}

void DirectoryInstaller::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void DirectoryInstaller::Install(const std::filesystem::path& local_file, const std::string& identity,
                                 const install::manager::v1::InstallRequest& request) {
  {
    std::lock_guard lock(mutex_);
    awaiting_user_.erase(identity);
    queue_.push_back(Job{identity, local_file, request, !require_confirmation_});
  }
  cv_.notify_one();
}

void DirectoryInstaller::Confirm(const std::string& identity) {
  {
    std::lock_guard lock(mutex_);
    auto            it = awaiting_user_.find(identity);
    if (it == awaiting_user_.end()) {
      INSTALL_LOG_WARN("Nothing awaiting confirmation", {StringField("identity", identity)});
      return;
    }
    it->second.confirmed = true;
    queue_.push_back(std::move(it->second));
    awaiting_user_.erase(it);
  }
  cv_.notify_one();
}

void DirectoryInstaller::Decline(const std::string& identity) {
  {
    std::lock_guard lock(mutex_);
    if (awaiting_user_.erase(identity) == 0) {
      INSTALL_LOG_WARN("Nothing awaiting confirmation", {StringField("identity", identity)});
      return;
    }
  }
  INSTALL_LOG_INFO("Install declined", {StringField("identity", identity)});
  bus_.Publish(identity, MakeEvent(InstallEventKind::kInterrupted));
}

install::events::Subscription DirectoryInstaller::Subscribe(const std::string& identity, Handler handler) {
  return bus_.Subscribe(identity, std::move(handler));
}

void DirectoryInstaller::Run() {
  while (running_) {
    Job job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (shutdown_) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }

    Execute(job);
  }
}

void DirectoryInstaller::Execute(const Job& job) {
  bus_.Publish(job.identity, MakeEvent(InstallEventKind::kStarted));

  if (!job.confirmed) {
    auto event = MakeEvent(InstallEventKind::kUserInteractionRequired);
    event.action.set_kind(install::manager::v1::ACTION_KIND_CONFIRM_INSTALL);
    event.action.set_identity(job.identity);
    event.action.set_token(install::util::NewUuid());
    {
      std::lock_guard lock(mutex_);
      awaiting_user_[job.identity] = job;
    }
    bus_.Publish(job.identity, event);
    return;
  }

  try {
    CopyIntoPlace(job);
  } catch (const std::exception& e) {
    INSTALL_LOG_WARN("Install failed", {StringField("identity", job.identity), StringField("error", e.what())});
    auto event          = MakeEvent(InstallEventKind::kInterrupted);
    event.error_message = e.what();
    bus_.Publish(job.identity, event);
    return;
  }

  bus_.Publish(job.identity, MakeEvent(InstallEventKind::kComplete));
}

void DirectoryInstaller::CopyIntoPlace(const Job& job) {
  if (!std::filesystem::is_regular_file(job.local_file)) {
    throw install::util::NotFound("downloaded file is missing: " + job.local_file.string());
  }

  const auto dir = install::content::PackageDir(install_root_, job.request.package_name());
  std::filesystem::create_directories(dir);

  const auto target  = dir / job.local_file.filename();
  const auto staging = install::content::StagingPath(target);
  std::filesystem::copy_file(job.local_file, staging, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::rename(staging, target);

  INSTALL_LOG_INFO("Installed artifact", {StringField("identity", job.identity), StringField("package", job.request.package_name()),
                                          StringField("path", target.string())});
}

} // namespace install::installer
