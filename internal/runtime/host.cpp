#include "host.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "install/manager/v1.hpp"
#include "internal/content/path_utils.hpp"
#include "internal/core/install_orchestrator.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/request_spool.hpp"
#include "internal/status/status_registry.hpp"

namespace install::runtime {

using install::core::InstallOrchestrator;
using install::observability::StringField;
using install::observability::UintField;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

// "name.package-added" has no single-dot extension we can ask filesystem for.
bool HasSuffix(const std::string& name, const std::string& suffix) {
  return name.size() > suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Host::Host(std::filesystem::path spool_root, std::chrono::milliseconds poll_interval, std::shared_ptr<InstallOrchestrator> orchestrator,
           std::shared_ptr<install::status::StatusRegistry> registry, std::shared_ptr<RequestSpool> spool)
    : inbox_dir_(spool_root / "inbox"),
      status_path_(spool_root / "status.json"),
      poll_interval_(poll_interval),
      orchestrator_(std::move(orchestrator)),
      registry_(std::move(registry)),
      spool_(std::move(spool)) {
  std::filesystem::create_directories(inbox_dir_);

  listener_id_ = registry_->AddListener([spool = spool_](const install::status::StatusChange& change) {
    const auto& record = change.record;
    if (change.kind == install::status::StatusChange::Kind::kRemoved || install::model::IsTerminal(record.status())) {
      spool->Remove(record.identity());
    }
  });
  listening_ = true;
}

Host::~Host() {
  Stop();
  if (listening_) {
    registry_->RemoveListener(listener_id_);
  }
}

void Host::Start() {
  if (running_.exchange(true)) return;

  const auto redelivered = Redeliver();
  const auto recovered   = orchestrator_->RecoverPendingInstalls();
  INSTALL_LOG_INFO("Host started", {StringField("inbox", inbox_dir_.string()), UintField("redelivered", redelivered),
                                    UintField("recovered", recovered)});

  thread_ = std::thread(&Host::Run, this);
}

void Host::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t Host::Redeliver() {
  std::size_t count = 0;
  for (const auto& request : spool_->LoadAll()) {
    const auto& identity = request.identity();
    // Nothing else runs for the identity yet, so the request is handled
    // before RequestInstall returns. No record afterwards means it was
    // abandoned.
    if (!orchestrator_->RequestInstall(request, InstallOrchestrator::Delivery::kRedelivery) || !registry_->Get(identity)) {
      spool_->Remove(identity);
      continue;
    }
    ++count;
  }
  return count;
}

void Host::Run() {
  while (running_) {
    try {
      PollOnce();
    } catch (const std::exception& e) {
      INSTALL_LOG_ERROR("Inbox poll failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wake_mutex_);
    wake_.wait_for(lock, poll_interval_, [this] { return !running_; });
  }
}

std::size_t Host::PollOnce() {
  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(inbox_dir_)) {
    if (entry.is_regular_file()) files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::size_t consumed = 0;
  for (const auto& file : files) {
    if (Consume(file)) ++consumed;
  }

  WriteStatus();
  return consumed;
}

bool Host::Consume(const std::filesystem::path& file) {
  const auto name = file.filename().string();

  enum class Kind { kRequest, kCancel, kConfirm, kDecline, kDismiss, kPackageAdded };
  Kind kind;
  if (HasSuffix(name, ".json")) {
    kind = Kind::kRequest;
  } else if (HasSuffix(name, ".cancel")) {
    kind = Kind::kCancel;
  } else if (HasSuffix(name, ".confirm")) {
    kind = Kind::kConfirm;
  } else if (HasSuffix(name, ".decline")) {
    kind = Kind::kDecline;
  } else if (HasSuffix(name, ".dismiss")) {
    kind = Kind::kDismiss;
  } else if (HasSuffix(name, ".package-added")) {
    kind = Kind::kPackageAdded;
  } else {
    // partial writes and rejects
    return false;
  }

  std::string body;
  try {
    body = ReadFile(file);
  } catch (const std::exception& e) {
    INSTALL_LOG_WARN("Failed to read inbox file", {StringField("path", file.string()), StringField("error", e.what())});
    return false;
  }

  if (kind == Kind::kRequest) {
    install::manager::v1::InstallRequest request;

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(body, &request, options);
    if (!status.ok()) {
      Reject(file, std::string(status.message()));
      return true;
    }

    // Spooled first so a request that finishes immediately is removed again.
    try {
      spool_->Add(request);
    } catch (const std::exception& e) {
      INSTALL_LOG_WARN("Failed to spool request", {StringField("identity", request.identity()), StringField("error", e.what())});
    }
    if (!orchestrator_->RequestInstall(request)) {
      spool_->Remove(request.identity());
      Reject(file, "malformed install request");
      return true;
    }
  } else {
    const auto value = Trim(body);
    if (value.empty()) {
      Reject(file, "empty body");
      return true;
    }

    switch (kind) {
      case Kind::kCancel:
        orchestrator_->Cancel(value);
        break;
      case Kind::kConfirm:
        orchestrator_->Confirm(value);
        break;
      case Kind::kDecline:
        orchestrator_->Decline(value);
        break;
      case Kind::kDismiss:
        orchestrator_->Dismiss(value);
        break;
      case Kind::kPackageAdded:
        orchestrator_->OnPackageAdded(value);
        break;
      case Kind::kRequest:
        break;
    }
  }

  std::error_code ec;
  std::filesystem::remove(file, ec);
  if (ec) {
    INSTALL_LOG_WARN("Failed to remove inbox file", {StringField("path", file.string()), StringField("error", ec.message())});
  }
  return true;
}

void Host::Reject(const std::filesystem::path& file, const std::string& reason) {
  INSTALL_LOG_WARN("Rejected inbox file", {StringField("path", file.string()), StringField("reason", reason)});

  auto            rejected = file;
  std::error_code ec;
  std::filesystem::rename(file, rejected += ".rejected", ec);
  if (ec) {
    std::filesystem::remove(file, ec);
  }
}

void Host::WriteStatus() const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(registry_->Snapshot(), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize status snapshot: " + std::string(status.message()));
  }

  const auto staging = install::content::StagingPath(status_path_);
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open " + staging.string());
    }
    out << json;
  }
  std::filesystem::rename(staging, status_path_);
}

} // namespace install::runtime
