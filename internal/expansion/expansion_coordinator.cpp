#include "expansion_coordinator.hpp"

#include <system_error>
#include <vector>

#include "internal/content/path_utils.hpp"
#include "internal/download/download_gateway.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"

namespace install::expansion {

using namespace install::manager::v1;
using install::download::DownloadEvent;
using install::download::DownloadEventKind;
using install::observability::StringField;
using install::observability::UintField;

namespace {

bool IsDescribed(const ExpansionFile& file) {
  return !file.url().empty() && !file.destination_path().empty();
}

// rename, falling back to copy + rename when the download cache sits on another filesystem
void MoveInto(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) return;

  const auto staging = install::content::StagingPath(to);
  std::filesystem::copy_file(from, staging, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::rename(staging, to);
  std::filesystem::remove(from, ec);
}

} // namespace

const char* RolePrefix(ExpansionRole role) {
  switch (role) {
    case EXPANSION_ROLE_MAIN:
      return "main.";
    case EXPANSION_ROLE_PATCH:
      return "patch.";
    default:
      return "";
  }
}

ExpansionCoordinator::ExpansionCoordinator(std::shared_ptr<install::download::DownloadGateway> gateway,
                                           std::shared_ptr<install::status::StatusRegistry>    registry)
    : gateway_(std::move(gateway)), registry_(std::move(registry)) {
}

// ------------------------------------------------------------
// Fetch / Cancel
// ------------------------------------------------------------

std::size_t ExpansionCoordinator::Fetch(const InstallRequest& request) {
  std::size_t queued = 0;

  auto main_file = request.main_expansion();
  if (main_file.role() == EXPANSION_ROLE_UNSPECIFIED) main_file.set_role(EXPANSION_ROLE_MAIN);
  if (FetchOne(request.identity(), main_file)) ++queued;

  auto patch_file = request.patch_expansion();
  if (patch_file.role() == EXPANSION_ROLE_UNSPECIFIED) patch_file.set_role(EXPANSION_ROLE_PATCH);
  if (FetchOne(request.identity(), patch_file)) ++queued;

  return queued;
}

bool ExpansionCoordinator::FetchOne(const std::string& artifact_identity, const ExpansionFile& file) {
  if (!IsDescribed(file)) return false;

  std::error_code ec;
  if (std::filesystem::exists(file.destination_path(), ec)) {
    INSTALL_LOG_DEBUG("Expansion file already in place", {StringField("identity", artifact_identity),
                                                          StringField("path", file.destination_path())});
    return false;
  }

  {
    std::lock_guard lock(mutex_);
    if (pending_.count(file.url()) > 0) return false;

    PendingFetch fetch;
    fetch.artifact_identity = artifact_identity;
    fetch.file              = file;
    fetch.subscription =
        gateway_->Subscribe(file.url(), [this](const std::string& url, const DownloadEvent& event) { OnDownloadEvent(url, event); });
    pending_.emplace(file.url(), std::move(fetch));
  }

  INSTALL_LOG_INFO("Fetching expansion file", {StringField("identity", artifact_identity), StringField("url", file.url()),
                                               StringField("role", ExpansionRole_Name(file.role()))});
  gateway_->Queue(file.url());
  return true;
}

void ExpansionCoordinator::Cancel(const std::string& artifact_identity) {
  std::vector<PendingFetch> cancelled;
  {
    std::lock_guard lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      if (it->second.artifact_identity != artifact_identity) {
        ++it;
        continue;
      }
      cancelled.push_back(std::move(it->second));
      it = pending_.erase(it);
    }
  }

  for (auto& fetch : cancelled) {
    fetch.subscription.Reset();
    gateway_->Cancel(fetch.file.url());
    INSTALL_LOG_DEBUG("Expansion download cancelled", {StringField("identity", artifact_identity), StringField("url", fetch.file.url())});
  }
}

std::size_t ExpansionCoordinator::PendingFor(const std::string& artifact_identity) const {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (const auto& [url, fetch] : pending_) {
    if (fetch.artifact_identity == artifact_identity) ++count;
  }
  return count;
}

std::optional<std::filesystem::path> ExpansionCoordinator::PlacedPath(const std::filesystem::path& directory, ExpansionRole role) const {
  std::lock_guard lock(placement_mutex_);
  auto            it = placed_.find(RoleKey{directory.string(), role});
  if (it == placed_.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// Download events
// ------------------------------------------------------------

void ExpansionCoordinator::OnDownloadEvent(const std::string& url, const DownloadEvent& event) {
  switch (event.kind) {
    case DownloadEventKind::kStarted:
      INSTALL_LOG_DEBUG("Expansion download started", {StringField("url", url)});
      return;

    case DownloadEventKind::kProgress: {
      std::string artifact_identity;
      {
        std::lock_guard lock(mutex_);
        auto            it = pending_.find(url);
        if (it == pending_.end()) return;
        artifact_identity = it->second.artifact_identity;
      }
      registry_->UpdateProgress(artifact_identity, event.total_bytes, event.bytes_read);
      return;
    }

    case DownloadEventKind::kCompleted:
    case DownloadEventKind::kInterrupted:
      break;

    default:
      INSTALL_LOG_ERROR("Unhandled download event", {StringField("url", url), UintField("kind", static_cast<uint64_t>(event.kind))});
      return;
  }

  PendingFetch fetch;
  {
    std::lock_guard lock(mutex_);
    auto            it = pending_.find(url);
    if (it == pending_.end()) return;
    fetch = std::move(it->second);
    pending_.erase(it);
  }
  fetch.subscription.Reset();

  if (event.kind == DownloadEventKind::kInterrupted) {
    INSTALL_LOG_WARN("Expansion download interrupted", {StringField("identity", fetch.artifact_identity), StringField("url", url),
                                                        StringField("message", event.message)});
    return;
  }

  const std::filesystem::path downloaded(event.local_path);
  try {
    Place(fetch, downloaded);
  } catch (const install::util::ValidationFailure& e) {
    INSTALL_LOG_WARN("Expansion file discarded", {StringField("identity", fetch.artifact_identity), StringField("error", e.what())});
  } catch (const std::exception& e) {
    INSTALL_LOG_ERROR("Expansion file placement failed", {StringField("identity", fetch.artifact_identity), StringField("error", e.what())});
  }

  std::error_code ec;
  std::filesystem::remove(downloaded, ec);
}

// ------------------------------------------------------------
// Placement
// ------------------------------------------------------------

void ExpansionCoordinator::Place(const PendingFetch& fetch, const std::filesystem::path& downloaded) {
  const auto& file   = fetch.file;
  const auto  actual = install::util::Sha256File(downloaded);
  if (!install::util::DigestEquals(file.sha256(), actual)) {
    throw install::util::ValidationFailure("hash mismatch for " + file.url() + ": expected " + file.sha256() + " got " + actual);
  }

  const std::filesystem::path destination(file.destination_path());

  std::lock_guard lock(placement_mutex_);
  std::filesystem::create_directories(destination.parent_path());
  MoveInto(downloaded, destination);
  INSTALL_LOG_INFO("Installed expansion file", {StringField("identity", fetch.artifact_identity), StringField("path", destination.string())});

  PruneSiblings(destination, file.role());
}

// placement_mutex_ held
void ExpansionCoordinator::PruneSiblings(const std::filesystem::path& destination, ExpansionRole role) {
  const auto directory = destination.parent_path();
  const auto key       = RoleKey{directory.string(), role};

  std::vector<std::filesystem::path> stale;
  if (auto it = placed_.find(key); it != placed_.end()) {
    if (it->second != destination) stale.push_back(it->second);
  } else {
    const std::string prefix = RolePrefix(role);
    std::error_code   ec;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
      if (!entry.is_regular_file(ec)) continue;
      const auto name = entry.path().filename().string();
      if (!prefix.empty() && name.rfind(prefix, 0) == 0 && entry.path() != destination) stale.push_back(entry.path());
    }
  }

  for (const auto& path : stale) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
      INSTALL_LOG_INFO("Deleted obsolete expansion file", {StringField("path", path.string()), StringField("role", ExpansionRole_Name(role))});
    } else if (ec) {
      INSTALL_LOG_WARN("Failed to delete obsolete expansion file", {StringField("path", path.string()), StringField("error", ec.message())});
    }
  }

  placed_[key] = destination;
}

} // namespace install::expansion
