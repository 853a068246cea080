#include "request_spool.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/content/path_utils.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/sha256.hpp"

namespace install::runtime {

using install::observability::StringField;
using install::observability::UintField;

namespace {

constexpr char kEntryExtension[] = ".pb";

} // namespace

RequestSpool::RequestSpool(std::filesystem::path root) : pending_dir_(std::move(root) / "pending") {
  std::filesystem::create_directories(pending_dir_);
}

std::filesystem::path RequestSpool::EntryPath(const std::string& identity) const {
  return pending_dir_ / (install::util::Sha256Hex(identity) + kEntryExtension);
}

void RequestSpool::Add(const install::manager::v1::InstallRequest& request) {
  std::string bytes;
  if (!request.SerializeToString(&bytes)) {
    throw std::runtime_error("failed to serialize install request for " + request.identity());
  }

  const auto target  = EntryPath(request.identity());
  const auto staging = install::content::StagingPath(target);

  std::lock_guard lock(mutex_);
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open spool entry: " + staging.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw std::runtime_error("failed to write spool entry: " + staging.string());
    }
  }
  std::filesystem::rename(staging, target);
}

bool RequestSpool::Remove(const std::string& identity) {
  std::lock_guard lock(mutex_);
  std::error_code ec;
  const bool      removed = std::filesystem::remove(EntryPath(identity), ec);
  if (ec) {
    INSTALL_LOG_WARN("Failed to remove spool entry", {StringField("identity", identity), StringField("error", ec.message())});
    return false;
  }
  return removed;
}

bool RequestSpool::Contains(const std::string& identity) const {
  std::lock_guard lock(mutex_);
  return std::filesystem::exists(EntryPath(identity));
}

std::vector<install::manager::v1::InstallRequest> RequestSpool::LoadAll() const {
  std::lock_guard lock(mutex_);

  std::vector<std::filesystem::path> entries;
  for (const auto& entry : std::filesystem::directory_iterator(pending_dir_)) {
    if (entry.is_regular_file() && entry.path().extension() == kEntryExtension) {
      entries.push_back(entry.path());
    }
  }
  std::sort(entries.begin(), entries.end());

  std::vector<install::manager::v1::InstallRequest> out;
  out.reserve(entries.size());
  for (const auto& path : entries) {
    std::ifstream                        in(path, std::ios::binary);
    install::manager::v1::InstallRequest request;
    if (!in || !request.ParseFromIstream(&in) || request.identity().empty()) {
      INSTALL_LOG_WARN("Skipping unreadable spool entry", {StringField("path", path.string())});
      continue;
    }
    out.push_back(std::move(request));
  }

  INSTALL_LOG_DEBUG("Loaded spooled requests", {UintField("count", out.size())});
  return out;
}

} // namespace install::runtime
