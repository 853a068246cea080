#include "content_store.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/sha256.hpp"

namespace install::content {

using install::observability::StringField;

namespace {

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
};

ParsedUrl ParseUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw std::invalid_argument("identity is not an absolute URL: " + url);
  }

  ParsedUrl parsed;
  parsed.scheme = url.substr(0, scheme_end);

  auto rest = url.substr(scheme_end + 3);
  if (const auto cut = rest.find_first_of("?#"); cut != std::string::npos) {
    rest.resize(cut);
  }

  const auto path_start = rest.find('/');
  auto       authority  = rest.substr(0, path_start);
  parsed.path           = path_start == std::string::npos ? std::string{} : rest.substr(path_start + 1);

  if (const auto at = authority.rfind('@'); at != std::string::npos) {
    authority.erase(0, at + 1);
  }
  if (const auto colon = authority.rfind(':'); colon != std::string::npos && authority.find(']') == std::string::npos) {
    parsed.port = authority.substr(colon + 1);
    authority.resize(colon);
  }
  parsed.host = authority;
  return parsed;
}

std::string Sanitize(const std::string& segment) {
  std::string out;
  out.reserve(segment.size());
  for (char c : segment) {
    const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '.' || c == '-' || c == '_';
    out.push_back(safe ? c : '_');
  }
  return out;
}

std::string DefaultPort(const std::string& scheme) {
  if (scheme == "https") return "443";
  if (scheme == "http") return "80";
  return "-1";
}

} // namespace

ContentStore::ContentStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path ContentStore::ResolvePath(const std::string& identity) const {
  const auto url = ParseUrl(identity);

  const auto host = url.host.empty() ? std::string{"local"} : Sanitize(url.host);
  const auto port = url.port.empty() ? DefaultPort(url.scheme) : Sanitize(url.port);

  std::filesystem::path path = root_ / (host + "-" + port);

  std::string segment;
  bool        has_file = false;
  for (std::size_t i = 0; i <= url.path.size(); ++i) {
    if (i < url.path.size() && url.path[i] != '/') {
      segment.push_back(url.path[i]);
      continue;
    }
    if (segment.empty()) continue;
    if (segment == "." || segment == "..") {
      throw std::invalid_argument("identity path must not contain relative components: " + identity);
    }
    path /= Sanitize(segment);
    has_file = true;
    segment.clear();
  }

  if (!has_file || url.path.back() == '/') {
    throw std::invalid_argument("identity does not name a file: " + identity);
  }
  return path;
}

bool ContentStore::Exists(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

uint64_t ContentStore::SizeOf(const std::filesystem::path& path) const {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

bool ContentStore::IsValid(const std::filesystem::path& path, uint64_t expected_size, const std::string& expected_sha256) const {
  if (!Exists(path) || SizeOf(path) != expected_size) {
    return false;
  }

  try {
    const auto actual = install::util::Sha256File(path);
    if (install::util::DigestEquals(expected_sha256, actual)) {
      return true;
    }
    INSTALL_LOG_DEBUG("Cached file hash mismatch", {StringField("path", path.string()), StringField("expected", expected_sha256),
                                                    StringField("actual", actual)});
  } catch (const std::runtime_error& e) {
    INSTALL_LOG_WARN("Failed to hash cached file", {StringField("path", path.string()), StringField("error", e.what())});
  }
  return false;
}

bool ContentStore::Remove(const std::filesystem::path& path) const {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec) {
    INSTALL_LOG_WARN("Failed to remove cached file", {StringField("path", path.string()), StringField("error", ec.message())});
    return false;
  }
  if (removed) {
    INSTALL_LOG_DEBUG("Removed cached file", {StringField("path", path.string())});
  }
  return removed;
}

} // namespace install::content
