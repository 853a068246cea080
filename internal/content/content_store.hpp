#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace install::content {

/*
  Local cache of downloaded artifacts and expansion files.

  The cache path for an identity is derived only here:
      <root>/<host>-<port>/<url path>
  Every other component asks ResolvePath() instead of building paths.
*/
class ContentStore {
 public:
  explicit ContentStore(std::filesystem::path root);

  // Deterministic. Throws std::invalid_argument for identities that are not
  // absolute URLs or that would escape the cache root.
  std::filesystem::path ResolvePath(const std::string& identity) const;

  bool     Exists(const std::filesystem::path& path) const;
  uint64_t SizeOf(const std::filesystem::path& path) const;

  // Full-file hash comparison; only hashes when the size matches.
  bool IsValid(const std::filesystem::path& path, uint64_t expected_size, const std::string& expected_sha256) const;

  bool Remove(const std::filesystem::path& path) const;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace install::content
