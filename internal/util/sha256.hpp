#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace install::util {

/*
  SHA-256 over OpenSSL EVP. Digests are lowercase hex.

  Hashing always covers a complete file; there is no streaming API.
*/

std::string Sha256Hex(std::string_view data);

// Throws std::runtime_error when the file cannot be read.
std::string Sha256File(const std::filesystem::path& path);

// Case-insensitive comparison of two hex digests. An empty expected digest
// never matches.
bool DigestEquals(std::string_view expected, std::string_view actual);

} // namespace install::util
