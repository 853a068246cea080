#include "sha256.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace install::util {
namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtxPtr NewSha256Context() {
  EvpMdCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("Failed to update SHA256");
  }
}

std::string Finalize(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
    throw std::runtime_error("Failed to finalize SHA256");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256Context();
  Update(ctx.get(), data.data(), data.size());
  return Finalize(ctx.get());
}

std::string Sha256File(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file for hashing: " + path.string());
  }

  auto              ctx = NewSha256Context();
  std::vector<char> buffer(kReadBufferSize);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto read = file.gcount();
    if (read > 0) {
      Update(ctx.get(), buffer.data(), static_cast<std::size_t>(read));
    }
  }
  if (file.bad()) {
    throw std::runtime_error("Failed to read file for hashing: " + path.string());
  }

  return Finalize(ctx.get());
}

bool DigestEquals(std::string_view expected, std::string_view actual) {
  if (expected.empty() || expected.size() != actual.size()) {
    return false;
  }
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(expected[i])) != std::tolower(static_cast<unsigned char>(actual[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace install::util
