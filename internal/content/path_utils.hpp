#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace install::content {

// Package names become directory names under the install root.
inline void ValidatePackageName(const std::string& package_name) {
  if (package_name.empty()) {
    throw std::invalid_argument("package name must not be empty");
  }
  for (char c : package_name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("package name contains invalid character");
    }
  }
  if (package_name == "." || package_name == "..") {
    throw std::invalid_argument("package name must not be a relative path component");
  }
}

inline std::filesystem::path PackageDir(const std::filesystem::path& root, const std::string& package_name) {
  ValidatePackageName(package_name);
  return root / package_name;
}

// Sibling used while a file is being written; renamed over the target when complete.
inline std::filesystem::path StagingPath(const std::filesystem::path& target) {
  return std::filesystem::path(target.string() + ".tmp");
}

} // namespace install::content
