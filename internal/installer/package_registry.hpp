#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace install::installer {

/*
  "Who installed this package" bookkeeping.
*/
class PackageRegistry {
 public:
  virtual ~PackageRegistry() = default;

  virtual void                       SetInstaller(const std::string& package_name, const std::string& installer_name) = 0;
  virtual std::optional<std::string> InstallerOf(const std::string& package_name) const                              = 0;
};

/*
  Keeps the installer name in <root>/<package>/INSTALLER next to the
  installed files.
*/
class DirectoryPackageRegistry final : public PackageRegistry {
 public:
  explicit DirectoryPackageRegistry(std::filesystem::path root);

  void                       SetInstaller(const std::string& package_name, const std::string& installer_name) override;
  std::optional<std::string> InstallerOf(const std::string& package_name) const override;

 private:
  std::filesystem::path root_;
};

} // namespace install::installer
