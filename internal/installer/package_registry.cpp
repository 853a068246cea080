#include "package_registry.hpp"

#include <fstream>
#include <stdexcept>

#include "internal/content/path_utils.hpp"
#include "internal/observability/logging.hpp"

namespace install::installer {

using install::observability::StringField;

namespace {

constexpr char kInstallerFile[] = "INSTALLER";

} // namespace

DirectoryPackageRegistry::DirectoryPackageRegistry(std::filesystem::path root) : root_(std::move(root)) {
}

void DirectoryPackageRegistry::SetInstaller(const std::string& package_name, const std::string& installer_name) {
  const auto dir = install::content::PackageDir(root_, package_name);
  std::filesystem::create_directories(dir);

  const auto target  = dir / kInstallerFile;
  const auto staging = install::content::StagingPath(target);
  {
    std::ofstream out(staging, std::ios::trunc);
    out << installer_name << '\n';
    if (!out) {
      throw std::runtime_error("failed to write " + staging.string());
    }
  }
  std::filesystem::rename(staging, target);

  INSTALL_LOG_DEBUG("Recorded installer", {StringField("package", package_name), StringField("installer", installer_name)});
}

std::optional<std::string> DirectoryPackageRegistry::InstallerOf(const std::string& package_name) const {
  std::ifstream in(install::content::PackageDir(root_, package_name) / kInstallerFile);
  if (!in) return std::nullopt;

  std::string installer_name;
  std::getline(in, installer_name);
  if (installer_name.empty()) return std::nullopt;
  return installer_name;
}

} // namespace install::installer
