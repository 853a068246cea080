#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "install_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(cache:
  root_path: "C:\\cache\\\"quoted\"\\dir"
installer:
  install_root: "/srv/apps"
  require_confirmation: true
)");

  auto config = install::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.cache().root_path() == "C:\\cache\\\"quoted\"\\dir");
  assert(config.installer().install_root() == "/srv/apps");
  assert(config.installer().require_confirmation());
}

void TestQuotedNumbersStayStrings() {
  auto config = install::config::ConfigLoader::LoadFromYamlString(R"(installer:
  installer_name: "1234"
)");
  assert(config.installer().installer_name() == "1234");
}

void TestBooleanSpellingsAndLogging() {
  auto config = install::config::ConfigLoader::LoadFromYamlString(R"(logging:
  level: off
  file_path: /tmp/install-manager.log
installer:
  require_confirmation: yes
)");
  assert(config.logging().level() == "off");
  assert(config.logging().file_path() == "/tmp/install-manager.log");
  assert(config.installer().require_confirmation());
}

void TestNumericFields() {
  auto config = install::config::ConfigLoader::LoadFromYamlString(R"(downloads:
  workers: 4
  chunk_size_bytes: 4096
spool:
  root_path: /tmp/spool
  poll_interval_ms: 50
)");
  assert(config.downloads().workers() == 4);
  assert(config.downloads().chunk_size_bytes() == 4096);
  assert(config.spool().root_path() == "/tmp/spool");
  assert(config.spool().poll_interval_ms() == 50);
}

void TestDefaultsForEmptyDocument() {
  auto config = install::config::ConfigLoader::LoadFromYamlString("");
  assert(config.cache().root_path() == install::config::kDefaultCacheRoot);
  assert(config.installer().install_root() == install::config::kDefaultInstallRoot);
  assert(config.installer().installer_name() == install::config::kDefaultInstallerName);
  assert(!config.installer().require_confirmation());
  assert(config.spool().root_path() == install::config::kDefaultSpoolRoot);
  assert(config.downloads().workers() == install::config::kDefaultDownloadWorkers);
  assert(config.downloads().chunk_size_bytes() == install::config::kDefaultChunkSizeBytes);
  assert(config.spool().poll_interval_ms() == install::config::kDefaultPollIntervalMs);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(cache:
  root_path: /tmp/cache
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)install::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)install::config::ConfigLoader::LoadFromYaml("/nonexistent/install-manager/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestBooleanSpellingsAndLogging();
  TestNumericFields();
  TestDefaultsForEmptyDocument();
  TestUnknownFieldsAreRejected();
  TestMissingFileThrows();

  std::cout << "install_manager_unit_config_loader: pass\n";
  return 0;
}
