#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace install::config {

namespace {

using google::protobuf::Value;

// quoted scalars stay strings; plain ones may be bool or number.
// "off" / "on" are left alone so log levels survive.
Value ScalarToValue(const YAML::Node& node) {
  Value       value;
  const auto& text = node.Scalar();
  if (node.Tag() == "!" || text.empty()) {
    value.set_string_value(text);
    return value;
  }

  if (text == "true" || text == "True" || text == "yes") {
    value.set_bool_value(true);
    return value;
  }
  if (text == "false" || text == "False" || text == "no") {
    value.set_bool_value(false);
    return value;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0') {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

Value ToValue(const YAML::Node& node) {
  Value value;
  if (node.IsNull()) {
    value.set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    value = ScalarToValue(node);
  } else if (node.IsSequence()) {
    auto* items = value.mutable_list_value();
    for (const auto& item : node) *items->add_values() = ToValue(item);
  } else if (node.IsMap()) {
    auto& fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) fields[entry.first.Scalar()] = ToValue(entry.second);
  } else {
    throw std::runtime_error("Unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
  return value;
}

install::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  install::runtime::config::RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(&config);
    return config;
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(ToValue(yaml), &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

install::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

install::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(install::runtime::config::RuntimeConfig* config) {
  if (config->cache().root_path().empty()) {
    config->mutable_cache()->set_root_path(kDefaultCacheRoot);
  }

  auto* downloads = config->mutable_downloads();
  if (downloads->workers() == 0) downloads->set_workers(kDefaultDownloadWorkers);
  if (downloads->chunk_size_bytes() == 0) downloads->set_chunk_size_bytes(kDefaultChunkSizeBytes);

  auto* installer = config->mutable_installer();
  if (installer->install_root().empty()) installer->set_install_root(kDefaultInstallRoot);
  if (installer->installer_name().empty()) installer->set_installer_name(kDefaultInstallerName);

  auto* spool = config->mutable_spool();
  if (spool->root_path().empty()) spool->set_root_path(kDefaultSpoolRoot);
  if (spool->poll_interval_ms() == 0) spool->set_poll_interval_ms(kDefaultPollIntervalMs);
}

} // namespace install::config
