#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

namespace {

using install::observability::StringField;

volatile std::sig_atomic_t g_stop_requested = 0;

void RequestStop(int) {
  g_stop_requested = 1;
}

std::optional<std::string> ConfigPathFromArgs(int argc, char** argv) {
  if (argc == 2 && argv[1][0] != '-') return std::string(argv[1]);
  if (argc == 3 && std::string(argv[1]) == "--config") return std::string(argv[2]);
  return std::nullopt;
}

int Serve(const std::string& config_path) {
  const auto config = install::config::ConfigLoader::LoadFromYaml(config_path);
  install::observability::InitializeLogging(config);

  auto app = install::factory::Build(config);

  std::signal(SIGINT, RequestStop);
  std::signal(SIGTERM, RequestStop);

  app.Start();
  INSTALL_LOG_INFO("Install manager running", {StringField("config", config_path),
                                               StringField("spool", config.spool().root_path())});

  while (g_stop_requested == 0) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  INSTALL_LOG_INFO("Stop requested, draining");
  app.Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const auto config_path = ConfigPathFromArgs(argc, argv);
  if (!config_path) {
    std::cerr << "usage: " << argv[0] << " [--config] <config.yaml>\n";
    return 1;
  }

  int code = 0;
  try {
    code = Serve(*config_path);
  } catch (const std::exception& e) {
    INSTALL_LOG_ERROR("Install manager failed", {StringField("error", e.what())});
    code = 2;
  }

  install::observability::ShutdownLogging();
  return code;
}
