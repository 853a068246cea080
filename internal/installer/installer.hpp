#pragma once

#include <filesystem>
#include <string>

#include "install/manager/v1/request.pb.h"
#include "internal/events/event_bus.hpp"
#include "internal/installer/install_event.hpp"

namespace install::installer {

/*
  Boundary to the platform package installer.

  Install() returns immediately; progress is reported as InstallEvents on
  the identity's stream.
*/
class Installer {
 public:
  using Handler = install::events::EventBus<InstallEvent>::Handler;

  virtual ~Installer() = default;

  virtual void Install(const std::filesystem::path& local_file, const std::string& identity,
                       const install::manager::v1::InstallRequest& request) = 0;

  // Answers a user-interaction-required prompt.
  virtual void Confirm(const std::string& identity) = 0;
  virtual void Decline(const std::string& identity) = 0;

  virtual install::events::Subscription Subscribe(const std::string& identity, Handler handler) = 0;
};

} // namespace install::installer
