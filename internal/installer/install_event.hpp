#pragma once

#include <cstdint>
#include <string>

#include "install/manager/v1/status.pb.h"

namespace install::installer {

enum class InstallEventKind : std::uint8_t {
  kStarted                 = 0,
  kComplete                = 1,
  kInterrupted             = 2,
  kUserInteractionRequired = 3,
};

/*
  Installer lifecycle signal, keyed by identity on the bus.
*/
struct InstallEvent {
  InstallEventKind kind = InstallEventKind::kStarted;

  // interrupted: empty means the user backed out
  std::string error_message;

  // user interaction required: what the observer must surface
  install::manager::v1::PendingAction action;
};

const char* ToString(InstallEventKind kind);

} // namespace install::installer
