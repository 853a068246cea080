#include "install_event.hpp"

namespace install::installer {

const char* ToString(InstallEventKind kind) {
  switch (kind) {
    case InstallEventKind::kStarted:
      return "install-started";
    case InstallEventKind::kComplete:
      return "install-complete";
    case InstallEventKind::kInterrupted:
      return "install-interrupted";
    case InstallEventKind::kUserInteractionRequired:
      return "user-interaction-required";
  }
  return "unknown";
}

} // namespace install::installer
