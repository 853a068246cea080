#pragma once

#include "install/manager/v1/status.pb.h"

namespace install::model {

using install::manager::v1::InstallStatus;

constexpr bool IsTerminal(InstallStatus status) {
  return status == install::manager::v1::INSTALL_STATUS_INSTALLED || status == install::manager::v1::INSTALL_STATUS_ERROR;
}

constexpr bool IsIntermediate(InstallStatus status) {
  return status != install::manager::v1::INSTALL_STATUS_UNSPECIFIED && !IsTerminal(status);
}

/*
  Allowed per-identity transitions:

    Unknown -> Downloading -> ReadyToInstall -> Installing -> Installed
    Unknown -> ReadyToInstall          (cached artifact)
    Downloading -> Downloading         (repeated started, refreshes the action)
    Downloading -> Unknown             (download interrupted)
    non-terminal -> Error
    any -> Installed                   (package registry reports the package)

  ReadyToInstall and Installing only re-enter ReadyToInstall through
  CanAwaitUser. Anything else is a stale or reordered event and is dropped.
*/
constexpr bool CanTransition(InstallStatus from, InstallStatus to) {
  using namespace install::manager::v1;

  if (to == INSTALL_STATUS_UNSPECIFIED) {
    return false;
  }
  if (to == INSTALL_STATUS_INSTALLED) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == INSTALL_STATUS_ERROR) {
    return true;
  }

  switch (to) {
    case INSTALL_STATUS_UNKNOWN:
      return from == INSTALL_STATUS_DOWNLOADING;
    case INSTALL_STATUS_DOWNLOADING:
      return from == INSTALL_STATUS_UNKNOWN || from == INSTALL_STATUS_DOWNLOADING;
    case INSTALL_STATUS_READY_TO_INSTALL:
      return from == INSTALL_STATUS_UNKNOWN || from == INSTALL_STATUS_DOWNLOADING;
    case INSTALL_STATUS_INSTALLING:
      return from == INSTALL_STATUS_READY_TO_INSTALL;
    default:
      return false;
  }
}

// The installer may ask for user input (again) once it owns the artifact.
constexpr bool CanAwaitUser(InstallStatus from) {
  return from == install::manager::v1::INSTALL_STATUS_READY_TO_INSTALL || from == install::manager::v1::INSTALL_STATUS_INSTALLING;
}

} // namespace install::model
