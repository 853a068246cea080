#pragma once

#include <memory>

#include "config/config.pb.h"

namespace install::content {
class ContentStore;
}
namespace install::download {
class FileDownloadGateway;
}
namespace install::installer {
class DirectoryInstaller;
class DirectoryPackageRegistry;
}
namespace install::status {
class StatusRegistry;
}
namespace install::expansion {
class ExpansionCoordinator;
}
namespace install::core {
class InstallOrchestrator;
}
namespace install::runtime {
class RequestSpool;
class Host;
}

namespace install::factory {

/*
  Owns every long-lived component of the process.

  Build() is the composition root and the only place that knows the
  concrete gateway, installer and registry types. Background workers are
  started by Start(); Stop() halts them host first, so no new work arrives
  while the workers drain.
*/
struct Application {
  std::shared_ptr<install::content::ContentStore>               store;
  std::shared_ptr<install::download::FileDownloadGateway>       gateway;
  std::shared_ptr<install::installer::DirectoryInstaller>       installer;
  std::shared_ptr<install::installer::DirectoryPackageRegistry> packages;
  std::shared_ptr<install::status::StatusRegistry>              registry;
  std::shared_ptr<install::expansion::ExpansionCoordinator>     expansion;
  std::shared_ptr<install::core::InstallOrchestrator>           orchestrator;
  std::shared_ptr<install::runtime::RequestSpool>               spool;
  std::shared_ptr<install::runtime::Host>                       host;

  void Start();
  void Stop();
};

Application Build(const install::runtime::config::RuntimeConfig& config);

} // namespace install::factory
