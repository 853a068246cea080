#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "install/manager/v1/request.pb.h"
#include "internal/download/download_event.hpp"
#include "internal/events/subscription.hpp"

namespace install::download {
class DownloadGateway;
}
namespace install::status {
class StatusRegistry;
}

namespace install::expansion {

/*
  Fetches, verifies and places the main/patch expansion files of an artifact.

  Each file is downloaded under its own URL. On completion it is hashed,
  moved to its destination and every other file previously placed for the
  same role in that directory is deleted, so at most one file per role
  exists. The role -> path index is kept here; the first placement for a
  directory in this process also prunes files left by earlier runs, matched
  by the role's filename prefix ("main." / "patch.").

  Best effort: mismatches, interruptions and I/O errors are logged and never
  reach the artifact's own install. Nothing is retried.
*/
class ExpansionCoordinator {
 public:
  ExpansionCoordinator(std::shared_ptr<install::download::DownloadGateway> gateway, std::shared_ptr<install::status::StatusRegistry> registry);

  // Queues each expansion file of the request whose destination is absent.
  // Returns how many downloads were queued.
  std::size_t Fetch(const install::manager::v1::InstallRequest& request);

  // Cancels expansion downloads still pending for the artifact.
  void Cancel(const std::string& artifact_identity);

  std::size_t PendingFor(const std::string& artifact_identity) const;

  std::optional<std::filesystem::path> PlacedPath(const std::filesystem::path& directory, install::manager::v1::ExpansionRole role) const;

 private:
  struct PendingFetch {
    std::string                         artifact_identity;
    install::manager::v1::ExpansionFile file;
    install::events::Subscription       subscription;
  };

  using RoleKey = std::pair<std::string, int>;

  bool FetchOne(const std::string& artifact_identity, const install::manager::v1::ExpansionFile& file);
  void OnDownloadEvent(const std::string& url, const install::download::DownloadEvent& event);
  void Place(const PendingFetch& fetch, const std::filesystem::path& downloaded);
  void PruneSiblings(const std::filesystem::path& destination, install::manager::v1::ExpansionRole role);

  std::shared_ptr<install::download::DownloadGateway> gateway_;
  std::shared_ptr<install::status::StatusRegistry>    registry_;

  mutable std::mutex                            mutex_;
  std::unordered_map<std::string, PendingFetch> pending_;

  mutable std::mutex                       placement_mutex_;
  std::map<RoleKey, std::filesystem::path> placed_;
};

// Filename prefix identifying a role's files on disk.
const char* RolePrefix(install::manager::v1::ExpansionRole role);

} // namespace install::expansion
