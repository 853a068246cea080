#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "install/manager/v1/request.pb.h"

namespace install::runtime {

/*
  Durable store of accepted install requests, owned by the host.

  Each request is written as a serialized InstallRequest to
  <root>/pending/<sha256(identity)>.pb through a staging file and rename,
  so a crash never leaves a half-written entry behind. On startup the host
  replays everything still pending as a redelivery.
*/
class RequestSpool {
 public:
  explicit RequestSpool(std::filesystem::path root);

  void Add(const install::manager::v1::InstallRequest& request);

  // Returns false when nothing was stored for the identity.
  bool Remove(const std::string& identity);

  bool Contains(const std::string& identity) const;

  // Unreadable entries are logged and skipped.
  std::vector<install::manager::v1::InstallRequest> LoadAll() const;

  const std::filesystem::path& PendingDir() const {
    return pending_dir_;
  }

 private:
  std::filesystem::path EntryPath(const std::string& identity) const;

  std::filesystem::path pending_dir_;
  mutable std::mutex    mutex_;
};

} // namespace install::runtime
