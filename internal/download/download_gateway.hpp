#pragma once

#include <string>

#include "internal/download/download_event.hpp"
#include "internal/events/event_bus.hpp"

namespace install::download {

/*
  Boundary to the transfer engine.

  Downloads are addressed only by identity. The engine writes each finished
  file to the ContentStore path of its identity and reports it in the
  completed event.
*/
class DownloadGateway {
 public:
  using Handler = install::events::EventBus<DownloadEvent>::Handler;

  virtual ~DownloadGateway() = default;

  // No-op when the identity is already queued or active.
  virtual void Queue(const std::string& identity) = 0;

  // No-op when nothing is queued or active for the identity.
  virtual void Cancel(const std::string& identity) = 0;

  virtual bool IsQueuedOrActive(const std::string& identity) const = 0;

  virtual install::events::Subscription Subscribe(const std::string& identity, Handler handler) = 0;
};

} // namespace install::download
