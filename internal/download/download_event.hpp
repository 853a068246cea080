#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace install::download {

enum class DownloadEventKind : std::uint8_t {
  kStarted     = 0,
  kProgress    = 1,
  kCompleted   = 2,
  kInterrupted = 3,
};

/*
  Lifecycle signal for one queued download, keyed by identity on the bus.

  Per identity: started, progress*, then exactly one of completed or
  interrupted.
*/
struct DownloadEvent {
  DownloadEventKind kind = DownloadEventKind::kStarted;

  uint64_t bytes_read  = 0;
  uint64_t total_bytes = 0;

  // completed only
  std::string local_path;
  // interrupted only, may be empty
  std::string message;
};

inline DownloadEvent Started() {
  return DownloadEvent{DownloadEventKind::kStarted};
}

inline DownloadEvent Progress(uint64_t bytes_read, uint64_t total_bytes) {
  DownloadEvent event{DownloadEventKind::kProgress};
  event.bytes_read  = bytes_read;
  event.total_bytes = total_bytes;
  return event;
}

inline DownloadEvent Completed(std::string local_path) {
  DownloadEvent event{DownloadEventKind::kCompleted};
  event.local_path = std::move(local_path);
  return event;
}

inline DownloadEvent Interrupted(std::string message = {}) {
  DownloadEvent event{DownloadEventKind::kInterrupted};
  event.message = std::move(message);
  return event;
}

const char* ToString(DownloadEventKind kind);

} // namespace install::download
