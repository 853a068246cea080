#include "download_event.hpp"

namespace install::download {

const char* ToString(DownloadEventKind kind) {
  switch (kind) {
    case DownloadEventKind::kStarted:
      return "started";
    case DownloadEventKind::kProgress:
      return "progress";
    case DownloadEventKind::kCompleted:
      return "completed";
    case DownloadEventKind::kInterrupted:
      return "interrupted";
  }
  return "unknown";
}

} // namespace install::download
