#include "file_download_gateway.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/content/content_store.hpp"
#include "internal/observability/logging.hpp"

namespace install::download {

using install::observability::StringField;
using install::observability::UintField;

namespace {

constexpr char kFileScheme[] = "file://";

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string PercentDecode(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size()) {
      const int hi = HexValue(in[i + 1]);
      const int lo = HexValue(in[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

// file:///abs/path and file://localhost/abs/path
std::filesystem::path SourcePath(const std::string& identity) {
  if (identity.rfind(kFileScheme, 0) != 0) {
    throw std::invalid_argument("unsupported scheme");
  }

  auto rest = identity.substr(sizeof(kFileScheme) - 1);
  if (rest.rfind("localhost/", 0) == 0) {
    rest.erase(0, sizeof("localhost") - 1);
  }
  if (rest.empty() || rest.front() != '/') {
    throw std::invalid_argument("file URL must name an absolute path");
  }
  return PercentDecode(rest);
}

} // namespace

FileDownloadGateway::FileDownloadGateway(std::shared_ptr<install::content::ContentStore> store, uint32_t workers,
                                         uint64_t chunk_size_bytes)
    : store_(std::move(store)), worker_count_(workers == 0 ? 1 : workers), chunk_size_bytes_(chunk_size_bytes == 0 ? 64 * 1024 : chunk_size_bytes) {
}

FileDownloadGateway::~FileDownloadGateway() {
  Stop();
}

void FileDownloadGateway::Start() {
  if (running_.exchange(true)) return;
  for (uint32_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back(&FileDownloadGateway::Run, this);
  }
}

void FileDownloadGateway::Stop() {
  scheduler_.Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void FileDownloadGateway::Queue(const std::string& identity) {
  {
    std::lock_guard lock(transfers_mutex_);
    auto [it, inserted] = transfers_.try_emplace(identity, std::make_shared<Transfer>());
    if (!inserted) {
      INSTALL_LOG_DEBUG("Download already queued or active", {StringField("identity", identity)});
      return;
    }
  }

  INSTALL_LOG_DEBUG("Download queued", {StringField("identity", identity)});
  scheduler_.Enqueue(DownloadTask{identity});
}

void FileDownloadGateway::Cancel(const std::string& identity) {
  std::shared_ptr<Transfer> transfer;
  {
    std::lock_guard lock(transfers_mutex_);
    auto            it = transfers_.find(identity);
    if (it == transfers_.end()) return;

    if (!it->second->active && scheduler_.Remove(identity)) {
      transfers_.erase(it);
      INSTALL_LOG_DEBUG("Queued download dropped", {StringField("identity", identity)});
      return;
    }
    transfer = it->second;
  }

  // picked up by a worker already; it stops at the next chunk boundary
  transfer->cancelled = true;
}

bool FileDownloadGateway::IsQueuedOrActive(const std::string& identity) const {
  std::lock_guard lock(transfers_mutex_);
  return transfers_.count(identity) > 0;
}

install::events::Subscription FileDownloadGateway::Subscribe(const std::string& identity, Handler handler) {
  return bus_.Subscribe(identity, std::move(handler));
}

void FileDownloadGateway::Run() {
  while (running_) {
    auto task = scheduler_.Dequeue();
    if (!task) break;

    std::shared_ptr<Transfer> transfer;
    {
      std::lock_guard lock(transfers_mutex_);
      auto            it = transfers_.find(task->identity);
      if (it == transfers_.end()) continue;
      transfer         = it->second;
      transfer->active = true;
    }

    Execute(task->identity, transfer);
  }
}

void FileDownloadGateway::Execute(const std::string& identity, const std::shared_ptr<Transfer>& transfer) {
  if (transfer->cancelled) {
    Finish(identity, transfer, Interrupted("cancelled"));
    return;
  }

  std::filesystem::path source;
  std::filesystem::path destination;
  try {
    source      = SourcePath(identity);
    destination = store_->ResolvePath(identity);
  } catch (const std::invalid_argument& e) {
    INSTALL_LOG_WARN("Download rejected", {StringField("identity", identity), StringField("error", e.what())});
    Finish(identity, transfer, Interrupted(e.what()));
    return;
  }

  bus_.Publish(identity, Started());

  try {
    Copy(identity, source, destination, transfer);
  } catch (const std::exception& e) {
    INSTALL_LOG_WARN("Download failed", {StringField("identity", identity), StringField("error", e.what())});
    std::error_code ec;
    std::filesystem::remove(destination.string() + ".part", ec);
    Finish(identity, transfer, Interrupted(e.what()));
  }
}

void FileDownloadGateway::Copy(const std::string& identity, const std::filesystem::path& source, const std::filesystem::path& destination,
                               const std::shared_ptr<Transfer>& transfer) {
  const auto total_bytes = static_cast<uint64_t>(std::filesystem::file_size(source));

  std::ifstream in(source, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open source " + source.string());
  }

  std::filesystem::create_directories(destination.parent_path());
  const auto    part_path = std::filesystem::path(destination.string() + ".part");
  std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open destination " + part_path.string());
  }

  std::string buffer(chunk_size_bytes_, '\0');
  uint64_t    bytes_read = 0;
  while (in) {
    if (transfer->cancelled) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(part_path, ec);
      INSTALL_LOG_INFO("Download cancelled", {StringField("identity", identity), UintField("bytes_read", bytes_read)});
      Finish(identity, transfer, Interrupted("cancelled"));
      return;
    }

    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = in.gcount();
    if (count <= 0) break;

    out.write(buffer.data(), count);
    if (!out) {
      throw std::runtime_error("write failed for " + part_path.string());
    }
    bytes_read += static_cast<uint64_t>(count);
    bus_.Publish(identity, Progress(bytes_read, total_bytes));
  }
  if (in.bad()) {
    throw std::runtime_error("read failed for " + source.string());
  }

  out.close();
  if (!out) {
    throw std::runtime_error("flush failed for " + part_path.string());
  }
  std::filesystem::rename(part_path, destination);

  INSTALL_LOG_INFO("Download completed", {StringField("identity", identity), StringField("path", destination.string()),
                                          UintField("size_bytes", bytes_read)});
  Finish(identity, transfer, Completed(destination.string()));
}

void FileDownloadGateway::Finish(const std::string& identity, const std::shared_ptr<Transfer>& transfer, const DownloadEvent& event) {
  {
    std::lock_guard lock(transfers_mutex_);
    auto            it = transfers_.find(identity);
    if (it != transfers_.end() && it->second == transfer) transfers_.erase(it);
  }
  bus_.Publish(identity, event);
}

} // namespace install::download
