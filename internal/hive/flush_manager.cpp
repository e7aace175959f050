#include "flush_manager.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/hive/dirty_tracker.hpp"
#include "internal/hive/export_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace swarm::hive {

namespace {

// Advisory lock shared by every process flushing the same file.
class ExportFileLock {
 public:
  explicit ExportFileLock(const std::string& export_path) : path_(export_path + ".lock") {
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw util::ExportError("cannot open " + path_ + ": " + std::strerror(errno));
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd_);
      throw util::ExportError("cannot lock " + path_ + ": " + std::strerror(err));
    }
  }

  ~ExportFileLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  ExportFileLock(const ExportFileLock&)            = delete;
  ExportFileLock& operator=(const ExportFileLock&) = delete;

 private:
  std::string path_;
  int         fd_ = -1;
};

struct ExistingFile {
  std::map<std::string, std::string> lines;     // id -> raw text
  std::vector<std::string>           unkeyed;   // kept verbatim after keyed lines
};

ExistingFile ReadExisting(const std::string& path) {
  ExistingFile existing;

  std::error_code ec;
  const auto      status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) return existing;
  if (ec) throw util::ExportError("cannot stat " + path + ": " + ec.message());
  if (!std::filesystem::is_regular_file(status)) throw util::ExportError(path + " is not a regular file");

  std::ifstream in(path);
  if (!in) throw util::ExportError("cannot open " + path);

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;

    auto id = ExtractId(line);
    if (!id) {
      SWARM_LOG_WARN("export line without id kept verbatim", {observability::StringField("path", path)});
      existing.unkeyed.push_back(line);
      continue;
    }
    existing.lines[*id] = line;
  }
  if (in.bad()) throw util::ExportError("read failed for " + path);
  return existing;
}

void WriteAtomically(const std::string& path, const ExistingFile& content) {
  const auto target = std::filesystem::path(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }

  const auto tmp_path = path + ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw util::ExportError("cannot open " + tmp_path);

    for (const auto& [id, line] : content.lines) {
      out << line << '\n';
    }
    for (const auto& line : content.unkeyed) {
      out << line << '\n';
    }

    out.flush();
    if (!out) throw util::ExportError("write failed for " + tmp_path);
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, target, ec);
  if (ec) {
    std::filesystem::remove(tmp_path);
    throw util::ExportError("rename to " + path + " failed: " + ec.message());
  }
}

} // namespace

FlushManager::FlushManager(service::ServiceContext ctx, std::shared_ptr<DirtyTracker> dirty, std::string export_path)
    : ctx_(std::move(ctx)), dirty_(std::move(dirty)), export_path_(std::move(export_path)) {
  if (export_path_.empty()) throw std::invalid_argument("FlushManager: export path is required");
}

FlushResult FlushManager::Flush() {
  return Flush(ctx_.project_key);
}

FlushResult FlushManager::Flush(const std::string& project_key) {
  observability::SpanScope span("hive.flush");
  span.SetAttribute("hive.project", project_key);
  const auto started_at = std::chrono::steady_clock::now();

  ExportFileLock lock(export_path_);

  FlushResult result;

  std::vector<db::model::DirtyRecord>  markers;
  std::map<std::string, std::string>   fresh;
  std::vector<db::model::DirtyRecord>  exported;

  {
    auto tx = ctx_.repository->Begin(db::TxMode::kRead);
    markers = dirty_->GetDirty(*tx, project_key);

    for (const auto& marker : markers) {
      try {
        auto cell = ctx_.repository->GetCell(*tx, marker.cell_id);
        if (!cell) throw util::NotFound("cell " + marker.cell_id + " not found");

        fresh[marker.cell_id] = RenderLine(BuildExport(*ctx_.repository, *tx, *cell));
        exported.push_back(marker);
      } catch (const std::exception& e) {
        ++result.failed_count;
        SWARM_LOG_ERROR("cell export failed", {observability::StringField("cell_id", marker.cell_id),
                                               observability::StringField("error", e.what())});
      }
    }
    tx->Commit();
  }

  if (markers.empty()) return result;

  if (!exported.empty()) {
    auto content = ReadExisting(export_path_);
    for (auto& [id, line] : fresh) {
      content.lines[id] = std::move(line);
    }
    WriteAtomically(export_path_, content);

    util::RetryTransient(ctx_.store_retry, "dirty clear", [&] {
      auto tx = ctx_.repository->Begin();
      for (const auto& marker : exported) {
        dirty_->Clear(*tx, marker);
      }
      tx->Commit();
    });
  }

  result.exported_count = static_cast<int64_t>(exported.size());
  observability::Metrics::Instance().RecordFlush(
      static_cast<std::uint64_t>(result.exported_count), static_cast<std::uint64_t>(result.failed_count),
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  SWARM_LOG_INFO("flush complete", {observability::StringField("project_key", project_key),
                                    observability::StringField("path", export_path_),
                                    observability::IntField("exported", result.exported_count),
                                    observability::IntField("failed", result.failed_count)});
  return result;
}

std::string FlushManager::ExportAll(const std::string& project_key, bool include_deleted) {
  db::CellFilter filter;
  filter.project_key     = project_key;
  filter.include_deleted = include_deleted;

  std::map<std::string, std::string> lines;

  auto tx = ctx_.repository->Begin(db::TxMode::kRead);
  for (const auto& cell : ctx_.repository->QueryCells(*tx, filter)) {
    lines[cell.id] = RenderLine(BuildExport(*ctx_.repository, *tx, cell));
  }
  tx->Commit();

  std::string out;
  for (const auto& [id, line] : lines) {
    out += line;
    out += '\n';
  }
  return out;
}

} // namespace swarm::hive
