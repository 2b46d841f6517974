#include "walden/wal/segment.hpp"
#include "walden/wal/sync.hpp"
#include "walden/core/log.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <regex>
#include <sstream>

namespace walden::wal {

namespace {
auto epoch_ms_now() -> std::uint64_t {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}
}

auto segment_file_name(std::uint64_t epoch_ms, std::uint64_t start_sequence) -> std::string {
  std::ostringstream oss;
  oss << "wal_" << std::setw(13) << std::setfill('0') << epoch_ms
      << "_" << std::setw(10) << std::setfill('0') << start_sequence << ".log";
  return oss.str();
}

auto parse_segment_name(std::string_view file_name) -> std::optional<SegmentName> {
  static const std::regex rx("^wal_([0-9]{13})_([0-9]{10,})\\.log$");
  std::string name(file_name);
  std::smatch m;
  if (!std::regex_match(name, m, rx)) return std::nullopt;
  try {
    return SegmentName{std::stoull(m[1].str()), std::stoull(m[2].str())};
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

auto list_segments(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::filesystem::path>, core::error> {
  using core::error; using core::error_code;
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) return files;
  std::filesystem::directory_iterator it(dir, ec), end;
  if (ec) return std::unexpected(error{error_code::io_failed, "list segments failed", "wal.segment"});
  for (; it != end; it.increment(ec)) {
    if (ec) return std::unexpected(error{error_code::io_failed, "list segments failed", "wal.segment"});
    if (!it->is_regular_file()) continue;
    if (parse_segment_name(it->path().filename().string())) files.push_back(it->path());
  }
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b){
    return a.filename().string() < b.filename().string();
  });
  return files;
}

SegmentWriter::~SegmentWriter(){ if (out_.is_open()) out_.close(); }

SegmentWriter::SegmentWriter(SegmentWriter&& o) noexcept
  : dir_(std::move(o.dir_)),
    path_(std::move(o.path_)),
    max_bytes_(o.max_bytes_),
    cur_bytes_(o.cur_bytes_),
    last_epoch_ms_(o.last_epoch_ms_),
    stats_(o.stats_),
    out_(std::move(o.out_)) {}

SegmentWriter& SegmentWriter::operator=(SegmentWriter&& o) noexcept {
  if (this != &o) {
    if (out_.is_open()) out_.close();
    dir_ = std::move(o.dir_);
    path_ = std::move(o.path_);
    max_bytes_ = o.max_bytes_;
    cur_bytes_ = o.cur_bytes_;
    last_epoch_ms_ = o.last_epoch_ms_;
    stats_ = o.stats_;
    out_ = std::move(o.out_);
  }
  return *this;
}

auto SegmentWriter::open(const std::filesystem::path& dir, std::uint64_t max_segment_bytes, std::uint64_t next_sequence)
    -> std::expected<SegmentWriter, core::error> {
  using core::error; using core::error_code;
  SegmentWriter w;
  w.dir_ = dir;
  w.max_bytes_ = max_segment_bytes;
  std::error_code ec;
  std::filesystem::create_directories(w.dir_, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "mkdir segments failed", "wal.segment"});

  auto existing = list_segments(w.dir_);
  if (!existing) return std::unexpected(existing.error());
  // New names must sort after every segment already on disk, whatever the clock says now.
  for (const auto& p : *existing) {
    if (auto n = parse_segment_name(p.filename().string())) w.last_epoch_ms_ = std::max(w.last_epoch_ms_, n->epoch_ms);
  }
  if (!existing->empty()) {
    const auto& newest = existing->back();
    auto n = parse_segment_name(newest.filename().string());
    std::error_code sec;
    const auto newest_bytes = std::filesystem::file_size(newest, sec);
    if (n && n->start_sequence == next_sequence && !sec && newest_bytes == 0) {
      if (auto r = w.attach(newest); !r) return std::unexpected(r.error());
      return w;
    }
  }
  if (auto r = w.open_segment(next_sequence); !r) return std::unexpected(r.error());
  return w;
}

auto SegmentWriter::open_segment(std::uint64_t next_sequence) -> std::expected<void, core::error> {
  // Keep names strictly increasing even if the clock stalls or steps back.
  auto ms = std::max(epoch_ms_now(), last_epoch_ms_);
  last_epoch_ms_ = ms;
  return attach(dir_ / segment_file_name(ms, next_sequence));
}

auto SegmentWriter::attach(const std::filesystem::path& file) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  path_ = file;
  out_.open(path_, std::ios::binary | std::ios::out | std::ios::app);
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "open segment failed: " + path_.filename().string(), "wal.segment"});
  std::error_code ec;
  auto sz = std::filesystem::file_size(path_, ec);
  cur_bytes_ = ec ? 0 : static_cast<std::uint64_t>(sz);
  (void)sync_dir(dir_);
  return {};
}

auto SegmentWriter::write_line(std::string_view line) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open()) return std::unexpected(error{error_code::precondition_failed, "segment closed", "wal.segment"});
  out_.write(line.data(), static_cast<std::streamsize>(line.size()));
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "write failed: " + path_.filename().string(), "wal.segment"});
  cur_bytes_ += line.size();
  stats_.lines++;
  return {};
}

auto SegmentWriter::flush(bool sync) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open()) return std::unexpected(error{error_code::precondition_failed, "segment closed", "wal.segment"});
  out_.flush();
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "flush failed: " + path_.filename().string(), "wal.segment"});
  stats_.flushes++;
  if (sync) {
    if (auto r = sync_file(path_); !r) return std::unexpected(r.error());
    stats_.syncs++;
  }
  return {};
}

auto SegmentWriter::close() -> std::expected<void, core::error> {
  if (!out_.is_open()) return {};
  if (auto r = flush(true); !r) {
    out_.close();
    return std::unexpected(r.error());
  }
  out_.close();
  return {};
}

auto SegmentWriter::rotate(std::uint64_t next_sequence) -> std::expected<void, core::error> {
  const auto finished = path_.filename().string();
  const auto finished_bytes = cur_bytes_;
  if (auto r = close(); !r) return std::unexpected(r.error());
  if (auto r = open_segment(next_sequence); !r) return std::unexpected(r.error());
  stats_.rotations++;
  core::log_info("segment", "rotated " + finished + " (" + std::to_string(finished_bytes) + " bytes) -> " + path_.filename().string());
  return {};
}

} // namespace walden::wal
