#include "walden/wal/recovery.hpp"
#include "walden/wal/integrity.hpp"
#include "walden/wal/segment.hpp"
#include "walden/core/log.hpp"

#include <algorithm>
#include <fstream>
#include <string>

namespace walden::wal {

namespace {
auto is_blank(const std::string& s) -> bool {
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return c == ' ' || c == '\t' || c == '\r'; });
}

// Newest checkpoint naming this segment; checkpoints are oldest first.
auto checkpoint_for(std::span<const Checkpoint> cps, const std::string& file_name) -> const Checkpoint* {
  for (auto it = cps.rbegin(); it != cps.rend(); ++it) {
    if (std::filesystem::path(it->file_path).filename().string() == file_name) return &*it;
  }
  return nullptr;
}
}

auto resolve_start_sequence(std::span<const Checkpoint> checkpoints, std::optional<std::string_view> checkpoint_id)
    -> std::expected<std::uint64_t, core::error> {
  if (checkpoint_id) {
    auto it = std::find_if(checkpoints.begin(), checkpoints.end(), [&](const Checkpoint& c){ return c.checkpoint_id == *checkpoint_id; });
    if (it == checkpoints.end()) {
      return std::unexpected(core::error{core::error_code::not_found, "unknown checkpoint " + std::string(*checkpoint_id), "wal.recovery"});
    }
    return it->sequence_number;
  }
  if (checkpoints.empty()) return std::uint64_t{0};
  return checkpoints.back().sequence_number;
}

auto verify_segment(const std::filesystem::path& segment, const Checkpoint& cp) -> std::expected<bool, core::error> {
  auto h = sha256_file(segment, cp.segment_size);
  if (!h) {
    if (h.error().code == core::error_code::data_integrity) return false; // truncated below covered size
    return std::unexpected(h.error());
  }
  return *h == cp.checksum;
}

auto scan_segment(const std::filesystem::path& segment, const RecordCallback& on_record)
    -> std::expected<RecoveryStats, core::error> {
  using core::error; using core::error_code;
  RecoveryStats stats{};
  std::ifstream in(segment, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "open segment failed: " + segment.filename().string(), "wal.recovery"});

  std::uint64_t prev = 0; bool have_prev = false;
  std::string line; std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (is_blank(line)) continue;
    auto rec = decode_line(line);
    if (!rec) {
      stats.corrupt_lines++;
      core::log_warn("recovery", "skipping line " + std::to_string(line_no) + " of " + segment.filename().string() + ": " + rec.error().message);
      continue;
    }
    if (have_prev && rec->sequence_number <= prev) stats.sequence_violations++;
    prev = rec->sequence_number; have_prev = true;
    stats.last_sequence = std::max(stats.last_sequence, rec->sequence_number);
    on_record(*rec);
  }
  if (in.bad()) return std::unexpected(error{error_code::io_failed, "read segment failed: " + segment.filename().string(), "wal.recovery"});
  stats.segments_scanned = 1;
  return stats;
}

auto recover_scan_dir(const std::filesystem::path& segments_dir, const RecoveryOptions& opts,
                      const RecordCallback& on_record)
    -> std::expected<RecoveryStats, core::error> {
  RecoveryStats agg{};
  auto files = list_segments(segments_dir);
  if (!files) return std::unexpected(files.error());

  const auto active_name = opts.active_segment.filename().string();
  for (const auto& seg : *files) {
    const auto name = seg.filename().string();
    // The open segment keeps growing after any checkpoint that names it; only the
    // sequence boundary applies to it. Closed segments must match their checkpoint.
    if (name != active_name) {
      if (const Checkpoint* cp = checkpoint_for(opts.checkpoints, name)) {
        auto ok = verify_segment(seg, *cp);
        if (!ok) return std::unexpected(ok.error());
        if (!*ok) {
          agg.segments_skipped++;
          core::log_warn("recovery", "checksum mismatch for " + name + " (checkpoint " + cp->checkpoint_id + "), skipping segment");
          continue;
        }
      }
    }

    auto st = scan_segment(seg, [&](const OperationRecord& r){
      if (r.sequence_number <= opts.start_sequence) return;
      agg.records_delivered++;
      on_record(r);
    });
    if (!st) return std::unexpected(st.error());
    agg.segments_scanned += st->segments_scanned;
    agg.corrupt_lines += st->corrupt_lines;
    agg.sequence_violations += st->sequence_violations;
    agg.last_sequence = std::max(agg.last_sequence, st->last_sequence);
  }
  return agg;
}

auto scan_last_sequence(const std::filesystem::path& segments_dir) -> std::expected<std::uint64_t, core::error> {
  auto files = list_segments(segments_dir);
  if (!files) return std::unexpected(files.error());
  // Filename order follows the wall clock, which can step back between runs, so
  // every segment is scanned rather than trusting the newest one.
  std::uint64_t last = 0;
  for (const auto& f : *files) {
    auto st = scan_segment(f, [](const OperationRecord&){});
    if (!st) return std::unexpected(st.error());
    last = std::max(last, st->last_sequence);
  }
  return last;
}

} // namespace walden::wal
