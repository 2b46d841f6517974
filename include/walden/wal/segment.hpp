#pragma once

/** \file segment.hpp
 *  \brief Segment files: naming, chronological enumeration and the rotating line writer.
 *
 * Layout: <dir>/wal_<13-digit epoch-ms>_<10-digit starting sequence>.log
 * Both fields are zero-padded so lexical filename order is chronological order.
 *
 * Notes
 * - SegmentWriter is not thread-safe; the owning WriteAheadLog serializes access.
 * - A rotated segment is closed and never reopened for writing.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "walden/error.hpp"

namespace walden::wal {

struct SegmentName {
  std::uint64_t epoch_ms{};
  std::uint64_t start_sequence{};
};

auto segment_file_name(std::uint64_t epoch_ms, std::uint64_t start_sequence) -> std::string;
auto parse_segment_name(std::string_view file_name) -> std::optional<SegmentName>;

// Segment files under dir in chronological (lexical) order. A missing dir yields an empty list.
[[nodiscard]] auto list_segments(const std::filesystem::path& dir)
    -> std::expected<std::vector<std::filesystem::path>, core::error>;

struct SegmentWriterStats {
  std::uint64_t lines{};
  std::uint64_t flushes{};
  std::uint64_t syncs{};
  std::uint64_t rotations{};
};

class SegmentWriter {
public:
  SegmentWriter() = default;
  ~SegmentWriter();
  SegmentWriter(SegmentWriter&&) noexcept;
  SegmentWriter& operator=(SegmentWriter&&) noexcept;
  SegmentWriter(const SegmentWriter&) = delete;
  SegmentWriter& operator=(const SegmentWriter&) = delete;

  /** Creates dir if needed and opens a new segment whose name carries next_sequence.
   *  An empty newest segment already named for next_sequence is reused instead. */
  static auto open(const std::filesystem::path& dir, std::uint64_t max_segment_bytes, std::uint64_t next_sequence)
      -> std::expected<SegmentWriter, core::error>;

  /** Buffered write of one encoded line (must end with '\n'). */
  auto write_line(std::string_view line) -> std::expected<void, core::error>;

  /** Pushes buffered bytes to the OS; with sync=true also fsyncs and counts a sync. */
  auto flush(bool sync) -> std::expected<void, core::error>;

  [[nodiscard]] bool needs_rotation() const noexcept { return max_bytes_ > 0 && cur_bytes_ > max_bytes_; }

  /** Flush, fsync and close the active segment, then open the one starting at next_sequence. */
  auto rotate(std::uint64_t next_sequence) -> std::expected<void, core::error>;

  /** Flush, fsync and close. Idempotent. */
  auto close() -> std::expected<void, core::error>;

  [[nodiscard]] bool is_open() const noexcept { return out_.is_open(); }
  const std::filesystem::path& path() const noexcept { return path_; }
  const std::filesystem::path& dir() const noexcept { return dir_; }
  std::uint64_t size() const noexcept { return cur_bytes_; }
  const SegmentWriterStats& stats() const noexcept { return stats_; }

private:
  std::filesystem::path dir_;
  std::filesystem::path path_;
  std::uint64_t max_bytes_{};
  std::uint64_t cur_bytes_{};
  std::uint64_t last_epoch_ms_{};
  SegmentWriterStats stats_{};
  std::ofstream out_;

  auto open_segment(std::uint64_t next_sequence) -> std::expected<void, core::error>;
  auto attach(const std::filesystem::path& file) -> std::expected<void, core::error>;
};

} // namespace walden::wal
