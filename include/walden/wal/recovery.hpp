#pragma once

/** \file recovery.hpp
 *  \brief Segment replay from a checkpoint boundary with corruption detection.
 *
 * Rules
 * - Segments are visited in filename (chronological) order.
 * - A segment named by a checkpoint is verified against the newest such checkpoint:
 *   the SHA-256 of its first segment_size bytes must equal the stored checksum.
 *   Bytes appended after the checkpoint do not affect the result, so a segment that
 *   kept growing after being checkpointed still verifies.
 * - The segment the caller is currently writing (RecoveryOptions::active_segment)
 *   is never checksum-verified; its records are bounded by sequence number only.
 * - A failed verification skips the whole segment and counts one corruption.
 * - Malformed lines are skipped and counted; scanning continues with the next line.
 * - Records with sequence_number > start_sequence are delivered in file/line order.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

#include "walden/error.hpp"
#include "walden/wal/checkpoint.hpp"
#include "walden/wal/record.hpp"

namespace walden::wal {

struct RecoveryStats {
  std::size_t segments_scanned{};    /**< segments whose lines were read */
  std::size_t segments_skipped{};    /**< segments rejected by checksum verification */
  std::size_t corrupt_lines{};       /**< malformed or schema-invalid lines */
  std::size_t records_delivered{};   /**< records passed to the callback */
  std::uint64_t last_sequence{};     /**< highest valid sequence seen, delivered or not */
  std::size_t sequence_violations{}; /**< non-increasing transitions (warn-only) */

  [[nodiscard]] std::size_t corruption_detections() const noexcept { return segments_skipped + corrupt_lines; }
};

struct RecoveryOptions {
  std::uint64_t start_sequence{0};
  std::span<const Checkpoint> checkpoints{};
  std::filesystem::path active_segment{};   /**< exempt from checksum verification */
};

using RecordCallback = std::function<void(const OperationRecord&)>;

/** Boundary for replay: the named checkpoint, else the newest one, else 0.
 *  An id that matches no checkpoint is not_found. checkpoints must be oldest first. */
[[nodiscard]] auto resolve_start_sequence(std::span<const Checkpoint> checkpoints,
                                          std::optional<std::string_view> checkpoint_id)
    -> std::expected<std::uint64_t, core::error>;

/** True when the segment's covered prefix matches cp.checksum. A segment shorter than
 *  cp.segment_size does not match. I/O failures are errors. */
[[nodiscard]] auto verify_segment(const std::filesystem::path& segment, const Checkpoint& cp)
    -> std::expected<bool, core::error>;

/** Reads every line of one segment; valid records go to on_record. */
[[nodiscard]] auto scan_segment(const std::filesystem::path& segment, const RecordCallback& on_record)
    -> std::expected<RecoveryStats, core::error>;

[[nodiscard]] auto recover_scan_dir(const std::filesystem::path& segments_dir, const RecoveryOptions& opts,
                                    const RecordCallback& on_record)
    -> std::expected<RecoveryStats, core::error>;

/** Highest valid sequence number stored in any segment (0 if none). */
[[nodiscard]] auto scan_last_sequence(const std::filesystem::path& segments_dir)
    -> std::expected<std::uint64_t, core::error>;

} // namespace walden::wal
