#pragma once

/** \file options.hpp
 *  \brief WAL configuration: fsync policy, batching, checkpoint cadence, segment size.
 *
 * Notes
 * - validate() rejects values that would make the log unusable (zero batch size, ...).
 * - apply_env_overrides() lets deployments retune a WAL without recompiling; each
 *   WALDEN_WAL_* variable replaces the matching field when set.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>

#include "walden/error.hpp"

namespace walden::wal {

/** Durability policy applied when buffered records are written.
 *  - Always:   every append is written and fsynced before it returns.
 *  - Batch:    flush+fsync once batch_size records are buffered, or when the
 *              background flusher finds the buffer older than batch_timeout.
 *  - Periodic: flush on the background timer only (no size trigger, no fsync);
 *              append_batch, checkpoints and close still flush.
 */
enum class FsyncMode : std::uint8_t { Always, Batch, Periodic };

auto to_string(FsyncMode mode) noexcept -> std::string_view;
auto parse_fsync_mode(std::string_view s) -> std::optional<FsyncMode>;

struct WalOptions {
  std::filesystem::path base_path;               /**< holds segments/ and checkpoints/ */
  FsyncMode fsync_mode{FsyncMode::Always};
  std::size_t batch_size{100};                   /**< Batch mode size trigger */
  double batch_timeout{5.0};                     /**< seconds; background flusher cadence */
  std::uint64_t checkpoint_interval{1000};       /**< flushed operations between checkpoints */
  std::uint64_t max_segment_size{100ull * 1024 * 1024}; /**< rotate once a segment exceeds this */
  std::size_t keep_checkpoints{10};              /**< newest checkpoints retained on disk */
};

[[nodiscard]] auto validate(const WalOptions& opts) -> std::expected<void, core::error>;

/** Overlay WALDEN_WAL_FSYNC_MODE, _BATCH_SIZE, _BATCH_TIMEOUT, _CHECKPOINT_INTERVAL,
 *  _MAX_SEGMENT_SIZE and _KEEP_CHECKPOINTS onto opts. Malformed values are errors. */
[[nodiscard]] auto apply_env_overrides(WalOptions& opts) -> std::expected<void, core::error>;

} // namespace walden::wal
