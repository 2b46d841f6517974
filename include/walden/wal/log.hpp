#pragma once

/** \file log.hpp
 *  \brief WriteAheadLog: sequencing, batching, fsync policy, checkpoints and recovery
 *         for one base directory.
 *
 * Lifecycle: open() (Initializing -> Ready) ... close() (-> Closed, terminal).
 * Thread-safety: every public call runs as one critical section under the instance
 * mutex, so concurrent appends are serialized and sequence numbers never collide.
 * In Batch and Periodic mode a background thread flushes records that have waited
 * longer than batch_timeout; it takes the same mutex as foreground callers.
 *
 * Destroying an instance without close() flushes buffered records but takes no
 * checkpoint, so the next recover() replays them.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "walden/error.hpp"
#include "walden/wal/checkpoint.hpp"
#include "walden/wal/options.hpp"
#include "walden/wal/segment.hpp"

namespace walden::wal {

struct WalStats {
  std::uint64_t total_operations{};
  std::uint64_t total_batches{};        /**< non-empty flushes */
  std::uint64_t total_fsyncs{};
  std::uint64_t total_checkpoints{};
  std::uint64_t total_rotations{};
  std::uint64_t corruption_detections{};
  std::uint64_t recovery_operations{};  /**< payloads returned by recover() */
  std::uint64_t sequence_number{};      /**< last assigned */
  std::size_t batch_buffer_size{};
  std::uint64_t operations_since_checkpoint{};
  std::size_t checkpoint_count{};
  FsyncMode fsync_mode{FsyncMode::Always};
  bool closed{false};
};

auto to_json(const WalStats& s) -> nlohmann::json;

class WriteAheadLog {
public:
  [[nodiscard]] static auto open(WalOptions opts)
      -> std::expected<std::unique_ptr<WriteAheadLog>, core::error>;

  ~WriteAheadLog();
  WriteAheadLog(const WriteAheadLog&) = delete;
  WriteAheadLog& operator=(const WriteAheadLog&) = delete;

  /** Assigns the next sequence number and buffers the record; flushes per fsync mode. */
  auto append(nlohmann::json operation) -> std::expected<std::uint64_t, core::error>;

  /** Consecutive sequence numbers for all operations; always flushed before returning. */
  auto append_batch(std::vector<nlohmann::json> operations)
      -> std::expected<std::vector<std::uint64_t>, core::error>;

  /** Writes buffered records now (fsync unless mode is Periodic). */
  auto flush() -> std::expected<void, core::error>;

  auto create_checkpoint() -> std::expected<Checkpoint, core::error>;

  /** Payloads of records after the boundary (named checkpoint, else newest, else 0), in order. */
  auto recover(std::optional<std::string_view> from_checkpoint = std::nullopt)
      -> std::expected<std::vector<nlohmann::json>, core::error>;

  /** Final checkpoint if operations are pending, then fsync and close. Terminal, even on error. */
  auto close() -> std::expected<void, core::error>;

  [[nodiscard]] auto stats() const -> WalStats;
  [[nodiscard]] auto list_checkpoints() const -> std::vector<Checkpoint>;
  [[nodiscard]] auto active_segment() const -> std::filesystem::path;
  [[nodiscard]] bool is_closed() const;

  const WalOptions& options() const noexcept { return opts_; }
  const std::filesystem::path& segments_dir() const noexcept { return segments_dir_; }
  const std::filesystem::path& checkpoints_dir() const noexcept { return checkpoints_dir_; }

private:
  enum class State : std::uint8_t { Initializing, Ready, Closed };

  struct PendingLine {
    std::uint64_t sequence_number;
    std::string line;
  };

  explicit WriteAheadLog(WalOptions opts);

  auto init() -> std::expected<void, core::error>;
  auto ensure_ready_locked() const -> std::expected<void, core::error>;
  bool sync_on_flush() const noexcept { return opts_.fsync_mode != FsyncMode::Periodic; }
  std::uint64_t next_write_sequence_locked() const noexcept;
  auto flush_locked(bool sync) -> std::expected<void, core::error>;
  auto after_write_locked() -> std::expected<void, core::error>;
  auto create_checkpoint_locked() -> std::expected<Checkpoint, core::error>;
  void flush_if_stale_locked();
  void flusher_loop();
  void stop_flusher();

  WalOptions opts_;
  std::filesystem::path segments_dir_;
  std::filesystem::path checkpoints_dir_;

  mutable std::mutex mu_;
  State state_{State::Initializing};
  SegmentWriter segment_;
  std::uint64_t sequence_{0};
  std::vector<PendingLine> buffer_;
  std::uint64_t ops_since_checkpoint_{0};
  std::vector<Checkpoint> checkpoints_;
  std::chrono::steady_clock::time_point last_flush_{};

  std::uint64_t total_operations_{0};
  std::uint64_t total_batches_{0};
  std::uint64_t total_checkpoints_{0};
  std::uint64_t corruption_detections_{0};
  std::uint64_t recovery_operations_{0};

  std::condition_variable flusher_cv_;
  bool stop_flusher_{false};
  std::thread flusher_;
};

} // namespace walden::wal
