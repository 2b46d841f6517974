#pragma once

/** \file checkpoint.hpp
 *  \brief Checkpoint records: recovery boundaries persisted as JSON files.
 *
 * File: <dir>/checkpoint_<epoch-seconds>_<10-digit sequence>.json
 * Schema: {"checkpoint_id", "timestamp", "sequence_number", "operations_count",
 *          "file_path", "checksum", "segment_size"}
 *
 * checksum is the SHA-256 of the first segment_size bytes of file_path at the time
 * the checkpoint was taken. Files written without segment_size hash the whole segment.
 *
 * Atomic, durable save: write <name>.tmp, fsync, rename over <name>, fsync directory.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "walden/error.hpp"

namespace walden::wal {

struct Checkpoint {
  std::string checkpoint_id;                 // 16 hex chars
  double timestamp{};                        // unix seconds
  std::uint64_t sequence_number{};           // every record <= this is covered
  std::uint64_t operations_count{};          // operations flushed since the previous checkpoint
  std::string file_path;                     // segment active when the checkpoint was taken
  std::string checksum;                      // sha256 hex of the covered segment bytes
  std::optional<std::uint64_t> segment_size; // bytes covered by checksum
};

// First 16 hex chars of sha256("<sequence>:<timestamp>").
auto make_checkpoint_id(std::uint64_t sequence_number, double timestamp)
    -> std::expected<std::string, core::error>;

auto checkpoint_file_name(const Checkpoint& cp) -> std::string;

auto to_json(const Checkpoint& cp) -> nlohmann::json;
auto checkpoint_from_json(const nlohmann::json& j) -> std::expected<Checkpoint, core::error>;

[[nodiscard]] auto save_checkpoint(const std::filesystem::path& dir, const Checkpoint& cp)
    -> std::expected<std::filesystem::path, core::error>;

[[nodiscard]] auto load_checkpoint(const std::filesystem::path& file)
    -> std::expected<Checkpoint, core::error>;

struct LoadedCheckpoints {
  std::vector<Checkpoint> checkpoints; // oldest first (timestamp, then sequence_number)
  std::size_t rejected{};              // files that failed to parse and were omitted
};

// Loads every checkpoint file under dir. Unparseable files are logged and omitted;
// only a failure to list the directory is an error. A missing dir yields no checkpoints.
[[nodiscard]] auto load_checkpoints(const std::filesystem::path& dir)
    -> std::expected<LoadedCheckpoints, core::error>;

/**
 * Keep only the keep_count newest checkpoints of list (ordered oldest first).
 * Files of the dropped entries are deleted from dir and the entries erased from list.
 * Returns the number of checkpoints removed.
 */
[[nodiscard]] auto prune_checkpoints(const std::filesystem::path& dir, std::vector<Checkpoint>& list,
                                     std::size_t keep_count)
    -> std::expected<std::size_t, core::error>;

} // namespace walden::wal
