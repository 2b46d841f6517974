#pragma once

/** \file integrity.hpp
 *  \brief SHA-256 digests over files and buffers (lowercase hex).
 *
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with walden::core::error.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "walden/error.hpp"

namespace walden::wal {

constexpr std::size_t INTEGRITY_CHUNK_SIZE = 4096;

// SHA-256 of an in-memory buffer.
auto sha256_hex(std::string_view bytes) -> std::expected<std::string, core::error>;

// Streams the file in INTEGRITY_CHUNK_SIZE chunks. With max_bytes set, only the
// first max_bytes are hashed; a file shorter than that is a data_integrity error.
[[nodiscard]] auto sha256_file(const std::filesystem::path& path,
                               std::optional<std::uint64_t> max_bytes = std::nullopt)
    -> std::expected<std::string, core::error>;

} // namespace walden::wal
