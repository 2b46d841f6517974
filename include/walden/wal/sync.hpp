#pragma once

/** \file sync.hpp
 *  \brief OS-level durability helpers (fsync / FlushFileBuffers) by path.
 */

#include <expected>
#include <filesystem>

#include "walden/error.hpp"

namespace walden::wal {

// Forces the file's written bytes to stable storage. Errors are io_failed.
auto sync_file(const std::filesystem::path& p) -> std::expected<void, core::error>;

// Best-effort directory metadata sync (new/renamed entries). Never fails.
auto sync_dir(const std::filesystem::path& dir) -> std::expected<void, core::error>;

} // namespace walden::wal
