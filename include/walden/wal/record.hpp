#pragma once

/** \file record.hpp
 *  \brief Operation record envelope and its newline-delimited JSON line codec.
 *
 * Line schema: {"sequence_number": int, "timestamp": float, "operation": <any JSON>}
 * The operation payload is opaque to the WAL.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "walden/error.hpp"

namespace walden::wal {

struct OperationRecord {
  std::uint64_t sequence_number{};
  double timestamp{};          // unix seconds
  nlohmann::json operation;    // opaque payload
};

/** Seconds since the unix epoch with sub-second precision. */
auto unix_now() -> double;

// Encode as a single JSON line terminated by '\n'. Fails only for payloads that
// cannot be serialized (e.g. invalid UTF-8 strings).
auto encode_line(const OperationRecord& rec) -> std::expected<std::string, core::error>;

// Decode one line (trailing '\r' / '\n' tolerated). Malformed JSON or a schema
// mismatch is reported as data_integrity.
auto decode_line(std::string_view line) -> std::expected<OperationRecord, core::error>;

} // namespace walden::wal
