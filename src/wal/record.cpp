#include "walden/wal/record.hpp"

#include <chrono>

namespace walden::wal {

auto unix_now() -> double {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

auto encode_line(const OperationRecord& rec) -> std::expected<std::string, core::error> {
  nlohmann::json j = {
    {"sequence_number", rec.sequence_number},
    {"timestamp", rec.timestamp},
    {"operation", rec.operation},
  };
  try {
    std::string out = j.dump();
    out.push_back('\n');
    return out;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(core::error{core::error_code::invalid_argument, std::string("operation not serializable: ") + e.what(), "wal.record"});
  }
}

auto decode_line(std::string_view line) -> std::expected<OperationRecord, core::error> {
  using core::error; using core::error_code;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);
  if (line.empty()) return std::unexpected(error{error_code::data_integrity, "empty line", "wal.record"});

  auto j = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return std::unexpected(error{error_code::data_integrity, "malformed JSON", "wal.record"});
  if (!j.is_object()) return std::unexpected(error{error_code::data_integrity, "record is not an object", "wal.record"});

  auto seq = j.find("sequence_number");
  auto ts = j.find("timestamp");
  auto op = j.find("operation");
  if (seq == j.end() || !seq->is_number_unsigned()) {
    return std::unexpected(error{error_code::data_integrity, "missing or invalid sequence_number", "wal.record"});
  }
  if (ts == j.end() || !ts->is_number()) {
    return std::unexpected(error{error_code::data_integrity, "missing or invalid timestamp", "wal.record"});
  }
  if (op == j.end()) return std::unexpected(error{error_code::data_integrity, "missing operation", "wal.record"});

  OperationRecord rec;
  rec.sequence_number = seq->get<std::uint64_t>();
  rec.timestamp = ts->get<double>();
  rec.operation = std::move(*op);
  return rec;
}

} // namespace walden::wal
