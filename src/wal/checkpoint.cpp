#include "walden/wal/checkpoint.hpp"
#include "walden/wal/integrity.hpp"
#include "walden/wal/sync.hpp"
#include "walden/core/log.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace walden::wal {

namespace {
auto by_age(const Checkpoint& a, const Checkpoint& b) -> bool {
  if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
  return a.sequence_number < b.sequence_number;
}

auto is_checkpoint_file(const std::filesystem::path& p) -> bool {
  const auto name = p.filename().string();
  return name.rfind("checkpoint_", 0) == 0 && p.extension() == ".json";
}
}

auto make_checkpoint_id(std::uint64_t sequence_number, double timestamp)
    -> std::expected<std::string, core::error> {
  std::ostringstream oss;
  oss << sequence_number << ':' << std::setprecision(17) << timestamp;
  auto h = sha256_hex(oss.str());
  if (!h) return std::unexpected(h.error());
  return h->substr(0, 16);
}

auto checkpoint_file_name(const Checkpoint& cp) -> std::string {
  std::ostringstream oss;
  oss << "checkpoint_" << static_cast<std::uint64_t>(std::floor(cp.timestamp))
      << "_" << std::setw(10) << std::setfill('0') << cp.sequence_number << ".json";
  return oss.str();
}

auto to_json(const Checkpoint& cp) -> nlohmann::json {
  nlohmann::json j = {
    {"checkpoint_id", cp.checkpoint_id},
    {"timestamp", cp.timestamp},
    {"sequence_number", cp.sequence_number},
    {"operations_count", cp.operations_count},
    {"file_path", cp.file_path},
    {"checksum", cp.checksum},
  };
  if (cp.segment_size) j["segment_size"] = *cp.segment_size;
  return j;
}

auto checkpoint_from_json(const nlohmann::json& j) -> std::expected<Checkpoint, core::error> {
  using core::error; using core::error_code;
  auto bad = [](const char* what) {
    return std::unexpected(error{error_code::data_integrity, std::string("checkpoint: ") + what, "wal.checkpoint"});
  };
  if (!j.is_object()) return bad("not an object");
  Checkpoint cp;
  auto id = j.find("checkpoint_id");
  if (id == j.end() || !id->is_string()) return bad("missing checkpoint_id");
  cp.checkpoint_id = id->get<std::string>();
  auto ts = j.find("timestamp");
  if (ts == j.end() || !ts->is_number()) return bad("missing timestamp");
  cp.timestamp = ts->get<double>();
  auto seq = j.find("sequence_number");
  if (seq == j.end() || !seq->is_number_unsigned()) return bad("missing sequence_number");
  cp.sequence_number = seq->get<std::uint64_t>();
  auto ops = j.find("operations_count");
  if (ops == j.end() || !ops->is_number_unsigned()) return bad("missing operations_count");
  cp.operations_count = ops->get<std::uint64_t>();
  auto fp = j.find("file_path");
  if (fp == j.end() || !fp->is_string()) return bad("missing file_path");
  cp.file_path = fp->get<std::string>();
  auto ck = j.find("checksum");
  if (ck == j.end() || !ck->is_string()) return bad("missing checksum");
  cp.checksum = ck->get<std::string>();
  if (auto sz = j.find("segment_size"); sz != j.end()) {
    if (!sz->is_number_unsigned()) return bad("invalid segment_size");
    cp.segment_size = sz->get<std::uint64_t>();
  }
  return cp;
}

auto save_checkpoint(const std::filesystem::path& dir, const Checkpoint& cp)
    -> std::expected<std::filesystem::path, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "mkdir checkpoints failed", "wal.checkpoint"});

  const auto p_dst = dir / checkpoint_file_name(cp);
  auto p_tmp = p_dst; p_tmp += ".tmp";
  // 1) Write tmp
  {
    std::ofstream out(p_tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "checkpoint tmp open failed", "wal.checkpoint"});
    out << to_json(cp).dump(2) << "\n";
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
      return std::unexpected(error{error_code::io_failed, "checkpoint tmp write failed", "wal.checkpoint"});
    }
  }
  // 2) Ensure tmp contents durable
  if (auto r = sync_file(p_tmp); !r) {
    std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
    return std::unexpected(r.error());
  }
  // 3) Atomic replace, then directory entry
  std::filesystem::rename(p_tmp, p_dst, ec);
  if (ec) {
    std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
    return std::unexpected(error{error_code::io_failed, "checkpoint rename failed", "wal.checkpoint"});
  }
  (void)sync_dir(dir);
  return p_dst;
}

auto load_checkpoint(const std::filesystem::path& file) -> std::expected<Checkpoint, core::error> {
  using core::error; using core::error_code;
  std::ifstream in(file, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::not_found, "checkpoint open failed", "wal.checkpoint"});
  auto j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return std::unexpected(error{error_code::data_integrity, "checkpoint: malformed JSON", "wal.checkpoint"});
  return checkpoint_from_json(j);
}

auto load_checkpoints(const std::filesystem::path& dir) -> std::expected<LoadedCheckpoints, core::error> {
  using core::error; using core::error_code;
  LoadedCheckpoints out;
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) return out;
  std::filesystem::directory_iterator it(dir, ec), end;
  if (ec) return std::unexpected(error{error_code::io_failed, "list checkpoints failed", "wal.checkpoint"});
  for (; it != end; it.increment(ec)) {
    if (ec) return std::unexpected(error{error_code::io_failed, "list checkpoints failed", "wal.checkpoint"});
    if (!it->is_regular_file() || !is_checkpoint_file(it->path())) continue;
    auto cp = load_checkpoint(it->path());
    if (!cp) {
      out.rejected++;
      core::log_warn("checkpoint", "ignoring " + it->path().filename().string() + ": " + cp.error().message);
      continue;
    }
    out.checkpoints.push_back(std::move(*cp));
  }
  std::sort(out.checkpoints.begin(), out.checkpoints.end(), by_age);
  return out;
}

auto prune_checkpoints(const std::filesystem::path& dir, std::vector<Checkpoint>& list, std::size_t keep_count)
    -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (list.size() <= keep_count) return std::size_t{0};
  std::stable_sort(list.begin(), list.end(), by_age);
  const auto cutoff_index = list.size() - keep_count;
  for (std::size_t i = 0; i < cutoff_index; ++i) {
    std::error_code ec; std::filesystem::remove(dir / checkpoint_file_name(list[i]), ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "remove checkpoint failed", "wal.checkpoint"});
  }
  list.erase(list.begin(), list.begin() + static_cast<std::ptrdiff_t>(cutoff_index));
  return cutoff_index;
}

} // namespace walden::wal
