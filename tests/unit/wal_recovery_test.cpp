#include <catch2/catch_all.hpp>
#include <walden/wal/log.hpp>
#include <walden/wal/recovery.hpp>
#include <walden/wal/segment.hpp>
#include <tests/support/wal_test_helpers.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace walden;

namespace {
wal::WalOptions options_for(const std::filesystem::path& dir) {
  wal::WalOptions opts; opts.base_path = dir;
  return opts;
}

// Rewrite one byte inside the first occurrence of needle.
void flip_byte(const std::filesystem::path& file, const std::string& needle) {
  std::string data;
  {
    std::ifstream in(file, std::ios::binary);
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  auto pos = data.find(needle);
  REQUIRE(pos != std::string::npos);
  data[pos] = data[pos] == 'b' ? 'c' : 'b';
  std::ofstream out(file, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  REQUIRE(out.good());
}
}

TEST_CASE("crash without close replays every durable record", "[wal][recovery]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_crash");
  {
    auto w = wal::WriteAheadLog::open(options_for(dir));
    REQUIRE(w.has_value());
    REQUIRE((*w)->append(nlohmann::json{{"op", "pin"}, {"cid", "QmA"}}).has_value());
    REQUIRE((*w)->append(nlohmann::json{{"op", "pin"}, {"cid", "QmB"}}).has_value());
    // dropped without close(): no final checkpoint
  }
  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  REQUIRE((*w)->list_checkpoints().empty());
  auto ops = (*w)->recover();
  REQUIRE(ops.has_value());
  REQUIRE(ops->size() == 2);
  REQUIRE((*ops)[0]["cid"] == "QmA");
  REQUIRE((*ops)[1]["cid"] == "QmB");
  REQUIRE((*w)->stats().recovery_operations == 2);
  REQUIRE((*w)->stats().corruption_detections == 0);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("clean shutdown leaves nothing to replay", "[wal][recovery]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_clean");
  {
    auto w = wal::WriteAheadLog::open(options_for(dir));
    REQUIRE(w.has_value());
    REQUIRE((*w)->append(nlohmann::json{{"op", "pin"}}).has_value());
    REQUIRE((*w)->append(nlohmann::json{{"op", "unpin"}}).has_value());
    REQUIRE((*w)->close().has_value());
  }
  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  auto cps = (*w)->list_checkpoints();
  REQUIRE(cps.size() == 1);
  REQUIRE(cps[0].sequence_number == 2);
  REQUIRE(cps[0].operations_count == 2);
  auto ops = (*w)->recover();
  REQUIRE(ops.has_value());
  REQUIRE(ops->empty());
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("malformed line is skipped and counted", "[wal][recovery][corruption]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_garbage");
  std::filesystem::path seg;
  {
    auto w = wal::WriteAheadLog::open(options_for(dir));
    REQUIRE(w.has_value());
    for (int i = 0; i < 5; ++i) REQUIRE((*w)->append(nlohmann::json{{"i", i}}).has_value());
    seg = (*w)->active_segment();
  }
  test_support::append_raw(seg, "{\"sequence_number\": 6, \"timest\n");

  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  auto ops = (*w)->recover();
  REQUIRE(ops.has_value());
  REQUIRE(ops->size() == 5);
  REQUIRE((*ops)[4]["i"] == 4);
  REQUIRE((*w)->stats().corruption_detections == 1);
  REQUIRE((*w)->append(nlohmann::json{{"i", 5}}).value() == 6);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("recover is idempotent", "[wal][recovery]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_idem");
  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  for (int i = 0; i < 4; ++i) REQUIRE((*w)->append(nlohmann::json{{"i", i}}).has_value());
  auto a = (*w)->recover();
  auto b = (*w)->recover();
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(*a == *b);
  REQUIRE(a->size() == 4);
  REQUIRE((*w)->stats().sequence_number == 4);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("recover from a named checkpoint", "[wal][recovery][checkpoint]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_named");
  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  REQUIRE((*w)->append(nlohmann::json{{"i", 1}}).has_value());
  REQUIRE((*w)->append(nlohmann::json{{"i", 2}}).has_value());
  auto cp1 = (*w)->create_checkpoint();
  REQUIRE(cp1.has_value());
  REQUIRE((*w)->append(nlohmann::json{{"i", 3}}).has_value());
  REQUIRE((*w)->append(nlohmann::json{{"i", 4}}).has_value());
  auto cp2 = (*w)->create_checkpoint();
  REQUIRE(cp2.has_value());
  REQUIRE((*w)->append(nlohmann::json{{"i", 5}}).has_value());

  auto from_first = (*w)->recover(cp1->checkpoint_id);
  REQUIRE(from_first.has_value());
  REQUIRE(from_first->size() == 3);
  REQUIRE((*from_first)[0]["i"] == 3);
  REQUIRE((*from_first)[1]["i"] == 4);
  REQUIRE((*from_first)[2]["i"] == 5);

  auto from_newest = (*w)->recover();
  REQUIRE(from_newest.has_value());
  REQUIRE(from_newest->size() == 1);
  REQUIRE((*from_newest)[0]["i"] == 5);

  auto unknown = (*w)->recover(std::string_view("0123456789abcdef"));
  REQUIRE_FALSE(unknown.has_value());
  REQUIRE(unknown.error().code == core::error_code::not_found);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("tampered checkpointed segment is skipped", "[wal][recovery][corruption]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_tamper");
  std::filesystem::path seg;
  {
    auto w = wal::WriteAheadLog::open(options_for(dir));
    REQUIRE(w.has_value());
    REQUIRE((*w)->append(nlohmann::json{{"v", "aaaa"}}).has_value());
    REQUIRE((*w)->append(nlohmann::json{{"v", "aaab"}}).has_value());
    REQUIRE((*w)->create_checkpoint().has_value());
    REQUIRE((*w)->append(nlohmann::json{{"v", "tail"}}).has_value());
    seg = (*w)->active_segment();
  }

  SECTION("intact segment verifies against its covered prefix") {
    auto w = wal::WriteAheadLog::open(options_for(dir));
    REQUIRE(w.has_value());
    REQUIRE((*w)->active_segment() != seg);
    auto ops = (*w)->recover();
    REQUIRE(ops.has_value());
    REQUIRE(ops->size() == 1);
    REQUIRE((*ops)[0]["v"] == "tail");
    REQUIRE((*w)->stats().corruption_detections == 0);
    REQUIRE((*w)->close().has_value());
  }
  SECTION("modified bytes fail verification") {
    flip_byte(seg, "aaaa");
    auto w = wal::WriteAheadLog::open(options_for(dir));
    REQUIRE(w.has_value());
    auto ops = (*w)->recover();
    REQUIRE(ops.has_value());
    REQUIRE(ops->empty());
    REQUIRE((*w)->stats().corruption_detections == 1);
    REQUIRE((*w)->close().has_value());
  }
}

TEST_CASE("recover_scan_dir honours the start boundary", "[wal][recovery]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_scan");
  auto segs = dir / "segments";
  std::filesystem::create_directories(segs);
  std::string body;
  for (std::uint64_t i = 1; i <= 6; ++i) body += *wal::encode_line(wal::OperationRecord{i, 1.0, nlohmann::json(i)});
  test_support::append_raw(segs / wal::segment_file_name(1000, 1), body);
  test_support::append_raw(segs / wal::segment_file_name(1000, 1), "\n   \n");

  wal::RecoveryOptions ro; ro.start_sequence = 4;
  std::vector<std::uint64_t> got;
  auto st = wal::recover_scan_dir(segs, ro, [&](const wal::OperationRecord& r){ got.push_back(r.sequence_number); });
  REQUIRE(st.has_value());
  REQUIRE(got == std::vector<std::uint64_t>{5, 6});
  REQUIRE(st->records_delivered == 2);
  REQUIRE(st->last_sequence == 6);
  REQUIRE(st->corrupt_lines == 0);

  auto last = wal::scan_last_sequence(segs);
  REQUIRE(last.has_value());
  REQUIRE(*last == 6);
}

TEST_CASE("operations on a closed log fail", "[wal][lifecycle]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_closed");
  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  REQUIRE((*w)->close().has_value());
  REQUIRE((*w)->is_closed());
  REQUIRE((*w)->stats().closed);
  REQUIRE((*w)->close().has_value());
  REQUIRE((*w)->recover().error().code == core::error_code::precondition_failed);
  REQUIRE((*w)->append(nlohmann::json{{"late", true}}).error().code == core::error_code::precondition_failed);
  REQUIRE((*w)->append_batch(std::vector<nlohmann::json>(1, nlohmann::json(1))).error().code == core::error_code::precondition_failed);
  REQUIRE((*w)->flush().error().code == core::error_code::precondition_failed);
  REQUIRE((*w)->create_checkpoint().error().code == core::error_code::precondition_failed);
  // Closing an idle log takes no checkpoint.
  REQUIRE((*w)->list_checkpoints().empty());
}

TEST_CASE("malformed line in the active segment is skipped on the same instance", "[wal][recovery][corruption]") {
  auto dir = test_support::fresh_temp_dir("walden_recovery_garbage_live");
  auto w = wal::WriteAheadLog::open(options_for(dir));
  REQUIRE(w.has_value());
  for (int i = 0; i < 3; ++i) REQUIRE((*w)->append(nlohmann::json{{"i", i}}).has_value());
  test_support::append_raw((*w)->active_segment(), "not json at all\n");
  for (int i = 3; i < 5; ++i) REQUIRE((*w)->append(nlohmann::json{{"i", i}}).has_value());

  const auto before = (*w)->stats().corruption_detections;
  auto ops = (*w)->recover();
  REQUIRE(ops.has_value());
  REQUIRE(ops->size() == 5);
  for (std::size_t i = 0; i < ops->size(); ++i) REQUIRE((*ops)[i]["i"] == static_cast<int>(i));
  REQUIRE((*w)->stats().corruption_detections == before + 1);
  REQUIRE((*w)->close().has_value());
}
