#include <catch2/catch_all.hpp>
#include <walden/wal/log.hpp>
#include <walden/wal/recovery.hpp>
#include <walden/wal/segment.hpp>
#include <tests/support/wal_test_helpers.hpp>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace walden;

TEST_CASE("append assigns consecutive sequence numbers", "[wal][sequence]") {
  auto dir = test_support::fresh_temp_dir("walden_seq_single");
  wal::WalOptions opts; opts.base_path = dir;
  auto w = wal::WriteAheadLog::open(opts);
  REQUIRE(w.has_value());
  for (std::uint64_t i = 1; i <= 5; ++i) {
    auto s = (*w)->append(nlohmann::json{{"i", i}});
    REQUIRE(s.has_value());
    REQUIRE(*s == i);
  }
  REQUIRE((*w)->stats().sequence_number == 5);
  REQUIRE((*w)->stats().total_operations == 5);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("append_batch is one consecutive run and one flush", "[wal][sequence][batch]") {
  auto dir = test_support::fresh_temp_dir("walden_seq_batch");
  wal::WalOptions opts; opts.base_path = dir; opts.fsync_mode = wal::FsyncMode::Batch; opts.batch_timeout = 60.0;
  auto w = wal::WriteAheadLog::open(opts);
  REQUIRE(w.has_value());
  REQUIRE((*w)->append(nlohmann::json{{"op", "first"}}).has_value());

  const auto before = (*w)->stats();
  std::vector<nlohmann::json> ops;
  for (int i = 0; i < 5; ++i) ops.push_back(nlohmann::json{{"i", i}});
  auto seqs = (*w)->append_batch(std::move(ops));
  REQUIRE(seqs.has_value());
  REQUIRE(*seqs == std::vector<std::uint64_t>{2, 3, 4, 5, 6});

  const auto after = (*w)->stats();
  REQUIRE(after.total_batches == before.total_batches + 1);
  REQUIRE(after.total_fsyncs == before.total_fsyncs + 1);
  REQUIRE(after.batch_buffer_size == 0);

  // The buffered single append is flushed together with the batch, in order.
  auto recs = test_support::read_segment_records(dir);
  REQUIRE(recs.size() == 6);
  for (std::size_t i = 0; i < recs.size(); ++i) REQUIRE(recs[i].sequence_number == i + 1);
  REQUIRE(recs[1].timestamp == recs[5].timestamp);

  auto empty = (*w)->append_batch({});
  REQUIRE(empty.has_value());
  REQUIRE(empty->empty());
  REQUIRE((*w)->append(nlohmann::json{{"op", "next"}}).value() == 7);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("concurrent appends never share a sequence number", "[wal][sequence][threads]") {
  auto dir = test_support::fresh_temp_dir("walden_seq_threads");
  wal::WalOptions opts; opts.base_path = dir; opts.fsync_mode = wal::FsyncMode::Batch;
  opts.batch_size = 32; opts.checkpoint_interval = 1000000;
  auto w = wal::WriteAheadLog::open(opts);
  REQUIRE(w.has_value());

  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  std::mutex m;
  std::vector<std::uint64_t> seen;
  std::vector<std::thread> threads;
  bool all_ok = true;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]{
      for (int i = 0; i < kPerThread; ++i) {
        auto s = (*w)->append(nlohmann::json{{"t", t}, {"i", i}});
        std::lock_guard<std::mutex> lk(m);
        if (!s) { all_ok = false; continue; }
        seen.push_back(*s);
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(all_ok);
  REQUIRE((*w)->flush().has_value());

  std::sort(seen.begin(), seen.end());
  REQUIRE(seen.size() == kThreads * kPerThread);
  for (std::size_t i = 0; i < seen.size(); ++i) REQUIRE(seen[i] == i + 1);

  auto recs = test_support::read_segment_records(dir);
  REQUIRE(recs.size() == seen.size());
  for (std::size_t i = 0; i < recs.size(); ++i) REQUIRE(recs[i].sequence_number == i + 1);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("sequence resumes after reopen", "[wal][sequence]") {
  auto dir = test_support::fresh_temp_dir("walden_seq_resume");
  wal::WalOptions opts; opts.base_path = dir;
  {
    auto w = wal::WriteAheadLog::open(opts);
    REQUIRE(w.has_value());
    for (int i = 0; i < 3; ++i) REQUIRE((*w)->append(nlohmann::json{{"i", i}}).has_value());
    REQUIRE((*w)->close().has_value());
  }
  {
    auto w = wal::WriteAheadLog::open(opts);
    REQUIRE(w.has_value());
    REQUIRE((*w)->stats().sequence_number == 3);
    REQUIRE((*w)->append(nlohmann::json{{"i", 3}}).value() == 4);
  }
  auto w = wal::WriteAheadLog::open(opts);
  REQUIRE(w.has_value());
  REQUIRE((*w)->append(nlohmann::json{{"i", 4}}).value() == 5);
  REQUIRE((*w)->close().has_value());
}

TEST_CASE("sequence resumes from the highest record when segment names are out of order", "[wal][sequence][clock]") {
  // A clock that stepped back between runs leaves a higher-numbered segment with an older name.
  auto dir = test_support::fresh_temp_dir("walden_seq_clock_skew");
  auto segs = dir / "segments";
  std::filesystem::create_directories(segs);
  auto write_records = [&](const std::filesystem::path& file, std::uint64_t first, std::uint64_t last) {
    std::string body;
    for (std::uint64_t s = first; s <= last; ++s) {
      body += *wal::encode_line(wal::OperationRecord{s, 1.0, nlohmann::json{{"s", s}}});
    }
    test_support::append_raw(file, body);
  };
  write_records(segs / wal::segment_file_name(2000000000000ull, 1), 1, 3);
  write_records(segs / wal::segment_file_name(1000000000000ull, 4), 4, 6);

  wal::WalOptions opts; opts.base_path = dir; opts.checkpoint_interval = 1000000;
  auto w = wal::WriteAheadLog::open(opts);
  REQUIRE(w.has_value());
  REQUIRE((*w)->stats().sequence_number == 6);
  REQUIRE((*w)->append(nlohmann::json{{"s", "new"}}).value() == 7);

  // The new segment sorts after every existing one.
  auto listed = wal::list_segments(segs);
  REQUIRE(listed.has_value());
  REQUIRE(listed->size() == 3);
  REQUIRE(listed->back() == (*w)->active_segment());
  auto parsed = wal::parse_segment_name(listed->back().filename().string());
  REQUIRE(parsed.has_value());
  REQUIRE(parsed->epoch_ms >= 2000000000000ull);
  REQUIRE(parsed->start_sequence == 7);

  auto ops = (*w)->recover();
  REQUIRE(ops.has_value());
  REQUIRE(ops->size() == 7);
  REQUIRE(ops->back()["s"] == "new");
  REQUIRE((*w)->close().has_value());

  auto last = wal::scan_last_sequence(segs);
  REQUIRE(last.has_value());
  REQUIRE(*last == 7);
}
