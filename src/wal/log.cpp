#include "walden/wal/log.hpp"
#include "walden/wal/integrity.hpp"
#include "walden/wal/record.hpp"
#include "walden/wal/recovery.hpp"
#include "walden/core/log.hpp"

#include <algorithm>
#include <iterator>

namespace walden::wal {

auto to_json(const WalStats& s) -> nlohmann::json {
  return nlohmann::json{
    {"total_operations", s.total_operations},
    {"total_batches", s.total_batches},
    {"total_fsyncs", s.total_fsyncs},
    {"total_checkpoints", s.total_checkpoints},
    {"total_rotations", s.total_rotations},
    {"corruption_detections", s.corruption_detections},
    {"recovery_operations", s.recovery_operations},
    {"sequence_number", s.sequence_number},
    {"batch_buffer_size", s.batch_buffer_size},
    {"operations_since_checkpoint", s.operations_since_checkpoint},
    {"checkpoint_count", s.checkpoint_count},
    {"fsync_mode", std::string(to_string(s.fsync_mode))},
    {"closed", s.closed},
  };
}

WriteAheadLog::WriteAheadLog(WalOptions opts)
  : opts_(std::move(opts)),
    segments_dir_(opts_.base_path / "segments"),
    checkpoints_dir_(opts_.base_path / "checkpoints") {}

auto WriteAheadLog::open(WalOptions opts) -> std::expected<std::unique_ptr<WriteAheadLog>, core::error> {
  if (auto v = validate(opts); !v) return std::unexpected(v.error());
  std::unique_ptr<WriteAheadLog> wal(new WriteAheadLog(std::move(opts)));
  if (auto r = wal->init(); !r) return std::unexpected(r.error());
  return wal;
}

auto WriteAheadLog::init() -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  std::filesystem::create_directories(segments_dir_, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "mkdir segments failed", "wal.log"});
  std::filesystem::create_directories(checkpoints_dir_, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "mkdir checkpoints failed", "wal.log"});

  auto loaded = load_checkpoints(checkpoints_dir_);
  if (!loaded) return std::unexpected(loaded.error());
  checkpoints_ = std::move(loaded->checkpoints);

  auto last = scan_last_sequence(segments_dir_);
  if (!last) return std::unexpected(last.error());
  sequence_ = *last;
  for (const auto& cp : checkpoints_) sequence_ = std::max(sequence_, cp.sequence_number);

  auto seg = SegmentWriter::open(segments_dir_, opts_.max_segment_size, sequence_ + 1);
  if (!seg) return std::unexpected(seg.error());
  segment_ = std::move(*seg);
  last_flush_ = std::chrono::steady_clock::now();
  state_ = State::Ready;

  core::log_info("log", "opened " + opts_.base_path.string() + " at sequence " + std::to_string(sequence_) +
                        " (" + std::to_string(checkpoints_.size()) + " checkpoints, mode " + std::string(to_string(opts_.fsync_mode)) + ")");

  if (opts_.fsync_mode != FsyncMode::Always) {
    flusher_ = std::thread([this]{ flusher_loop(); });
  }
  return {};
}

WriteAheadLog::~WriteAheadLog() {
  stop_flusher();
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != State::Ready) return;
  if (auto r = flush_locked(sync_on_flush()); !r) {
    core::log_error("log", "flush on destruction failed: " + r.error().message);
  }
  if (auto r = segment_.close(); !r) {
    core::log_error("log", "segment close on destruction failed: " + r.error().message);
  }
  state_ = State::Closed;
}

auto WriteAheadLog::ensure_ready_locked() const -> std::expected<void, core::error> {
  if (state_ != State::Ready) {
    return std::unexpected(core::error{core::error_code::precondition_failed, "write-ahead log is closed", "wal.log"});
  }
  return {};
}

std::uint64_t WriteAheadLog::next_write_sequence_locked() const noexcept {
  return buffer_.empty() ? sequence_ + 1 : buffer_.front().sequence_number;
}

auto WriteAheadLog::flush_locked(bool sync) -> std::expected<void, core::error> {
  if (buffer_.empty()) return {};
  std::size_t written = 0;
  for (const auto& p : buffer_) {
    if (auto w = segment_.write_line(p.line); !w) {
      // Drop what already reached the stream so a later flush cannot duplicate it.
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return std::unexpected(w.error());
    }
    ++written;
  }
  buffer_.clear();
  if (auto f = segment_.flush(sync); !f) return std::unexpected(f.error());
  ops_since_checkpoint_ += written;
  total_batches_++;
  last_flush_ = std::chrono::steady_clock::now();
  return {};
}

auto WriteAheadLog::after_write_locked() -> std::expected<void, core::error> {
  if (ops_since_checkpoint_ >= opts_.checkpoint_interval) {
    if (auto cp = create_checkpoint_locked(); !cp) return std::unexpected(cp.error());
  }
  if (segment_.needs_rotation()) {
    if (auto r = segment_.rotate(next_write_sequence_locked()); !r) return std::unexpected(r.error());
  }
  return {};
}

auto WriteAheadLog::append(nlohmann::json operation) -> std::expected<std::uint64_t, core::error> {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto r = ensure_ready_locked(); !r) return std::unexpected(r.error());

  const std::uint64_t seq = sequence_ + 1;
  auto line = encode_line(OperationRecord{seq, unix_now(), std::move(operation)});
  if (!line) return std::unexpected(line.error());
  sequence_ = seq;
  buffer_.push_back(PendingLine{seq, std::move(*line)});
  total_operations_++;

  const bool flush_now = opts_.fsync_mode == FsyncMode::Always ||
                         (opts_.fsync_mode == FsyncMode::Batch && buffer_.size() >= opts_.batch_size);
  if (flush_now) {
    if (auto f = flush_locked(sync_on_flush()); !f) return std::unexpected(f.error());
  }
  if (auto r = after_write_locked(); !r) return std::unexpected(r.error());
  return seq;
}

auto WriteAheadLog::append_batch(std::vector<nlohmann::json> operations)
    -> std::expected<std::vector<std::uint64_t>, core::error> {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto r = ensure_ready_locked(); !r) return std::unexpected(r.error());
  std::vector<std::uint64_t> seqs;
  if (operations.empty()) return seqs;

  // Encode everything first so a bad payload leaves no partial batch behind.
  std::vector<PendingLine> pending;
  pending.reserve(operations.size());
  seqs.reserve(operations.size());
  const double ts = unix_now();
  std::uint64_t seq = sequence_;
  for (auto& op : operations) {
    ++seq;
    auto line = encode_line(OperationRecord{seq, ts, std::move(op)});
    if (!line) return std::unexpected(line.error());
    pending.push_back(PendingLine{seq, std::move(*line)});
    seqs.push_back(seq);
  }
  sequence_ = seq;
  total_operations_ += pending.size();
  buffer_.insert(buffer_.end(), std::make_move_iterator(pending.begin()), std::make_move_iterator(pending.end()));

  if (auto f = flush_locked(sync_on_flush()); !f) return std::unexpected(f.error());
  if (auto r = after_write_locked(); !r) return std::unexpected(r.error());
  return seqs;
}

auto WriteAheadLog::flush() -> std::expected<void, core::error> {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto r = ensure_ready_locked(); !r) return std::unexpected(r.error());
  if (auto f = flush_locked(sync_on_flush()); !f) return std::unexpected(f.error());
  return after_write_locked();
}

auto WriteAheadLog::create_checkpoint() -> std::expected<Checkpoint, core::error> {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto r = ensure_ready_locked(); !r) return std::unexpected(r.error());
  return create_checkpoint_locked();
}

auto WriteAheadLog::create_checkpoint_locked() -> std::expected<Checkpoint, core::error> {
  if (auto f = flush_locked(sync_on_flush()); !f) return std::unexpected(f.error());
  if (auto s = segment_.flush(true); !s) return std::unexpected(s.error());

  Checkpoint cp;
  cp.timestamp = unix_now();
  cp.sequence_number = sequence_;
  cp.operations_count = ops_since_checkpoint_;
  cp.file_path = segment_.path().string();
  cp.segment_size = segment_.size();
  auto sum = sha256_file(segment_.path(), cp.segment_size);
  if (!sum) return std::unexpected(sum.error());
  cp.checksum = std::move(*sum);
  auto id = make_checkpoint_id(cp.sequence_number, cp.timestamp);
  if (!id) return std::unexpected(id.error());
  cp.checkpoint_id = std::move(*id);

  auto saved = save_checkpoint(checkpoints_dir_, cp);
  if (!saved) return std::unexpected(saved.error());

  // Same second and sequence reuse the file name; the new record replaces the old one.
  const auto name = checkpoint_file_name(cp);
  checkpoints_.erase(std::remove_if(checkpoints_.begin(), checkpoints_.end(),
                                    [&](const Checkpoint& c){ return checkpoint_file_name(c) == name; }),
                     checkpoints_.end());
  checkpoints_.push_back(cp);
  total_checkpoints_++;
  ops_since_checkpoint_ = 0;

  auto pruned = prune_checkpoints(checkpoints_dir_, checkpoints_, opts_.keep_checkpoints);
  if (!pruned) return std::unexpected(pruned.error());

  core::log_info("checkpoint", "created " + cp.checkpoint_id + " at sequence " + std::to_string(cp.sequence_number) +
                               " (" + std::to_string(*pruned) + " pruned)");
  return cp;
}

auto WriteAheadLog::recover(std::optional<std::string_view> from_checkpoint)
    -> std::expected<std::vector<nlohmann::json>, core::error> {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto r = ensure_ready_locked(); !r) return std::unexpected(r.error());
  // Make buffered records visible to the scan.
  if (auto f = flush_locked(sync_on_flush()); !f) return std::unexpected(f.error());

  auto start = resolve_start_sequence(checkpoints_, from_checkpoint);
  if (!start) return std::unexpected(start.error());

  RecoveryOptions ro;
  ro.start_sequence = *start;
  ro.checkpoints = checkpoints_;
  ro.active_segment = segment_.path();

  std::vector<nlohmann::json> ops;
  auto st = recover_scan_dir(segments_dir_, ro, [&](const OperationRecord& r){ ops.push_back(r.operation); });
  if (!st) return std::unexpected(st.error());

  corruption_detections_ += st->corruption_detections();
  recovery_operations_ += ops.size();
  if (st->sequence_violations > 0) {
    core::log_warn("recovery", std::to_string(st->sequence_violations) + " non-increasing sequence transitions");
  }
  core::log_info("recovery", "recovered " + std::to_string(ops.size()) + " operations after sequence " +
                             std::to_string(*start) + " (" + std::to_string(st->corruption_detections()) + " corruptions)");
  return ops;
}

auto WriteAheadLog::close() -> std::expected<void, core::error> {
  stop_flusher();
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == State::Closed) return {};
  std::expected<void, core::error> result{};
  if (!buffer_.empty() || ops_since_checkpoint_ > 0) {
    if (auto cp = create_checkpoint_locked(); !cp) result = std::unexpected(cp.error());
  }
  if (auto c = segment_.close(); !c && result) result = std::unexpected(c.error());
  state_ = State::Closed;
  if (!result) core::log_error("log", "close failed: " + result.error().message);
  return result;
}

auto WriteAheadLog::stats() const -> WalStats {
  std::lock_guard<std::mutex> lk(mu_);
  WalStats s;
  s.total_operations = total_operations_;
  s.total_batches = total_batches_;
  s.total_fsyncs = segment_.stats().syncs;
  s.total_checkpoints = total_checkpoints_;
  s.total_rotations = segment_.stats().rotations;
  s.corruption_detections = corruption_detections_;
  s.recovery_operations = recovery_operations_;
  s.sequence_number = sequence_;
  s.batch_buffer_size = buffer_.size();
  s.operations_since_checkpoint = ops_since_checkpoint_;
  s.checkpoint_count = checkpoints_.size();
  s.fsync_mode = opts_.fsync_mode;
  s.closed = state_ == State::Closed;
  return s;
}

auto WriteAheadLog::list_checkpoints() const -> std::vector<Checkpoint> {
  std::lock_guard<std::mutex> lk(mu_);
  return checkpoints_;
}

auto WriteAheadLog::active_segment() const -> std::filesystem::path {
  std::lock_guard<std::mutex> lk(mu_);
  return segment_.path();
}

bool WriteAheadLog::is_closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_ == State::Closed;
}

void WriteAheadLog::flush_if_stale_locked() {
  if (state_ != State::Ready || buffer_.empty()) return;
  const auto age = std::chrono::steady_clock::now() - last_flush_;
  if (age < std::chrono::duration<double>(opts_.batch_timeout)) return;
  auto r = flush_locked(sync_on_flush());
  if (r) r = after_write_locked();
  if (!r) core::log_error("flusher", "background flush failed: " + r.error().message);
}

void WriteAheadLog::flusher_loop() {
  const auto period = std::chrono::duration<double>(opts_.batch_timeout);
  std::unique_lock<std::mutex> lk(mu_);
  while (!stop_flusher_) {
    if (flusher_cv_.wait_for(lk, period, [this]{ return stop_flusher_; })) break;
    flush_if_stale_locked();
  }
}

void WriteAheadLog::stop_flusher() {
  // Only the caller that takes the thread out joins it; concurrent close() calls see an empty handle.
  std::thread flusher;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_flusher_ = true;
    flusher = std::move(flusher_);
  }
  flusher_cv_.notify_all();
  if (flusher.joinable()) flusher.join();
}

} // namespace walden::wal
