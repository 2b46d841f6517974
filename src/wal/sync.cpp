#include "walden/wal/sync.hpp"

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace walden::wal {

auto sync_file(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed: " + p.filename().string(), "wal.sync"});
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed: " + p.filename().string(), "wal.sync"});
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "wal.sync"});
  }
  BOOL ok = ::FlushFileBuffers(h);
  ::CloseHandle(h);
  if (!ok) return std::unexpected(error{error_code::io_failed, "FlushFileBuffers failed", "wal.sync"});
#endif
  return {};
}

auto sync_dir(const std::filesystem::path& dir) -> std::expected<void, core::error> {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(dir.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return {}; // best-effort for directory metadata
  }
  (void)::fsync(fd);
  (void)::close(fd);
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(dir.wstring().c_str(), GENERIC_READ,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
  if (h != INVALID_HANDLE_VALUE) {
    (void)::FlushFileBuffers(h);
    ::CloseHandle(h);
  }
#endif
  return {};
}

} // namespace walden::wal
