#include "walden/wal/integrity.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace walden::wal {

namespace {

struct MdCtxDeleter { void operator()(EVP_MD_CTX* c) const noexcept { EVP_MD_CTX_free(c); } };
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

auto to_hex(const unsigned char* p, unsigned int n) -> std::string {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out(static_cast<std::size_t>(n) * 2, '0');
  for (unsigned int i = 0; i < n; ++i) {
    out[2 * i] = digits[p[i] >> 4];
    out[2 * i + 1] = digits[p[i] & 0x0F];
  }
  return out;
}

auto new_sha256() -> std::expected<MdCtx, core::error> {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return std::unexpected(core::error{core::error_code::internal, "sha256 init failed", "wal.integrity"});
  }
  return ctx;
}

auto finish(EVP_MD_CTX* ctx) -> std::expected<std::string, core::error> {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, md.data(), &len) != 1) {
    return std::unexpected(core::error{core::error_code::internal, "sha256 final failed", "wal.integrity"});
  }
  return to_hex(md.data(), len);
}

} // namespace

auto sha256_hex(std::string_view bytes) -> std::expected<std::string, core::error> {
  auto ctx = new_sha256();
  if (!ctx) return std::unexpected(ctx.error());
  if (EVP_DigestUpdate(ctx->get(), bytes.data(), bytes.size()) != 1) {
    return std::unexpected(core::error{core::error_code::internal, "sha256 update failed", "wal.integrity"});
  }
  return finish(ctx->get());
}

auto sha256_file(const std::filesystem::path& path, std::optional<std::uint64_t> max_bytes)
    -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::not_found, "open for checksum failed: " + path.filename().string(), "wal.integrity"});
  auto ctx = new_sha256();
  if (!ctx) return std::unexpected(ctx.error());

  std::array<char, INTEGRITY_CHUNK_SIZE> buf{};
  std::uint64_t remaining = max_bytes.value_or(~0ull);
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buf.size(), remaining));
    in.read(buf.data(), want);
    const auto got = in.gcount();
    if (got > 0) {
      if (EVP_DigestUpdate(ctx->get(), buf.data(), static_cast<std::size_t>(got)) != 1) {
        return std::unexpected(error{error_code::internal, "sha256 update failed", "wal.integrity"});
      }
      remaining -= static_cast<std::uint64_t>(got);
    }
    if (got < want) {
      if (in.bad()) return std::unexpected(error{error_code::io_failed, "read for checksum failed", "wal.integrity"});
      break; // EOF
    }
  }
  if (max_bytes && remaining > 0) {
    return std::unexpected(error{error_code::data_integrity, "file shorter than checksummed length", "wal.integrity"});
  }
  return finish(ctx->get());
}

} // namespace walden::wal
