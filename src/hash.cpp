#include "asteria/hash.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

#include <openssl/crypto.h>
#include <openssl/evp.h>

extern "C" {
#include <blake3.h>
}

namespace asteria {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.manifest_primitive = "sha256";
  info.manifest_backend = OpenSSL_version(OPENSSL_VERSION);
  info.chain_primitive = "blake3";
  info.chain_version = blake3_version();
  return info;
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (EVP_Digest(payload.data(), payload.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    return {};
  }
  return to_hex(out.data(), len);
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string ledger_entry_hash(std::string_view line) {
  return hash_domain("ledger:", line);
}

std::string report_hash(std::string_view report_json) {
  return hash_domain("report:", report_json);
}

std::string compute_hash(const std::string& path, Error* error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    if (error) *error = make_error(ErrorCode::io_error, "cannot read manifest: " + path);
    return {};
  }

  EvpCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    if (error) *error = make_error(ErrorCode::io_error, "sha256 context initialisation failed");
    return {};
  }

  constexpr std::size_t buffer_size = 65536;
  std::array<char, buffer_size> buffer{};
  while (file.good()) {
    file.read(buffer.data(), buffer.size());
    const std::streamsize count = file.gcount();
    if (count > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
      if (error) *error = make_error(ErrorCode::io_error, "sha256 update failed");
      return {};
    }
  }
  if (file.bad()) {
    if (error) *error = make_error(ErrorCode::io_error, "read error on manifest: " + path);
    return {};
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1) {
    if (error) *error = make_error(ErrorCode::io_error, "sha256 finalisation failed");
    return {};
  }
  return to_hex(out.data(), len);
}

bool write_artifact(const std::string& digest, const std::string& out_path, Error* error) {
  namespace fs = std::filesystem;
  const fs::path target(out_path);
  if (target.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      if (error) *error = make_error(ErrorCode::io_error,
                                     "cannot create " + target.parent_path().string() + ": " + ec.message());
      return false;
    }
  }

  std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    if (error) *error = make_error(ErrorCode::io_error, "cannot open artifact for writing: " + out_path);
    return false;
  }
  ofs << digest << '\n';
  ofs.flush();
  if (!ofs) {
    if (error) *error = make_error(ErrorCode::io_error, "short write to artifact: " + out_path);
    return false;
  }
  return true;
}

std::string read_artifact(const std::string& artifact_path, Error* error) {
  std::ifstream ifs(artifact_path, std::ios::binary);
  if (!ifs) {
    if (error) *error = make_error(ErrorCode::io_error, "cannot read artifact: " + artifact_path,
                                   "run `asteria hash` to produce it");
    return {};
  }
  std::string line;
  std::getline(ifs, line);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

bool verify_artifact(const std::string& manifest_path, const std::string& artifact_path,
                     Error* error) {
  const std::string expected = read_artifact(artifact_path, error);
  if (expected.empty()) {
    if (error && error->ok()) {
      *error = make_error(ErrorCode::io_error, "artifact is empty: " + artifact_path);
    }
    return false;
  }
  const std::string actual = compute_hash(manifest_path, error);
  if (actual.empty()) return false;
  if (actual != expected) {
    if (error) *error = make_error(ErrorCode::digest_mismatch,
                                   "manifest digest " + actual + " does not match artifact " + expected,
                                   "re-run `asteria hash` if the manifest change is intended");
    return false;
  }
  return true;
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != 64) return false;
  for (char c : s) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

}  // namespace asteria
