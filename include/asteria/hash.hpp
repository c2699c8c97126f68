#pragma once

// asteria/hash.hpp — Digest primitives and the manifest hash artifact.
//
// PRIMITIVES:
//   SHA-256 (OpenSSL EVP) is the manifest digest. Its hex output is identical
//   to `sha256sum`, so artifacts can be cross-checked with coreutils.
//   BLAKE3 is the internal chaining primitive for the governance ledger and
//   report digests. The two are never mixed for the same purpose.
//
// ARTIFACT:
//   A single line: 64 lowercase hex chars followed by '\n'. Written with
//   truncate-create. A reader racing a writer can observe a partial file;
//   write-then-rename is not done.

#include <string>
#include <string_view>

#include "asteria/types.hpp"

namespace asteria {

struct HashRuntimeInfo {
  std::string manifest_primitive;  // "sha256"
  std::string manifest_backend;    // OpenSSL version string
  std::string chain_primitive;     // "blake3"
  std::string chain_version;       // blake3_version()
};

HashRuntimeInfo hash_runtime_info();

std::string sha256_hex(std::string_view payload);
std::string blake3_hex(std::string_view payload);

// Domain-separated BLAKE3: "ledger:" and "report:" prefixes keep the two
// digest spaces disjoint.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string ledger_entry_hash(std::string_view line);
std::string report_hash(std::string_view report_json);

// Stream-hash a file's raw bytes with SHA-256 (64 KB reads). Formatting
// changes in the manifest change the digest. Returns empty on failure and
// fills *error with io_error.
std::string compute_hash(const std::string& path, Error* error);

// Creates parent directories, then truncate-writes digest + "\n".
bool write_artifact(const std::string& digest, const std::string& out_path, Error* error);

// Reads the first line of an artifact. Empty + io_error when unreadable.
std::string read_artifact(const std::string& artifact_path, Error* error);

// Recomputes the manifest digest and compares it to the stored artifact.
// digest_mismatch when they differ.
bool verify_artifact(const std::string& manifest_path, const std::string& artifact_path,
                     Error* error);

bool is_hex_digest(std::string_view s);

}  // namespace asteria
