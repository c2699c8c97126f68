#pragma once

// asteria/version.hpp — Version manifest for every persisted format.
//
// INVARIANT:
//   Any structural change to a format written to disk bumps its constant here
//   before the change ships. Readers compare against these values.

#include <cstdint>
#include <string>

#ifndef ASTERIA_VERSION_STRING
#define ASTERIA_VERSION_STRING "0.3.0"
#endif

namespace asteria {
namespace version {

// ---------------------------------------------------------------------------
// ARTIFACT_FORMAT_VERSION
// Version 1 = one line of lowercase SHA-256 hex followed by '\n'.
// ---------------------------------------------------------------------------
constexpr uint32_t ARTIFACT_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// LEDGER_FORMAT_VERSION
// Version 1 = NDJSON entries chained with domain-separated BLAKE3 ("ledger:").
// ---------------------------------------------------------------------------
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// REPORT_FORMAT_VERSION
// Version 1 = {weld_id, seed, manifest_sha256, sample, gates[3], status},
//             numbers as %.6f.
// Version 2 = same fields, numbers in shortest round-trip form.
// Adding or reordering gates requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t REPORT_FORMAT_VERSION = 2;

struct VersionManifest {
  std::string semver{ASTERIA_VERSION_STRING};
  uint32_t artifact_format{ARTIFACT_FORMAT_VERSION};
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t report_format{REPORT_FORMAT_VERSION};
  std::string manifest_hash;    // "sha256"
  std::string chain_hash;       // "blake3"
  std::string build_timestamp;  // __DATE__ " " __TIME__
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace asteria
