#pragma once

// asteria/ledger.hpp — Append-only, hash-chained governance ledger.
//
// FORMAT (NDJSON, one entry per line):
//   {"seq":N,"prev":"<blake3>","ledger_version":V,"timestamp_unix_ms":T,
//    "report_digest":"<blake3>","status":"pass|warn|fail","report":{...}}
//
// INVARIANTS:
//   1. APPEND-ONLY: existing lines are never rewritten.
//   2. SEQUENTIAL: seq increases by one per successful append.
//   3. CHAINED: prev is ledger_entry_hash() of the previous line in the file
//      (64 zeros for the first line). Opening an existing ledger resumes seq
//      and the chain from its last line. verify_ledger_chain() recomputes it.
//   5. SELF-DESCRIBING: report_digest is report_hash() of the embedded report
//      and status matches the report's own status field.
//   4. A failed append writes nothing and does not advance seq or the chain.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "asteria/gates.hpp"
#include "asteria/types.hpp"

namespace asteria {

inline constexpr const char* kLedgerGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct LedgerEntry {
  std::uint64_t sequence{0};
  std::string previous_digest;
  std::uint64_t timestamp_unix_ms{0};
  std::string report_digest;
  GateStatus status{GateStatus::pass};
  std::string report_json;
};

std::string ledger_entry_to_json(const LedgerEntry& e);

class GovernanceLedger {
 public:
  // Empty path disables the ledger: append() succeeds without writing.
  explicit GovernanceLedger(const std::string& path = "");
  ~GovernanceLedger();

  GovernanceLedger(const GovernanceLedger&) = delete;
  GovernanceLedger& operator=(const GovernanceLedger&) = delete;

  bool enabled() const;

  // Assigns sequence, previous_digest, timestamp and report_digest in place.
  // An empty report_json is written as {}.
  bool append(LedgerEntry& entry, Error* error);
  bool append_report(const GovernanceReport& report, Error* error);

  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;
  const std::string& last_digest() const;
  const std::string& path() const { return path_; }

 private:
  struct Impl;
  std::string path_;
  std::unique_ptr<Impl> impl_;
};

// Re-reads a ledger file and checks every entry: seq counts up from 1, prev
// links to the line before, report_digest and status match the embedded
// report. On the first bad entry, returns false and sets *broken_at to its
// 1-based line number.
bool verify_ledger_chain(const std::string& path, std::uint64_t* broken_at, Error* error);

}  // namespace asteria
