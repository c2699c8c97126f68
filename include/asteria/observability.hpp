#pragma once

// asteria/observability.hpp — Structured stage events.
//
// Every pipeline stage (manifest load, hash, gate evaluation, planner state,
// launch) emits one StageEvent. Events are:
//   - counted in the process-wide StageStats,
//   - passed to a registered hook if one is set (tests use this),
//   - otherwise appended as one JSON line to $ASTERIA_EVENT_LOG when set.
// Emission never fails the caller: a sink that cannot be opened is skipped.

#include <chrono>
#include <cstdint>
#include <string>

#include "asteria/types.hpp"

namespace asteria {

struct StageEvent {
  std::string stage;        // e.g. "manifest.load", "planner.firmware_discover"
  bool ok{true};
  std::string error_code;   // to_string(ErrorCode), empty when ok
  std::string detail;       // short free text: a path, a digest, a verdict
  uint64_t duration_ns{0};
};

std::string event_to_json(const StageEvent& ev);

struct StageStats {
  uint64_t events{0};
  uint64_t failures{0};
};

// Single-threaded process: plain counters.
StageStats& global_stage_stats();

void emit_event(const StageEvent& ev);

using StageEventHook = void (*)(const StageEvent&);
// nullptr restores the default JSONL sink.
void set_stage_event_hook(StageEventHook hook);

// Convenience for a failed stage.
void emit_failure(const std::string& stage, const Error& error, uint64_t duration_ns = 0);

// Writes error.to_json() to stderr, followed by the remediation line when set.
void report_error(const Error& error);

// ---------------------------------------------------------------------------
// ScopeTimer: RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace asteria
