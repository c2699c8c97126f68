#pragma once

// asteria/gates.hpp — Threshold gates over a telemetry sample.
//
// GATES (fixed declaration order, always all three):
//   omega-stable         pass  omega <= stable
//                        warn  stable < omega <= collapse
//                        fail  omega > collapse
//   integrity-low-bound  pass  I >= Ilow, else fail
//   weld-ok              pass  residual <= tol, else fail (a negative or
//                        non-finite residual or tol also fails)
//
// Evaluation never short-circuits: a failing gate does not hide the others.

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "asteria/types.hpp"

namespace asteria {

inline constexpr std::string_view kGateOmegaStable = "omega-stable";
inline constexpr std::string_view kGateIntegrityLowBound = "integrity-low-bound";
inline constexpr std::string_view kGateWeldOk = "weld-ok";

inline constexpr std::array<std::string_view, 3> kGateOrder = {
    kGateOmegaStable, kGateIntegrityLowBound, kGateWeldOk};

GateVerdict evaluate_omega(const TelemetrySample& sample, const StudyConstants& constants);
GateVerdict evaluate_integrity(const TelemetrySample& sample, const StudyConstants& constants);
GateVerdict evaluate_weld(const TelemetrySample& sample);

// One verdict per entry of kGateOrder, in that order.
std::vector<GateVerdict> evaluate(const TelemetrySample& sample, const StudyConstants& constants);

// Worst status across verdicts (fail > warn > pass). pass for an empty list.
GateStatus overall_status(const std::vector<GateVerdict>& verdicts);

std::string verdict_to_json(const GateVerdict& v);

// ---------------------------------------------------------------------------
// GovernanceReport: one evaluation of one manifest
// ---------------------------------------------------------------------------
struct GovernanceReport {
  std::string weld_id;
  std::int64_t seed{0};
  std::string manifest_sha256;
  TelemetrySample sample;
  std::vector<GateVerdict> verdicts;
  GateStatus status{GateStatus::pass};

  // Compact single-line JSON, fields in fixed order.
  std::string to_json() const;
  // BLAKE3 "report:" digest over to_json().
  std::string digest() const;
};

GovernanceReport build_report(const ReproManifest& manifest, const StudyConstants& constants,
                              const TelemetrySample& sample, const std::string& manifest_digest);

}  // namespace asteria
