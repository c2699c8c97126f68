#include "asteria/gates.hpp"

#include <sstream>

#include "asteria/hash.hpp"
#include "asteria/jsonlite.hpp"
#include "asteria/telemetry.hpp"

namespace asteria {

GateVerdict evaluate_omega(const TelemetrySample& sample, const StudyConstants& constants) {
  GateVerdict v;
  v.gate_name = std::string(kGateOmegaStable);
  v.observed = sample.omega;
  v.threshold = constants.omega_gates.stable;
  if (sample.omega <= constants.omega_gates.stable) {
    v.status = GateStatus::pass;
  } else if (sample.omega <= constants.omega_gates.collapse) {
    v.status = GateStatus::warn;
  } else {
    // Report the bound that was crossed.
    v.threshold = constants.omega_gates.collapse;
    v.status = GateStatus::fail;
  }
  return v;
}

GateVerdict evaluate_integrity(const TelemetrySample& sample, const StudyConstants& constants) {
  GateVerdict v;
  v.gate_name = std::string(kGateIntegrityLowBound);
  v.observed = sample.integrity;
  v.threshold = constants.i_low;
  v.status = sample.integrity >= constants.i_low ? GateStatus::pass : GateStatus::fail;
  return v;
}

GateVerdict evaluate_weld(const TelemetrySample& sample) {
  GateVerdict v;
  v.gate_name = std::string(kGateWeldOk);
  v.observed = sample.weld.residual;
  v.threshold = sample.weld.tol;
  // A sample that bypassed make_sample() may carry negative or non-finite
  // weld inputs; weld_ok() rejects those and the gate fails.
  const auto ok = weld_ok(sample.weld.residual, sample.weld.tol, nullptr);
  v.status = ok.value_or(false) ? GateStatus::pass : GateStatus::fail;
  return v;
}

std::vector<GateVerdict> evaluate(const TelemetrySample& sample, const StudyConstants& constants) {
  std::vector<GateVerdict> out;
  out.reserve(kGateOrder.size());
  out.push_back(evaluate_omega(sample, constants));
  out.push_back(evaluate_integrity(sample, constants));
  out.push_back(evaluate_weld(sample));
  return out;
}

GateStatus overall_status(const std::vector<GateVerdict>& verdicts) {
  GateStatus worst = GateStatus::pass;
  for (const auto& v : verdicts) {
    if (v.status == GateStatus::fail) return GateStatus::fail;
    if (v.status == GateStatus::warn) worst = GateStatus::warn;
  }
  return worst;
}

std::string verdict_to_json(const GateVerdict& v) {
  std::ostringstream o;
  o << "{\"gate\":\"" << v.gate_name << "\""
    << ",\"observed\":" << jsonlite::format_double(v.observed)
    << ",\"threshold\":" << jsonlite::format_double(v.threshold)
    << ",\"status\":\"" << to_string(v.status) << "\"}";
  return o.str();
}

std::string GovernanceReport::to_json() const {
  std::ostringstream o;
  o << "{\"weld_id\":\"" << jsonlite::escape(weld_id) << "\""
    << ",\"seed\":" << seed
    << ",\"manifest_sha256\":\"" << manifest_sha256 << "\""
    << ",\"sample\":{\"kappa\":" << jsonlite::format_double(sample.kappa)
    << ",\"I\":" << jsonlite::format_double(sample.integrity)
    << ",\"omega\":" << jsonlite::format_double(sample.omega)
    << ",\"weld\":{\"residual\":" << jsonlite::format_double(sample.weld.residual)
    << ",\"tol\":" << jsonlite::format_double(sample.weld.tol) << "}}"
    << ",\"gates\":[";
  for (size_t i = 0; i < verdicts.size(); ++i) {
    if (i) o << ",";
    o << verdict_to_json(verdicts[i]);
  }
  o << "],\"status\":\"" << to_string(status) << "\"}";
  return o.str();
}

std::string GovernanceReport::digest() const {
  return report_hash(to_json());
}

GovernanceReport build_report(const ReproManifest& manifest, const StudyConstants& constants,
                              const TelemetrySample& sample, const std::string& manifest_digest) {
  GovernanceReport r;
  r.weld_id = manifest.weld_id;
  r.seed = manifest.seed;
  r.manifest_sha256 = manifest_digest;
  r.sample = sample;
  r.verdicts = evaluate(sample, constants);
  r.status = overall_status(r.verdicts);
  return r;
}

}  // namespace asteria
