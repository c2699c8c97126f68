#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <unistd.h>

#include "asteria/gates.hpp"
#include "asteria/hash.hpp"
#include "asteria/jsonlite.hpp"
#include "asteria/launch_config.hpp"
#include "asteria/launcher.hpp"
#include "asteria/ledger.hpp"
#include "asteria/manifest.hpp"
#include "asteria/observability.hpp"
#include "asteria/planner.hpp"
#include "asteria/telemetry.hpp"
#include "asteria/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / ("asteria_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void write_file(const fs::path& p, const std::string& content) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << content;
}

asteria::StudyConstants study_constants() {
  asteria::StudyConstants c;
  c.omega_gates.stable = 0.038;
  c.omega_gates.collapse = 0.30;
  c.c_ref = 1.0;
  c.i_low = 0.594;
  return c;
}

asteria::TelemetrySample sample_with(double kappa, double omega, double residual = 0.0,
                                     double tol = 0.005) {
  asteria::Error err;
  auto s = asteria::make_sample(kappa, omega, residual, tol, &err);
  expect(s.has_value(), "make_sample must accept finite inputs");
  return *s;
}

const char* kManifestJson =
    "{\"weld_id\":\"ss1m_block_collapse_v1\",\"tol\":0.005,\"residual\":0.0,"
    "\"seed\":3021,\"manifest_sha256\":\"\"}";

const char* kConstantsJson =
    "{\"omega_gates\":{\"stable\":0.038,\"collapse\":0.30},\"C_ref\":1.0,\"Ilow\":0.594,"
    "\"notes\":\"reference thresholds\"}";

// ============================================================================
// TelemetryEngine
// ============================================================================

void test_integrity_at_zero() {
  asteria::Error err;
  const auto i = asteria::integrity(0.0, &err);
  expect(i.has_value() && *i == 1.0, "integrity(0) must be exactly 1.0");
}

void test_integrity_positive_and_monotonic() {
  asteria::Error err;
  double prev = 0.0;
  for (double k = -50.0; k <= 50.0; k += 0.5) {
    const auto i = asteria::integrity(k, &err);
    expect(i.has_value(), "integrity must be defined for moderate kappa");
    expect(*i > 0.0, "integrity must be strictly positive");
    expect(*i > prev, "integrity must be strictly increasing");
    prev = *i;
  }
  const auto tiny = asteria::integrity(-1e6, &err);
  expect(tiny.has_value() && *tiny > 0.0, "integrity must stay positive for very negative kappa");
}

void test_integrity_rejects_non_finite() {
  asteria::Error err;
  expect(!asteria::integrity(std::numeric_limits<double>::quiet_NaN(), &err).has_value(),
         "NaN kappa must be rejected");
  expect(err.code == asteria::ErrorCode::invalid_metric, "NaN kappa -> invalid_metric");
  err = {};
  expect(!asteria::integrity(std::numeric_limits<double>::infinity(), &err).has_value(),
         "infinite kappa must be rejected");
  expect(err.code == asteria::ErrorCode::invalid_metric, "inf kappa -> invalid_metric");
}

void test_weld_ok() {
  asteria::Error err;
  expect(*asteria::weld_ok(0.0, 0.005, &err), "zero residual is within tolerance");
  expect(*asteria::weld_ok(0.005, 0.005, &err), "residual == tol passes");
  expect(!*asteria::weld_ok(0.006, 0.005, &err), "residual > tol fails");
  expect(!asteria::weld_ok(-1.0, 0.005, &err).has_value(), "negative residual rejected");
  expect(err.code == asteria::ErrorCode::invalid_metric, "negative residual -> invalid_metric");
  err = {};
  expect(!asteria::weld_ok(0.0, std::numeric_limits<double>::quiet_NaN(), &err).has_value(),
         "NaN tol rejected");
}

void test_projection_and_ratio() {
  const auto s = sample_with(0.0, 0.02);
  asteria::Error err;
  const double dk = 0.45000000000000007;
  const auto p = asteria::project(s, dk, &err);
  expect(p.has_value(), "projection must succeed");
  expect(p->kappa_t1 == dk, "kappa_t1 = kappa + dk");
  expect(std::fabs(p->integrity_t1 - std::exp(dk)) < 1e-12, "I_t1 = I * e^dk");
  expect(asteria::ratio_consistent(dk, std::exp(dk)), "exact ratio is consistent");
  expect(!asteria::ratio_consistent(dk, std::exp(dk) * 1.001), "0.1% off is inconsistent");
}

// ============================================================================
// GateEvaluator
// ============================================================================

void test_omega_stable_pass() {
  const auto v = asteria::evaluate_omega(sample_with(0.0, 0.02), study_constants());
  expect(v.gate_name == "omega-stable", "gate name");
  expect(v.status == asteria::GateStatus::pass, "omega=0.02 must pass");
}

void test_omega_stable_warn() {
  const auto v = asteria::evaluate_omega(sample_with(0.0, 0.20), study_constants());
  expect(v.status == asteria::GateStatus::warn, "omega=0.20 must warn");
}

void test_omega_stable_fail() {
  const auto v = asteria::evaluate_omega(sample_with(0.0, 0.5), study_constants());
  expect(v.status == asteria::GateStatus::fail, "omega=0.5 must fail");
  expect(v.threshold == 0.30, "failing verdict reports the collapse bound");
}

void test_omega_boundaries() {
  const auto c = study_constants();
  expect(asteria::evaluate_omega(sample_with(0.0, 0.038), c).status == asteria::GateStatus::pass,
         "omega == stable passes");
  expect(asteria::evaluate_omega(sample_with(0.0, 0.30), c).status == asteria::GateStatus::warn,
         "omega == collapse warns");
}

void test_integrity_gate() {
  const auto c = study_constants();
  const auto pass = asteria::evaluate_integrity(sample_with(0.0, 0.02), c);
  expect(pass.observed == 1.0, "I at kappa=0 is 1.0");
  expect(pass.status == asteria::GateStatus::pass, "I=1.0 >= 0.594 passes");
  const auto fail = asteria::evaluate_integrity(sample_with(-1.0, 0.02), c);
  expect(fail.status == asteria::GateStatus::fail, "I=e^-1 < 0.594 fails");
}

void test_evaluate_total_and_ordered() {
  // All three gates fail; none may be hidden.
  const auto verdicts = asteria::evaluate(sample_with(-1.0, 0.9, 1.0, 0.005), study_constants());
  expect(verdicts.size() == asteria::kGateOrder.size(), "one verdict per gate");
  for (size_t i = 0; i < verdicts.size(); ++i) {
    expect(verdicts[i].gate_name == asteria::kGateOrder[i], "verdicts in declaration order");
    expect(verdicts[i].status == asteria::GateStatus::fail, "every gate fails in this sample");
  }
  expect(asteria::overall_status(verdicts) == asteria::GateStatus::fail, "overall fail");
}

void test_overall_status() {
  const auto c = study_constants();
  expect(asteria::overall_status(asteria::evaluate(sample_with(0.0, 0.02), c)) ==
             asteria::GateStatus::pass, "all pass -> pass");
  expect(asteria::overall_status(asteria::evaluate(sample_with(0.0, 0.2), c)) ==
             asteria::GateStatus::warn, "one warn -> warn");
  expect(asteria::overall_status({}) == asteria::GateStatus::pass, "empty -> pass");
}

void test_report_json_and_digest() {
  asteria::Error err;
  const auto m = asteria::parse_repro_manifest(kManifestJson, &err);
  expect(m.has_value(), "manifest parses");
  const auto report = asteria::build_report(*m, study_constants(), sample_with(0.0, 0.2),
                                            std::string(64, 'a'));
  expect(report.status == asteria::GateStatus::warn, "report status is worst verdict");
  const std::string json = report.to_json();
  std::optional<asteria::jsonlite::JsonError> jerr;
  const auto obj = asteria::jsonlite::parse(json, &jerr);
  expect(!jerr, "report JSON must be strictly valid");
  expect(asteria::jsonlite::get_string(obj, "weld_id") == "ss1m_block_collapse_v1", "weld_id");
  expect(asteria::jsonlite::get_string(obj, "status") == "warn", "status field");
  expect(report.digest() == report.digest(), "report digest deterministic");
  expect(report.digest().size() == 64, "report digest is 64 hex chars");
}

void test_weld_gate_rejects_negative_residual() {
  // Built by hand, bypassing make_sample(), as a caller holding raw metrics might.
  asteria::TelemetrySample s;
  s.kappa = 0.0;
  s.integrity = 1.0;
  s.omega = 0.02;
  s.weld.residual = -1.0;
  s.weld.tol = 0.005;
  const auto v = asteria::evaluate_weld(s);
  expect(v.gate_name == "weld-ok", "gate name");
  expect(v.status == asteria::GateStatus::fail, "negative residual must fail the weld gate");

  const auto verdicts = asteria::evaluate(s, study_constants());
  expect(verdicts[2].status == asteria::GateStatus::fail, "weld verdict fails inside evaluate");
  expect(asteria::overall_status(verdicts) == asteria::GateStatus::fail, "overall fail");

  s.weld.residual = 0.0;
  s.weld.tol = std::numeric_limits<double>::quiet_NaN();
  expect(asteria::evaluate_weld(s).status == asteria::GateStatus::fail, "NaN tol fails");
}

void test_report_keeps_extreme_values() {
  auto c = study_constants();
  c.i_low = 1e-9;
  const auto s = sample_with(-25.0, 1e100);
  const auto verdicts = asteria::evaluate(s, c);
  expect(verdicts[0].status == asteria::GateStatus::fail, "omega=1e100 fails");
  expect(verdicts[1].status == asteria::GateStatus::fail, "I=e^-25 is below Ilow=1e-9");

  for (const auto& v : verdicts) {
    const std::string json = asteria::verdict_to_json(v);
    std::optional<asteria::jsonlite::JsonError> jerr;
    const auto obj = asteria::jsonlite::parse(json, &jerr);
    expect(!jerr, "verdict JSON is valid");
    const auto* observed = asteria::jsonlite::find(obj, "observed");
    expect(observed && asteria::jsonlite::is_number(*observed), "observed is a number");
    expect(asteria::jsonlite::as_double(*observed) == v.observed, "observed survives the report");
    const auto* threshold = asteria::jsonlite::find(obj, "threshold");
    expect(asteria::jsonlite::as_double(*threshold) == v.threshold, "threshold survives the report");
  }
  expect(asteria::verdict_to_json(verdicts[1]).find("\"observed\":0.0,") == std::string::npos,
         "a tiny integrity is not printed as zero");
}

void test_format_double() {
  using asteria::jsonlite::format_double;
  expect(format_double(0.0) == "0.0", "zero");
  expect(format_double(1.0) == "1.0", "integral keeps .0");
  expect(format_double(0.038) == "0.038", "short decimal stays short");
  expect(format_double(0.1 + 0.2) == "0.30000000000000004", "17 digits when needed");
  expect(format_double(-2.5) == "-2.5", "negative");
  expect(std::strtod(format_double(1e100).c_str(), nullptr) == 1e100, "1e100 round-trips");
  expect(std::strtod(format_double(1e-11).c_str(), nullptr) == 1e-11, "1e-11 round-trips");
  expect(std::strtod(format_double(std::exp(-25.0)).c_str(), nullptr) == std::exp(-25.0),
         "e^-25 round-trips");
  expect(format_double(std::numeric_limits<double>::infinity()) == "null", "inf -> null");
}

// ============================================================================
// HashVerifier
// ============================================================================

void test_sha256_known_vector() {
  expect(asteria::sha256_hex("") ==
             "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
         "SHA-256 empty vector");
  expect(asteria::sha256_hex("abc") ==
             "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
         "SHA-256 abc vector");
}

void test_blake3_known_vector() {
  expect(asteria::blake3_hex("") ==
             "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
}

void test_domain_separation() {
  expect(asteria::ledger_entry_hash("x") != asteria::report_hash("x"),
         "ledger and report digests must differ for the same payload");
}

void test_compute_hash_deterministic() {
  const fs::path dir = scratch_dir("hash_det");
  write_file(dir / "m.json", kManifestJson);
  asteria::Error err;
  const std::string a = asteria::compute_hash((dir / "m.json").string(), &err);
  const std::string b = asteria::compute_hash((dir / "m.json").string(), &err);
  expect(a == b, "same bytes -> same digest");
  expect(a == asteria::sha256_hex(kManifestJson), "file digest equals in-memory digest");
  expect(asteria::is_hex_digest(a), "digest is 64 lowercase hex");
  fs::remove_all(dir);
}

void test_compute_hash_one_byte_change() {
  const fs::path dir = scratch_dir("hash_byte");
  std::string text = kManifestJson;
  write_file(dir / "a.json", text);
  text[text.size() - 2] = ' ';
  write_file(dir / "b.json", text);
  asteria::Error err;
  expect(asteria::compute_hash((dir / "a.json").string(), &err) !=
             asteria::compute_hash((dir / "b.json").string(), &err),
         "one changed byte must change the digest");
  fs::remove_all(dir);
}

void test_compute_hash_missing_file() {
  asteria::Error err;
  expect(asteria::compute_hash("/nonexistent/asteria/manifest.json", &err).empty(),
         "missing file yields empty digest");
  expect(err.code == asteria::ErrorCode::io_error, "missing file -> io_error");
}

void test_artifact_write_and_verify() {
  const fs::path dir = scratch_dir("artifact");
  write_file(dir / "m.json", kManifestJson);
  const std::string out = (dir / "dist" / "MANIFEST_SHA256.txt").string();
  asteria::Error err;
  const std::string digest = asteria::compute_hash((dir / "m.json").string(), &err);
  expect(asteria::write_artifact(digest, out, &err), "artifact write creates parent dirs");

  std::ifstream ifs(out, std::ios::binary);
  const std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  expect(content == digest + "\n", "artifact is digest plus newline");
  expect(asteria::verify_artifact((dir / "m.json").string(), out, &err), "fresh artifact verifies");

  write_file(dir / "m.json", std::string(kManifestJson) + "\n");
  err = {};
  expect(!asteria::verify_artifact((dir / "m.json").string(), out, &err), "edited manifest fails");
  expect(err.code == asteria::ErrorCode::digest_mismatch, "edited manifest -> digest_mismatch");
  fs::remove_all(dir);
}

// ============================================================================
// ManifestStore
// ============================================================================

void test_manifest_parse() {
  asteria::Error err;
  const auto m = asteria::parse_repro_manifest(kManifestJson, &err);
  expect(m.has_value(), "canonical manifest parses");
  expect(m->weld_id == "ss1m_block_collapse_v1", "weld_id");
  expect(m->seed == 3021, "seed");
  expect(m->tol == 0.005 && m->residual == 0.0, "tol/residual");
  expect(m->manifest_sha256.empty(), "empty manifest_sha256 accepted");
}

void test_manifest_schema_errors() {
  asteria::Error err;
  expect(!asteria::parse_repro_manifest("{\"tol\":0.1,\"residual\":0,\"seed\":1}", &err),
         "missing weld_id rejected");
  expect(err.code == asteria::ErrorCode::schema_error, "missing field -> schema_error");

  err = {};
  expect(!asteria::parse_repro_manifest(
             "{\"weld_id\":\"w\",\"tol\":\"0.1\",\"residual\":0,\"seed\":1}", &err),
         "string tol rejected");
  expect(err.code == asteria::ErrorCode::schema_error, "mistyped field -> schema_error");

  err = {};
  expect(!asteria::parse_repro_manifest(
             "{\"weld_id\":\"w\",\"tol\":-0.1,\"residual\":0,\"seed\":1}", &err),
         "negative tol rejected");
  expect(err.code == asteria::ErrorCode::schema_error, "negative tol -> schema_error");
}

void test_manifest_parse_errors() {
  asteria::Error err;
  expect(!asteria::parse_repro_manifest("{\"weld_id\":", &err), "truncated JSON rejected");
  expect(err.code == asteria::ErrorCode::parse_error, "truncated -> parse_error");

  err = {};
  expect(!asteria::parse_repro_manifest(
             "{\"weld_id\":\"a\",\"weld_id\":\"b\",\"tol\":0,\"residual\":0,\"seed\":1}", &err),
         "duplicate key rejected");
  expect(err.code == asteria::ErrorCode::parse_error, "duplicate key -> parse_error");

  err = {};
  expect(!asteria::load_repro_manifest("/nonexistent/asteria.json", &err), "missing file rejected");
  expect(err.code == asteria::ErrorCode::parse_error, "missing file -> parse_error");
}

void test_json_wide_integers() {
  std::optional<asteria::jsonlite::JsonError> jerr;
  auto obj = asteria::jsonlite::parse("{\"n\":18446744073709551615}", &jerr);
  expect(!jerr, "uint64 max parses");
  expect(std::holds_alternative<std::uint64_t>(asteria::jsonlite::find(obj, "n")->v),
         "uint64 max stays an integer");

  obj = asteria::jsonlite::parse("{\"n\":18446744073709551616}", &jerr);
  expect(!jerr, "an integer past uint64 is still a valid number");
  const auto* n = asteria::jsonlite::find(obj, "n");
  expect(n && std::holds_alternative<double>(n->v), "wide integer kept as a double");
  expect(asteria::jsonlite::as_double(*n) == 18446744073709551616.0, "wide integer value");
  expect(!asteria::jsonlite::as_int64(*n), "a double is never coerced to an integer");

  obj = asteria::jsonlite::parse("{\"n\":-9223372036854775809}", &jerr);
  expect(!jerr, "an integer past int64 is still a valid number");
  expect(std::holds_alternative<double>(asteria::jsonlite::find(obj, "n")->v),
         "wide negative integer kept as a double");

  obj = asteria::jsonlite::parse("{\"n\":1e400}", &jerr);
  expect(jerr.has_value(), "a number past double range is rejected");

  asteria::Error err;
  expect(!asteria::parse_repro_manifest(
             "{\"weld_id\":\"w\",\"tol\":0.1,\"residual\":0,\"seed\":18446744073709551616}", &err),
         "seed wider than uint64 rejected");
  expect(err.code == asteria::ErrorCode::schema_error, "wide seed -> schema_error, not parse_error");
}

void test_constants_parse() {
  asteria::Error err;
  const auto c = asteria::parse_study_constants(kConstantsJson, &err);
  expect(c.has_value(), "constants parse");
  expect(c->omega_gates.stable == 0.038 && c->omega_gates.collapse == 0.30, "omega gates");
  expect(c->i_low == 0.594 && c->c_ref == 1.0, "Ilow/C_ref");
  expect(c->notes == "reference thresholds", "notes");

  err = {};
  expect(!asteria::parse_study_constants(
             "{\"omega_gates\":{\"stable\":0.5,\"collapse\":0.3},\"C_ref\":1,\"Ilow\":0.5}", &err),
         "stable >= collapse rejected");
  expect(err.code == asteria::ErrorCode::schema_error, "inverted gates -> schema_error");
}

void test_manifest_store_load() {
  const fs::path dir = scratch_dir("store");
  write_file(dir / "m.json", kManifestJson);
  write_file(dir / "c.json", kConstantsJson);
  write_file(dir / "bad.json", "[]");

  asteria::ManifestStore store;
  asteria::Error err;
  expect(!store.load((dir / "bad.json").string(), (dir / "c.json").string(), &err),
         "array top level rejected");
  expect(!store.loaded(), "failed load leaves store empty");
  expect(store.load((dir / "m.json").string(), (dir / "c.json").string(), &err), "store loads");
  expect(store.loaded() && store.manifest().seed == 3021, "store exposes manifest");
  expect(store.manifest_path() == (dir / "m.json").string(), "store remembers manifest path");
  fs::remove_all(dir);
}

// ============================================================================
// Launch configuration
// ============================================================================

void test_config_defaults() {
  asteria::Error err;
  const auto c = asteria::build_launch_config(asteria::LaunchConfig{}, asteria::EnvSnapshot{},
                                              asteria::ParsedFlags{}, &err);
  expect(c.has_value(), "defaults build");
  expect(c->mode == asteria::BootMode::uefi, "default mode uefi");
  expect(c->memory == "1024M" && c->cpu_count == 2, "default mem/cpus");
  expect(c->graphics == asteria::Graphics::sdl, "default graphics sdl");
  expect(c->accelerator == asteria::Accelerator::auto_detect, "default accel auto");
  expect(c->machine_type == "q35" && !c->debug_halt, "default machine/gdb");
}

void test_config_precedence() {
  asteria::EnvSnapshot env;
  env.values["MEM"] = "2G";
  env.values["CPUS"] = "4";
  env.values["IMG"] = "env.img";
  env.values["GDB"] = "1";
  env.values["MACHINE"] = "";  // empty counts as unset
  asteria::ParsedFlags flags;
  asteria::Error err;
  expect(asteria::parse_run_flags({"--mem", "512M", "--nographic", "--accel", "tcg"}, &flags, &err),
         "flags parse");
  const auto c = asteria::build_launch_config(asteria::LaunchConfig{}, env, flags, &err);
  expect(c.has_value(), "config builds");
  expect(c->memory == "512M", "flag beats env");
  expect(c->cpu_count == 4 && c->image_path == "env.img", "env beats default");
  expect(c->graphics == asteria::Graphics::none, "--nographic -> headless");
  expect(c->accelerator == asteria::Accelerator::tcg, "--accel tcg");
  expect(c->debug_halt, "GDB=1 enables debug halt");
  expect(c->machine_type == "q35", "empty MACHINE keeps default");
}

void test_config_errors() {
  asteria::ParsedFlags flags;
  asteria::Error err;
  expect(!asteria::parse_run_flags({"--frobnicate"}, &flags, &err), "unknown flag rejected");
  expect(err.code == asteria::ErrorCode::unknown_argument, "unknown flag -> unknown_argument");
  expect(asteria::exit_code_for(err.code) == 2, "unknown flag exits 2");

  err = {};
  flags = {};
  expect(!asteria::parse_run_flags({"--mem"}, &flags, &err), "missing value rejected");

  asteria::EnvSnapshot env;
  env.values["MODE"] = "pxe";
  err = {};
  expect(!asteria::build_launch_config(asteria::LaunchConfig{}, env, asteria::ParsedFlags{}, &err),
         "unknown MODE rejected");
  expect(err.code == asteria::ErrorCode::unknown_mode, "MODE=pxe -> unknown_mode");
  expect(asteria::exit_code_for(err.code) == 2, "unknown mode exits 2");

  env.values.clear();
  env.values["CPUS"] = "0";
  err = {};
  expect(!asteria::build_launch_config(asteria::LaunchConfig{}, env, asteria::ParsedFlags{}, &err),
         "zero cpus rejected");

  flags = {};
  expect(asteria::parse_run_flags({"--help", "--bogus"}, &flags, &err) && flags.help,
         "help stops flag parsing");

  // bios wins over otherwise invalid settings so the planner can report it.
  env.values.clear();
  env.values["MEM"] = "lots";
  flags = {};
  flags.mode = "bios";
  err = {};
  const auto bios = asteria::build_launch_config(asteria::LaunchConfig{}, env, flags, &err);
  expect(bios.has_value() && bios->mode == asteria::BootMode::bios, "bios config builds");
}

// ============================================================================
// LaunchPlanner
// ============================================================================

class FakeProbe : public asteria::HostProbe {
 public:
  std::set<std::string> files;
  std::set<std::string> char_devices;
  bool is_regular_file(const std::string& path) const override { return files.contains(path); }
  bool is_char_device(const std::string& path) const override {
    return char_devices.contains(path);
  }
};

asteria::PlannerOptions fake_options() {
  asteria::PlannerOptions o;
  o.firmware_code_candidates = {"/fw/a/OVMF_CODE.fd", "/fw/b/OVMF_CODE.fd"};
  o.firmware_vars_candidates = {"/fw/a/OVMF_VARS.fd", "/fw/b/OVMF_VARS.fd"};
  o.kvm_device = "/dev/kvm";
  return o;
}

// The planner holds its host view by reference, so temporaries are refused.
static_assert(std::is_constructible_v<asteria::LaunchPlanner, asteria::LaunchConfig,
                                      const asteria::FilesystemProbe&>);
static_assert(!std::is_constructible_v<asteria::LaunchPlanner, asteria::LaunchConfig,
                                       asteria::FilesystemProbe&&>);
static_assert(!std::is_constructible_v<asteria::LaunchPlanner, asteria::LaunchConfig,
                                       asteria::FilesystemProbe, asteria::PlannerOptions>);

bool trace_contains(const asteria::LaunchPlanner& p, asteria::PlannerState s) {
  for (auto t : p.trace()) {
    if (t == s) return true;
  }
  return false;
}

void test_planner_bios_not_implemented() {
  FakeProbe probe;
  asteria::LaunchConfig c;
  c.mode = asteria::BootMode::bios;
  asteria::LaunchPlanner planner(c, probe, fake_options());
  expect(!planner.run(), "bios must not reach ready");
  expect(planner.error().code == asteria::ErrorCode::not_implemented, "bios -> not_implemented");
  expect(asteria::exit_code_for(planner.error().code) == 2, "bios exits 2");
  expect(!trace_contains(planner, asteria::PlannerState::image_validate), "bios stops at mode");
}

void test_planner_missing_image() {
  FakeProbe probe;
  probe.files = {"/fw/a/OVMF_CODE.fd"};
  asteria::LaunchConfig c;
  c.image_path = "/nope.img";
  asteria::LaunchPlanner planner(c, probe, fake_options());
  expect(!planner.run(), "missing image must not reach ready");
  expect(planner.error().code == asteria::ErrorCode::missing_image, "-> missing_image");
  expect(!planner.error().remediation.empty(), "missing image carries a remediation");
  expect(!trace_contains(planner, asteria::PlannerState::firmware_discover),
         "firmware is never probed without an image");
}

void test_planner_missing_firmware() {
  FakeProbe probe;
  probe.files = {"disk.img", "/fw/a/OVMF_VARS.fd"};
  asteria::LaunchConfig c;
  c.image_path = "disk.img";
  asteria::LaunchPlanner planner(c, probe, fake_options());
  expect(!planner.run(), "missing code blob must fail");
  expect(planner.error().code == asteria::ErrorCode::missing_firmware, "-> missing_firmware");
  expect(asteria::exit_code_for(planner.error().code) == 1, "missing firmware exits 1");
}

void test_planner_first_match_wins() {
  FakeProbe probe;
  probe.files = {"disk.img", "/fw/a/OVMF_CODE.fd", "/fw/b/OVMF_CODE.fd", "/fw/b/OVMF_VARS.fd"};
  asteria::LaunchConfig c;
  c.image_path = "disk.img";
  asteria::LaunchPlanner planner(c, probe, fake_options());
  expect(planner.run(), "planner reaches ready");
  expect(planner.plan().firmware_code == "/fw/a/OVMF_CODE.fd", "first code candidate wins");
  expect(planner.plan().firmware_vars == "/fw/b/OVMF_VARS.fd", "vars scanned independently");

  probe.files.erase("/fw/b/OVMF_VARS.fd");
  asteria::LaunchPlanner no_vars(c, probe, fake_options());
  expect(no_vars.run() && no_vars.plan().firmware_vars.empty(), "vars blob is optional");
}

void test_planner_accel_and_graphics() {
  FakeProbe probe;
  probe.files = {"disk.img", "/fw/a/OVMF_CODE.fd"};
  asteria::LaunchConfig c;
  c.image_path = "disk.img";

  asteria::LaunchPlanner no_kvm(c, probe, fake_options());
  expect(no_kvm.run() && no_kvm.plan().resolved_accel == asteria::Accelerator::tcg,
         "auto without /dev/kvm -> tcg");
  expect(!no_kvm.plan().headless, "sdl by default");

  probe.char_devices = {"/dev/kvm"};
  asteria::LaunchPlanner with_kvm(c, probe, fake_options());
  expect(with_kvm.run() && with_kvm.plan().resolved_accel == asteria::Accelerator::kvm,
         "auto with /dev/kvm -> kvm");

  c.accelerator = asteria::Accelerator::tcg;
  c.graphics = asteria::Graphics::none;
  asteria::LaunchPlanner forced(c, probe, fake_options());
  expect(forced.run() && forced.plan().resolved_accel == asteria::Accelerator::tcg,
         "explicit tcg is never overridden");
  expect(forced.plan().headless, "graphics none -> headless");

  const std::vector<asteria::PlannerState> expected = {
      asteria::PlannerState::mode_select, asteria::PlannerState::image_validate,
      asteria::PlannerState::firmware_discover, asteria::PlannerState::accel_select,
      asteria::PlannerState::graphics_select, asteria::PlannerState::ready};
  expect(forced.trace() == expected, "states visited in order");
}

// ============================================================================
// ProcessLauncher
// ============================================================================

asteria::LaunchPlan sample_plan(const std::string& vars) {
  asteria::LaunchPlan plan;
  plan.config.image_path = "dist/asteria-uefi.img";
  plan.firmware_code = "/usr/share/OVMF/OVMF_CODE.fd";
  plan.firmware_vars = vars;
  plan.resolved_accel = asteria::Accelerator::kvm;
  plan.headless = true;
  return plan;
}

bool has_sequence(const std::vector<std::string>& args, const std::vector<std::string>& seq) {
  for (size_t i = 0; i + seq.size() <= args.size(); ++i) {
    bool match = true;
    for (size_t j = 0; j < seq.size(); ++j) {
      if (args[i + j] != seq[j]) { match = false; break; }
    }
    if (match) return true;
  }
  return false;
}

void test_engine_args() {
  auto plan = sample_plan("");
  auto args = asteria::build_engine_args(plan, "/tmp/vars.fd");
  expect(has_sequence(args, {"-machine", "q35"}), "machine type");
  expect(has_sequence(args, {"-m", "1024M"}), "memory");
  expect(has_sequence(args, {"-smp", "2"}), "cpu count");
  expect(has_sequence(args, {"-serial", "stdio"}), "serial console on stdio");
  expect(has_sequence(args, {"-nographic"}), "headless flag");
  expect(has_sequence(args, {"-accel", "kvm"}), "resolved accel");
  expect(has_sequence(args, {"-drive", "if=pflash,format=raw,readonly=on,file=/usr/share/OVMF/OVMF_CODE.fd"}),
         "read-only code blob");
  expect(has_sequence(args, {"-drive", "if=pflash,format=raw,file=/tmp/vars.fd"}),
         "writable vars copy");
  expect(!has_sequence(args, {"-S", "-s"}), "no gdb stub by default");

  plan.headless = false;
  plan.config.debug_halt = true;
  args = asteria::build_engine_args(plan, "");
  expect(has_sequence(args, {"-display", "sdl"}), "sdl display");
  expect(has_sequence(args, {"-S", "-s"}), "gdb stub when debug halt");
  for (const auto& a : args) {
    expect(a.find("if=pflash,format=raw,file=") == std::string::npos, "no vars drive without a copy");
  }
}

void test_launch_dry_run() {
  asteria::LaunchOptions options;
  options.engine = "qemu-system-x86_64";
  options.search_path = "/nonexistent";
  options.dry_run = true;
  const auto r = asteria::launch(sample_plan("/usr/share/OVMF/OVMF_VARS.fd"), options);
  expect(r.ok, "dry run succeeds without an engine");
  expect(r.command_line.find("qemu-system-x86_64") == 0, "command starts with the engine");
  expect(r.command_line.find("OVMF_VARS.XXXXXX.fd") != std::string::npos,
         "dry run shows the vars placeholder");
}

void test_launch_engine_not_found() {
  asteria::LaunchOptions options;
  options.engine = "asteria-no-such-engine";
  options.search_path = "/nonexistent";
  const auto r = asteria::launch(sample_plan(""), options);
  expect(!r.ok, "missing engine fails");
  expect(r.error.code == asteria::ErrorCode::engine_not_found, "-> engine_not_found");
  expect(!r.error.remediation.empty(), "engine_not_found carries a remediation");
}

void test_launch_removes_vars_copy() {
  const fs::path dir = scratch_dir("launch");
  write_file(dir / "OVMF_VARS.fd", std::string(4096, '\0'));

  asteria::LaunchOptions options;
  options.engine = "true";
  options.search_path = "/usr/bin:/bin";
  options.temp_dir = dir.string();
  const auto ok = asteria::launch(sample_plan((dir / "OVMF_VARS.fd").string()), options);
  expect(ok.ok && ok.exit_code == 0, "engine exit 0 is propagated");
  expect(!ok.vars_copy_path.empty(), "a private vars copy was made");
  expect(ok.vars_copy_path != (dir / "OVMF_VARS.fd").string(), "the original is never used");
  expect(!fs::exists(ok.vars_copy_path), "vars copy removed after exit");
  expect(fs::exists(dir / "OVMF_VARS.fd"), "the original is untouched");

  options.engine = "false";
  const auto bad = asteria::launch(sample_plan((dir / "OVMF_VARS.fd").string()), options);
  expect(bad.ok && bad.exit_code == 1, "non-zero engine status is propagated");
  expect(!fs::exists(bad.vars_copy_path), "vars copy removed after failing exit");
  fs::remove_all(dir);
}

void test_launch_forwards_sigterm() {
  const fs::path dir = scratch_dir("launch_signal");
  write_file(dir / "OVMF_VARS.fd", std::string(4096, '\0'));
  const fs::path engine = dir / "engine.sh";
  write_file(engine, "#!/bin/sh\nexec sleep 30\n");
  fs::permissions(engine, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);

  asteria::LaunchOptions options;
  options.engine = engine.string();
  options.temp_dir = dir.string();

  // Terminate ourselves while launch() waits on the engine.
  std::thread terminator([] {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    ::kill(::getpid(), SIGTERM);
  });
  const auto r = asteria::launch(sample_plan((dir / "OVMF_VARS.fd").string()), options);
  terminator.join();

  expect(r.ok, "signalled engine is still a completed launch");
  expect(r.exit_code == 128 + SIGTERM, "SIGTERM reaches the engine and maps to 143");
  expect(!r.vars_copy_path.empty() && !fs::exists(r.vars_copy_path),
         "vars copy removed after a forwarded signal");
  fs::remove_all(dir);
}

void test_scoped_temp_file() {
  const fs::path dir = scratch_dir("tempfile");
  write_file(dir / "src.bin", "payload");
  asteria::Error err;
  std::string path;
  {
    auto t = asteria::ScopedTempFile::copy_of((dir / "src.bin").string(), dir.string(), "copy",
                                              ".bin", &err);
    expect(t.has_value(), "copy_of succeeds");
    path = t->path();
    expect(fs::exists(path) && fs::file_size(path) == 7, "copy has the source bytes");
    asteria::ScopedTempFile moved = std::move(*t);
    expect(t->empty() && moved.path() == path, "move transfers ownership");
  }
  expect(!fs::exists(path), "temp file removed on destruction");

  err = {};
  expect(!asteria::ScopedTempFile::copy_of((dir / "missing.bin").string(), dir.string(), "copy",
                                           ".bin", &err),
         "missing source fails");
  expect(err.code == asteria::ErrorCode::io_error, "missing source -> io_error");
  std::size_t leftovers = 0;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.path().filename() != "src.bin") ++leftovers;
  }
  expect(leftovers == 0, "failed copy leaves nothing behind");
  fs::remove_all(dir);
}

// ============================================================================
// GovernanceLedger
// ============================================================================

std::vector<std::string> read_lines(const std::string& path) {
  std::ifstream ifs(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) lines.push_back(line);
  return lines;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
  std::ofstream ofs(path, std::ios::trunc);
  for (const auto& l : lines) ofs << l << "\n";
}

asteria::GovernanceReport sample_report(double omega) {
  asteria::Error err;
  const auto m = asteria::parse_repro_manifest(kManifestJson, &err);
  return asteria::build_report(*m, study_constants(), sample_with(0.0, omega),
                               asteria::sha256_hex(kManifestJson));
}

void test_ledger_chain() {
  const fs::path dir = scratch_dir("ledger");
  const std::string path = (dir / "ledger.ndjson").string();
  asteria::Error err;
  {
    asteria::GovernanceLedger ledger(path);
    expect(ledger.append_report(sample_report(0.02), &err), "first append");
    expect(ledger.append_report(sample_report(0.2), &err), "second append");
    expect(ledger.entry_count() == 2 && ledger.failure_count() == 0, "two entries");
  }
  {
    // Reopening resumes sequence and chain.
    asteria::GovernanceLedger ledger(path);
    asteria::LedgerEntry e;
    e.report_json = sample_report(0.5).to_json();
    e.status = asteria::GateStatus::fail;
    e.report_digest = asteria::report_hash(e.report_json);
    expect(ledger.append(e, &err), "append after reopen");
    expect(e.sequence == 3, "sequence resumes");
    expect(e.previous_digest != asteria::kLedgerGenesisDigest, "chain resumes");
  }
  std::uint64_t broken = 0;
  expect(asteria::verify_ledger_chain(path, &broken, &err), "intact chain verifies");

  // Tamper with the first entry's timestamp: only the next link notices.
  auto lines = read_lines(path);
  expect(lines.size() == 3, "three lines on disk");
  const size_t ts = lines[0].find("\"timestamp_unix_ms\":") + 20;
  lines[0][ts] = lines[0][ts] == '9' ? '8' : '9';
  write_lines(path, lines);
  expect(!asteria::verify_ledger_chain(path, &broken, &err), "tampered chain fails");
  expect(broken == 2, "break detected at the entry after the edit");
  expect(err.code == asteria::ErrorCode::digest_mismatch, "broken chain -> digest_mismatch");
  fs::remove_all(dir);
}

std::vector<std::string> ledger_with_three_entries(const std::string& path) {
  asteria::Error err;
  asteria::GovernanceLedger ledger(path);
  expect(ledger.append_report(sample_report(0.02), &err), "append pass");
  expect(ledger.append_report(sample_report(0.2), &err), "append warn");
  expect(ledger.append_report(sample_report(0.5), &err), "append fail");
  return read_lines(path);
}

void test_ledger_detects_last_line_edits() {
  const fs::path dir = scratch_dir("ledger_tail");
  const std::string path = (dir / "ledger.ndjson").string();
  const auto lines = ledger_with_three_entries(path);
  asteria::Error err;
  std::uint64_t broken = 0;
  expect(asteria::verify_ledger_chain(path, &broken, &err), "fresh ledger verifies");

  // No later line links to the last one, so each edit must be caught on its own.
  auto edited = lines;
  edited[2].replace(edited[2].find("\"status\":\"fail\""), 15, "\"status\":\"pass\"");
  write_lines(path, edited);
  expect(!asteria::verify_ledger_chain(path, &broken, &err), "status edit detected");
  expect(broken == 3, "status edit reported on the last line");

  edited = lines;
  edited[2].replace(edited[2].find("\"omega\":0.5"), 11, "\"omega\":0.6");
  write_lines(path, edited);
  broken = 0;
  expect(!asteria::verify_ledger_chain(path, &broken, &err), "report edit detected");
  expect(broken == 3, "report edit reported on the last line");

  edited = lines;
  edited[2].replace(edited[2].find("\"seq\":3"), 7, "\"seq\":7");
  write_lines(path, edited);
  broken = 0;
  expect(!asteria::verify_ledger_chain(path, &broken, &err), "seq edit detected");
  expect(broken == 3, "seq edit reported on the last line");

  edited = lines;
  const size_t rd = edited[2].find("\"report_digest\":\"") + 17;
  edited[2].replace(rd, 64, "not-a-digest");
  write_lines(path, edited);
  broken = 0;
  expect(!asteria::verify_ledger_chain(path, &broken, &err), "malformed digest detected");
  expect(broken == 3, "malformed digest reported on the last line");

  write_lines(path, lines);
  expect(asteria::verify_ledger_chain(path, &broken, &err), "restored ledger verifies");
  fs::remove_all(dir);
}

void test_ledger_disabled() {
  asteria::GovernanceLedger ledger;
  asteria::Error err;
  expect(!ledger.enabled(), "empty path disables the ledger");
  expect(ledger.append_report(sample_report(0.02), &err), "disabled append is a no-op success");
  expect(ledger.entry_count() == 0, "nothing counted");
}

// ============================================================================
// Observability & version
// ============================================================================

std::vector<asteria::StageEvent>& captured_events() {
  static std::vector<asteria::StageEvent> events;
  return events;
}

void capture_event(const asteria::StageEvent& ev) { captured_events().push_back(ev); }

void test_stage_events() {
  captured_events().clear();
  asteria::set_stage_event_hook(capture_event);
  const auto before = asteria::global_stage_stats();

  FakeProbe probe;
  asteria::LaunchConfig c;
  c.image_path = "/nope.img";
  asteria::LaunchPlanner planner(c, probe, fake_options());
  planner.run();
  asteria::set_stage_event_hook(nullptr);

  expect(captured_events().size() == 2, "one event per planner transition");
  expect(captured_events()[0].stage == "planner.mode_select" && captured_events()[0].ok,
         "mode select event");
  expect(captured_events()[1].stage == "planner.image_validate", "image validate event");
  expect(!captured_events()[1].ok && captured_events()[1].error_code == "missing_image",
         "failure event carries the error code");
  const auto after = asteria::global_stage_stats();
  expect(after.events == before.events + 2 && after.failures == before.failures + 1,
         "stats count events and failures");
}

void test_error_json() {
  const auto e = asteria::make_error(asteria::ErrorCode::missing_firmware, "no \"OVMF\"", "install");
  std::optional<asteria::jsonlite::JsonError> jerr;
  const auto obj = asteria::jsonlite::parse(e.to_json(), &jerr);
  expect(!jerr, "error JSON is valid");
  expect(asteria::jsonlite::get_string(obj, "error") == "missing_firmware", "error code field");
  expect(asteria::jsonlite::get_string(obj, "remediation") == "install", "remediation field");
}

void test_version_manifest() {
  const auto m = asteria::version::current_manifest();
  expect(m.ledger_format == asteria::version::LEDGER_FORMAT_VERSION, "ledger format");
  expect(m.report_format == 2, "reports use round-trip number formatting");
  expect(m.manifest_hash == "sha256" && m.chain_hash == "blake3", "hash primitives");
  std::optional<asteria::jsonlite::JsonError> jerr;
  asteria::jsonlite::parse(asteria::version::manifest_to_json(m), &jerr);
  expect(!jerr, "version manifest JSON is valid");
}

}  // namespace

int main() {
  std::cout << "=== Asteria Test Suite ===\n";

  std::cout << "\n[Telemetry]\n";
  run_test("integrity at kappa=0", test_integrity_at_zero);
  run_test("integrity positive and monotonic", test_integrity_positive_and_monotonic);
  run_test("integrity rejects non-finite", test_integrity_rejects_non_finite);
  run_test("weld_ok", test_weld_ok);
  run_test("projection and ratio check", test_projection_and_ratio);

  std::cout << "\n[Gates]\n";
  run_test("omega-stable pass (omega=0.02)", test_omega_stable_pass);
  run_test("omega-stable warn (omega=0.20)", test_omega_stable_warn);
  run_test("omega-stable fail (omega=0.5)", test_omega_stable_fail);
  run_test("omega boundaries", test_omega_boundaries);
  run_test("integrity-low-bound", test_integrity_gate);
  run_test("evaluate is total and ordered", test_evaluate_total_and_ordered);
  run_test("overall status", test_overall_status);
  run_test("report JSON and digest", test_report_json_and_digest);
  run_test("weld gate rejects negative residual", test_weld_gate_rejects_negative_residual);
  run_test("report keeps extreme values", test_report_keeps_extreme_values);
  run_test("format_double round-trips", test_format_double);

  std::cout << "\n[Hash]\n";
  run_test("SHA-256 known vectors", test_sha256_known_vector);
  run_test("BLAKE3 known vector", test_blake3_known_vector);
  run_test("domain separation", test_domain_separation);
  run_test("file hash deterministic", test_compute_hash_deterministic);
  run_test("one-byte change alters digest", test_compute_hash_one_byte_change);
  run_test("missing file", test_compute_hash_missing_file);
  run_test("artifact write and verify", test_artifact_write_and_verify);

  std::cout << "\n[Manifests]\n";
  run_test("manifest parse", test_manifest_parse);
  run_test("manifest schema errors", test_manifest_schema_errors);
  run_test("manifest parse errors", test_manifest_parse_errors);
  run_test("integers wider than uint64", test_json_wide_integers);
  run_test("study constants", test_constants_parse);
  run_test("manifest store load", test_manifest_store_load);

  std::cout << "\n[Launch configuration]\n";
  run_test("defaults", test_config_defaults);
  run_test("flag > env > default", test_config_precedence);
  run_test("argument errors", test_config_errors);

  std::cout << "\n[Planner]\n";
  run_test("bios not implemented", test_planner_bios_not_implemented);
  run_test("missing image", test_planner_missing_image);
  run_test("missing firmware", test_planner_missing_firmware);
  run_test("first match wins", test_planner_first_match_wins);
  run_test("accelerator and graphics", test_planner_accel_and_graphics);

  std::cout << "\n[Launcher]\n";
  run_test("engine arguments", test_engine_args);
  run_test("dry run", test_launch_dry_run);
  run_test("engine not found", test_launch_engine_not_found);
  run_test("vars copy removed", test_launch_removes_vars_copy);
  run_test("SIGTERM forwarded to the engine", test_launch_forwards_sigterm);
  run_test("scoped temp file", test_scoped_temp_file);

  std::cout << "\n[Ledger]\n";
  run_test("hash chain", test_ledger_chain);
  run_test("last-line edits detected", test_ledger_detects_last_line_edits);
  run_test("disabled ledger", test_ledger_disabled);

  std::cout << "\n[Observability]\n";
  run_test("stage events", test_stage_events);
  run_test("error JSON", test_error_json);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
