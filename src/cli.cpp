#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

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

namespace {

constexpr const char* kDefaultManifest = "manifests/REPRO_MANIFEST.json";
constexpr const char* kDefaultConstants = "manifests/STUDY_CONSTANTS.json";
constexpr const char* kDefaultArtifact = "dist/MANIFEST_SHA256.txt";

void usage(std::ostream& os) {
  os << "Usage: asteria <command> [options]\n"
        "\n"
        "Commands:\n"
        "  run      launch the UEFI image under QEMU (see `asteria run --help`)\n"
        "  hash     write the SHA-256 of the run manifest to an artifact\n"
        "             [--manifest PATH] [--out PATH]\n"
        "  verify   check the run manifest against its artifact\n"
        "             [--manifest PATH] [--artifact PATH]\n"
        "  govern   evaluate telemetry gates and print the governance report\n"
        "             [--manifest PATH] [--constants PATH] --omega X [--kappa X]\n"
        "             [--delta-kappa X [--i-ratio X]] [--ledger PATH]\n"
        "  ledger   verify the hash chain of a ledger file\n"
        "             --ledger PATH\n"
        "  version  print the version manifest\n"
        "  help     show this text\n";
}

int fail(const std::string& stage, const asteria::Error& error) {
  asteria::emit_failure(stage, error);
  asteria::report_error(error);
  return asteria::exit_code_for(error.code);
}

// --name VALUE pairs. Unknown names and missing values are argument errors.
bool parse_options(const std::vector<std::string>& args, const std::vector<std::string>& known,
                   std::map<std::string, std::string>* out, asteria::Error* error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    bool recognised = false;
    for (const auto& k : known) {
      if (a == "--" + k) { recognised = true; break; }
    }
    if (!recognised) {
      *error = asteria::make_error(asteria::ErrorCode::unknown_argument, "unknown arg: " + a);
      return false;
    }
    if (i + 1 >= args.size()) {
      *error = asteria::make_error(asteria::ErrorCode::unknown_argument, "missing value for " + a);
      return false;
    }
    (*out)[a.substr(2)] = args[++i];
  }
  return true;
}

std::string option_or(const std::map<std::string, std::string>& opts, const std::string& key,
                      const std::string& def) {
  auto it = opts.find(key);
  return it == opts.end() ? def : it->second;
}

std::optional<double> parse_number(const std::string& name, const std::string& text,
                                   asteria::Error* error) {
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(v)) {
    *error = asteria::make_error(asteria::ErrorCode::unknown_argument,
                                 "--" + name + " expects a finite number, got '" + text + "'");
    return std::nullopt;
  }
  return v;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
int cmd_run(const std::vector<std::string>& args, const asteria::EnvSnapshot& env) {
  asteria::Error error;
  asteria::ParsedFlags flags;
  if (!asteria::parse_run_flags(args, &flags, &error)) {
    const int rc = fail("cli.run", error);
    std::cerr << asteria::run_usage();
    return rc;
  }
  if (flags.help) {
    std::cout << asteria::run_usage();
    return 2;
  }

  const auto config = asteria::build_launch_config(asteria::LaunchConfig{}, env, flags, &error);
  if (!config) return fail("config.build", error);
  asteria::StageEvent ev;
  ev.stage = "config.build";
  ev.detail = asteria::launch_config_to_json(*config);
  asteria::emit_event(ev);

  // ASTERIA_FIRMWARE_DIR replaces the distro search list with one directory.
  asteria::FilesystemProbe probe;
  const auto firmware_dir = env.get("ASTERIA_FIRMWARE_DIR");
  asteria::LaunchPlanner planner(*config, probe,
                                 firmware_dir ? asteria::planner_options_for_dirs({*firmware_dir})
                                              : asteria::default_planner_options());
  if (!planner.run()) {
    // The planner has already emitted its failure event.
    asteria::report_error(planner.error());
    return asteria::exit_code_for(planner.error().code);
  }

  asteria::LaunchOptions options;
  if (auto engine = env.get("ASTERIA_ENGINE")) options.engine = *engine;
  options.search_path = env.get("PATH").value_or("/usr/local/bin:/usr/bin:/bin");
  options.temp_dir = env.get("TMPDIR").value_or("");
  options.dry_run = flags.dry_run;

  const auto result = asteria::launch(planner.plan(), options);
  if (!result.ok) {
    asteria::report_error(result.error);
    return asteria::exit_code_for(result.error.code);
  }
  if (options.dry_run) {
    std::cout << result.command_line << "\n";
    return 0;
  }
  return result.exit_code;
}

// ---------------------------------------------------------------------------
// hash / verify
// ---------------------------------------------------------------------------
int cmd_hash(const std::vector<std::string>& args) {
  asteria::Error error;
  std::map<std::string, std::string> opts;
  if (!parse_options(args, {"manifest", "out"}, &opts, &error)) return fail("cli.hash", error);
  const std::string manifest = option_or(opts, "manifest", kDefaultManifest);
  const std::string out = option_or(opts, "out", kDefaultArtifact);

  asteria::StageEvent ev;
  ev.stage = "hash.compute";
  std::string digest;
  {
    asteria::ScopeTimer timer(ev.duration_ns);
    digest = asteria::compute_hash(manifest, &error);
  }
  if (digest.empty()) return fail(ev.stage, error);
  ev.detail = digest;
  asteria::emit_event(ev);

  if (!asteria::write_artifact(digest, out, &error)) return fail("hash.write_artifact", error);
  std::cout << "Wrote " << out << "\n";
  return 0;
}

int cmd_verify(const std::vector<std::string>& args) {
  asteria::Error error;
  std::map<std::string, std::string> opts;
  if (!parse_options(args, {"manifest", "artifact"}, &opts, &error)) return fail("cli.verify", error);
  const std::string manifest = option_or(opts, "manifest", kDefaultManifest);
  const std::string artifact = option_or(opts, "artifact", kDefaultArtifact);

  if (!asteria::verify_artifact(manifest, artifact, &error)) return fail("hash.verify", error);
  asteria::StageEvent ev;
  ev.stage = "hash.verify";
  ev.detail = artifact;
  asteria::emit_event(ev);
  std::cout << "{\"verified\":true,\"manifest\":\"" << asteria::jsonlite::escape(manifest)
            << "\",\"artifact\":\"" << asteria::jsonlite::escape(artifact) << "\"}\n";
  return 0;
}

// ---------------------------------------------------------------------------
// govern
// ---------------------------------------------------------------------------
int cmd_govern(const std::vector<std::string>& args, const asteria::EnvSnapshot& env) {
  asteria::Error error;
  std::map<std::string, std::string> opts;
  if (!parse_options(args, {"manifest", "constants", "omega", "kappa", "delta-kappa", "i-ratio", "ledger"},
                     &opts, &error)) {
    return fail("cli.govern", error);
  }
  if (!opts.contains("omega")) {
    return fail("cli.govern", asteria::make_error(asteria::ErrorCode::unknown_argument,
                                                  "--omega is required"));
  }
  if (opts.contains("i-ratio") && !opts.contains("delta-kappa")) {
    return fail("cli.govern", asteria::make_error(asteria::ErrorCode::unknown_argument,
                                                  "--i-ratio requires --delta-kappa"));
  }
  const auto omega = parse_number("omega", opts["omega"], &error);
  if (!omega) return fail("cli.govern", error);
  const auto kappa = parse_number("kappa", option_or(opts, "kappa", "0"), &error);
  if (!kappa) return fail("cli.govern", error);

  asteria::ManifestStore store;
  const std::string manifest_path = option_or(opts, "manifest", kDefaultManifest);
  if (!store.load(manifest_path, option_or(opts, "constants", kDefaultConstants), &error)) {
    return fail("manifest.load", error);
  }

  const std::string digest = asteria::compute_hash(store.manifest_path(), &error);
  if (digest.empty()) return fail("hash.compute", error);

  const auto sample = asteria::make_sample(*kappa, *omega, store.manifest().residual,
                                           store.manifest().tol, &error);
  if (!sample) return fail("telemetry.sample", error);

  const auto report = asteria::build_report(store.manifest(), store.constants(), *sample, digest);
  asteria::StageEvent ev;
  ev.stage = "gates.evaluate";
  ev.ok = true;
  ev.detail = asteria::to_string(report.status);
  asteria::emit_event(ev);

  std::ostringstream out;
  out << "{\"report\":" << report.to_json() << ",\"report_digest\":\"" << report.digest() << "\"";
  if (opts.contains("delta-kappa")) {
    const auto dk = parse_number("delta-kappa", opts["delta-kappa"], &error);
    if (!dk) return fail("cli.govern", error);
    const auto projection = asteria::project(*sample, *dk, &error);
    if (!projection) return fail("telemetry.project", error);
    out << ",\"projection\":{\"delta_kappa\":" << asteria::jsonlite::format_double(*dk)
        << ",\"kappa_t1\":" << asteria::jsonlite::format_double(projection->kappa_t1)
        << ",\"I_t1\":" << asteria::jsonlite::format_double(projection->integrity_t1);
    if (opts.contains("i-ratio")) {
      const auto ratio = parse_number("i-ratio", opts["i-ratio"], &error);
      if (!ratio) return fail("cli.govern", error);
      out << ",\"ratio_consistent\":" << (asteria::ratio_consistent(*dk, *ratio) ? "true" : "false");
    }
    out << "}";
  }
  out << "}";

  const std::string ledger_path = option_or(opts, "ledger", env.get("ASTERIA_LEDGER").value_or(""));
  if (!ledger_path.empty()) {
    asteria::GovernanceLedger ledger(ledger_path);
    if (!ledger.append_report(report, &error)) return fail("ledger.append", error);
  }

  std::cout << out.str() << "\n";
  return report.status == asteria::GateStatus::fail ? 1 : 0;
}

int cmd_ledger(const std::vector<std::string>& args) {
  asteria::Error error;
  std::map<std::string, std::string> opts;
  if (!parse_options(args, {"ledger"}, &opts, &error)) return fail("cli.ledger", error);
  if (!opts.contains("ledger")) {
    return fail("cli.ledger", asteria::make_error(asteria::ErrorCode::unknown_argument,
                                                  "--ledger is required"));
  }
  std::uint64_t broken_at = 0;
  if (!asteria::verify_ledger_chain(opts["ledger"], &broken_at, &error)) {
    return fail("ledger.verify", error);
  }
  std::cout << "{\"chain_ok\":true}\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage(std::cerr);
    return 2;
  }
  const std::string cmd = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);
  const auto env = asteria::EnvSnapshot::capture();

  if (cmd == "run") return cmd_run(args, env);
  if (cmd == "hash") return cmd_hash(args);
  if (cmd == "verify") return cmd_verify(args);
  if (cmd == "govern") return cmd_govern(args, env);
  if (cmd == "ledger") return cmd_ledger(args);
  if (cmd == "version") {
    std::cout << asteria::version::manifest_to_json(asteria::version::current_manifest()) << "\n";
    return 0;
  }
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    usage(std::cout);
    return 2;
  }

  asteria::report_error(asteria::make_error(asteria::ErrorCode::unknown_argument,
                                            "unknown command: " + cmd));
  usage(std::cerr);
  return 2;
}
