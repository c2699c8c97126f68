#pragma once

// asteria/launch_config.hpp — Building a LaunchConfig from defaults, the
// environment and command-line flags.
//
// PRECEDENCE (lowest to highest): defaults < environment < flags.
// build_launch_config() is a pure function of its three inputs; nothing here
// reads the process environment except EnvSnapshot::capture().
//
// Environment keys: IMG MEM CPUS GRAPHICS GDB MODE ACCEL MACHINE.
// An empty value counts as unset.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "asteria/types.hpp"

namespace asteria {

struct EnvSnapshot {
  std::map<std::string, std::string> values;

  // Reads the launcher keys plus ASTERIA_ENGINE, ASTERIA_LEDGER, PATH, TMPDIR.
  static EnvSnapshot capture();

  // nullopt when absent or empty.
  std::optional<std::string> get(const std::string& key) const;
};

// Raw flag values. Interpretation happens in build_launch_config() so flags
// and environment share one validation path.
struct ParsedFlags {
  std::optional<std::string> image_path;
  std::optional<std::string> memory;
  std::optional<std::string> cpus;
  std::optional<std::string> graphics;  // "none" | "sdl"
  std::optional<std::string> mode;      // "uefi" | "bios"
  std::optional<std::string> machine;
  std::optional<std::string> accel;
  bool gdb{false};
  bool dry_run{false};
  bool help{false};
};

// unknown_argument for an unrecognized flag or a flag missing its value.
// Parsing stops at -h/--help with flags->help set.
bool parse_run_flags(const std::vector<std::string>& args, ParsedFlags* flags, Error* error);

// unknown_mode for a MODE other than uefi/bios; unknown_argument for an
// invalid accelerator, CPU count or memory size.
std::optional<LaunchConfig> build_launch_config(const LaunchConfig& defaults,
                                                const EnvSnapshot& env,
                                                const ParsedFlags& flags,
                                                Error* error);

std::string launch_config_to_json(const LaunchConfig& c);

std::string run_usage();

}  // namespace asteria
