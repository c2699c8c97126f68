#include "asteria/launch_config.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

#include "asteria/jsonlite.hpp"

namespace asteria {

namespace {

const char* const kCapturedKeys[] = {
    "IMG", "MEM", "CPUS", "GRAPHICS", "GDB", "MODE", "ACCEL", "MACHINE",
    "ASTERIA_ENGINE", "ASTERIA_LEDGER", "ASTERIA_FIRMWARE_DIR", "PATH", "TMPDIR",
};

// Digits with an optional single size suffix, e.g. "1024M", "2G", "536870912".
bool valid_memory_size(const std::string& s) {
  if (s.empty()) return false;
  size_t i = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
  if (i == 0) return false;
  if (i == s.size()) return true;
  if (i + 1 != s.size()) return false;
  switch (s[i]) {
    case 'K': case 'k': case 'M': case 'm': case 'G': case 'g': case 'T': case 't':
      return true;
    default:
      return false;
  }
}

bool parse_cpu_count(const std::string& s, unsigned* out) {
  if (s.empty() || s.size() > 4) return false;
  unsigned v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + static_cast<unsigned>(c - '0');
  }
  if (v == 0) return false;
  *out = v;
  return true;
}

// Later sources win: flag over env over default.
std::optional<std::string> pick(const std::optional<std::string>& flag,
                                const EnvSnapshot& env, const char* key) {
  if (flag) return flag;
  return env.get(key);
}

}  // namespace

EnvSnapshot EnvSnapshot::capture() {
  EnvSnapshot snap;
  for (const char* key : kCapturedKeys) {
    if (const char* v = std::getenv(key)) snap.values[key] = v;
  }
  return snap;
}

std::optional<std::string> EnvSnapshot::get(const std::string& key) const {
  auto it = values.find(key);
  if (it == values.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

bool parse_run_flags(const std::vector<std::string>& args, ParsedFlags* flags, Error* error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    auto take_value = [&](std::optional<std::string>* slot) {
      if (i + 1 >= args.size()) {
        if (error) *error = make_error(ErrorCode::unknown_argument, "missing value for " + a);
        return false;
      }
      *slot = args[++i];
      return true;
    };

    if (a == "--img") {
      if (!take_value(&flags->image_path)) return false;
    } else if (a == "--mem") {
      if (!take_value(&flags->memory)) return false;
    } else if (a == "--cpus") {
      if (!take_value(&flags->cpus)) return false;
    } else if (a == "--machine") {
      if (!take_value(&flags->machine)) return false;
    } else if (a == "--accel") {
      if (!take_value(&flags->accel)) return false;
    } else if (a == "--nographic") {
      flags->graphics = "none";
    } else if (a == "--sdl") {
      flags->graphics = "sdl";
    } else if (a == "--gdb") {
      flags->gdb = true;
    } else if (a == "--uefi") {
      flags->mode = "uefi";
    } else if (a == "--bios") {
      flags->mode = "bios";
    } else if (a == "--dry-run") {
      flags->dry_run = true;
    } else if (a == "-h" || a == "--help") {
      flags->help = true;
      return true;
    } else {
      if (error) *error = make_error(ErrorCode::unknown_argument, "unknown arg: " + a);
      return false;
    }
  }
  return true;
}

std::optional<LaunchConfig> build_launch_config(const LaunchConfig& defaults,
                                                const EnvSnapshot& env,
                                                const ParsedFlags& flags,
                                                Error* error) {
  LaunchConfig c = defaults;

  if (auto mode = pick(flags.mode, env, "MODE")) {
    if (*mode == "uefi") c.mode = BootMode::uefi;
    else if (*mode == "bios") c.mode = BootMode::bios;
    else {
      if (error) *error = make_error(ErrorCode::unknown_mode, "unknown MODE: " + *mode);
      return std::nullopt;
    }
  }
  // The planner rejects bios in its first state; nothing else is consulted.
  if (c.mode == BootMode::bios) return c;

  if (auto img = pick(flags.image_path, env, "IMG")) c.image_path = *img;

  if (auto mem = pick(flags.memory, env, "MEM")) {
    if (!valid_memory_size(*mem)) {
      if (error) *error = make_error(ErrorCode::unknown_argument, "invalid memory size: " + *mem);
      return std::nullopt;
    }
    c.memory = *mem;
  }

  if (auto cpus = pick(flags.cpus, env, "CPUS")) {
    if (!parse_cpu_count(*cpus, &c.cpu_count)) {
      if (error) *error = make_error(ErrorCode::unknown_argument, "invalid cpu count: " + *cpus);
      return std::nullopt;
    }
  }

  if (auto graphics = pick(flags.graphics, env, "GRAPHICS")) {
    c.graphics = *graphics == "none" ? Graphics::none : Graphics::sdl;
  }

  if (flags.gdb) {
    c.debug_halt = true;
  } else if (auto gdb = env.get("GDB")) {
    c.debug_halt = *gdb == "1";
  }

  if (auto accel = pick(flags.accel, env, "ACCEL")) {
    if (*accel == "auto") c.accelerator = Accelerator::auto_detect;
    else if (*accel == "kvm") c.accelerator = Accelerator::kvm;
    else if (*accel == "tcg") c.accelerator = Accelerator::tcg;
    else {
      if (error) *error = make_error(ErrorCode::unknown_argument,
                                     "invalid accelerator: " + *accel + " (expected auto|kvm|tcg)");
      return std::nullopt;
    }
  }

  if (auto machine = pick(flags.machine, env, "MACHINE")) c.machine_type = *machine;

  return c;
}

std::string launch_config_to_json(const LaunchConfig& c) {
  std::ostringstream o;
  o << "{\"mode\":\"" << to_string(c.mode) << "\""
    << ",\"image_path\":\"" << jsonlite::escape(c.image_path) << "\""
    << ",\"memory\":\"" << jsonlite::escape(c.memory) << "\""
    << ",\"cpu_count\":" << c.cpu_count
    << ",\"graphics\":\"" << to_string(c.graphics) << "\""
    << ",\"accelerator\":\"" << to_string(c.accelerator) << "\""
    << ",\"machine_type\":\"" << jsonlite::escape(c.machine_type) << "\""
    << ",\"debug_halt\":" << (c.debug_halt ? "true" : "false")
    << "}";
  return o.str();
}

std::string run_usage() {
  return
      "Usage: asteria run [--img PATH] [--mem 1024M] [--cpus 2] [--nographic|--sdl] [--gdb]\n"
      "                   [--uefi] [--bios] [--machine q35] [--accel auto|kvm|tcg] [--dry-run]\n"
      "\n"
      "Env overrides: IMG, MEM, CPUS, GRAPHICS, GDB, MODE, ACCEL, MACHINE\n"
      "Host: ASTERIA_ENGINE (qemu binary), ASTERIA_FIRMWARE_DIR (OVMF directory)\n"
      "Examples:\n"
      "  asteria run --uefi --img dist/asteria-uefi.img\n"
      "  GDB=1 GRAPHICS=none asteria run\n";
}

}  // namespace asteria
