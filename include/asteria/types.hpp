#pragma once

// asteria/types.hpp — Core data structures shared by the governance and launch
// pipelines.
//
// OWNERSHIP:
//   - All types are value types. String members are value-owned.
//   - Errors are returned as values (Error / std::optional<Error>); nothing in
//     the library throws across a module boundary.
//
// PIPELINES:
//   governance: ReproManifest + StudyConstants -> TelemetrySample -> GateVerdict[]
//   launch:     LaunchConfig -> LaunchPlan -> engine process
//   The two pipelines share no mutable state.

#include <cstdint>
#include <string>
#include <vector>

namespace asteria {

enum class ErrorCode {
  none,
  parse_error,
  schema_error,
  invalid_metric,
  missing_image,
  missing_firmware,
  not_implemented,
  unknown_argument,
  unknown_mode,
  io_error,
  digest_mismatch,
  engine_not_found,
  spawn_failed,
};

std::string to_string(ErrorCode code);

// Process exit status for a fatal error of this kind.
//   1: missing inputs on the host (image, firmware, engine) and data errors.
//   2: invocation errors (arguments, unsupported or unknown mode).
int exit_code_for(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string message;
  std::string remediation;  // empty when there is no concrete next step

  bool ok() const { return code == ErrorCode::none; }
  std::string to_json() const;
};

Error make_error(ErrorCode code, std::string message, std::string remediation = "");

// ---------------------------------------------------------------------------
// Governance documents
// ---------------------------------------------------------------------------

struct ReproManifest {
  std::string weld_id;
  double tol{0.0};
  double residual{0.0};
  std::int64_t seed{0};
  std::string manifest_sha256;  // empty until the hash step has run
};

struct OmegaGates {
  double stable{0.0};
  double collapse{0.0};
};

struct StudyConstants {
  OmegaGates omega_gates;
  double c_ref{0.0};
  double i_low{0.0};
  std::string notes;
};

struct WeldMetrics {
  double residual{0.0};
  double tol{0.0};
};

struct TelemetrySample {
  double kappa{0.0};
  double integrity{1.0};  // I = e^kappa
  double omega{0.0};
  WeldMetrics weld;
};

enum class GateStatus { pass, warn, fail };

std::string to_string(GateStatus status);

struct GateVerdict {
  std::string gate_name;
  double observed{0.0};
  double threshold{0.0};
  GateStatus status{GateStatus::pass};
};

// ---------------------------------------------------------------------------
// Launch configuration
// ---------------------------------------------------------------------------

enum class BootMode { uefi, bios };
enum class Graphics { sdl, none };
enum class Accelerator { auto_detect, kvm, tcg };

std::string to_string(BootMode mode);
std::string to_string(Graphics graphics);
std::string to_string(Accelerator accel);

struct LaunchConfig {
  BootMode mode{BootMode::uefi};
  std::string image_path{"dist/asteria-uefi.img"};
  std::string memory{"1024M"};
  unsigned cpu_count{2};
  Graphics graphics{Graphics::sdl};
  Accelerator accelerator{Accelerator::auto_detect};
  std::string machine_type{"q35"};
  bool debug_halt{false};
};

// Output of the planner's Ready state. Immutable once produced.
struct LaunchPlan {
  LaunchConfig config;
  std::string firmware_code;
  std::string firmware_vars;      // empty when no variables blob was found
  Accelerator resolved_accel{Accelerator::tcg};  // never auto_detect
  bool headless{false};
};

}  // namespace asteria
