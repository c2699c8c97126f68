#pragma once

// asteria/planner.hpp — Launch planning state machine.
//
// STATES:
//   mode_select -> image_validate -> firmware_discover -> accel_select
//               -> graphics_select -> ready
//   Any state may transition to error; ready and error are terminal.
//
//   mode_select        uefi continues; bios -> error(not_implemented).
//   image_validate     image must be a regular file, else error(missing_image).
//   firmware_discover  ordered scan; first existing candidate wins. The code
//                      blob is mandatory (error(missing_firmware)), the
//                      variables blob optional.
//   accel_select       auto probes the KVM device node; kvm/tcg are taken
//                      verbatim and never probed.
//   graphics_select    none -> headless, anything else -> SDL display.
//   ready              LaunchPlan assembled; immutable from here on.
//
// All host access goes through HostProbe so the machine is testable without
// touching /usr/share or /dev.

#include <string>
#include <vector>

#include "asteria/types.hpp"

namespace asteria {

class HostProbe {
 public:
  virtual ~HostProbe() = default;
  virtual bool is_regular_file(const std::string& path) const = 0;
  virtual bool is_char_device(const std::string& path) const = 0;
};

// std::filesystem-backed probe.
class FilesystemProbe : public HostProbe {
 public:
  bool is_regular_file(const std::string& path) const override;
  bool is_char_device(const std::string& path) const override;
};

struct PlannerOptions {
  // Scanned in order; put more specific locations first.
  std::vector<std::string> firmware_code_candidates;
  std::vector<std::string> firmware_vars_candidates;
  std::string kvm_device{"/dev/kvm"};
};

// OVMF_CODE.fd / OVMF_VARS.fd under each of dirs, in order.
PlannerOptions planner_options_for_dirs(const std::vector<std::string>& dirs);

// planner_options_for_dirs() over the usual distro locations.
PlannerOptions default_planner_options();

// First candidate the probe reports as a regular file; empty if none.
std::string first_existing(const std::vector<std::string>& candidates, const HostProbe& probe);

enum class PlannerState {
  mode_select,
  image_validate,
  firmware_discover,
  accel_select,
  graphics_select,
  ready,
  error,
};

std::string to_string(PlannerState state);

class LaunchPlanner {
 public:
  LaunchPlanner(LaunchConfig config, const HostProbe& probe,
                PlannerOptions options = default_planner_options());
  // Held by reference below; a temporary would dangle.
  LaunchPlanner(LaunchConfig config, const HostProbe&& probe,
                PlannerOptions options = default_planner_options()) = delete;

  PlannerState state() const { return state_; }

  // Performs one transition. No-op in ready or error.
  PlannerState step();

  // Steps to a terminal state. True iff ready.
  bool run();

  // Valid in the error state.
  const Error& error() const { return error_; }

  // Valid in the ready state.
  const LaunchPlan& plan() const { return plan_; }

  // States entered, in order, starting with mode_select.
  const std::vector<PlannerState>& trace() const { return trace_; }

 private:
  void enter(PlannerState next);
  void fail(Error error);

  const HostProbe& probe_;
  PlannerOptions options_;
  PlannerState state_{PlannerState::mode_select};
  LaunchPlan plan_;
  Error error_;
  std::vector<PlannerState> trace_;
};

}  // namespace asteria
