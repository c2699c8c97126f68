#include "asteria/planner.hpp"

#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

#include "asteria/observability.hpp"

namespace asteria {

namespace {

const char* const kFirmwareDirs[] = {
    "/usr/share/OVMF",
    "/usr/share/ovmf",
    "/usr/share/qemu",
    "/usr/share/edk2/x64",
    "/usr/share/edk2/ovmf",
};

void emit_transition(PlannerState state, const std::string& detail) {
  StageEvent ev;
  ev.stage = "planner." + to_string(state);
  ev.detail = detail;
  emit_event(ev);
}

}  // namespace

bool FilesystemProbe::is_regular_file(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

bool FilesystemProbe::is_char_device(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::is_character_file(path, ec);
}

PlannerOptions planner_options_for_dirs(const std::vector<std::string>& dirs) {
  PlannerOptions o;
  for (const auto& dir : dirs) {
    o.firmware_code_candidates.push_back(dir + "/OVMF_CODE.fd");
    o.firmware_vars_candidates.push_back(dir + "/OVMF_VARS.fd");
  }
  return o;
}

PlannerOptions default_planner_options() {
  return planner_options_for_dirs(
      std::vector<std::string>(std::begin(kFirmwareDirs), std::end(kFirmwareDirs)));
}

std::string first_existing(const std::vector<std::string>& candidates, const HostProbe& probe) {
  for (const auto& p : candidates) {
    if (probe.is_regular_file(p)) return p;
  }
  return {};
}

std::string to_string(PlannerState state) {
  switch (state) {
    case PlannerState::mode_select: return "mode_select";
    case PlannerState::image_validate: return "image_validate";
    case PlannerState::firmware_discover: return "firmware_discover";
    case PlannerState::accel_select: return "accel_select";
    case PlannerState::graphics_select: return "graphics_select";
    case PlannerState::ready: return "ready";
    case PlannerState::error: return "error";
  }
  return "error";
}

LaunchPlanner::LaunchPlanner(LaunchConfig config, const HostProbe& probe, PlannerOptions options)
    : probe_(probe), options_(std::move(options)) {
  plan_.config = std::move(config);
  trace_.push_back(state_);
}

void LaunchPlanner::enter(PlannerState next) {
  state_ = next;
  trace_.push_back(next);
}

void LaunchPlanner::fail(Error error) {
  emit_failure("planner." + to_string(state_), error);
  error_ = std::move(error);
  enter(PlannerState::error);
}

PlannerState LaunchPlanner::step() {
  const LaunchConfig& c = plan_.config;
  switch (state_) {
    case PlannerState::mode_select:
      if (c.mode == BootMode::bios) {
        fail(make_error(ErrorCode::not_implemented, "BIOS path not wired yet",
                        "use UEFI with an ESP image instead (--uefi)"));
        break;
      }
      emit_transition(state_, to_string(c.mode));
      enter(PlannerState::image_validate);
      break;

    case PlannerState::image_validate:
      if (!probe_.is_regular_file(c.image_path)) {
        fail(make_error(ErrorCode::missing_image, "no UEFI image at: " + c.image_path,
                        "build one with the image builder first, e.g. `cargo run -p xtask --release`"));
        break;
      }
      emit_transition(state_, c.image_path);
      enter(PlannerState::firmware_discover);
      break;

    case PlannerState::firmware_discover:
      plan_.firmware_code = first_existing(options_.firmware_code_candidates, probe_);
      if (plan_.firmware_code.empty()) {
        fail(make_error(ErrorCode::missing_firmware, "OVMF firmware not found",
                        "install it: sudo apt-get install -y ovmf"));
        break;
      }
      plan_.firmware_vars = first_existing(options_.firmware_vars_candidates, probe_);
      emit_transition(state_, plan_.firmware_code);
      enter(PlannerState::accel_select);
      break;

    case PlannerState::accel_select:
      switch (c.accelerator) {
        case Accelerator::auto_detect:
          plan_.resolved_accel =
              probe_.is_char_device(options_.kvm_device) ? Accelerator::kvm : Accelerator::tcg;
          break;
        case Accelerator::kvm:
          // Taken as given; the engine reports a missing /dev/kvm itself.
          plan_.resolved_accel = Accelerator::kvm;
          break;
        case Accelerator::tcg:
          plan_.resolved_accel = Accelerator::tcg;
          break;
      }
      emit_transition(state_, to_string(plan_.resolved_accel));
      enter(PlannerState::graphics_select);
      break;

    case PlannerState::graphics_select:
      plan_.headless = c.graphics == Graphics::none;
      emit_transition(state_, plan_.headless ? "headless" : "sdl");
      enter(PlannerState::ready);
      break;

    case PlannerState::ready:
    case PlannerState::error:
      break;
  }
  return state_;
}

bool LaunchPlanner::run() {
  while (state_ != PlannerState::ready && state_ != PlannerState::error) {
    step();
  }
  return state_ == PlannerState::ready;
}

}  // namespace asteria
