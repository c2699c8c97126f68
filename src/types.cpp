#include "asteria/types.hpp"

#include "asteria/jsonlite.hpp"

#include <sstream>
#include <utility>

namespace asteria {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::parse_error: return "parse_error";
    case ErrorCode::schema_error: return "schema_error";
    case ErrorCode::invalid_metric: return "invalid_metric";
    case ErrorCode::missing_image: return "missing_image";
    case ErrorCode::missing_firmware: return "missing_firmware";
    case ErrorCode::not_implemented: return "not_implemented";
    case ErrorCode::unknown_argument: return "unknown_argument";
    case ErrorCode::unknown_mode: return "unknown_mode";
    case ErrorCode::io_error: return "io_error";
    case ErrorCode::digest_mismatch: return "digest_mismatch";
    case ErrorCode::engine_not_found: return "engine_not_found";
    case ErrorCode::spawn_failed: return "spawn_failed";
  }
  return "";
}

int exit_code_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::none:
      return 0;
    case ErrorCode::not_implemented:
    case ErrorCode::unknown_argument:
    case ErrorCode::unknown_mode:
      return 2;
    case ErrorCode::parse_error:
    case ErrorCode::schema_error:
    case ErrorCode::invalid_metric:
    case ErrorCode::missing_image:
    case ErrorCode::missing_firmware:
    case ErrorCode::io_error:
    case ErrorCode::digest_mismatch:
    case ErrorCode::engine_not_found:
    case ErrorCode::spawn_failed:
      return 1;
  }
  return 1;
}

std::string Error::to_json() const {
  std::ostringstream o;
  o << "{\"error\":\"" << to_string(code) << "\""
    << ",\"message\":\"" << jsonlite::escape(message) << "\"";
  if (!remediation.empty()) {
    o << ",\"remediation\":\"" << jsonlite::escape(remediation) << "\"";
  }
  o << "}";
  return o.str();
}

Error make_error(ErrorCode code, std::string message, std::string remediation) {
  Error e;
  e.code = code;
  e.message = std::move(message);
  e.remediation = std::move(remediation);
  return e;
}

std::string to_string(GateStatus status) {
  switch (status) {
    case GateStatus::pass: return "pass";
    case GateStatus::warn: return "warn";
    case GateStatus::fail: return "fail";
  }
  return "fail";
}

std::string to_string(BootMode mode) {
  return mode == BootMode::uefi ? "uefi" : "bios";
}

std::string to_string(Graphics graphics) {
  return graphics == Graphics::none ? "none" : "sdl";
}

std::string to_string(Accelerator accel) {
  switch (accel) {
    case Accelerator::auto_detect: return "auto";
    case Accelerator::kvm: return "kvm";
    case Accelerator::tcg: return "tcg";
  }
  return "auto";
}

}  // namespace asteria
