#pragma once

// asteria/launcher.hpp — Hand-off of a LaunchPlan to the virtualization engine.
//
// NVRAM:
//   When the plan names a firmware variables blob, it is copied to a private
//   temp file (ScopedTempFile) and the engine writes to the copy. The copy is
//   removed when launch() returns, on success, spawn failure or a forwarded
//   signal. SIGKILL to the orchestrator itself cannot be cleaned up.
//
// HAND-OFF:
//   POSIX fork + execv, then wait. The engine inherits stdin/stdout/stderr so
//   the guest serial console is the orchestrator's terminal. SIGINT, SIGTERM
//   and SIGHUP received while waiting are forwarded to the engine; launch()
//   returns once it exits. Exit status: the engine's own, or 128 + signal.
//   No restart on crash; no timeout.

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "asteria/types.hpp"

namespace asteria {

// Owns a temp file path; unlinks it on destruction. Move-only.
class ScopedTempFile {
 public:
  ScopedTempFile() = default;
  ~ScopedTempFile();

  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  // mkstemps() in dir using "<stem>.XXXXXX<suffix>", then copies source into
  // it. io_error on any failure; nothing is left behind.
  static std::optional<ScopedTempFile> copy_of(const std::string& source, const std::string& dir,
                                               const std::string& stem, const std::string& suffix,
                                               Error* error);

  const std::string& path() const { return path_; }
  bool empty() const { return path_.empty(); }

  // Removes the file now. Idempotent.
  void reset();

 private:
  explicit ScopedTempFile(std::string path) : path_(std::move(path)) {}
  std::string path_;
};

struct LaunchOptions {
  std::string engine{"qemu-system-x86_64"};  // bare name (PATH lookup) or path
  std::string search_path;                   // PATH value used for lookup
  std::string temp_dir;                      // empty -> $TMPDIR or /tmp
  bool dry_run{false};
};

// Empty when not found. Names containing '/' are checked directly.
std::string find_engine(const std::string& engine, const std::string& search_path);

// Engine arguments, excluding argv[0]. vars_path is the private copy (or
// empty to omit the writable pflash drive).
std::vector<std::string> build_engine_args(const LaunchPlan& plan, const std::string& vars_path);

// Shell-style rendering for logs and --dry-run.
std::string render_command(const std::string& engine, const std::vector<std::string>& args);

struct LaunchResult {
  bool ok{false};            // engine ran (any exit status) or dry run printed
  int exit_code{0};          // engine status, or 128 + signal
  Error error;               // set when !ok
  std::string command_line;
  std::string vars_copy_path;  // path that was used, already removed
};

LaunchResult launch(const LaunchPlan& plan, const LaunchOptions& options);

}  // namespace asteria
