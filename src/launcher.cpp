#ifndef _WIN32

#include "asteria/launcher.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

#include "asteria/observability.hpp"

namespace asteria {

namespace {

volatile sig_atomic_t g_pending_signal = 0;
volatile sig_atomic_t g_child_pid = 0;

extern "C" void forward_signal(int sig) {
  g_pending_signal = sig;
  if (g_child_pid > 0) kill(static_cast<pid_t>(g_child_pid), sig);
}

constexpr int kForwardedSignals[] = {SIGINT, SIGTERM, SIGHUP};

// Installs forward_signal for the launch attempt; restores the previous
// dispositions on scope exit.
class SignalForwarder {
 public:
  SignalForwarder() {
    g_pending_signal = 0;
    g_child_pid = 0;
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = forward_signal;
    sigemptyset(&sa.sa_mask);
    for (size_t i = 0; i < std::size(kForwardedSignals); ++i) {
      sigaction(kForwardedSignals[i], &sa, &previous_[i]);
    }
  }
  ~SignalForwarder() {
    for (size_t i = 0; i < std::size(kForwardedSignals); ++i) {
      sigaction(kForwardedSignals[i], &previous_[i], nullptr);
    }
    g_child_pid = 0;
  }
  SignalForwarder(const SignalForwarder&) = delete;
  SignalForwarder& operator=(const SignalForwarder&) = delete;

 private:
  struct sigaction previous_[std::size(kForwardedSignals)];
};

std::string default_temp_dir() {
  const char* t = std::getenv("TMPDIR");
  if (t && t[0]) return t;
  return "/tmp";
}

bool is_executable(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) return false;
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::string quote_arg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"'$\\") == std::string::npos) return arg;
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

}  // namespace

// ---------------------------------------------------------------------------
// ScopedTempFile
// ---------------------------------------------------------------------------

ScopedTempFile::~ScopedTempFile() { reset(); }

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    reset();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void ScopedTempFile::reset() {
  if (path_.empty()) return;
  ::unlink(path_.c_str());
  path_.clear();
}

std::optional<ScopedTempFile> ScopedTempFile::copy_of(const std::string& source,
                                                      const std::string& dir,
                                                      const std::string& stem,
                                                      const std::string& suffix, Error* error) {
  std::string tmpl = dir + "/" + stem + ".XXXXXX" + suffix;
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    if (error) *error = make_error(ErrorCode::io_error,
                                   "mkstemps failed in " + dir + ": " + std::strerror(errno));
    return std::nullopt;
  }
  ::close(fd);
  ScopedTempFile tmp{std::string(buf.data())};

  std::error_code ec;
  std::filesystem::copy_file(source, tmp.path(),
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error) *error = make_error(ErrorCode::io_error,
                                   "cannot copy " + source + " to " + tmp.path() + ": " + ec.message());
    return std::nullopt;  // tmp unlinks itself
  }
  return std::optional<ScopedTempFile>(std::move(tmp));
}

// ---------------------------------------------------------------------------
// Engine command
// ---------------------------------------------------------------------------

std::string find_engine(const std::string& engine, const std::string& search_path) {
  if (engine.empty()) return {};
  if (engine.find('/') != std::string::npos) {
    return is_executable(engine) ? engine : std::string();
  }
  size_t start = 0;
  while (start <= search_path.size()) {
    size_t end = search_path.find(':', start);
    if (end == std::string::npos) end = search_path.size();
    std::string dir = search_path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + engine;
    if (is_executable(candidate)) return candidate;
    start = end + 1;
  }
  return {};
}

std::vector<std::string> build_engine_args(const LaunchPlan& plan, const std::string& vars_path) {
  const LaunchConfig& c = plan.config;
  std::vector<std::string> args = {
      "-machine", c.machine_type,
      "-m", c.memory,
      "-cpu", "max",
      "-smp", std::to_string(c.cpu_count),
      "-serial", "stdio",
  };
  if (plan.headless) {
    args.push_back("-nographic");
  } else {
    args.insert(args.end(), {"-display", "sdl"});
  }
  args.insert(args.end(), {"-accel", to_string(plan.resolved_accel)});
  if (c.debug_halt) {
    // Halt at reset and listen for gdb on :1234.
    args.insert(args.end(), {"-S", "-s"});
  }
  args.insert(args.end(),
              {"-drive", "if=pflash,format=raw,readonly=on,file=" + plan.firmware_code});
  if (!vars_path.empty()) {
    args.insert(args.end(), {"-drive", "if=pflash,format=raw,file=" + vars_path});
  }
  args.insert(args.end(), {"-drive", "file=" + c.image_path + ",if=none,format=raw,id=esp",
                           "-device", "virtio-blk-pci,drive=esp"});
  return args;
}

std::string render_command(const std::string& engine, const std::vector<std::string>& args) {
  std::string out = quote_arg(engine);
  for (const auto& a : args) {
    out += ' ';
    out += quote_arg(a);
  }
  return out;
}

// ---------------------------------------------------------------------------
// launch
// ---------------------------------------------------------------------------

LaunchResult launch(const LaunchPlan& plan, const LaunchOptions& options) {
  LaunchResult result;
  StageEvent ev;
  ev.stage = "launcher.launch";

  const std::string engine = find_engine(options.engine, options.search_path);

  if (options.dry_run) {
    const std::string vars =
        plan.firmware_vars.empty() ? std::string() : "$TMPDIR/OVMF_VARS.XXXXXX.fd";
    result.command_line =
        render_command(engine.empty() ? options.engine : engine, build_engine_args(plan, vars));
    result.ok = true;
    ev.detail = "dry-run";
    emit_event(ev);
    return result;
  }

  if (engine.empty()) {
    result.error = make_error(ErrorCode::engine_not_found, options.engine + " not found",
                              "install it: sudo apt-get install -y qemu-system-x86");
    emit_failure(ev.stage, result.error);
    return result;
  }

  SignalForwarder forwarder;

  ScopedTempFile vars_copy;
  if (!plan.firmware_vars.empty()) {
    const std::string dir = options.temp_dir.empty() ? default_temp_dir() : options.temp_dir;
    auto copy = ScopedTempFile::copy_of(plan.firmware_vars, dir, "OVMF_VARS", ".fd", &result.error);
    if (!copy) {
      emit_failure(ev.stage, result.error);
      return result;
    }
    vars_copy = std::move(*copy);
    result.vars_copy_path = vars_copy.path();
  }

  if (g_pending_signal != 0) {
    result.exit_code = 128 + g_pending_signal;
    result.error = make_error(ErrorCode::spawn_failed, "interrupted before launch");
    emit_failure(ev.stage, result.error);
    return result;
  }

  const std::vector<std::string> args = build_engine_args(plan, vars_copy.path());
  result.command_line = render_command(engine, args);

  std::vector<std::string> all = {engine};
  all.insert(all.end(), args.begin(), args.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  // Close-on-exec pipe: the child writes errno only if execv() fails.
  int err_pipe[2];
  if (::pipe(err_pipe) != 0 || ::fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
    result.error = make_error(ErrorCode::spawn_failed, std::string("pipe: ") + std::strerror(errno));
    emit_failure(ev.stage, result.error);
    return result;
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    result.error = make_error(ErrorCode::spawn_failed, std::string("fork: ") + std::strerror(errno));
    emit_failure(ev.stage, result.error);
    return result;
  }

  if (pid == 0) {
    for (int sig : kForwardedSignals) ::signal(sig, SIG_DFL);
    ::close(err_pipe[0]);
    ::execv(engine.c_str(), argv.data());
    const int exec_errno = errno;
    ssize_t ignored = ::write(err_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  g_child_pid = static_cast<sig_atomic_t>(pid);
  if (g_pending_signal != 0) ::kill(pid, g_pending_signal);
  ::close(err_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  ::close(err_pipe[0]);

  int status = 0;
  pid_t w;
  do {
    w = ::waitpid(pid, &status, 0);
  } while (w < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    result.error = make_error(ErrorCode::spawn_failed,
                              "exec " + engine + ": " + std::strerror(exec_errno));
    emit_failure(ev.stage, result.error);
    return result;
  }
  if (w < 0) {
    result.error = make_error(ErrorCode::spawn_failed, std::string("waitpid: ") + std::strerror(errno));
    emit_failure(ev.stage, result.error);
    return result;
  }

  result.ok = true;
  result.exit_code = decode_status(status);
  ev.duration_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - started).count());
  ev.detail = "exit=" + std::to_string(result.exit_code);
  ev.ok = true;
  emit_event(ev);
  return result;
}

}  // namespace asteria

#endif
