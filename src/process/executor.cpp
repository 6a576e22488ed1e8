#include "process/executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <system_error>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace termctl {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

// Chunks read from one pipe per supervision round, so a child that writes
// without pause cannot keep the loop away from the deadline check.
constexpr size_t kChunksPerRound = 64;
constexpr size_t kChunksFinalDrain = 1024;

enum class ReadState { Open, Closed };

Duration since(Clock::time_point start) {
  return std::chrono::duration_cast<Duration>(Clock::now() - start);
}

}  // namespace

std::string to_string(CommandStatus status) {
  switch (status) {
    case CommandStatus::Completed:
      return "completed";
    case CommandStatus::TimedOut:
      return "timed_out";
    case CommandStatus::Failed:
      return "failed";
  }
  return "failed";
}

std::string to_string(ProcessState state) {
  switch (state) {
    case ProcessState::Created:
      return "Created";
    case ProcessState::Spawning:
      return "Spawning";
    case ProcessState::Running:
      return "Running";
    case ProcessState::Completed:
      return "Completed";
    case ProcessState::TimedOut:
      return "TimedOut";
    case ProcessState::SpawnFailed:
      return "SpawnFailed";
    case ProcessState::Reaped:
      return "Reaped";
  }
  return "Created";
}

json CommandRequest::to_json() const {
  json j;
  j["command"] = command;
  j["working_dir"] = working_dir ? json(working_dir->string()) : json(nullptr);
  j["timeout_ms"] = timeout ? json(timeout->count()) : json(nullptr);
  return j;
}

json CommandResult::to_json() const {
  json j;
  j["status"] = to_string(status);
  j["stdout"] = sanitize_utf8(stdout_text);
  j["stderr"] = sanitize_utf8(stderr_text);
  j["exit_code"] = exit_code ? json(*exit_code) : json(nullptr);
  j["elapsed_ms"] = elapsed.count();
  j["truncated"] = truncated;
  if (error) {
    j["error"] = *error;
  }
  return j;
}

void OutputCapture::append(const char* data, size_t size) {
  size_t room = data_.size() < limit_ ? limit_ - data_.size() : 0;
  size_t keep = std::min(room, size);
  data_.append(data, keep);
  dropped_ += size - keep;
}

std::string OutputCapture::finish() const {
  if (dropped_ == 0) {
    return data_;
  }
  return data_ + "\n... [Output truncated. " + std::to_string(dropped_) + " bytes omitted]";
}

ProcessExecutor::ProcessExecutor(ExecutorOptions options) : options_(std::move(options)) {}

CommandResult ProcessExecutor::execute(const CommandRequest& request, const ShellConfig& shell, const fs::path& cwd,
                                       const StateObserver& observer) const {
  StateObserver notify = [&observer](ProcessState state) {
    if (observer) {
      observer(state);
    }
  };
  notify(ProcessState::Created);

  Duration timeout = request.timeout.value_or(options_.default_timeout);
  if (timeout.count() <= 0) {
    spdlog::warn("[Executor] Non-positive timeout {}ms, using default {}ms", timeout.count(), options_.default_timeout.count());
    timeout = options_.default_timeout;
  }
  if (timeout > kMaxTimeout) {
    spdlog::warn("[Executor] Timeout {}ms exceeds the {}ms limit, clamping", timeout.count(), kMaxTimeout.count());
    timeout = kMaxTimeout;
  }
  fs::path workdir = request.working_dir.value_or(cwd);

  spdlog::debug("[Executor] Executing: command=\"{}\", workdir=\"{}\", timeout={}ms, shell={}", request.command, workdir.string(),
                timeout.count(), shell.executable);

  auto result = run(request.command, shell, workdir, timeout, notify);
  notify(ProcessState::Reaped);

  switch (result.status) {
    case CommandStatus::Completed:
      spdlog::debug("[Executor] Command completed with exit code {} in {}ms", result.exit_code ? *result.exit_code : -1,
                    result.elapsed.count());
      break;
    case CommandStatus::TimedOut:
      spdlog::warn("[Executor] Command timed out after {}ms: {}", timeout.count(), request.command);
      break;
    case CommandStatus::Failed:
      spdlog::error("[Executor] Command could not be started: {}", result.error.value_or("unknown error"));
      break;
  }
  return result;
}

#ifndef _WIN32

namespace {

// Owns one file descriptor
class ScopedFd {
 public:
  ScopedFd() = default;
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    reset();
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

  bool valid() const {
    return fd_ >= 0;
  }

  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

// Both ends close-on-exec, so concurrently spawned children never inherit them
bool make_pipe(ScopedFd& read_end, ScopedFd& write_end) {
  int fds[2];
#ifdef __linux__
  if (::pipe2(fds, O_CLOEXEC) == -1) return false;
#else
  if (::pipe(fds) == -1) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

void set_nonblocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string errno_message(int err) {
  return std::generic_category().message(err);
}

// Written by the child to the status pipe when it cannot exec
struct SpawnFailure {
  enum Stage : int { Chdir = 1, Exec = 2 };
  int stage;
  int error;
};

[[noreturn]] void report_and_exit(int status_fd, int stage) {
  SpawnFailure failure{stage, errno};
  ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
  (void)ignored;
  _exit(127);
}

// Resolve a bare executable name through PATH before forking
std::optional<std::string> find_executable(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    return name;
  }
  const char* path_env = std::getenv("PATH");
  std::string path_list = path_env ? path_env : "/usr/bin:/bin";
  size_t begin = 0;
  while (begin <= path_list.size()) {
    size_t end = path_list.find(':', begin);
    if (end == std::string::npos) end = path_list.size();
    std::string dir = path_list.substr(begin, end - begin);
    auto candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    begin = end + 1;
  }
  return std::nullopt;
}

struct Stream {
  ScopedFd fd;
  OutputCapture capture;
  int error_streak = 0;

  explicit Stream(size_t limit) : capture(limit) {}

  // Read what is available without blocking, at most max_chunks buffers
  ReadState drain(size_t max_chunks) {
    if (!fd.valid()) return ReadState::Closed;

    std::array<char, 4096> buffer;
    for (size_t i = 0; i < max_chunks; ++i) {
      ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
      if (n > 0) {
        capture.append(buffer.data(), static_cast<size_t>(n));
        error_streak = 0;
        continue;
      }
      if (n == 0) {
        fd.reset();
        return ReadState::Closed;
      }
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadState::Open;

      // Transient read error: retry next round, give up on a stream that keeps failing
      if (++error_streak >= 16) {
        spdlog::warn("[Executor] Giving up on output pipe after repeated errors: {}", errno_message(errno));
        fd.reset();
        return ReadState::Closed;
      }
      return ReadState::Open;
    }
    return ReadState::Open;
  }
};

void signal_group(pid_t pid, int sig) {
  // The child leads its own process group; fall back to the pid alone
  if (::kill(-pid, sig) == -1) {
    ::kill(pid, sig);
  }
}

bool wait_blocking(pid_t pid, int& status) {
  while (true) {
    pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) return true;
    if (r == -1 && errno != EINTR) return false;
  }
}

int decode_exit_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

CommandResult ProcessExecutor::run(const std::string& command, const ShellConfig& shell, const fs::path& cwd, Duration timeout,
                                   const StateObserver& notify) const {
  CommandResult result;
  notify(ProcessState::Spawning);

  auto fail = [&](const std::string& message) {
    result.status = CommandStatus::Failed;
    result.error = message;
    notify(ProcessState::SpawnFailed);
    return result;
  };

  auto executable = find_executable(shell.executable);
  if (!executable) {
    return fail("Shell executable not found in PATH: " + shell.executable);
  }

  // Everything the child touches is prepared before fork
  std::vector<std::string> args = shell.argv(command);
  args[0] = *executable;
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::string workdir = cwd.string();

  Stream out(options_.max_output_bytes);
  Stream err(options_.max_output_bytes);
  ScopedFd out_write, err_write, status_read, status_write;
  if (!make_pipe(out.fd, out_write) || !make_pipe(err.fd, err_write) || !make_pipe(status_read, status_write)) {
    return fail("Failed to create pipe: " + errno_message(errno));
  }

  // stdin comes from /dev/null: a shell waiting on an inherited, never-closing stdin hangs forever
  ScopedFd null_in(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (!null_in.valid()) {
    return fail("Failed to open /dev/null: " + errno_message(errno));
  }

  auto start = Clock::now();
  pid_t pid = ::fork();
  if (pid == -1) {
    return fail("Failed to fork process: " + errno_message(errno));
  }

  if (pid == 0) {
    // ---- Child process: async-signal-safe calls only ----
    ::setpgid(0, 0);

    struct sigaction sa {};
    sa.sa_handler = SIG_DFL;
    ::sigaction(SIGPIPE, &sa, nullptr);

    ::dup2(null_in.get(), STDIN_FILENO);
    ::dup2(out_write.get(), STDOUT_FILENO);
    ::dup2(err_write.get(), STDERR_FILENO);

    if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
      report_and_exit(status_write.get(), SpawnFailure::Chdir);
    }

    ::execv(argv[0], argv.data());
    report_and_exit(status_write.get(), SpawnFailure::Exec);
  }

  // ---- Parent process ----
  out_write.reset();
  err_write.reset();
  status_write.reset();
  null_in.reset();

  // EOF on the status pipe means exec succeeded (close-on-exec)
  SpawnFailure failure{};
  ssize_t n;
  do {
    n = ::read(status_read.get(), &failure, sizeof(failure));
  } while (n == -1 && errno == EINTR);
  status_read.reset();

  if (n == static_cast<ssize_t>(sizeof(failure))) {
    int status = 0;
    wait_blocking(pid, status);
    result.elapsed = since(start);
    if (failure.stage == SpawnFailure::Chdir) {
      return fail("Cannot enter working directory " + workdir + ": " + errno_message(failure.error));
    }
    return fail("Failed to execute " + shell.executable + ": " + errno_message(failure.error));
  }

  notify(ProcessState::Running);

  set_nonblocking(out.fd.get());
  set_nonblocking(err.fd.get());

  auto deadline = start + timeout;
  int status = 0;
  bool exited = false;
  bool timed_out = false;

  // Race between "process exited" and "deadline reached"
  while (true) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      exited = true;
      break;
    }
    if (r == -1 && errno != EINTR) {
      result.error = "Failed to reap process: " + errno_message(errno);
      break;
    }

    auto now = Clock::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }
    auto wait = std::min(std::chrono::duration_cast<Duration>(deadline - now), options_.poll_interval);

    std::vector<pollfd> fds;
    std::vector<Stream*> polled;
    for (Stream* s : {&out, &err}) {
      if (s->fd.valid()) {
        fds.push_back({s->fd.get(), POLLIN, 0});
        polled.push_back(s);
      }
    }

    if (fds.empty()) {
      // Both pipes closed; only the exit is left to observe
      std::this_thread::sleep_for(std::min(wait, Duration(5)));
      continue;
    }

    int ready = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
    if (ready == -1) {
      if (errno != EINTR) {
        spdlog::warn("[Executor] poll failed: {}", errno_message(errno));
        std::this_thread::sleep_for(Duration(5));
      }
      continue;
    }

    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].revents != 0) {
        polled[i]->drain(kChunksPerRound);
      }
    }
  }

  if (timed_out) {
    // Graceful termination first, then escalate
    signal_group(pid, SIGTERM);
    auto grace_end = Clock::now() + options_.kill_grace;
    bool reaped = false;
    while (Clock::now() < grace_end) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        reaped = true;
        break;
      }
      if (r == -1 && errno != EINTR) break;
      out.drain(kChunksPerRound);
      err.drain(kChunksPerRound);
      std::this_thread::sleep_for(Duration(10));
    }
    if (!reaped) {
      spdlog::debug("[Executor] Process {} ignored SIGTERM, sending SIGKILL", pid);
      signal_group(pid, SIGKILL);
      if (!wait_blocking(pid, status)) {
        result.error = "Failed to reap killed process: " + errno_message(errno);
      }
    }
    // Descendants still holding the pipes
    ::kill(-pid, SIGKILL);
  }

  out.drain(kChunksFinalDrain);
  err.drain(kChunksFinalDrain);

  result.elapsed = since(start);
  result.stdout_text = out.capture.finish();
  result.stderr_text = err.capture.finish();
  result.truncated = out.capture.truncated() || err.capture.truncated();

  if (timed_out) {
    result.status = CommandStatus::TimedOut;
    notify(ProcessState::TimedOut);
  } else {
    result.status = CommandStatus::Completed;
    if (exited) {
      result.exit_code = decode_exit_status(status);
    } else {
      // Could not be reaped: make sure it is gone and report without an exit code
      signal_group(pid, SIGKILL);
    }
    notify(ProcessState::Completed);
  }

  // Stream destructors close the read ends
  return result;
}

#else  // _WIN32

namespace {

// Owns one Win32 handle
class ScopedHandle {
 public:
  ScopedHandle() = default;
  explicit ScopedHandle(HANDLE h) : h_(h) {}
  ~ScopedHandle() {
    reset();
  }

  ScopedHandle(const ScopedHandle&) = delete;
  ScopedHandle& operator=(const ScopedHandle&) = delete;

  HANDLE get() const {
    return h_;
  }

  HANDLE* out() {
    reset();
    return &h_;
  }

  bool valid() const {
    return h_ != nullptr && h_ != INVALID_HANDLE_VALUE;
  }

  void reset(HANDLE h = nullptr) {
    if (valid()) {
      ::CloseHandle(h_);
    }
    h_ = h;
  }

 private:
  HANDLE h_ = nullptr;
};

std::string win32_message(DWORD err) {
  return std::system_category().message(static_cast<int>(err));
}

// Quote one argument so CommandLineToArgvW-style parsing gives it back unchanged
std::string quote_windows_arg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
    return arg;
  }
  std::string quoted = "\"";
  for (auto it = arg.begin();; ++it) {
    size_t backslashes = 0;
    while (it != arg.end() && *it == '\\') {
      ++it;
      ++backslashes;
    }
    if (it == arg.end()) {
      quoted.append(backslashes * 2, '\\');
      break;
    }
    if (*it == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
    } else {
      quoted.append(backslashes, '\\');
    }
    quoted.push_back(*it);
  }
  quoted.push_back('"');
  return quoted;
}

std::string build_command_line(const ShellConfig& shell, const std::string& command) {
  if (shell.flag == "/C") {
    // cmd.exe parses quotes itself; /S strips exactly the outer pair
    return quote_windows_arg(shell.executable) + " /S /C \"" + command + "\"";
  }
  return quote_windows_arg(shell.executable) + " " + shell.flag + " " + quote_windows_arg(command);
}

struct Stream {
  ScopedHandle pipe;
  OutputCapture capture;

  explicit Stream(size_t limit) : capture(limit) {}

  ReadState drain(size_t max_chunks) {
    if (!pipe.valid()) return ReadState::Closed;

    std::array<char, 4096> buffer;
    for (size_t i = 0; i < max_chunks; ++i) {
      DWORD available = 0;
      if (!::PeekNamedPipe(pipe.get(), nullptr, 0, nullptr, &available, nullptr)) {
        pipe.reset();  // Broken pipe: every writer is gone
        return ReadState::Closed;
      }
      if (available == 0) return ReadState::Open;

      DWORD got = 0;
      DWORD want = std::min<DWORD>(available, static_cast<DWORD>(buffer.size()));
      if (!::ReadFile(pipe.get(), buffer.data(), want, &got, nullptr) || got == 0) {
        pipe.reset();
        return ReadState::Closed;
      }
      capture.append(buffer.data(), got);
    }
    return ReadState::Open;
  }
};

}  // namespace

CommandResult ProcessExecutor::run(const std::string& command, const ShellConfig& shell, const fs::path& cwd, Duration timeout,
                                   const StateObserver& notify) const {
  CommandResult result;
  notify(ProcessState::Spawning);

  auto fail = [&](const std::string& message) {
    result.status = CommandStatus::Failed;
    result.error = message;
    notify(ProcessState::SpawnFailed);
    return result;
  };

  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};

  Stream out(options_.max_output_bytes);
  Stream err(options_.max_output_bytes);
  ScopedHandle out_write, err_write;
  if (!::CreatePipe(out.pipe.out(), out_write.out(), &sa, 0) || !::CreatePipe(err.pipe.out(), err_write.out(), &sa, 0)) {
    return fail("Failed to create pipe: " + win32_message(::GetLastError()));
  }
  // Only the write ends are inherited
  ::SetHandleInformation(out.pipe.get(), HANDLE_FLAG_INHERIT, 0);
  ::SetHandleInformation(err.pipe.get(), HANDLE_FLAG_INHERIT, 0);

  // stdin comes from NUL: a shell waiting on an inherited, never-closing stdin hangs forever
  ScopedHandle null_in(::CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr));
  if (!null_in.valid()) {
    return fail("Failed to open NUL: " + win32_message(::GetLastError()));
  }

  STARTUPINFOA si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = null_in.get();
  si.hStdOutput = out_write.get();
  si.hStdError = err_write.get();

  std::string command_line = build_command_line(shell, command);
  std::vector<char> command_buffer(command_line.begin(), command_line.end());
  command_buffer.push_back('\0');
  std::string workdir = cwd.string();

  // The job lets a timeout take down the whole process tree
  ScopedHandle job(::CreateJobObjectA(nullptr, nullptr));

  PROCESS_INFORMATION pi{};
  auto start = Clock::now();
  BOOL created = ::CreateProcessA(nullptr, command_buffer.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW | CREATE_SUSPENDED, nullptr,
                                  workdir.empty() ? nullptr : workdir.c_str(), &si, &pi);
  DWORD create_error = ::GetLastError();

  out_write.reset();
  err_write.reset();
  null_in.reset();

  if (!created) {
    result.elapsed = since(start);
    return fail("Failed to execute " + shell.executable + ": " + win32_message(create_error));
  }

  ScopedHandle process(pi.hProcess);
  ScopedHandle thread(pi.hThread);
  if (job.valid()) {
    ::AssignProcessToJobObject(job.get(), process.get());
  }
  ::ResumeThread(thread.get());
  thread.reset();

  notify(ProcessState::Running);

  auto deadline = start + timeout;
  bool exited = false;
  bool timed_out = false;

  while (true) {
    out.drain(kChunksPerRound);
    err.drain(kChunksPerRound);

    auto now = Clock::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }
    auto wait = std::min(std::chrono::duration_cast<Duration>(deadline - now), Duration(10));
    DWORD w = ::WaitForSingleObject(process.get(), static_cast<DWORD>(wait.count()));
    if (w == WAIT_OBJECT_0) {
      exited = true;
      break;
    }
    if (w == WAIT_FAILED) {
      result.error = "Failed to wait for process: " + win32_message(::GetLastError());
      break;
    }
  }

  if (timed_out) {
    if (job.valid()) {
      ::TerminateJobObject(job.get(), 1);
    } else {
      ::TerminateProcess(process.get(), 1);
    }
    if (::WaitForSingleObject(process.get(), static_cast<DWORD>(options_.kill_grace.count())) != WAIT_OBJECT_0) {
      ::TerminateProcess(process.get(), 1);
      ::WaitForSingleObject(process.get(), INFINITE);
    }
  }

  out.drain(kChunksFinalDrain);
  err.drain(kChunksFinalDrain);

  result.elapsed = since(start);
  result.stdout_text = out.capture.finish();
  result.stderr_text = err.capture.finish();
  result.truncated = out.capture.truncated() || err.capture.truncated();

  if (timed_out) {
    result.status = CommandStatus::TimedOut;
    notify(ProcessState::TimedOut);
  } else {
    result.status = CommandStatus::Completed;
    DWORD code = 0;
    if (exited && ::GetExitCodeProcess(process.get(), &code)) {
      result.exit_code = static_cast<int>(code);
    } else {
      ::TerminateProcess(process.get(), 1);
    }
    notify(ProcessState::Completed);
  }

  return result;
}

#endif  // _WIN32

}  // namespace termctl
