#include "ramcp_core/process_supervisor.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "ramcp_core/logging.h"

namespace ramcp {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

void ClosePipe(int fds[2]) {
  CloseFd(&fds[0]);
  CloseFd(&fds[1]);
}

int TakeFd(int* fd) {
  int out = *fd;
  *fd = -1;
  return out;
}

}  // namespace

ProcessSupervisor::~ProcessSupervisor() {
  Terminate(std::chrono::milliseconds(500));
  std::lock_guard<std::mutex> lock(mutex_);
  CloseFdsLocked();
}

bool ProcessSupervisor::Spawn(const SpawnOptions& options, Error* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ > 0 && !reaped_) {
    SetError(error, ErrorCode::kSpawn, "backend already running");
    return false;
  }
  if (options.executable.empty()) {
    SetError(error, ErrorCode::kSpawn, "no backend executable configured");
    return false;
  }

  // Writes to a dead backend must surface as EPIPE, not kill this process.
  signal(SIGPIPE, SIG_IGN);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
      pipe2(err_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
    std::string reason = std::strerror(errno);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    SetError(error, ErrorCode::kSpawn, "pipe creation failed: " + reason);
    return false;
  }

  std::vector<std::string> argv_storage;
  argv_storage.push_back(options.executable);
  argv_storage.insert(argv_storage.end(), options.args.begin(), options.args.end());
  std::vector<char*> argv;
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::string working_dir = options.working_dir.string();

  pid_t pid = fork();
  if (pid < 0) {
    std::string reason = std::strerror(errno);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    ClosePipe(exec_pipe);
    SetError(error, ErrorCode::kSpawn, "fork failed: " + reason);
    return false;
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    signal(SIGPIPE, SIG_DFL);
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      int code = errno;
      ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
      (void)ignored;
      _exit(127);
    }
    execvp(argv[0], argv.data());
    int code = errno;
    ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
    (void)ignored;
    _exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);

  // The exec pipe closes on successful exec; otherwise it carries errno.
  int child_errno = 0;
  ssize_t received;
  do {
    received = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (received < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  if (received > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    ClosePipe(in_pipe);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    SetError(error, ErrorCode::kSpawn,
             "cannot launch " + options.executable + ": " + std::strerror(child_errno));
    return false;
  }

  CloseFdsLocked();
  pid_ = pid;
  reaped_ = false;
  exit_status_.reset();
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  Log("spawned " + options.executable + " (pid " + std::to_string(pid) + ")");
  return true;
}

int ProcessSupervisor::TakeStdin() {
  std::lock_guard<std::mutex> lock(mutex_);
  return TakeFd(&stdin_fd_);
}

int ProcessSupervisor::TakeStdout() {
  std::lock_guard<std::mutex> lock(mutex_);
  return TakeFd(&stdout_fd_);
}

int ProcessSupervisor::TakeStderr() {
  std::lock_guard<std::mutex> lock(mutex_);
  return TakeFd(&stderr_fd_);
}

bool ProcessSupervisor::IsAlive() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ <= 0 || reaped_) {
    return false;
  }
  return !ReapLocked(false);
}

std::optional<int> ProcessSupervisor::exit_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exit_status_;
}

pid_t ProcessSupervisor::pid() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pid_;
}

bool ProcessSupervisor::ReapLocked(bool block) {
  if (reaped_) {
    return true;
  }
  int status = 0;
  pid_t result;
  do {
    result = waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (result < 0 && errno == EINTR);
  if (result == pid_) {
    reaped_ = true;
    exit_status_ = status;
    Log("backend pid " + std::to_string(pid_) + " exited with status " +
        std::to_string(status));
    return true;
  }
  if (result < 0) {
    // ECHILD: someone else reaped it; it is gone either way.
    reaped_ = true;
    return true;
  }
  return false;
}

bool ProcessSupervisor::WaitForExitLocked(std::chrono::steady_clock::time_point deadline) {
  while (!ReapLocked(false)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  return true;
}

bool ProcessSupervisor::Terminate(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pid_ <= 0 || reaped_) {
    return true;
  }
  auto start = std::chrono::steady_clock::now();
  if (WaitForExitLocked(start + grace / 2)) {
    return true;
  }
  Log("backend pid " + std::to_string(pid_) + " still running, sending SIGTERM");
  kill(pid_, SIGTERM);
  if (WaitForExitLocked(start + grace)) {
    return true;
  }
  Log("backend pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
  kill(pid_, SIGKILL);
  ReapLocked(true);
  return false;
}

void ProcessSupervisor::CloseFdsLocked() {
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
}

}  // namespace ramcp
