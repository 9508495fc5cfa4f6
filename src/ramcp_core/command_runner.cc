#include "ramcp_core/command_runner.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "ramcp_core/logging.h"

namespace ramcp {

namespace {

void CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

std::string JoinArgv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

// Drains both pipes until each reports end of stream.
void DrainOutputs(int out_fd, int err_fd, std::string* out, std::string* err) {
  char buffer[4096];
  while (out_fd >= 0 || err_fd >= 0) {
    pollfd fds[2];
    int count = 0;
    if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
    if (poll(fds, count, -1) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;
      int* fd = fds[i].fd == out_fd ? &out_fd : &err_fd;
      std::string* sink = fds[i].fd == out_fd ? out : err;
      ssize_t received = read(*fd, buffer, sizeof(buffer));
      if (received < 0 && errno == EINTR) continue;
      if (received <= 0) {
        CloseFd(fd);
        continue;
      }
      sink->append(buffer, static_cast<size_t>(received));
    }
  }
  CloseFd(&out_fd);
  CloseFd(&err_fd);
}

}  // namespace

bool RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& cwd,
                CommandResult* result, Error* error) {
  if (argv.empty() || argv.front().empty()) {
    SetError(error, ErrorCode::kInvalidParams, "empty command");
    return false;
  }
  signal(SIGPIPE, SIG_IGN);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    std::string reason = std::strerror(errno);
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0],
                    &exec_pipe[1]}) {
      CloseFd(fd);
    }
    SetError(error, ErrorCode::kSpawn, "pipe creation failed: " + reason);
    return false;
  }

  std::vector<std::string> storage = argv;
  std::vector<char*> args;
  for (auto& arg : storage) {
    args.push_back(arg.data());
  }
  args.push_back(nullptr);
  std::string working_dir = cwd.string();

  pid_t pid = fork();
  if (pid < 0) {
    std::string reason = std::strerror(errno);
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0],
                    &exec_pipe[1]}) {
      CloseFd(fd);
    }
    SetError(error, ErrorCode::kSpawn, "fork failed: " + reason);
    return false;
  }
  if (pid == 0) {
    signal(SIGPIPE, SIG_DFL);
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      int code = errno;
      ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
      (void)ignored;
      _exit(127);
    }
    execvp(args[0], args.data());
    int code = errno;
    ssize_t ignored = write(exec_pipe[1], &code, sizeof(code));
    (void)ignored;
    _exit(127);
  }

  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  CloseFd(&exec_pipe[1]);
  int child_errno = 0;
  ssize_t received;
  do {
    received = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (received < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  CommandResult local;
  DrainOutputs(out_pipe[0], err_pipe[0], &local.stdout_text, &local.stderr_text);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (received > 0) {
    SetError(error, ErrorCode::kSpawn,
             "cannot launch " + argv.front() + ": " + std::strerror(child_errno));
    return false;
  }
  if (WIFEXITED(status)) {
    local.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    local.exit_code = 128 + WTERMSIG(status);
  }
  Log("ran " + JoinArgv(argv) + " -> " + std::to_string(local.exit_code));
  if (result) {
    *result = std::move(local);
  }
  return true;
}

}  // namespace ramcp
