#ifndef RAMCP_CORE_PROCESS_SUPERVISOR_H_
#define RAMCP_CORE_PROCESS_SUPERVISOR_H_

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ramcp_core/error.h"

namespace ramcp {

struct SpawnOptions {
  std::string executable;
  std::vector<std::string> args;
  // Empty means inherit the current directory.
  std::filesystem::path working_dir;
};

// Owns the backend child process. Stream descriptors are handed out once
// through the Take* accessors; the supervisor never reads or writes them.
class ProcessSupervisor {
 public:
  ProcessSupervisor() = default;
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  // Starts the executable with stdin/stdout/stderr redirected to pipes.
  // Fails with kSpawn if it cannot be launched (including exec failure in
  // the child).
  bool Spawn(const SpawnOptions& options, Error* error);

  // Ownership of the descriptor passes to the caller. -1 once taken.
  int TakeStdin();
  int TakeStdout();
  int TakeStderr();

  // Non-blocking liveness probe. Reaps the child if it has exited.
  bool IsAlive();
  // Raw wait status once the child was reaped.
  std::optional<int> exit_status() const;
  pid_t pid() const;

  // Waits for a voluntary exit, then SIGTERM, then SIGKILL once `grace` is
  // spent. Returns true when the child exited before the SIGKILL.
  bool Terminate(std::chrono::milliseconds grace);

 private:
  bool ReapLocked(bool block);
  bool WaitForExitLocked(std::chrono::steady_clock::time_point deadline);
  void CloseFdsLocked();

  mutable std::mutex mutex_;
  pid_t pid_ = -1;
  bool reaped_ = false;
  std::optional<int> exit_status_;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
};

}  // namespace ramcp

#endif  // RAMCP_CORE_PROCESS_SUPERVISOR_H_
