#ifndef RAMCP_CORE_COMMAND_RUNNER_H_
#define RAMCP_CORE_COMMAND_RUNNER_H_

#include <filesystem>
#include <string>
#include <vector>

#include "ramcp_core/error.h"

namespace ramcp {

struct CommandResult {
  // Exit status, or 128 + signal number when the child was killed.
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs argv[0] (looked up in PATH) without a shell and captures both output
// streams until the child exits. Independent of the backend session.
bool RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& cwd,
                CommandResult* result, Error* error);

}  // namespace ramcp

#endif  // RAMCP_CORE_COMMAND_RUNNER_H_
