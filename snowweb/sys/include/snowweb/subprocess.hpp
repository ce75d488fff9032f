#pragma once

#include <span>
#include <string>
#include <utility>
#include <vector>

namespace snowweb {

struct CommandResult {
  // Exit status of the process, or 128 + signal number if it was killed by a signal.
  int exitStatus{};
  std::string stdoutData;
};

using EnvironmentOverrides = std::vector<std::pair<std::string, std::string>>;

// Runs 'argv' (argv[0] looked up in PATH) to completion, capturing its standard output.
// Standard error is inherited. The child starts with an empty signal mask and default signal dispositions,
// whatever the caller blocked. 'envOverrides' are added to (or replace entries of) the current environment.
// Throws std::system_error if the process cannot be spawned or waited for.
[[nodiscard]] CommandResult RunCommand(std::span<const std::string> argv, const EnvironmentOverrides& envOverrides = {});

// Renders 'argv' as a single space separated string, for logs and error contexts.
[[nodiscard]] std::string FormatCommand(std::span<const std::string> argv);

}  // namespace snowweb
