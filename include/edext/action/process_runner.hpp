#pragma once

/// @file process_runner.hpp
/// @brief Blocking child-process execution with separate stdout/stderr capture.

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "edext/foundation/engine_result.hpp"

namespace edext::action {

struct CommandRequest {
    std::string command;                       ///< Passed as `<shell> -c <command>`.
    std::string shell = "/bin/sh";
    std::filesystem::path workingDirectory;    ///< Empty: inherit.
    std::optional<std::string> input;          ///< nullopt: stdin closed at once.
    std::size_t outputLimitBytes = 4 * 1024 * 1024;  ///< Per stream.
};

struct CommandOutput {
    int exitCode = 0;       ///< 128 + signal number when killed by a signal.
    bool signaled = false;
    std::string stdoutText;
    std::string stderrText;
    bool truncated = false; ///< A stream exceeded outputLimitBytes.

    [[nodiscard]] bool succeeded() const noexcept { return !signaled && exitCode == 0; }
};

/// Run @p request to completion.
///
/// Input is written while output is drained, so large inputs and outputs do
/// not deadlock. Output beyond the limit is read and discarded.
/// SIGPIPE is ignored process-wide on first use.
///
/// @return CommandSpawnFailed when the pipes or child cannot be created.
///         A command that runs and exits non-zero is still a successful
///         result; callers inspect CommandOutput::succeeded().
[[nodiscard]] foundation::EngineResult<CommandOutput> runCommand(const CommandRequest& request);

} // namespace edext::action
