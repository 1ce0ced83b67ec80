#pragma once
/**
 * @file subprocess.hpp
 * @brief Runs an external command with a deadline and captures its standard output.
 *
 * Used where the OS offers no in-process API for a query (e.g. `lsof` on macOS and
 * FreeBSD). The child's stderr is discarded; stdin is not connected.
 */
#include <chrono>
#include <string>
#include <vector>

#include "livepreview_utils_export.h"
#include "utils/result.hpp"

namespace livepreview::utils
{

enum class CommandError
{
    SpawnFailed, ///< Executable not found or the process could not be created
    Timeout,     ///< Deadline passed; the child was killed
    ReadFailed   ///< Reading the child's output or reaping it failed
};

/** @brief Short name for logging. */
LIVEPREVIEW_UTILS_EXPORT const char *to_string(CommandError err) noexcept;

struct CommandOutput
{
    int exit_code = -1;
    std::string stdout_text;
};

using CommandResult = Result<CommandOutput, CommandError>;

/**
 * @brief Runs @p argv (argv[0] is looked up on PATH) and waits at most @p timeout.
 *
 * A non-zero exit status is not an error: it is reported in CommandOutput::exit_code.
 * On error, Result::error_code() carries the errno / GetLastError() value when one
 * is available.
 */
[[nodiscard]] LIVEPREVIEW_UTILS_EXPORT CommandResult
run_command(const std::vector<std::string> &argv, std::chrono::milliseconds timeout);

} // namespace livepreview::utils
