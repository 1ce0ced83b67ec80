// tests/test_framework/test_process_utils.h
#pragma once

#include "lp_base.hpp"

#include <chrono>
#include <string>
#include <vector>

#if defined(LIVEPREVIEW_IS_POSIX)
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

/**
 * @file test_process_utils.h
 * @brief Platform-abstracted utilities for spawning and managing child processes in tests.
 *
 * Port ownership tests need a second process that holds a socket; the test binary
 * re-spawns itself in worker mode to get one.
 */
namespace livepreview::tests::helper
{
namespace fs = std::filesystem;

#if defined(LIVEPREVIEW_PLATFORM_WIN64)
using ProcessHandle = HANDLE;
static const HANDLE NULL_PROC_HANDLE = nullptr;
#else
using ProcessHandle = pid_t;
static constexpr pid_t NULL_PROC_HANDLE = 0;
#endif

/**
 * @class WorkerProcess
 * @brief Spawns this test executable as a worker and captures its output.
 *
 * stdout and stderr go to temporary files that are removed on destruction. Output can
 * be read while the worker is still running (see wait_for_stdout()). The destructor
 * waits for a worker that has not been waited for.
 */
class WorkerProcess
{
  public:
    /**
     * @param exe_path The path to this executable (from g_self_exe_path).
     * @param mode The worker mode string (e.g., "listener.hold_port").
     * @param args Additional arguments for the worker.
     */
    WorkerProcess(const std::string &exe_path, const std::string &mode,
                  const std::vector<std::string> &args);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;
    WorkerProcess(WorkerProcess &&) = delete;
    WorkerProcess &operator=(WorkerProcess &&) = delete;

    /// Waits for the worker to exit and captures its output. Returns the exit code.
    int wait_for_exit();

    /**
     * @brief Polls the worker's stdout until it contains @p expected.
     * @return False on timeout or if the worker exited without printing it.
     */
    bool wait_for_stdout(const std::string &expected,
                         std::chrono::milliseconds timeout = std::chrono::seconds(15)) const;

    /// Forcibly stops a running worker and reaps it.
    void terminate();

    const std::string &get_stdout() const;
    const std::string &get_stderr() const;

    /// The exit code, or -1 if not yet waited for or killed by a signal.
    int exit_code() const { return exit_code_; }

    bool valid() const { return handle_ != NULL_PROC_HANDLE || waited_; }

    /// OS process id of the worker; 0 before spawn or after exit.
    uint64_t pid() const { return pid_; }

  private:
    ProcessHandle handle_ = NULL_PROC_HANDLE;
    uint64_t pid_ = 0;
    int exit_code_ = -1;
    fs::path stdout_path_;
    fs::path stderr_path_;
    mutable std::string stdout_content_;
    mutable std::string stderr_content_;
    bool waited_ = false;
};

/**
 * @brief Asserts that a worker completed successfully.
 *
 * Checks exit code 0, the absence of failure markers in stderr, and the presence of
 * every string in @p expected_stderr_substrings.
 */
void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings = {});

} // namespace livepreview::tests::helper
