/**
 * @file subprocess.cpp
 * @brief fork/exec (POSIX) and CreateProcessW (Windows) command runner with a deadline.
 */
#include "lp_service.hpp"

#include <thread>

#if defined(LIVEPREVIEW_IS_POSIX)
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace livepreview::utils
{

const char *to_string(CommandError err) noexcept
{
    switch (err)
    {
    case CommandError::SpawnFailed:
        return "SpawnFailed";
    case CommandError::Timeout:
        return "Timeout";
    case CommandError::ReadFailed:
        return "ReadFailed";
    default:
        return "Unknown";
    }
}

namespace
{
constexpr std::chrono::milliseconds kReapPollInterval{5};
}

#if defined(LIVEPREVIEW_IS_POSIX)

namespace
{

int remaining_ms(std::chrono::steady_clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Waits for @p pid until @p deadline. Returns the raw status, or nullopt on timeout/failure.
std::optional<int> reap_until(pid_t pid, std::chrono::steady_clock::time_point deadline)
{
    for (;;)
    {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid)
        {
            return status;
        }
        if (r == -1 && errno != EINTR)
        {
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return std::nullopt;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void kill_and_reap(pid_t pid) noexcept
{
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR)
    {
    }
}

} // namespace

CommandResult run_command(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
{
    if (argv.empty())
    {
        return CommandResult::error(CommandError::SpawnFailed, EINVAL);
    }

    // Built before fork(): the child must not allocate.
    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        cargv.push_back(const_cast<char *>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int out_pipe[2];
    if (::pipe(out_pipe) == -1)
    {
        return CommandResult::error(CommandError::SpawnFailed, errno);
    }
    auto close_out = basics::make_scope_guard(
        [&out_pipe]() noexcept
        {
            for (int fd : out_pipe)
                if (fd != -1)
                    ::close(fd);
        });

    // Reports exec failure: closed by a successful exec, or carries the child's errno.
    int exec_pipe[2];
    if (::pipe(exec_pipe) == -1)
    {
        return CommandResult::error(CommandError::SpawnFailed, errno);
    }
    auto close_exec = basics::make_scope_guard(
        [&exec_pipe]() noexcept
        {
            for (int fd : exec_pipe)
                if (fd != -1)
                    ::close(fd);
        });
    ::fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC);

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    pid_t pid = ::fork();
    if (pid == -1)
    {
        return CommandResult::error(CommandError::SpawnFailed, errno);
    }
    if (pid == 0)
    {
        ::close(out_pipe[0]);
        ::close(exec_pipe[0]);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::close(out_pipe[1]);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull != -1)
        {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t n = ::write(exec_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    ::close(out_pipe[1]);
    out_pipe[1] = -1;
    ::close(exec_pipe[1]);
    exec_pipe[1] = -1;

    int child_errno = 0;
    ssize_t n = 0;
    do
    {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        kill_and_reap(pid);
        LOGGER_DEBUG("run_command: exec of '{}' failed: errno {}", argv[0], child_errno);
        return CommandResult::error(CommandError::SpawnFailed, child_errno);
    }

    CommandOutput output;
    char buf[4096];
    for (;;)
    {
        struct pollfd pfd{out_pipe[0], POLLIN, 0};
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0)
        {
            kill_and_reap(pid);
            LOGGER_WARN("run_command: '{}' timed out after {} ms", argv[0], timeout.count());
            return CommandResult::error(CommandError::Timeout);
        }
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc == -1)
        {
            if (errno == EINTR)
                continue;
            int err = errno;
            kill_and_reap(pid);
            return CommandResult::error(CommandError::ReadFailed, err);
        }
        if (rc == 0)
        {
            continue; // deadline check at the top of the loop
        }
        ssize_t got = ::read(out_pipe[0], buf, sizeof(buf));
        if (got > 0)
        {
            output.stdout_text.append(buf, static_cast<size_t>(got));
            continue;
        }
        if (got == 0)
        {
            break; // EOF
        }
        if (errno == EINTR || errno == EAGAIN)
        {
            continue;
        }
        int err = errno;
        kill_and_reap(pid);
        return CommandResult::error(CommandError::ReadFailed, err);
    }

    auto status = reap_until(pid, deadline);
    if (!status)
    {
        kill_and_reap(pid);
        LOGGER_WARN("run_command: '{}' did not exit before the deadline", argv[0]);
        return CommandResult::error(CommandError::Timeout);
    }
    if (WIFEXITED(*status))
    {
        output.exit_code = WEXITSTATUS(*status);
    }
    else if (WIFSIGNALED(*status))
    {
        output.exit_code = 128 + WTERMSIG(*status);
    }
    LOGGER_TRACE("run_command: '{}' exited with {} ({} bytes of output)", argv[0],
                 output.exit_code, output.stdout_text.size());
    return CommandResult::ok(std::move(output));
}

#elif defined(LIVEPREVIEW_PLATFORM_WIN64)

CommandResult run_command(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
{
    if (argv.empty())
    {
        return CommandResult::error(CommandError::SpawnFailed, ERROR_INVALID_PARAMETER);
    }

    std::string cmdline;
    for (const auto &a : argv)
    {
        if (!cmdline.empty())
            cmdline += ' ';
        cmdline += fmt::format("\"{}\"", a);
    }
    std::wstring wcmd = format_tools::s2ws(cmdline);
    std::vector<wchar_t> wcmd_buf(wcmd.begin(), wcmd.end());
    wcmd_buf.push_back(L'\0');

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0))
    {
        return CommandResult::error(CommandError::SpawnFailed, static_cast<int>(GetLastError()));
    }
    auto close_read = basics::make_scope_guard([read_end]() noexcept { CloseHandle(read_end); });
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si{};
    PROCESS_INFORMATION pi{};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = nullptr;
    si.hStdInput = nullptr;

    BOOL ok = CreateProcessW(nullptr, wcmd_buf.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                             nullptr, nullptr, &si, &pi);
    CloseHandle(write_end);
    if (!ok)
    {
        return CommandResult::error(CommandError::SpawnFailed, static_cast<int>(GetLastError()));
    }
    CloseHandle(pi.hThread);
    auto close_process =
        basics::make_scope_guard([&pi]() noexcept { CloseHandle(pi.hProcess); });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    CommandOutput output;
    char buf[4096];
    for (;;)
    {
        DWORD available = 0;
        if (PeekNamedPipe(read_end, nullptr, 0, nullptr, &available, nullptr) && available > 0)
        {
            DWORD got = 0;
            if (!ReadFile(read_end, buf, sizeof(buf), &got, nullptr))
            {
                TerminateProcess(pi.hProcess, 1);
                return CommandResult::error(CommandError::ReadFailed,
                                            static_cast<int>(GetLastError()));
            }
            output.stdout_text.append(buf, got);
            continue;
        }
        if (WaitForSingleObject(pi.hProcess, 0) == WAIT_OBJECT_0)
        {
            // Drain whatever the child wrote before exiting.
            DWORD got = 0;
            while (ReadFile(read_end, buf, sizeof(buf), &got, nullptr) && got > 0)
            {
                output.stdout_text.append(buf, got);
            }
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            TerminateProcess(pi.hProcess, 1);
            WaitForSingleObject(pi.hProcess, INFINITE);
            LOGGER_WARN("run_command: '{}' timed out after {} ms", argv[0], timeout.count());
            return CommandResult::error(CommandError::Timeout);
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    DWORD exit_code = 0;
    GetExitCodeProcess(pi.hProcess, &exit_code);
    output.exit_code = static_cast<int>(exit_code);
    return CommandResult::ok(std::move(output));
}

#else

CommandResult run_command(const std::vector<std::string> &argv,
                          [[maybe_unused]] std::chrono::milliseconds timeout)
{
    LOGGER_ERROR("run_command: '{}' cannot be run on this platform",
                 argv.empty() ? std::string{} : argv[0]);
    return CommandResult::error(CommandError::SpawnFailed);
}

#endif

} // namespace livepreview::utils
