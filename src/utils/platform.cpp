/**
 * @file platform.cpp
 * @brief OS-specific process, thread and clock queries.
 *
 * Implements the `livepreview::platform` functions declared in lp_platform.hpp. The
 * health checks use these to learn their own PID (the "self" side of port ownership)
 * and the logger uses them to stamp each record.
 */
#include "lp_base.hpp"
#include "livepreview_version.h"
#include <chrono>
#include <thread>
#include <vector>

#if defined(LIVEPREVIEW_IS_POSIX)
#include <errno.h>
#include <limits.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#ifdef LIVEPREVIEW_PLATFORM_FREEBSD
#include <sys/sysctl.h>
#endif

#if defined(LIVEPREVIEW_PLATFORM_APPLE)
#include <libproc.h>     // proc_pidpath
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

namespace livepreview::platform
{

uint64_t get_pid()
{
#if defined(LIVEPREVIEW_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Native thread id of the caller (`GetCurrentThreadId`, `pthread_threadid_np`,
 *        `SYS_gettid`), used in log records.
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(LIVEPREVIEW_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(LIVEPREVIEW_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(LIVEPREVIEW_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(LIVEPREVIEW_PLATFORM_WIN64)
        std::vector<wchar_t> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = livepreview::format_tools::ws2s(std::wstring(buf.data(), len));

#elif defined(LIVEPREVIEW_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));

#elif defined(LIVEPREVIEW_PLATFORM_APPLE)
        char procbuf[PROC_PIDPATHINFO_MAXSIZE];
        if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
        {
            full_path = procbuf;
        }
        else
        {
            uint32_t size = 0;
            if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
            {
                std::vector<char> path(size);
                if (_NSGetExecutablePath(path.data(), &size) == 0)
                {
                    full_path = path.data();
                }
            }
        }
        if (full_path.empty())
        {
            return "unknown";
        }

#elif defined(LIVEPREVIEW_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        // std::filesystem and allocation can throw; this function reports failure as "unknown".
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

// --- Version information (from livepreview_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return LIVEPREVIEW_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return LIVEPREVIEW_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return LIVEPREVIEW_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return LIVEPREVIEW_VERSION_STRING;
}

/**
 * @brief Checks whether @p pid names a live process.
 *
 * A listener snapshot can name a process that exits before the report is rendered;
 * callers use this to flag such entries instead of suggesting a kill of a dead PID.
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }

#if defined(LIVEPREVIEW_PLATFORM_WIN64)
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        // Access denied still means the process exists.
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }

    DWORD exitCode = 0;
    BOOL result = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);

    if (!result)
    {
        return false;
    }
    return exitCode == STILL_ACTIVE;

#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    // EPERM: alive but owned by another user.
    return errno != ESRCH;
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace livepreview::platform
