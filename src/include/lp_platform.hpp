#pragma once
/**
 * @file lp_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * Every file that needs platform macros (LIVEPREVIEW_PLATFORM_LINUX, LIVEPREVIEW_IS_POSIX,
 * etc.) or Windows headers should include this. It is self-contained and can be included
 * at any point.
 *
 * Prefer build-system macros (PLATFORM_LINUX, etc.); fall back to compiler predefined macros.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(PLATFORM_WIN64)

#define LIVEPREVIEW_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)

#define LIVEPREVIEW_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD)

#define LIVEPREVIEW_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX)

#define LIVEPREVIEW_PLATFORM_LINUX 1

#elif defined(PLATFORM_UNKNOWN)

#define LIVEPREVIEW_PLATFORM_UNKNOWN 1

#else
// Fallback detection
#if defined(_WIN64)
#define LIVEPREVIEW_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(__APPLE__) && defined(__MACH__)
#define LIVEPREVIEW_PLATFORM_APPLE 1

#elif defined(__FreeBSD__)
#define LIVEPREVIEW_PLATFORM_FREEBSD 1

#elif defined(__linux__)
#define LIVEPREVIEW_PLATFORM_LINUX 1

#else
#define LIVEPREVIEW_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(LIVEPREVIEW_PLATFORM_WIN64)
#define LIVEPREVIEW_IS_WINDOWS 1
#undef LIVEPREVIEW_IS_POSIX
#elif defined(LIVEPREVIEW_PLATFORM_APPLE) || defined(LIVEPREVIEW_PLATFORM_FREEBSD) ||             \
    defined(LIVEPREVIEW_PLATFORM_LINUX)
#undef LIVEPREVIEW_IS_WINDOWS
#define LIVEPREVIEW_IS_POSIX 1
#else
#undef LIVEPREVIEW_IS_WINDOWS
#undef LIVEPREVIEW_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "livepreview_utils_export.h"

namespace livepreview::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
LIVEPREVIEW_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;

/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
LIVEPREVIEW_UTILS_EXPORT uint64_t get_pid();

/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
LIVEPREVIEW_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/** @brief Major version of the livepreview package (e.g., 0 from 0.1.0). */
LIVEPREVIEW_UTILS_EXPORT int get_version_major() noexcept;
/** @brief Minor version of the livepreview package (e.g., 1 from 0.1.0). */
LIVEPREVIEW_UTILS_EXPORT int get_version_minor() noexcept;
/** @brief Rolling version number (e.g., 0 from 0.1.0). */
LIVEPREVIEW_UTILS_EXPORT int get_version_rolling() noexcept;
/** @brief Full version string (major.minor.rolling). */
LIVEPREVIEW_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Uses platform-specific APIs:
 *          - Windows: OpenProcess() + GetExitCodeProcess()
 *          - POSIX: kill(pid, 0) with errno check
 * @param pid The process ID to check.
 * @return True if the process is alive, false otherwise.
 * @note PID 0 always returns false (invalid/system PID).
 * @note On POSIX, EPERM (permission denied) is treated as "alive".
 */
LIVEPREVIEW_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
LIVEPREVIEW_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns. Returns 0 if start_ns is in the future.
 */
LIVEPREVIEW_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

} // namespace livepreview::platform
