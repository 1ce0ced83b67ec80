/*******************************************************************************
 * @file logger.hpp
 * @brief Thread-safe, fmt-based logging utility.
 *
 * **Design**
 * 1.  **Compile-time checked formatting**: `LOGGER_INFO("port {} owned by {}", port, pid)`
 *     checks the format string against its arguments at compile time through
 *     `FMT_STRING`. The `_RT` variants accept a runtime format string.
 * 2.  **Sink Abstraction**: a `Sink` base class defines write/flush. `ConsoleSink`
 *     writes to stderr (the default), `FileSink` appends to a file.
 * 3.  **Synchronous, serialized writes**: each record is formatted on the calling
 *     thread and written to the active sink under a mutex, so a diagnostic run that
 *     exits right after its last log line never loses output.
 * 4.  **Robustness**: formatting errors are logged as `[FORMAT ERROR] ...` and never
 *     propagate. Sink write failures are reported through an optional callback.
 *
 * **Thread Safety**
 * All public methods are thread-safe.
 *
 * **Usage**
 * ```cpp
 * #include "utils/logger.hpp"
 * LOGGER_INFO("Listing listeners on port {}", port);
 *
 * Logger &logger = Logger::instance();
 * logger.set_logfile("/tmp/checkhealth.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "livepreview_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (512u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace livepreview::utils
{

class LIVEPREVIEW_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---

    /**
     * @brief Switch logging to the console (stderr).
     * @return true on success.
     */
    bool set_console();

    /**
     * @brief Switch logging to an append-only file.
     * @param utf8_path Path to the log file. Created if missing.
     * @return true on success. On failure the previous sink stays active and the
     *         write-error callback (if any) receives the reason.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Flushes the active sink.
     */
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Parses a level name ("trace", "debug", "info", "warn"/"warning",
     *        "error", "system"), case-insensitive.
     */
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    /**
     * @brief Sets a callback invoked when a sink cannot be opened or written.
     * @param cb A function taking the error message.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    // --- Runtime Path ---
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <typename... Args> void trace_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_TRACE, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void debug_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void error_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void system_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_SYSTEM, fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    // Stamps the record and hands it to the active sink.
    void write_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        write_log(lvl, std::move(mb));
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    fmt::memory_buffer mb;
    try
    {
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    }
    catch (const std::exception &ex)
    {
        mb.clear();
        fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
    }
    write_log(lvl, std::move(mb));
}

} // namespace livepreview::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::livepreview::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::livepreview::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::livepreview::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::livepreview::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::livepreview::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::livepreview::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE_RT(fmt, ...)                                                                  \
    ::livepreview::utils::Logger::instance().trace_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG_RT(fmt, ...)                                                                  \
    ::livepreview::utils::Logger::instance().debug_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::livepreview::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...)                                                                   \
    ::livepreview::utils::Logger::instance().warn_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::livepreview::utils::Logger::instance().error_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM_RT(fmt, ...)                                                                 \
    ::livepreview::utils::Logger::instance().system_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
