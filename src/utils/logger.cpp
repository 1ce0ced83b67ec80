/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the synchronous, sink-based logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include "lp_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace livepreview::utils
{

struct Logger::Impl
{
    Impl() : sink_(std::make_unique<ConsoleSink>()) {}

    void write(LogRecord &&record) noexcept;
    void switch_sink(std::unique_ptr<Sink> new_sink);
    void report_error(const std::string &message) noexcept;

    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    std::mutex m_sink_mutex;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
};

// Caller must hold m_sink_mutex.
void Logger::Impl::report_error(const std::string &message) noexcept
{
    if (error_callback_)
    {
        error_callback_(message);
        return;
    }
    fmt::print(stderr, "[LP] Logger error: {}\n", message);
}

void Logger::Impl::write(LogRecord &&record) noexcept
{
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    if (!sink_)
    {
        return;
    }
    try
    {
        sink_->write(record);
    }
    catch (const std::exception &e)
    {
        report_error(fmt::format("Failed to write to {}: {}", sink_->description(), e.what()));
    }
}

void Logger::Impl::switch_sink(std::unique_ptr<Sink> new_sink)
{
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    std::string old_desc = sink_ ? sink_->description() : "null";
    std::string new_desc = new_sink ? new_sink->description() : "null";
    auto announce = [this](fmt::memory_buffer &&body)
    {
        if (!sink_)
        {
            return;
        }
        try
        {
            sink_->write(LogRecord{.timestamp = std::chrono::system_clock::now(),
                                    .process_id = platform::get_pid(),
                                    .thread_id = platform::get_native_thread_id(),
                                    .level = static_cast<int>(Logger::Level::L_SYSTEM),
                                    .body = std::move(body)});
            sink_->flush();
        }
        catch (const std::exception &e)
        {
            report_error(fmt::format("Failed to write to {}: {}", sink_->description(), e.what()));
        }
    };
    announce(format_tools::make_buffer("Switching log sink to: {}", new_desc));
    sink_ = std::move(new_sink);
    announce(format_tools::make_buffer("Log sink switched from: {}", old_desc));
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::set_console()
{
    try
    {
        pImpl->switch_sink(std::make_unique<ConsoleSink>());
        return true;
    }
    catch (const std::exception &e)
    {
        std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
        pImpl->report_error(fmt::format("Failed to create ConsoleSink: {}", e.what()));
    }
    return false;
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        pImpl->switch_sink(std::make_unique<FileSink>(utf8_path));
        return true;
    }
    catch (const std::exception &e)
    {
        std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
        pImpl->report_error(fmt::format("Failed to create FileSink: {}", e.what()));
    }
    return false;
}

void Logger::flush()
{
    std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
    if (pImpl->sink_)
    {
        pImpl->sink_->flush();
    }
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    auto iequals = [name](std::string_view expected)
    {
        return std::equal(name.begin(), name.end(), expected.begin(), expected.end(),
                          [](char a, char b)
                          {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };
    if (iequals("trace"))
        return Level::L_TRACE;
    if (iequals("debug"))
        return Level::L_DEBUG;
    if (iequals("info"))
        return Level::L_INFO;
    if (iequals("warn") || iequals("warning"))
        return Level::L_WARNING;
    if (iequals("error"))
        return Level::L_ERROR;
    if (iequals("system"))
        return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
    pImpl->error_callback_ = std::move(cb);
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::write_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    pImpl->write(LogRecord{.timestamp = std::chrono::system_clock::now(),
                            .process_id = platform::get_pid(),
                            .thread_id = platform::get_native_thread_id(),
                            .level = static_cast<int>(lvl),
                            .body = std::move(body)});
}

} // namespace livepreview::utils
