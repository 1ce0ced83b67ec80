#pragma once
/**
 * @file sink.hpp
 * @brief Destination interface for Logger records.
 */
#include "lp_base.hpp"

#include <chrono>
#include <string_view>

namespace livepreview::utils
{

/// One formatted log event, stamped by the Logger before it reaches a sink.
struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id = 0;
    uint64_t thread_id = 0;
    int level = 0; ///< Logger::Level as int; sinks do not depend on logger.hpp
    fmt::memory_buffer body;
};

class Sink
{
  public:
    virtual ~Sink() = default;

    /// @throws std::exception on I/O failure; the Logger reports it via its error callback.
    virtual void write(const LogRecord &record) = 0;
    virtual void flush() = 0;
    [[nodiscard]] virtual std::string description() const = 0;

    /// "TRACE" .. "SYSTEM", or "UNK" for an out-of-range level.
    static std::string_view level_name(int level) noexcept;

    /// `[LP] [LEVEL ] [time] [PID:    n TID:    n] body\n`
    static std::string render_line(const LogRecord &record);
};

} // namespace livepreview::utils
