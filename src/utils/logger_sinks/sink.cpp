#include "lp_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <array>

namespace livepreview::utils
{

namespace
{
// Indexed by Logger::Level.
constexpr std::array<std::string_view, 6> kLevelNames = {"TRACE", "DEBUG", "INFO",
                                                         "WARN",  "ERROR", "SYSTEM"};
} // namespace

std::string_view Sink::level_name(int level) noexcept
{
    if (level < 0 || static_cast<size_t>(level) >= kLevelNames.size())
        return "UNK";
    return kLevelNames[static_cast<size_t>(level)];
}

std::string Sink::render_line(const LogRecord &record)
{
    return fmt::format("[LP] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", level_name(record.level),
                       format_tools::formatted_time(record.timestamp), record.process_id,
                       record.thread_id, std::string_view(record.body.data(), record.body.size()));
}

} // namespace livepreview::utils
