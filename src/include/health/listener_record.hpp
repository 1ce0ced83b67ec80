#pragma once
/**
 * @file listener_record.hpp
 * @brief A process bound to a TCP port in LISTEN state, and the lookup error type.
 */
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "livepreview_health_export.h"

namespace livepreview::health
{

/// PID reported when the socket owner could not be resolved.
inline constexpr uint64_t kUnknownPid = 0;
/// Name reported alongside kUnknownPid.
inline constexpr std::string_view kUnknownProcessName = "unknown";

/**
 * @struct ListenerRecord
 * @brief One OS process holding a listening socket on a port.
 *
 * Snapshots only: the PID may exit or be reused by the time the record is read.
 */
struct ListenerRecord
{
    uint64_t process_id = kUnknownPid;
    std::string process_name{kUnknownProcessName};
    uint16_t port = 0;

    [[nodiscard]] bool is_pid_known() const noexcept { return process_id != kUnknownPid; }

    bool operator==(const ListenerRecord &) const = default;
};

/**
 * @brief "`python` (PID: 9999)" or "an unidentified process" for unknown owners.
 */
LIVEPREVIEW_HEALTH_EXPORT std::string describe(const ListenerRecord &record);

LIVEPREVIEW_HEALTH_EXPORT void to_json(nlohmann::json &j, const ListenerRecord &record);

/**
 * @class LookupError
 * @brief The OS listener table could not be queried: tool missing, access denied,
 *        timeout, or unparseable output.
 */
class LIVEPREVIEW_HEALTH_EXPORT LookupError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

} // namespace livepreview::health
