#pragma once
/**
 * @file health_verdict.hpp
 * @brief Outcome of evaluating one listener (or the absence of any) on the server port.
 *
 * A verdict keeps two facts apart: who holds the socket (SocketOwnership) and whether
 * the host's preview server reports itself running (ServerState). "This process holds
 * the port" does not imply "the preview server is up".
 */
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json_fwd.hpp>

#include "health/listener_record.hpp"
#include "livepreview_health_export.h"

namespace livepreview::health
{

enum class Severity
{
    Ok,
    Warn,
    Error,
    Info
};

enum class VerdictKind
{
    Healthy,
    NotRunning,
    PortStolen,
    Unknown
};

enum class SocketOwnership
{
    Self,       ///< This process holds the socket
    Foreign,    ///< Another identified process holds it
    Unresolved, ///< Held, but the owner could not be identified
    None        ///< Nobody is listening
};

enum class ServerState
{
    Running,
    Stopped,
    Unknown
};

/// This process listens and its preview server is running.
struct Healthy
{
    ListenerRecord listener;
    std::optional<std::string> webroot;
};

/// Nothing listens on the port.
struct NotRunning
{
    uint16_t port = 0;
};

/// Someone other than the running preview server holds the port.
struct PortStolen
{
    ListenerRecord by;
    std::optional<std::string> webroot; ///< Only when `by` is this process
};

/// The state could not be determined.
struct Unknown
{
    std::optional<ListenerRecord> listener;
};

// Alternative order matches VerdictKind.
using VerdictState = std::variant<Healthy, NotRunning, PortStolen, Unknown>;

struct HealthVerdict
{
    VerdictState state;
    Severity severity = Severity::Warn;
    std::string message;
    std::optional<std::string> hint;
    SocketOwnership ownership = SocketOwnership::None;
    ServerState server_state = ServerState::Unknown;

    [[nodiscard]] VerdictKind kind() const noexcept
    {
        return static_cast<VerdictKind>(state.index());
    }
};

LIVEPREVIEW_HEALTH_EXPORT const char *to_string(Severity severity) noexcept;
LIVEPREVIEW_HEALTH_EXPORT const char *to_string(VerdictKind kind) noexcept;
LIVEPREVIEW_HEALTH_EXPORT const char *to_string(SocketOwnership ownership) noexcept;
LIVEPREVIEW_HEALTH_EXPORT const char *to_string(ServerState state) noexcept;

LIVEPREVIEW_HEALTH_EXPORT void to_json(nlohmann::json &j, const HealthVerdict &verdict);

} // namespace livepreview::health
