#include "lp_service.hpp"

#include "health/health_reporter.hpp"

#include <nlohmann/json.hpp>

namespace livepreview::health
{

const char *to_string(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Ok:
        return "ok";
    case Severity::Warn:
        return "warn";
    case Severity::Error:
        return "error";
    case Severity::Info:
        return "info";
    default:
        return "unknown";
    }
}

const char *to_string(VerdictKind kind) noexcept
{
    switch (kind)
    {
    case VerdictKind::Healthy:
        return "Healthy";
    case VerdictKind::NotRunning:
        return "NotRunning";
    case VerdictKind::PortStolen:
        return "PortStolen";
    case VerdictKind::Unknown:
        return "Unknown";
    default:
        return "Invalid";
    }
}

const char *to_string(SocketOwnership ownership) noexcept
{
    switch (ownership)
    {
    case SocketOwnership::Self:
        return "self";
    case SocketOwnership::Foreign:
        return "foreign";
    case SocketOwnership::Unresolved:
        return "unresolved";
    case SocketOwnership::None:
        return "none";
    default:
        return "invalid";
    }
}

const char *to_string(ServerState state) noexcept
{
    switch (state)
    {
    case ServerState::Running:
        return "running";
    case ServerState::Stopped:
        return "stopped";
    case ServerState::Unknown:
        return "unknown";
    default:
        return "invalid";
    }
}

void to_json(nlohmann::json &j, const HealthVerdict &verdict)
{
    j = nlohmann::json{{"kind", to_string(verdict.kind())},
                       {"ownership", to_string(verdict.ownership)},
                       {"server_state", to_string(verdict.server_state)}};
    std::visit(
        [&j](const auto &state)
        {
            using T = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<T, Healthy>)
            {
                j["listener"] = state.listener;
                if (state.webroot)
                    j["webroot"] = *state.webroot;
            }
            else if constexpr (std::is_same_v<T, NotRunning>)
            {
                j["port"] = state.port;
            }
            else if constexpr (std::is_same_v<T, PortStolen>)
            {
                j["listener"] = state.by;
                if (state.webroot)
                    j["webroot"] = *state.webroot;
            }
            else if constexpr (std::is_same_v<T, Unknown>)
            {
                if (state.listener)
                    j["listener"] = *state.listener;
            }
        },
        verdict.state);
}

namespace
{

ServerState query_server_state(const PreviewServer &server)
{
    return server.is_running() ? ServerState::Running : ServerState::Stopped;
}

HealthVerdict not_running_verdict(uint16_t port, const PreviewServer &server)
{
    ServerState state = ServerState::Unknown;
    try
    {
        state = query_server_state(server);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("health_reporter: server state query failed: {}", e.what());
    }
    catch (...)
    {
        LOGGER_WARN("health_reporter: server state query failed with a non-standard exception");
    }
    return HealthVerdict{
        .state = NotRunning{port},
        .severity = Severity::Warn,
        .message = fmt::format("Live-preview server is not listening on configured port {}", port),
        .hint = std::nullopt,
        .ownership = SocketOwnership::None,
        .server_state = state};
}

HealthVerdict evaluate(const ClassifiedListener &listener, uint16_t port,
                       const PreviewServer &server)
{
    const ListenerRecord &record = listener.record;

    if (!record.is_pid_known())
    {
        return HealthVerdict{
            .state = Unknown{record},
            .severity = Severity::Warn,
            .message = fmt::format(
                "The port {} is held by a process whose owner could not be determined", port),
            .hint = std::string("The owner may belong to another user. Run the check with "
                                "sufficient privileges to identify it."),
            .ownership = SocketOwnership::Unresolved,
            .server_state = query_server_state(server)};
    }

    const ServerState server_state = query_server_state(server);

    if (listener.is_self)
    {
        auto webroot = server.webroot();
        const std::string root_note =
            webroot ? fmt::format(" (server root: {})", *webroot) : std::string();
        if (server_state == ServerState::Running)
        {
            return HealthVerdict{.state = Healthy{record, std::move(webroot)},
                                 .severity = Severity::Ok,
                                 .message = fmt::format("Server is healthy on port {}{}", port,
                                                        root_note),
                                 .hint = std::nullopt,
                                 .ownership = SocketOwnership::Self,
                                 .server_state = server_state};
        }
        return HealthVerdict{
            .state = PortStolen{record, std::move(webroot)},
            .severity = Severity::Warn,
            .message = fmt::format("Port {} is held by this process but the live-preview server "
                                   "is stopped: another component is using the port{}",
                                   port, root_note),
            .hint = std::string("Stop the other component or configure a different port for "
                                "live-preview."),
            .ownership = SocketOwnership::Self,
            .server_state = server_state};
    }

    return HealthVerdict{
        .state = PortStolen{record, std::nullopt},
        .severity = Severity::Warn,
        .message = fmt::format("The port {} is being used by another process `{}` (PID: {}).", port,
                               record.process_name, record.process_id),
        .hint = fmt::format("You can run `:lua vim.uv.kill({})` to kill it.", record.process_id),
        .ownership = SocketOwnership::Foreign,
        .server_state = server_state};
}

HealthVerdict evaluation_failed(const ClassifiedListener &listener, uint16_t port,
                               std::string_view reason)
{
    LOGGER_WARN("health_reporter: could not evaluate {} on port {}: {}",
                describe(listener.record), port, reason);
    return HealthVerdict{
        .state = Unknown{listener.record},
        .severity = Severity::Warn,
        .message = fmt::format("Could not evaluate the listener {} on port {}: {}",
                               describe(listener.record), port, reason),
        .hint = std::nullopt,
        .ownership = listener.is_self                   ? SocketOwnership::Self
                     : listener.record.is_pid_known() ? SocketOwnership::Foreign
                                                      : SocketOwnership::Unresolved,
        .server_state = ServerState::Unknown};
}

} // namespace

std::vector<HealthVerdict> report(const std::vector<ClassifiedListener> &classified,
                                  uint16_t port, const PreviewServer &server)
{
    std::vector<HealthVerdict> verdicts;
    if (classified.empty())
    {
        verdicts.push_back(not_running_verdict(port, server));
        return verdicts;
    }

    verdicts.reserve(classified.size());
    for (const auto &listener : classified)
    {
        try
        {
            verdicts.push_back(evaluate(listener, port, server));
        }
        catch (const std::exception &e)
        {
            verdicts.push_back(evaluation_failed(listener, port, e.what()));
        }
        catch (...)
        {
            verdicts.push_back(evaluation_failed(listener, port, "non-standard exception"));
        }
    }
    return verdicts;
}

} // namespace livepreview::health
