#pragma once
/**
 * @file preview_server.hpp
 * @brief What the health checks need to know about the live-preview HTTP server.
 *
 * The server is owned by the host; the checks only observe it.
 */
#include <optional>
#include <string>
#include <utility>

namespace livepreview::health
{

class PreviewServer
{
  public:
    virtual ~PreviewServer() = default;

    /// True while the host's server has been started and not stopped.
    [[nodiscard]] virtual bool is_running() const = 0;

    /// Directory the server serves from, if it has one.
    [[nodiscard]] virtual std::optional<std::string> webroot() const = 0;
};

/**
 * @class StaticPreviewServer
 * @brief Fixed answers, for callers that learn the server state out of band (the CLI
 *        receives it as flags).
 */
class StaticPreviewServer final : public PreviewServer
{
  public:
    explicit StaticPreviewServer(bool running, std::optional<std::string> webroot = std::nullopt)
        : m_running(running), m_webroot(std::move(webroot))
    {
    }

    bool is_running() const override { return m_running; }
    std::optional<std::string> webroot() const override { return m_webroot; }

  private:
    bool m_running;
    std::optional<std::string> m_webroot;
};

} // namespace livepreview::health
