#include "lp_service.hpp"

#include "health/diagnostic_runner.hpp"
#include "health/health_reporter.hpp"
#include "health/ownership.hpp"
#include "health/version_range.hpp"

#include <nlohmann/json.hpp>

namespace livepreview::health
{

namespace
{

/// Runs @p check; an exception it throws is recorded as an error entry of @p category.
template <typename F>
void isolated(DiagnosticReport::Builder &builder, Category category, std::string_view name,
              F &&check)
{
    try
    {
        std::forward<F>(check)();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("diagnostic: {} check failed: {}", name, e.what());
        builder.error(category, fmt::format("The {} check failed: {}", name, e.what()));
    }
}

} // namespace

DiagnosticRunner::DiagnosticRunner(const PreviewServer &server, const ProcessLister &lister,
                                   const DependencyProbe &dependencies,
                                   const ExecutableFinder &executables, std::string host_version,
                                   std::string supported_range, uint64_t self_pid)
    : m_server(server), m_lister(lister), m_dependencies(dependencies),
      m_executables(executables), m_host_version(std::move(host_version)),
      m_supported_range(std::move(supported_range)), m_self_pid(self_pid)
{
}

DiagnosticReport DiagnosticRunner::run(const PreviewConfig &config) const
{
    LOGGER_INFO("diagnostic: starting health check (host {}, supported {}, pid {})",
                m_host_version, m_supported_range, m_self_pid);

    const uint64_t started_ns = platform::monotonic_time_ns();
    DiagnosticReport::Builder builder;

    builder.start_section(kDependenciesSection);
    isolated(builder, Category::Compatibility, "version compatibility",
             [&] { check_compatibility(builder); });
    isolated(builder, Category::Shell, "shell", [&] { check_shell(builder); });
    isolated(builder, Category::Dependencies, "optional dependencies",
             [&] { check_dependencies(builder, config); });

    if (config.port)
    {
        builder.start_section(kServerSection);
        isolated(builder, Category::ServerPort, "server port",
                 [&] { check_server_port(builder, *config.port); });
    }

    builder.start_section(kConfigSection);
    isolated(builder, Category::Config, "configuration", [&] { check_config(builder, config); });

    auto report = std::move(builder).build();
    LOGGER_INFO("diagnostic: finished in {} ms with {} ok, {} warning(s), {} error(s)",
                platform::elapsed_time_ns(started_ns) / 1'000'000, report.count(Severity::Ok),
                report.count(Severity::Warn), report.count(Severity::Error));
    return report;
}

// ============================================================================
// Individual checks
// ============================================================================

void DiagnosticRunner::check_compatibility(DiagnosticReport::Builder &builder) const
{
    if (is_compatible(m_host_version, m_supported_range))
    {
        builder.ok(Category::Compatibility,
                   fmt::format("Nvim {} is compatible with Live Preview", m_host_version));
        return;
    }
    builder.error(Category::Compatibility,
                  fmt::format("|live-preview.nvim| requires Nvim {}, but you are using {}",
                              m_supported_range, m_host_version),
                  "Please upgrade your Nvim");
}

void DiagnosticRunner::check_shell(DiagnosticReport::Builder &builder) const
{
    const char *shell = default_shell();
    if (m_executables.find(shell))
    {
        builder.ok(Category::Shell, fmt::format("`{}` is available", shell));
        return;
    }
    builder.error(Category::Shell, fmt::format("`{}` is not available", shell),
                  "Please make sure it is installed and available in your PATH");
}

void DiagnosticRunner::check_dependencies(DiagnosticReport::Builder &builder,
                                          const PreviewConfig &config) const
{
    for (const auto &dep : config.pickers)
    {
        if (dep.empty())
            continue;
        if (m_dependencies.is_installed(dep))
            builder.ok(Category::Dependencies, fmt::format("`{}` is installed", dep));
        else
            builder.warn(Category::Dependencies,
                         fmt::format("`{}` (optional) is not installed", dep));
    }
}

void DiagnosticRunner::check_server_port(DiagnosticReport::Builder &builder, int port) const
{
    builder.info(Category::ServerPort, fmt::format("This process's PID is {}", m_self_pid));

    if (port < 1 || port > 65535)
    {
        builder.error(Category::ServerPort,
                      fmt::format("Configured port {} is not a valid TCP port", port),
                      "Set `port` to a value between 1 and 65535.");
        return;
    }

    std::vector<ListenerRecord> records;
    try
    {
        records = m_lister.list_listeners_on_port(port);
    }
    catch (const LookupError &e)
    {
        LOGGER_WARN("diagnostic: listener lookup on port {} failed: {}", port, e.what());
        builder.error(Category::ServerPort,
                      fmt::format("Could not list the processes listening on port {}: {}", port,
                                  e.what()),
                      "Make sure the process table is readable by the current user.");
        return;
    }
    LOGGER_DEBUG("diagnostic: {} listener(s) on port {}", records.size(), port);

    auto classified = classify(records, m_self_pid);
    for (auto &verdict : report(classified, static_cast<uint16_t>(port), m_server))
    {
        builder.verdict(std::move(verdict));
    }
}

void DiagnosticRunner::check_config(DiagnosticReport::Builder &builder,
                                    const PreviewConfig &config) const
{
    for (const auto &key : config.unknown_keys)
    {
        builder.warn(Category::Config, fmt::format("{} is not a config option", key));
    }
    for (const auto &problem : config.invalid_values)
    {
        builder.error(Category::Config, fmt::format("Invalid config value: {}", problem),
                      "The default value is used instead. Fix the value in your configuration.");
    }
    if (!config.unknown_keys.empty() || !config.invalid_values.empty())
    {
        builder.info(Category::Config,
                     "Hint: see help doc of |livepreview-config| for guide on configuration");
    }
    builder.info(Category::Config,
                 fmt::format("Your configuration table:\n{}", config.to_json().dump(2)));
}

} // namespace livepreview::health
