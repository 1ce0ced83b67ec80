#pragma once
/**
 * @file diagnostic_runner.hpp
 * @brief Runs every health check in a fixed order and collects one DiagnosticReport.
 *
 * Order of sections and checks:
 *   1. "Check dependencies": host version compatibility, shell availability, optional
 *      pickers.
 *   2. "Checkhealth server and process": only when the configuration sets a port. The
 *      current PID, then one entry per verdict of lister -> classify -> report.
 *   3. "Check your live-preview.nvim config": unknown keys, rejected values and the
 *      effective configuration.
 *
 * A check that throws becomes an error entry; the checks after it still run.
 */
#include <cstdint>
#include <string>

#include "health/dependency_probe.hpp"
#include "health/diagnostic_report.hpp"
#include "health/executable_finder.hpp"
#include "health/preview_config.hpp"
#include "health/preview_server.hpp"
#include "health/process_lister.hpp"
#include "livepreview_health_export.h"

namespace livepreview::health
{

inline constexpr const char *kDependenciesSection = "Check dependencies";
inline constexpr const char *kServerSection = "Checkhealth server and process";
inline constexpr const char *kConfigSection = "Check your live-preview.nvim config";

/**
 * @class DiagnosticRunner
 * @brief Holds the collaborators of a diagnostic run; run() may be called repeatedly.
 *
 * All referenced collaborators must outlive the runner.
 */
class LIVEPREVIEW_HEALTH_EXPORT DiagnosticRunner
{
  public:
    /**
     * @param host_version     Version of the host editor, e.g. "0.10.1".
     * @param supported_range  Range the plugin supports, e.g. ">=0.10.0" (engines.nvim).
     * @param self_pid         PID that counts as "this process" for port ownership.
     */
    DiagnosticRunner(const PreviewServer &server, const ProcessLister &lister,
                     const DependencyProbe &dependencies, const ExecutableFinder &executables,
                     std::string host_version, std::string supported_range, uint64_t self_pid);

    [[nodiscard]] DiagnosticReport run(const PreviewConfig &config) const;

  private:
    void check_compatibility(DiagnosticReport::Builder &builder) const;
    void check_shell(DiagnosticReport::Builder &builder) const;
    void check_dependencies(DiagnosticReport::Builder &builder, const PreviewConfig &config) const;
    void check_server_port(DiagnosticReport::Builder &builder, int port) const;
    void check_config(DiagnosticReport::Builder &builder, const PreviewConfig &config) const;

    const PreviewServer &m_server;
    const ProcessLister &m_lister;
    const DependencyProbe &m_dependencies;
    const ExecutableFinder &m_executables;
    std::string m_host_version;
    std::string m_supported_range;
    uint64_t m_self_pid;
};

} // namespace livepreview::health
