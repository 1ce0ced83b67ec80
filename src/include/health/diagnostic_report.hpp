#pragma once
/**
 * @file diagnostic_report.hpp
 * @brief Ordered, sectioned result of a diagnostic run, with text and JSON renderers.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "health/health_verdict.hpp"
#include "livepreview_health_export.h"

namespace livepreview::health
{

enum class Category
{
    Compatibility,
    Shell,
    Dependencies,
    ServerPort,
    Config
};

LIVEPREVIEW_HEALTH_EXPORT const char *to_string(Category category) noexcept;

struct ReportEntry
{
    Category category = Category::Compatibility;
    Severity severity = Severity::Ok;
    std::string message;
    std::optional<std::string> hint;
    std::optional<HealthVerdict> verdict;
};

struct ReportSection
{
    std::string title;
    std::vector<ReportEntry> entries;
};

/**
 * @class DiagnosticReport
 * @brief Immutable once built. Entries keep the order in which checks ran.
 */
class LIVEPREVIEW_HEALTH_EXPORT DiagnosticReport
{
  public:
    class Builder;

    DiagnosticReport() = default;

    [[nodiscard]] const std::vector<ReportSection> &sections() const noexcept { return m_sections; }

    /// All entries across sections, in order.
    [[nodiscard]] std::vector<ReportEntry> entries() const;

    /// Entries of one category, in order.
    [[nodiscard]] std::vector<ReportEntry> entries(Category category) const;

    [[nodiscard]] std::size_t count(Severity severity) const noexcept;
    [[nodiscard]] bool has_errors() const noexcept { return count(Severity::Error) > 0; }

  private:
    explicit DiagnosticReport(std::vector<ReportSection> sections)
        : m_sections(std::move(sections))
    {
    }

    std::vector<ReportSection> m_sections;
};

/**
 * @class DiagnosticReport::Builder
 * @brief Collects entries section by section.
 *
 * An entry added before any start_section() goes into an untitled section.
 */
class LIVEPREVIEW_HEALTH_EXPORT DiagnosticReport::Builder
{
  public:
    Builder &start_section(std::string title);
    Builder &add(ReportEntry entry);

    Builder &ok(Category category, std::string message);
    Builder &info(Category category, std::string message);
    Builder &warn(Category category, std::string message,
                  std::optional<std::string> hint = std::nullopt);
    Builder &error(Category category, std::string message,
                   std::optional<std::string> hint = std::nullopt);
    /// Adds @p verdict as an entry carrying its severity, message and hint.
    Builder &verdict(HealthVerdict verdict);

    [[nodiscard]] DiagnosticReport build() &&;

  private:
    std::vector<ReportSection> m_sections;
};

/**
 * @brief Renders the report in the host's :checkhealth layout.
 *
 * @code
 * Check dependencies ~
 * - OK Nvim 0.10.1 is compatible with live-preview.nvim
 * - WARNING `snacks` (optional) is not installed
 * - ERROR `sh` is not available
 *   - ADVICE:
 *     - Please make sure it is installed and available in your PATH
 * @endcode
 */
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT std::string render_text(const DiagnosticReport &report);

/// {"sections": [...], "summary": {"ok": n, "warn": n, "error": n, "info": n}}
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT nlohmann::json to_json(const DiagnosticReport &report);

} // namespace livepreview::health
