#include "lp_base.hpp"

#include "health/diagnostic_report.hpp"

#include <nlohmann/json.hpp>

namespace livepreview::health
{

const char *to_string(Category category) noexcept
{
    switch (category)
    {
    case Category::Compatibility:
        return "compatibility";
    case Category::Shell:
        return "shell";
    case Category::Dependencies:
        return "dependencies";
    case Category::ServerPort:
        return "server_port";
    case Category::Config:
        return "config";
    default:
        return "unknown";
    }
}

// ============================================================================
// DiagnosticReport
// ============================================================================

std::vector<ReportEntry> DiagnosticReport::entries() const
{
    std::vector<ReportEntry> all;
    for (const auto &section : m_sections)
    {
        all.insert(all.end(), section.entries.begin(), section.entries.end());
    }
    return all;
}

std::vector<ReportEntry> DiagnosticReport::entries(Category category) const
{
    std::vector<ReportEntry> matching;
    for (const auto &section : m_sections)
    {
        for (const auto &entry : section.entries)
        {
            if (entry.category == category)
                matching.push_back(entry);
        }
    }
    return matching;
}

std::size_t DiagnosticReport::count(Severity severity) const noexcept
{
    std::size_t n = 0;
    for (const auto &section : m_sections)
    {
        for (const auto &entry : section.entries)
        {
            if (entry.severity == severity)
                ++n;
        }
    }
    return n;
}

// ============================================================================
// DiagnosticReport::Builder
// ============================================================================

DiagnosticReport::Builder &DiagnosticReport::Builder::start_section(std::string title)
{
    m_sections.push_back(ReportSection{std::move(title), {}});
    return *this;
}

DiagnosticReport::Builder &DiagnosticReport::Builder::add(ReportEntry entry)
{
    if (m_sections.empty())
    {
        m_sections.push_back(ReportSection{});
    }
    m_sections.back().entries.push_back(std::move(entry));
    return *this;
}

DiagnosticReport::Builder &DiagnosticReport::Builder::ok(Category category, std::string message)
{
    return add(ReportEntry{category, Severity::Ok, std::move(message), std::nullopt, std::nullopt});
}

DiagnosticReport::Builder &DiagnosticReport::Builder::info(Category category, std::string message)
{
    return add(
        ReportEntry{category, Severity::Info, std::move(message), std::nullopt, std::nullopt});
}

DiagnosticReport::Builder &DiagnosticReport::Builder::warn(Category category, std::string message,
                                                           std::optional<std::string> hint)
{
    return add(
        ReportEntry{category, Severity::Warn, std::move(message), std::move(hint), std::nullopt});
}

DiagnosticReport::Builder &DiagnosticReport::Builder::error(Category category, std::string message,
                                                            std::optional<std::string> hint)
{
    return add(
        ReportEntry{category, Severity::Error, std::move(message), std::move(hint), std::nullopt});
}

DiagnosticReport::Builder &DiagnosticReport::Builder::verdict(HealthVerdict verdict)
{
    ReportEntry entry{Category::ServerPort, verdict.severity, verdict.message, verdict.hint,
                      std::nullopt};
    entry.verdict = std::move(verdict);
    return add(std::move(entry));
}

DiagnosticReport DiagnosticReport::Builder::build() &&
{
    return DiagnosticReport(std::move(m_sections));
}

// ============================================================================
// Rendering
// ============================================================================

namespace
{

const char *text_label(Severity severity)
{
    switch (severity)
    {
    case Severity::Ok:
        return "OK ";
    case Severity::Warn:
        return "WARNING ";
    case Severity::Error:
        return "ERROR ";
    case Severity::Info:
    default:
        return "";
    }
}

// Appends @p text, indenting every line after the first by @p indent.
void append_indented(std::string &out, std::string_view text, std::string_view indent)
{
    size_t start = 0;
    bool first = true;
    while (start <= text.size())
    {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos)
            end = text.size();
        if (!first)
        {
            out += '\n';
            out += indent;
        }
        out += text.substr(start, end - start);
        first = false;
        start = end + 1;
    }
}

} // namespace

std::string render_text(const DiagnosticReport &report)
{
    std::string out;
    out += std::string(78, '=');
    out += fmt::format("\nlivepreview: health check ({})\n", platform::get_version_string());

    for (const auto &section : report.sections())
    {
        out += '\n';
        if (!section.title.empty())
        {
            out += fmt::format("{} ~\n", section.title);
        }
        for (const auto &entry : section.entries)
        {
            out += "- ";
            out += text_label(entry.severity);
            append_indented(out, entry.message, "  ");
            out += '\n';
            if (entry.hint)
            {
                out += "  - ADVICE:\n    - ";
                append_indented(out, *entry.hint, "      ");
                out += '\n';
            }
        }
    }

    out += fmt::format("\nSummary: {} ok, {} warning(s), {} error(s)\n",
                       report.count(Severity::Ok), report.count(Severity::Warn),
                       report.count(Severity::Error));
    return out;
}

nlohmann::json to_json(const DiagnosticReport &report)
{
    nlohmann::json sections = nlohmann::json::array();
    for (const auto &section : report.sections())
    {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto &entry : section.entries)
        {
            nlohmann::json e{{"category", to_string(entry.category)},
                             {"severity", to_string(entry.severity)},
                             {"message", entry.message}};
            if (entry.hint)
                e["hint"] = *entry.hint;
            if (entry.verdict)
                e["verdict"] = *entry.verdict;
            entries.push_back(std::move(e));
        }
        sections.push_back({{"title", section.title}, {"entries", std::move(entries)}});
    }

    return nlohmann::json{{"version", platform::get_version_string()},
                          {"sections", std::move(sections)},
                          {"summary",
                           {{"ok", report.count(Severity::Ok)},
                            {"warn", report.count(Severity::Warn)},
                            {"error", report.count(Severity::Error)},
                            {"info", report.count(Severity::Info)}}}};
}

} // namespace livepreview::health
