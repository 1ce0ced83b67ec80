#include "lp_service.hpp"

#include "health/executable_finder.hpp"

#include <cstdlib>
#include <filesystem>

#if defined(LIVEPREVIEW_IS_POSIX)
#include <unistd.h>
#endif

namespace livepreview::health
{

namespace fs = std::filesystem;

namespace
{

#if defined(LIVEPREVIEW_IS_WINDOWS)
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

std::vector<std::string> split_list(std::string_view list, char separator)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= list.size())
    {
        size_t end = list.find(separator, start);
        if (end == std::string_view::npos)
            end = list.size();
        auto part = format_tools::trim_whitespace(list.substr(start, end - start));
        if (!part.empty())
            parts.emplace_back(part);
        start = end + 1;
    }
    return parts;
}

bool is_executable_file(const fs::path &candidate)
{
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec))
        return false;
#if defined(LIVEPREVIEW_IS_POSIX)
    return ::access(candidate.c_str(), X_OK) == 0;
#else
    return true;
#endif
}

#if defined(LIVEPREVIEW_IS_WINDOWS)
std::vector<std::string> executable_extensions()
{
    const char *pathext = std::getenv("PATHEXT");
    return split_list(pathext != nullptr ? pathext : ".COM;.EXE;.BAT;.CMD", ';');
}
#endif

} // namespace

// ============================================================================
// PathExecutableFinder
// ============================================================================

PathExecutableFinder::PathExecutableFinder()
{
    const char *path = std::getenv("PATH");
    m_search_path = path != nullptr ? path : "";
}

PathExecutableFinder::PathExecutableFinder(std::string search_path)
    : m_search_path(std::move(search_path))
{
}

std::optional<std::string> PathExecutableFinder::find(const std::string &name) const
{
    if (name.empty())
        return std::nullopt;

    // A name with a directory component is checked as given, not searched.
    if (name.find('/') != std::string::npos
#if defined(LIVEPREVIEW_IS_WINDOWS)
        || name.find('\\') != std::string::npos
#endif
    )
    {
        if (is_executable_file(name))
            return name;
        return std::nullopt;
    }

#if defined(LIVEPREVIEW_IS_WINDOWS)
    std::vector<std::string> suffixes{""};
    if (fs::path(name).extension().empty())
        suffixes = executable_extensions();
#else
    const std::vector<std::string> suffixes{""};
#endif

    for (const auto &dir : split_list(m_search_path, kPathListSeparator))
    {
        for (const auto &suffix : suffixes)
        {
            fs::path candidate = fs::path(dir) / (name + suffix);
            if (is_executable_file(candidate))
            {
                LOGGER_TRACE("executable_finder: '{}' -> '{}'", name, candidate.string());
                return candidate.string();
            }
        }
    }
    LOGGER_DEBUG("executable_finder: '{}' not found on search path", name);
    return std::nullopt;
}

const char *default_shell() noexcept
{
#if defined(LIVEPREVIEW_IS_WINDOWS)
    return "powershell";
#else
    return "sh";
#endif
}

} // namespace livepreview::health
