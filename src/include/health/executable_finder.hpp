#pragma once
/**
 * @file executable_finder.hpp
 * @brief PATH lookup for the shell check.
 */
#include <optional>
#include <string>

#include "livepreview_health_export.h"

namespace livepreview::health
{

/**
 * @class ExecutableFinder
 * @brief Resolves a command name the way the shell would.
 */
class ExecutableFinder
{
  public:
    virtual ~ExecutableFinder() = default;

    /// Full path of @p name, or nullopt if it is not an executable on the search path.
    [[nodiscard]] virtual std::optional<std::string> find(const std::string &name) const = 0;
};

/**
 * @class PathExecutableFinder
 * @brief Searches the directories of a PATH-style list.
 *
 * On POSIX a candidate must be a regular file with execute permission. On Windows
 * each PATHEXT extension (".COM;.EXE;.BAT;.CMD" if unset) is tried when @p name has
 * none.
 */
class LIVEPREVIEW_HEALTH_EXPORT PathExecutableFinder : public ExecutableFinder
{
  public:
    /// Uses the PATH of the current environment.
    PathExecutableFinder();
    /// Uses @p search_path instead of the environment.
    explicit PathExecutableFinder(std::string search_path);

    [[nodiscard]] std::optional<std::string> find(const std::string &name) const override;

  private:
    std::string m_search_path;
};

/// "powershell" on Windows, "sh" elsewhere.
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT const char *default_shell() noexcept;

} // namespace livepreview::health
