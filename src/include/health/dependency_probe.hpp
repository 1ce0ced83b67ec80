#pragma once
/**
 * @file dependency_probe.hpp
 * @brief Presence checks for the optional picker plugins.
 *
 * A picker is a Lua module ("telescope", "fzf-lua", "mini.pick"), so a picker is
 * installed when the editor could `require` it: some plugin directory holds
 * `lua/<name>.lua` or `lua/<name>/init.lua`, with each '.' of the name mapped to a
 * directory separator.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "livepreview_health_export.h"

namespace livepreview::health
{

/**
 * @class DependencyProbe
 * @brief Tells whether an optional dependency (a picker plugin) is installed.
 */
class DependencyProbe
{
  public:
    virtual ~DependencyProbe() = default;

    [[nodiscard]] virtual bool is_installed(const std::string &name) const = 0;
};

/**
 * @class LuaModuleProbe
 * @brief Looks for a Lua module below a list of search roots.
 *
 * Each root is searched three ways, in order:
 *  - as a runtime directory itself (`<root>/lua/...`, e.g. the user config directory),
 *  - as a package root (`<root>/pack/<any>/{start,opt}/<plugin>/lua/...`),
 *  - as a directory of plugins (`<root>/<plugin>/lua/...`, e.g. a plugin manager's
 *    install directory).
 * Roots that do not exist are skipped.
 */
class LIVEPREVIEW_HEALTH_EXPORT LuaModuleProbe : public DependencyProbe
{
  public:
    explicit LuaModuleProbe(std::vector<std::filesystem::path> search_roots);

    [[nodiscard]] bool is_installed(const std::string &name) const override;

    /// The plugin directory that provides @p name, or nullopt.
    [[nodiscard]] std::optional<std::filesystem::path> find_module(const std::string &name) const;

    /// "mini.pick" -> "mini/pick"; nullopt for names that cannot be a module path.
    [[nodiscard]] static std::optional<std::filesystem::path>
    module_relative_path(const std::string &name);

    [[nodiscard]] const std::vector<std::filesystem::path> &search_roots() const noexcept
    {
        return m_search_roots;
    }

  private:
    std::vector<std::filesystem::path> m_search_roots;
};

/**
 * @brief The editor's usual plugin locations for the current user.
 *
 * POSIX: `$XDG_CONFIG_HOME/nvim` (default `~/.config/nvim`), then `site` and `lazy`
 * under `$XDG_DATA_HOME/nvim` (default `~/.local/share/nvim`). Windows: the same below
 * `%LOCALAPPDATA%/nvim` and `%LOCALAPPDATA%/nvim-data`. Empty when neither the XDG
 * variables nor the home directory are set.
 */
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT std::vector<std::filesystem::path> default_plugin_roots();

} // namespace livepreview::health
