#include "lp_service.hpp"

#include "health/dependency_probe.hpp"

#include <cstdlib>

namespace livepreview::health
{

namespace fs = std::filesystem;

namespace
{

bool is_file(const fs::path &path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

// A plugin (or runtime) directory provides the module if lua/<module>.lua or
// lua/<module>/init.lua exists below it.
bool provides_module(const fs::path &plugin_dir, const fs::path &module)
{
    const fs::path base = plugin_dir / "lua" / module;
    fs::path as_file = base;
    as_file += ".lua";
    return is_file(as_file) || is_file(base / "init.lua");
}

// Immediate subdirectories of @p dir; empty when it cannot be read.
std::vector<fs::path> subdirectories(const fs::path &dir)
{
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
        return out;
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        std::error_code type_ec;
        if (it->is_directory(type_ec))
            out.push_back(it->path());
    }
    return out;
}

std::optional<fs::path> search_root(const fs::path &root, const fs::path &module)
{
    if (provides_module(root, module))
        return root;

    for (const auto &package : subdirectories(root / "pack"))
    {
        for (const char *kind : {"start", "opt"})
        {
            for (const auto &plugin : subdirectories(package / kind))
            {
                if (provides_module(plugin, module))
                    return plugin;
            }
        }
    }

    for (const auto &plugin : subdirectories(root))
    {
        if (provides_module(plugin, module))
            return plugin;
    }
    return std::nullopt;
}

std::optional<fs::path> env_path(const char *name)
{
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0')
        return std::nullopt;
    return fs::path(value);
}

} // namespace

LuaModuleProbe::LuaModuleProbe(std::vector<fs::path> search_roots)
    : m_search_roots(std::move(search_roots))
{
}

std::optional<fs::path> LuaModuleProbe::module_relative_path(const std::string &name)
{
    if (name.empty() || name.front() == '.' || name.back() == '.' ||
        name.find("..") != std::string::npos || name.find_first_of("/\\") != std::string::npos)
    {
        return std::nullopt;
    }
    fs::path module;
    size_t start = 0;
    while (start <= name.size())
    {
        size_t end = name.find('.', start);
        if (end == std::string::npos)
            end = name.size();
        module /= name.substr(start, end - start);
        start = end + 1;
    }
    return module;
}

std::optional<fs::path> LuaModuleProbe::find_module(const std::string &name) const
{
    auto module = module_relative_path(name);
    if (!module)
    {
        LOGGER_DEBUG("dependency_probe: '{}' is not a Lua module name", name);
        return std::nullopt;
    }
    for (const auto &root : m_search_roots)
    {
        if (auto plugin = search_root(root, *module))
        {
            LOGGER_TRACE("dependency_probe: '{}' -> '{}'", name, plugin->string());
            return plugin;
        }
    }
    LOGGER_DEBUG("dependency_probe: module '{}' not found in {} search root(s)", name,
                 m_search_roots.size());
    return std::nullopt;
}

bool LuaModuleProbe::is_installed(const std::string &name) const
{
    return find_module(name).has_value();
}

std::vector<fs::path> default_plugin_roots()
{
    std::vector<fs::path> roots;
#if defined(LIVEPREVIEW_IS_WINDOWS)
    if (auto local = env_path("LOCALAPPDATA"))
    {
        roots.push_back(*local / "nvim");
        roots.push_back(*local / "nvim-data" / "site");
        roots.push_back(*local / "nvim-data" / "lazy");
    }
#else
    auto home = env_path("HOME");
    auto config = env_path("XDG_CONFIG_HOME");
    if (!config && home)
        config = *home / ".config";
    auto data = env_path("XDG_DATA_HOME");
    if (!data && home)
        data = *home / ".local" / "share";

    if (config)
        roots.push_back(*config / "nvim");
    if (data)
    {
        roots.push_back(*data / "nvim" / "site");
        roots.push_back(*data / "nvim" / "lazy");
    }
#endif
    return roots;
}

} // namespace livepreview::health
