#include "lp_service.hpp"

#include "health/preview_config.hpp"

#include <algorithm>
#include <array>
#include <fstream>

#include <nlohmann/json.hpp>

namespace livepreview::health
{

// ============================================================================
// Parsing helpers (anonymous namespace)
// ============================================================================

namespace
{

constexpr std::array<std::string_view, 6> kKnownKeys = {"port",        "browser", "dynamic_root",
                                                        "sync_scroll", "picker",  "pickers"};

// Problems found while reading; each bad key keeps its default value.
using Problems = std::vector<std::string>;

void type_error(Problems &problems, const std::string &key, const char *expected,
                const nlohmann::json &value)
{
    LOGGER_DEBUG("preview config: '{}' has the wrong type ({})", key, value.type_name());
    problems.push_back(fmt::format("'{}' must be {}, got {}", key, expected, value.type_name()));
}

void read_string(const nlohmann::json &j, const std::string &key, std::string &out,
                 Problems &problems)
{
    const auto &value = j[key];
    if (!value.is_string())
        return type_error(problems, key, "a string", value);
    out = value.get<std::string>();
}

void read_bool(const nlohmann::json &j, const std::string &key, bool &out, Problems &problems)
{
    const auto &value = j[key];
    if (!value.is_boolean())
        return type_error(problems, key, "a boolean", value);
    out = value.get<bool>();
}

void read_port(const nlohmann::json &j, std::optional<int> &out, Problems &problems)
{
    const auto &value = j["port"];
    if (value.is_null())
    {
        out.reset();
        return;
    }
    if (!value.is_number_integer())
        return type_error(problems, "port", "an integer", value);

    const auto port = value.get<int64_t>();
    if (port < 1 || port > 65535)
    {
        problems.push_back(fmt::format("'port' = {} is out of range (must be 1..65535)", port));
        return;
    }
    out = static_cast<int>(port);
}

void read_pickers(const nlohmann::json &j, std::vector<std::string> &out, Problems &problems)
{
    const auto &value = j["pickers"];
    if (!value.is_array())
        return type_error(problems, "pickers", "an array of strings", value);

    std::vector<std::string> pickers;
    pickers.reserve(value.size());
    for (const auto &item : value)
    {
        if (!item.is_string())
            return type_error(problems, "pickers", "an array of strings", item);
        pickers.push_back(item.get<std::string>());
    }
    out = std::move(pickers);
}

} // anonymous namespace

// ============================================================================
// PreviewConfig
// ============================================================================

PreviewConfig PreviewConfig::defaults()
{
    PreviewConfig cfg;
    cfg.port = kDefaultPort;
    return cfg;
}

bool PreviewConfig::is_known_key(const std::string &key)
{
    return std::find(kKnownKeys.begin(), kKnownKeys.end(), key) != kKnownKeys.end();
}

PreviewConfig PreviewConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw ConfigError(std::string("Preview config: top level must be a JSON object, got ") +
                          j.type_name());

    PreviewConfig cfg;
    if (j.contains("port"))
        read_port(j, cfg.port, cfg.invalid_values);
    if (j.contains("browser"))
        read_string(j, "browser", cfg.browser, cfg.invalid_values);
    if (j.contains("dynamic_root"))
        read_bool(j, "dynamic_root", cfg.dynamic_root, cfg.invalid_values);
    if (j.contains("sync_scroll"))
        read_bool(j, "sync_scroll", cfg.sync_scroll, cfg.invalid_values);
    if (j.contains("picker"))
        read_string(j, "picker", cfg.picker, cfg.invalid_values);
    if (j.contains("pickers"))
        read_pickers(j, cfg.pickers, cfg.invalid_values);

    for (const auto &item : j.items())
    {
        if (!is_known_key(item.key()))
        {
            LOGGER_DEBUG("preview config: unknown key '{}'", item.key());
            cfg.unknown_keys.push_back(item.key());
        }
    }
    return cfg;
}

PreviewConfig PreviewConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("Preview config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigError("Preview config: JSON parse error in '" + path + "': " + e.what());
    }

    try
    {
        return from_json(j);
    }
    catch (const ConfigError &e)
    {
        throw ConfigError(std::string(e.what()) + " in '" + path + "'");
    }
}

nlohmann::json PreviewConfig::to_json() const
{
    nlohmann::json j{{"browser", browser},   {"dynamic_root", dynamic_root},
                     {"sync_scroll", sync_scroll}, {"picker", picker},
                     {"pickers", pickers}};
    j["port"] = port ? nlohmann::json(*port) : nlohmann::json(nullptr);
    return j;
}

} // namespace livepreview::health
