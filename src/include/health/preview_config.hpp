#pragma once
/**
 * @file preview_config.hpp
 * @brief User configuration of the live-preview plugin, loaded from JSON.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "port":         5500,
 *   "browser":      "default",
 *   "dynamic_root": false,
 *   "sync_scroll":  true,
 *   "picker":       "",
 *   "pickers":      ["telescope", "fzf-lua", "mini.pick", "snacks"]
 * }
 * @endcode
 *
 * Every key is optional. Keys not listed above are kept in unknown_keys, and a known
 * key with a value of the wrong type (or a port outside 1..65535) keeps its default and
 * is described in invalid_values. Neither makes loading fail; the health check reports
 * both.
 */
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "livepreview_health_export.h"

namespace livepreview::health
{

/**
 * @class ConfigError
 * @brief A configuration or package file cannot be read, is not valid JSON, or does not
 *        hold a JSON object. Package metadata also throws it for missing or mistyped
 *        fields.
 */
class LIVEPREVIEW_HEALTH_EXPORT ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct LIVEPREVIEW_HEALTH_EXPORT PreviewConfig
{
    static constexpr int kDefaultPort = 5500;

    std::optional<int> port;          ///< Server port; the port check is skipped when unset
    std::string browser{"default"};
    bool dynamic_root = false;
    bool sync_scroll = true;
    std::string picker;
    std::vector<std::string> pickers{"telescope", "fzf-lua", "mini.pick", "snacks"};

    /// Top-level keys of the source object that are not part of the schema, sorted.
    std::vector<std::string> unknown_keys;
    /// One message per known key whose value was rejected, e.g. "'browser' must be a
    /// string, got number". Schema key order.
    std::vector<std::string> invalid_values;

    /// The plugin's defaults: every field above with port = kDefaultPort.
    static PreviewConfig defaults();

    /**
     * @brief Reads the keys present in @p j; absent and rejected keys keep their default
     *        values (port stays unset).
     * @throws ConfigError if @p j is not an object.
     */
    static PreviewConfig from_json(const nlohmann::json &j);

    /// @throws ConfigError on I/O and parse errors, naming @p path.
    static PreviewConfig from_json_file(const std::string &path);

    /// Effective configuration; unknown keys are not included.
    [[nodiscard]] nlohmann::json to_json() const;

    /// True if @p key is part of the schema.
    [[nodiscard]] static bool is_known_key(const std::string &key);
};

} // namespace livepreview::health
