#pragma once
/**
 * @file package_spec.hpp
 * @brief Plugin package metadata (pkg.json).
 *
 * @code{.json}
 * {
 *   "name": "live-preview.nvim",
 *   "version": "0.9.6",
 *   "engines": { "nvim": ">=0.10.0" }
 * }
 * @endcode
 */
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "livepreview_health_export.h"

namespace livepreview::health
{

struct LIVEPREVIEW_HEALTH_EXPORT PackageSpec
{
    std::string name;
    std::string version;
    std::string engines_nvim; ///< Supported host version range, e.g. ">=0.10.0"

    /// @throws ConfigError if a field is missing or not a string.
    static PackageSpec from_json(const nlohmann::json &j);

    /// @throws ConfigError on I/O and parse errors, naming @p path.
    static PackageSpec from_json_file(const std::string &path);
};

} // namespace livepreview::health
