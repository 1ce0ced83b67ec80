#pragma once
/**
 * @file version_range.hpp
 * @brief Semantic versions and npm-style range expressions ("engines.nvim" in pkg.json).
 *
 * Grammar accepted by VersionRange::parse:
 *   range      := set ( "||" set )*
 *   set        := "*" | "" | hyphen | comparator+
 *   hyphen     := version " - " version            (inclusive on both ends)
 *   comparator := (">=" | ">" | "<=" | "<" | "=" | "^" | "~")? version
 *
 * A bare version means "exactly". "^1.2.3" keeps the left-most non-zero component,
 * "~1.2.3" keeps major.minor. Partial versions ("0.10") fill the missing parts with 0.
 */
#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "livepreview_health_export.h"

namespace livepreview::health
{

struct LIVEPREVIEW_HEALTH_EXPORT SemVer
{
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease; ///< "dev" in "0.11.0-dev"; empty for releases

    /**
     * @brief Parses "1.2.3", "v1.2.3", "1.2", "1", "0.11.0-dev+1234" (build metadata is
     *        dropped).
     * @return nullopt on anything else.
     */
    static std::optional<SemVer> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    /// Release ordering; a prerelease sorts before the release with the same core.
    std::strong_ordering operator<=>(const SemVer &other) const;
    bool operator==(const SemVer &other) const = default;
};

class LIVEPREVIEW_HEALTH_EXPORT VersionRange
{
  public:
    /**
     * @return nullopt if @p text does not follow the grammar above.
     */
    static std::optional<VersionRange> parse(std::string_view text);

    /// True if @p version satisfies any of the comparator sets.
    [[nodiscard]] bool contains(const SemVer &version) const;

    [[nodiscard]] const std::string &text() const noexcept { return m_text; }

  private:
    enum class Op
    {
        Eq,
        Gt,
        Ge,
        Lt,
        Le
    };
    struct Comparator
    {
        Op op;
        SemVer version;
    };
    using ComparatorSet = std::vector<Comparator>;

    static bool parse_set(std::string_view text, ComparatorSet &out);
    static bool satisfies(const Comparator &cmp, const SemVer &version);

    std::vector<ComparatorSet> m_sets;
    std::string m_text;
};

/**
 * @brief True if @p version parses and lies in @p range. An unparseable version or
 *        range is not compatible.
 */
[[nodiscard]] LIVEPREVIEW_HEALTH_EXPORT bool is_compatible(std::string_view version,
                                                           std::string_view range);

} // namespace livepreview::health
