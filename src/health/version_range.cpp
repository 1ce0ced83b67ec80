#include "lp_base.hpp"

#include "health/version_range.hpp"

#include <algorithm>
#include <charconv>

namespace livepreview::health
{

namespace
{

std::optional<int> parse_component(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0)
    {
        return std::nullopt;
    }
    return value;
}

bool is_numeric(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Dot-separated identifiers: numeric ones compare numerically and sort before
// alphanumeric ones; a shorter list that is a prefix of a longer one sorts first.
std::strong_ordering compare_prerelease(std::string_view a, std::string_view b)
{
    while (!a.empty() && !b.empty())
    {
        auto a_dot = a.find('.');
        auto b_dot = b.find('.');
        std::string_view a_id = a.substr(0, a_dot);
        std::string_view b_id = b.substr(0, b_dot);

        const bool a_num = is_numeric(a_id);
        const bool b_num = is_numeric(b_id);
        if (a_num && b_num)
        {
            if (a_id.size() != b_id.size())
                return a_id.size() <=> b_id.size();
            if (auto c = a_id.compare(b_id); c != 0)
                return c <=> 0;
        }
        else if (a_num != b_num)
        {
            return a_num ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        else if (auto c = a_id.compare(b_id); c != 0)
        {
            return c <=> 0;
        }

        a = a_dot == std::string_view::npos ? std::string_view{} : a.substr(a_dot + 1);
        b = b_dot == std::string_view::npos ? std::string_view{} : b.substr(b_dot + 1);
    }
    return a.empty() == b.empty() ? std::strong_ordering::equal
           : a.empty()            ? std::strong_ordering::less
                                  : std::strong_ordering::greater;
}

} // namespace

// ============================================================================
// SemVer
// ============================================================================

std::optional<SemVer> SemVer::parse(std::string_view text)
{
    text = format_tools::trim_whitespace(text);
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V'))
    {
        text.remove_prefix(1);
    }
    if (auto plus = text.find('+'); plus != std::string_view::npos)
    {
        text = text.substr(0, plus);
    }

    SemVer v;
    if (auto dash = text.find('-'); dash != std::string_view::npos)
    {
        v.prerelease = std::string(text.substr(dash + 1));
        text = text.substr(0, dash);
        if (v.prerelease.empty())
        {
            return std::nullopt;
        }
    }

    int *parts[] = {&v.major, &v.minor, &v.patch};
    size_t index = 0;
    size_t start = 0;
    while (true)
    {
        if (index == 3)
        {
            return std::nullopt; // more than three components
        }
        size_t dot = text.find('.', start);
        auto component = parse_component(text.substr(start, dot == std::string_view::npos
                                                                ? std::string_view::npos
                                                                : dot - start));
        if (!component)
        {
            return std::nullopt;
        }
        *parts[index++] = *component;
        if (dot == std::string_view::npos)
        {
            break;
        }
        start = dot + 1;
    }
    return v;
}

std::string SemVer::to_string() const
{
    if (prerelease.empty())
    {
        return fmt::format("{}.{}.{}", major, minor, patch);
    }
    return fmt::format("{}.{}.{}-{}", major, minor, patch, prerelease);
}

std::strong_ordering SemVer::operator<=>(const SemVer &other) const
{
    if (auto c = major <=> other.major; c != 0)
        return c;
    if (auto c = minor <=> other.minor; c != 0)
        return c;
    if (auto c = patch <=> other.patch; c != 0)
        return c;
    if (prerelease.empty() || other.prerelease.empty())
    {
        // A release sorts after any of its prereleases.
        return prerelease.empty() <=> other.prerelease.empty();
    }
    return compare_prerelease(prerelease, other.prerelease);
}

// ============================================================================
// VersionRange
// ============================================================================

bool VersionRange::satisfies(const Comparator &cmp, const SemVer &version)
{
    switch (cmp.op)
    {
    case Op::Eq:
        return version == cmp.version;
    case Op::Gt:
        return version > cmp.version;
    case Op::Ge:
        return version >= cmp.version;
    case Op::Lt:
        return version < cmp.version;
    case Op::Le:
        return version <= cmp.version;
    }
    return false;
}

bool VersionRange::parse_set(std::string_view text, ComparatorSet &out)
{
    auto tokens = format_tools::split_whitespace(text);
    if (tokens.empty() || (tokens.size() == 1 && tokens[0] == "*"))
    {
        return true; // matches everything
    }

    if (tokens.size() == 3 && tokens[1] == "-")
    {
        auto low = SemVer::parse(tokens[0]);
        auto high = SemVer::parse(tokens[2]);
        if (!low || !high)
        {
            return false;
        }
        out.push_back({Op::Ge, *low});
        out.push_back({Op::Le, *high});
        return true;
    }

    for (size_t i = 0; i < tokens.size(); ++i)
    {
        std::string_view token = tokens[i];
        std::string_view op_text;
        for (std::string_view candidate : {">=", "<=", ">", "<", "=", "^", "~"})
        {
            if (token.starts_with(candidate))
            {
                op_text = candidate;
                break;
            }
        }
        std::string_view version_text = token.substr(op_text.size());
        if (version_text.empty())
        {
            // Operator separated from its version: ">= 0.10.0"
            if (op_text.empty() || i + 1 >= tokens.size())
            {
                return false;
            }
            version_text = tokens[++i];
        }

        auto version = SemVer::parse(version_text);
        if (!version)
        {
            return false;
        }

        if (op_text == ">=")
            out.push_back({Op::Ge, *version});
        else if (op_text == "<=")
            out.push_back({Op::Le, *version});
        else if (op_text == ">")
            out.push_back({Op::Gt, *version});
        else if (op_text == "<")
            out.push_back({Op::Lt, *version});
        else if (op_text == "^")
        {
            // Upper bounds use the lowest prerelease ("-0") so that prereleases of the
            // next version stay out of range.
            SemVer upper;
            if (version->major > 0)
                upper = SemVer{version->major + 1, 0, 0, "0"};
            else if (version->minor > 0)
                upper = SemVer{0, version->minor + 1, 0, "0"};
            else
                upper = SemVer{0, 0, version->patch + 1, "0"};
            out.push_back({Op::Ge, *version});
            out.push_back({Op::Lt, upper});
        }
        else if (op_text == "~")
        {
            out.push_back({Op::Ge, *version});
            out.push_back({Op::Lt, SemVer{version->major, version->minor + 1, 0, "0"}});
        }
        else
            out.push_back({Op::Eq, *version});
    }
    return true;
}

std::optional<VersionRange> VersionRange::parse(std::string_view text)
{
    VersionRange range;
    range.m_text = std::string(format_tools::trim_whitespace(text));

    std::string_view rest = range.m_text;
    while (true)
    {
        auto bar = rest.find("||");
        ComparatorSet set;
        if (!parse_set(rest.substr(0, bar), set))
        {
            return std::nullopt;
        }
        range.m_sets.push_back(std::move(set));
        if (bar == std::string_view::npos)
        {
            break;
        }
        rest = rest.substr(bar + 2);
    }
    return range;
}

bool VersionRange::contains(const SemVer &version) const
{
    for (const auto &set : m_sets)
    {
        bool all = true;
        for (const auto &cmp : set)
        {
            if (!satisfies(cmp, version))
            {
                all = false;
                break;
            }
        }
        if (all)
        {
            return true;
        }
    }
    return false;
}

bool is_compatible(std::string_view version, std::string_view range)
{
    auto v = SemVer::parse(version);
    auto r = VersionRange::parse(range);
    return v && r && r->contains(*v);
}

} // namespace livepreview::health
