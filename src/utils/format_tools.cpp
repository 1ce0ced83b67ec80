// format_tools.cpp
#include "lp_base.hpp"

namespace livepreview::format_tools
{

// Formatted local time with microsecond resolution. The fractional part is computed
// separately so the result does not depend on fmt's chrono subsecond support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

#if defined(LIVEPREVIEW_PLATFORM_WIN64)

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};

    int required = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                       static_cast<int>(s.size()), nullptr, 0);
    if (required <= 0)
        return {};

    std::wstring w(required, L'\0');
    int written = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                      static_cast<int>(s.size()), w.data(), required);
    if (written == 0)
        return {};

    return w;
}

std::string ws2s(const std::wstring &w)
{
    if (w.empty())
        return {};

    int required = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(),
                                       static_cast<int>(w.size()), nullptr, 0, nullptr, nullptr);
    if (required <= 0)
        return {};

    std::string s(required, '\0');
    int written =
        WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                            s.data(), required, nullptr, nullptr);
    if (written == 0)
        return {};

    return s;
}

#else

// Wide strings are only needed for Win32 APIs.
std::wstring s2ws([[maybe_unused]] const std::string &str)
{
    return {};
}

std::string ws2s([[maybe_unused]] const std::wstring &wstr)
{
    return {};
}

#endif

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::vector<std::string_view> split_whitespace(std::string_view input)
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    std::vector<std::string_view> fields;
    std::string_view::size_type pos = input.find_first_not_of(whitespace);
    while (pos != std::string_view::npos)
    {
        auto end = input.find_first_of(whitespace, pos);
        if (end == std::string_view::npos)
        {
            fields.push_back(input.substr(pos));
            break;
        }
        fields.push_back(input.substr(pos, end - pos));
        pos = input.find_first_not_of(whitespace, end);
    }
    return fields;
}

std::optional<std::string> extract_value_from_string(std::string_view keyword,
                                                     std::string_view input, char separator,
                                                     char assignment_symbol)
{
    std::string_view::size_type start = 0;
    while (start < input.size())
    {
        std::string_view::size_type end = input.find(separator, start);
        if (end == std::string_view::npos)
        {
            end = input.size();
        }

        std::string_view segment = input.substr(start, end - start);
        start = end + 1;

        std::string_view::size_type assignment_pos = segment.find(assignment_symbol);
        if (assignment_pos == std::string_view::npos)
        {
            continue; // not a key-value pair
        }

        std::string_view key_sv = trim_whitespace(segment.substr(0, assignment_pos));
        if (key_sv == keyword)
        {
            return std::string(trim_whitespace(segment.substr(assignment_pos + 1)));
        }
    }
    return std::nullopt;
}

} // namespace livepreview::format_tools
