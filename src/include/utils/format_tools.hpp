// Tools for formatting and slicing strings
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "livepreview_utils_export.h"

namespace livepreview::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
LIVEPREVIEW_UTILS_EXPORT std::string
formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Extracts a value from a dictionary-like string.
 *
 * Parses a string containing key-value pairs (e.g. "key1=val1; key2=val2", or the
 * "Name:\tnvim\nState:\tS" layout of /proc/<pid>/status) and returns the value for a
 * specified key. Whitespace around separators and assignment symbols is ignored.
 *
 * @param keyword The key to search for.
 * @param input The string_view to parse.
 * @param separator The character separating key-value pairs.
 * @param assignment_symbol The character separating a key from its value.
 * @return The value if found, otherwise std::nullopt.
 */
LIVEPREVIEW_UTILS_EXPORT std::optional<std::string>
extract_value_from_string(std::string_view keyword, std::string_view input, char separator = ';',
                          char assignment_symbol = '=');

/** @brief Returns @p str without leading and trailing whitespace. */
LIVEPREVIEW_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/**
 * @brief Splits @p input on runs of whitespace, dropping empty fields.
 * @return Views into @p input; they are valid only as long as the input is.
 */
LIVEPREVIEW_UTILS_EXPORT std::vector<std::string_view> split_whitespace(std::string_view input);

/**
 * @brief Converts a UTF-8 encoded std::string to a std::wstring on Windows.
 * @return The converted wstring. Returns an empty string on non-Windows platforms.
 */
LIVEPREVIEW_UTILS_EXPORT std::wstring s2ws(const std::string &s);

/// UTF-16 to UTF-8 on Windows; empty elsewhere.
LIVEPREVIEW_UTILS_EXPORT std::string ws2s(const std::wstring &w);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

} // namespace livepreview::format_tools
