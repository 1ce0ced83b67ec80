/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that fail in expected ways.
 *
 * Used where a failure is part of normal operation (a subprocess that times out, an
 * OS query that is denied) and the caller must decide what to do with it. Unexpected
 * failures are still reported with exceptions.
 *
 * - Success holds a T, failure holds an enum E plus an optional detail code (errno).
 * - No implicit conversion to bool.
 * - [[nodiscard]] factories and queries so results are not dropped silently.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace livepreview::utils
{

/**
 * @class Result
 * @brief Holds either a success value T or an error enum E with a detail code.
 *
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * Usage:
 * @code
 * auto out = run_command({"lsof", "-nP", "-iTCP:5500"}, std::chrono::seconds(3));
 * if (out.is_ok()) {
 *     parse(out.content().stdout_text);
 * } else if (out.error() == CommandError::Timeout) {
 *     // report as a lookup failure
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /// @param code Detail code, usually an errno.
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    /// An error holding E{}.
    Result() : m_data(ErrorData{E{}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;

    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /// Success value. @throws std::logic_error on an error Result.
    [[nodiscard]] T &content() &
    {
        expect_ok("content");
        return std::get<T>(m_data);
    }
    [[nodiscard]] const T &content() const &
    {
        expect_ok("content");
        return std::get<T>(m_data);
    }
    [[nodiscard]] T &&content() &&
    {
        expect_ok("content");
        return std::get<T>(std::move(m_data));
    }

    /** @brief Contained value if ok, @p default_value otherwise. */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /// Error enum. @throws std::logic_error on a successful Result.
    [[nodiscard]] E error() const
    {
        expect_error("error");
        return std::get<ErrorData>(m_data).kind;
    }

    /// Detail code given to error(), 0 if none. @throws std::logic_error on success.
    [[nodiscard]] int error_code() const
    {
        expect_error("error_code");
        return std::get<ErrorData>(m_data).code;
    }

  private:
    struct ErrorData
    {
        E kind;
        int code;
    };

    void expect_ok(const char *accessor) const
    {
        if (!is_ok())
            throw std::logic_error(std::string("Result::") + accessor + "() called on an error");
    }
    void expect_error(const char *accessor) const
    {
        if (is_ok())
            throw std::logic_error(std::string("Result::") + accessor + "() called on a success");
    }

    std::variant<T, ErrorData> m_data;
};

} // namespace livepreview::utils
