#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

namespace livepreview::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, normally or by exception.
 *
 * Used for raw OS handles that have no RAII wrapper of their own: pipe and file
 * descriptors, DIR* streams from opendir(), Win32 HANDLEs.
 *
 * @code
 *  DIR *dir = ::opendir("/proc");
 *  if (dir == nullptr) return;
 *  auto close_dir = livepreview::basics::make_scope_guard([dir]() noexcept { ::closedir(dir); });
 * @endcode
 *
 * The destructor is noexcept; the callable must not throw. Movable, not copyable.
 * A moved-from guard is inactive.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            m_func();
        }
    }

    /** @brief Cancels the cleanup action. */
    void dismiss() noexcept { m_active = false; }

    /** @brief Runs the cleanup action now and deactivates the guard. */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false;
            m_func();
        }
    }

  private:
    Callable m_func;
    bool m_active = true;
};

/**
 * @brief Creates a ScopeGuard, deducing the decayed callable type.
 */
template <typename F>
[[nodiscard]] auto make_scope_guard(F &&f) noexcept(
    std::is_nothrow_constructible_v<ScopeGuard<std::decay_t<F>>, F>)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace livepreview::basics
