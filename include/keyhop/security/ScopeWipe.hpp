#ifndef INCLUDE_KEYHOP_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_KEYHOP_SECURITY_SCOPEWIPE_HPP

#include "keyhop/security/MemoryWiper.hpp"
#include "keyhop/security/SecureBuffer.hpp"
#include "keyhop/security/SecureString.hpp"
#include <concepts>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

namespace keyhop::security
{

// Runs an action when the scope ends, on normal return and during unwinding alike.
// release() disarms it once the guarded resource has been committed elsewhere.
template <std::invocable Action> class [[nodiscard]] ScopeExit final
{
public:
    explicit ScopeExit(Action action) noexcept(std::is_nothrow_move_constructible_v<Action>)
        : m_action{ std::move(action) }
    {
    }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

    ScopeExit(ScopeExit&& other) noexcept(std::is_nothrow_move_constructible_v<Action>)
        : m_action{ std::move(other.m_action) }, m_active{ other.m_active }
    {
        other.release();
    }

    ScopeExit& operator=(ScopeExit&& other) noexcept
        requires std::is_nothrow_move_assignable_v<Action>
    {
        if (this == &other)
        {
            return *this;
        }
        fire();
        m_action = std::move(other.m_action);
        m_active = other.m_active;
        other.release();
        return *this;
    }

    ~ScopeExit() noexcept
    {
        fire();
    }

    void release() noexcept
    {
        m_active = false;
    }

    [[nodiscard]] bool active() const noexcept
    {
        return m_active;
    }

private:
    void fire() noexcept
    {
        if (m_active)
        {
            m_active = false;
            m_action();
        }
    }

    Action m_action;
    bool m_active{ true };
};

struct WipeBytes final
{
    std::span<std::byte> bytes;

    void operator()() const noexcept
    {
        secureWipe(bytes);
    }
};

using ScopeWipe = ScopeExit<WipeBytes>;

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::byte> b) noexcept
{
    return ScopeWipe{ WipeBytes{ b } };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ WipeBytes{ std::as_writable_bytes(b) } };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ WipeBytes{ asWritableBytes(b) } };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ WipeBytes{ asWritableBytes(s) } };
}

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_SCOPEWIPE_HPP
