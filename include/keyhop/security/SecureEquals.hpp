#ifndef INCLUDE_KEYHOP_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_KEYHOP_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace keyhop::security
{
// Constant-time for equal lengths. Lengths themselves are not secret.
[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
    }
    return (diff == 0U);
}

[[nodiscard]] inline bool isAllZero(std::span<const std::uint8_t> bytes) noexcept
{
    volatile std::uint8_t acc{};
    for (const std::uint8_t b : bytes)
    {
        acc |= b;
    }
    return (acc == 0U);
}

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_SECUREEQUALS_HPP
