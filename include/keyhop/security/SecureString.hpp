#ifndef INCLUDE_KEYHOP_SECURITY_SECURESTRING_HPP
#define INCLUDE_KEYHOP_SECURITY_SECURESTRING_HPP

#include "keyhop/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace keyhop::security
{
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Parentheses select the range constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureString secureStringFrom(const SecureBuffer& b)
{
    SecureString out{};
    out.reserve(b.size());
    for (const std::uint8_t c : b)
    {
        out.push_back(static_cast<char>(c));
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

inline void secureAppend(SecureString& s, std::string_view tail)
{
    s.insert(s.end(), tail.begin(), tail.end());
}

inline void secureWipeSize(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipeSize(s);
    SecureString empty{};
    s.swap(empty);
}

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_SECURESTRING_HPP
