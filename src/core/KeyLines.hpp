#ifndef KEYHOP_SRC_CORE_KEYLINES_HPP
#define KEYHOP_SRC_CORE_KEYLINES_HPP

#include "keyhop/crypto/ICryptoProvider.hpp"
#include "keyhop/security/SecureString.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace keyhop::core::detail
{

constexpr std::string_view g_kIdentityPrefix{ "KEYHOP-SECRET-KEY-" };
constexpr std::string_view g_kRecipientPrefix{ "keyhop1" };
constexpr std::size_t g_kKeyHexChars{ keyhop::crypto::g_x25519KeyBytes * 2U };

constexpr std::array<char, 16> g_kUpperHex{ '0', '1', '2', '3', '4', '5', '6', '7',
                                            '8', '9', 'A', 'B', 'C', 'D', 'E', 'F' };
constexpr std::array<char, 16> g_kLowerHex{ '0', '1', '2', '3', '4', '5', '6', '7',
                                            '8', '9', 'a', 'b', 'c', 'd', 'e', 'f' };

// Nibble value of `c` in the given alphabet case, or -1.
[[nodiscard]] constexpr int hexNibble(char c, bool upper) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    const char first{ upper ? 'A' : 'a' };
    if (c >= first && c <= static_cast<char>(first + 5))
    {
        return 10 + (c - first);
    }
    return -1;
}

[[nodiscard]] inline bool decodeHex(std::string_view hex, std::span<std::uint8_t> out, bool upper) noexcept
{
    if (hex.size() != out.size() * 2U)
    {
        return false;
    }
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const int hi{ hexNibble(hex[2U * i], upper) };
        const int lo{ hexNibble(hex[(2U * i) + 1U], upper) };
        if (hi < 0 || lo < 0)
        {
            return false;
        }
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

[[nodiscard]] inline std::string_view trimCarriageReturn(std::string_view line) noexcept
{
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1);
    }
    return line;
}

[[nodiscard]] inline keyhop::security::SecureString encodeIdentityLine(std::span<const std::uint8_t> secretKey)
{
    keyhop::security::SecureString line{};
    line.reserve(g_kIdentityPrefix.size() + (secretKey.size() * 2U));
    keyhop::security::secureAppend(line, g_kIdentityPrefix);
    for (const std::uint8_t b : secretKey)
    {
        line.push_back(g_kUpperHex[b >> 4U]);
        line.push_back(g_kUpperHex[b & 0x0FU]);
    }
    return line;
}

[[nodiscard]] inline std::string encodeRecipientLine(const keyhop::crypto::PublicKey& publicKey)
{
    std::string line{ g_kRecipientPrefix };
    line.reserve(g_kRecipientPrefix.size() + (publicKey.size() * 2U));
    for (const std::uint8_t b : publicKey)
    {
        line.push_back(g_kLowerHex[b >> 4U]);
        line.push_back(g_kLowerHex[b & 0x0FU]);
    }
    return line;
}

// `out` must hold g_x25519KeyBytes. Leaves `out` unspecified on failure; callers wipe it.
[[nodiscard]] inline bool decodeIdentityLine(std::string_view line, std::span<std::uint8_t> out) noexcept
{
    line = trimCarriageReturn(line);
    if (line.size() != g_kIdentityPrefix.size() + g_kKeyHexChars || !line.starts_with(g_kIdentityPrefix))
    {
        return false;
    }
    return decodeHex(line.substr(g_kIdentityPrefix.size()), out, true);
}

[[nodiscard]] inline std::optional<keyhop::crypto::PublicKey> decodeRecipientLine(std::string_view line) noexcept
{
    line = trimCarriageReturn(line);
    if (line.size() != g_kRecipientPrefix.size() + g_kKeyHexChars || !line.starts_with(g_kRecipientPrefix))
    {
        return std::nullopt;
    }
    keyhop::crypto::PublicKey publicKey{};
    if (!decodeHex(line.substr(g_kRecipientPrefix.size()), publicKey, false))
    {
        return std::nullopt;
    }
    return publicKey;
}

} // namespace keyhop::core::detail

#endif // KEYHOP_SRC_CORE_KEYLINES_HPP
