#ifndef INCLUDE_KEYHOP_SECURITY_SECURERANDOM_HPP
#define INCLUDE_KEYHOP_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace keyhop::security
{

// Fills `out` from the OS CSPRNG. Returns false if the OS refused.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Lower-case hex of `byteCount` random bytes, for unpredictable file and directory names.
[[nodiscard]] std::optional<std::string> randomHexToken(std::size_t byteCount);

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_SECURERANDOM_HPP
