#ifndef INCLUDE_KEYHOP_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_KEYHOP_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace keyhop::security
{

// Zeroes `bytes` through a call the optimizer cannot drop as a dead store.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// For std::string lines read from a terminal before they reach a SecureString.
// Only size() bytes are zeroed, then the string is cleared.
void secureWipe(std::string& s) noexcept;

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_MEMORYWIPER_HPP
