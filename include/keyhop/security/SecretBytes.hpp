#ifndef INCLUDE_KEYHOP_SECURITY_SECRETBYTES_HPP
#define INCLUDE_KEYHOP_SECURITY_SECRETBYTES_HPP

#include "keyhop/security/SecureString.hpp"
#include <cstddef>
#include <span>
#include <string_view>

namespace keyhop::security
{

// Owns one decrypted plaintext for the duration of a single operation.
//
// clear() zeroes every byte in place (the size is kept so the wipe can be observed).
// close() zeroes and detaches the buffer; afterwards str() is empty. Both are
// idempotent, and the destructor closes.
class SecretBytes final
{
public:
    SecretBytes() = default;
    explicit SecretBytes(SecureString data) noexcept;

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;
    SecretBytes(SecretBytes&& other) noexcept;
    SecretBytes& operator=(SecretBytes&& other) noexcept;
    ~SecretBytes() noexcept;

    // Valid until the next clear(), close() or move.
    [[nodiscard]] std::string_view str() const noexcept;
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] bool closed() const noexcept;

    void clear() noexcept;
    void close() noexcept;

private:
    SecureString m_data;
    bool m_closed{ false };
};

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_SECRETBYTES_HPP
