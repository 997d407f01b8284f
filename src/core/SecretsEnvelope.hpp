#ifndef KEYHOP_SRC_CORE_SECRETSENVELOPE_HPP
#define KEYHOP_SRC_CORE_SECRETSENVELOPE_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/crypto/ICryptoProvider.hpp"
#include "keyhop/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace keyhop::core::detail
{

// magic(8) | ephemeral public key(32) | nonce(12) | tag(16) | ciphertext
constexpr std::array<std::uint8_t, 8> g_kEnvelopeMagic{ 'K', 'H', 'S', 'E', 'C', 'R', 'E', 'T' };
constexpr std::size_t g_kEnvelopeHeaderBytes{ g_kEnvelopeMagic.size() + keyhop::crypto::g_x25519KeyBytes +
                                              keyhop::crypto::g_aeadNonceBytes + keyhop::crypto::g_aeadTagBytes };
constexpr std::string_view g_kEnvelopeKeyLabel{ "keyhop.secrets.envelope" };

// Encrypts `plainText` to `recipient` under a fresh ephemeral key.
// Throws std::runtime_error / std::invalid_argument from the provider.
[[nodiscard]] std::vector<std::uint8_t> sealEnvelope(keyhop::crypto::ICryptoProvider& crypto,
                                                     const keyhop::crypto::PublicKey& recipient,
                                                     std::span<const std::byte> plainText);

// Errors are always ErrorKind::Crypto: NotAnEnvelope, TruncatedEnvelope or AuthenticationFailed.
[[nodiscard]] Result<keyhop::security::SecureBuffer> openEnvelope(keyhop::crypto::ICryptoProvider& crypto,
                                                                  std::span<const std::uint8_t> identity,
                                                                  std::span<const std::uint8_t> envelope) noexcept;

} // namespace keyhop::core::detail

#endif // KEYHOP_SRC_CORE_SECRETSENVELOPE_HPP
