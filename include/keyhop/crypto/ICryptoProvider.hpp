#ifndef INCLUDE_KEYHOP_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_KEYHOP_CRYPTO_ICRYPTOPROVIDER_HPP

#include "keyhop/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace keyhop::crypto
{

constexpr std::size_t g_x25519KeyBytes{ 32 };
constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };
constexpr std::size_t g_subkeyMaxBytes{ 64 };

using PublicKey = std::array<std::uint8_t, g_x25519KeyBytes>;

struct X25519KeyPair final
{
    keyhop::security::SecureBuffer secretKey;
    PublicKey publicKey{};
};

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// Primitive set used by the secrets envelope. Implementations must agree byte-for-byte
// so that a blob written by one provider opens with any other.
//
// Contract violations (wrong key sizes, oversized inputs) throw std::invalid_argument;
// backend or CSPRNG failures throw std::runtime_error.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    [[nodiscard]] virtual X25519KeyPair generateKeyPair() = 0;

    [[nodiscard]] virtual PublicKey derivePublicKey(std::span<const std::uint8_t> secretKey) const = 0;

    // Raw X25519. Throws std::runtime_error when the result is all zeros (low-order peer key).
    [[nodiscard]] virtual keyhop::security::SecureBuffer keyAgreement(std::span<const std::uint8_t> secretKey,
                                                                      std::span<const std::uint8_t> peerPublicKey) const = 0;

    // Keyed BLAKE2b over a non-empty `context`. `inputKey` and `outBytes` are both 1..64 bytes.
    [[nodiscard]] virtual keyhop::security::SecureBuffer
    deriveSubkey(std::span<const std::uint8_t> inputKey, std::span<const std::byte> context, std::size_t outBytes) const = 0;

    // AEAD: ChaCha20-Poly1305 (IETF, 12-byte nonce).
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<keyhop::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace keyhop::crypto

#endif // INCLUDE_KEYHOP_CRYPTO_ICRYPTOPROVIDER_HPP
