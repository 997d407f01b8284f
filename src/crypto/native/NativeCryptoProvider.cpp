#include "keyhop/crypto/providers/ProviderFactory.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include "keyhop/security/SecureBuffer.hpp"
#include "keyhop/security/SecureEquals.hpp"
#include "keyhop/security/SecureRandom.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <monocypher.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace keyhop::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

class NativeCryptoProvider final : public keyhop::crypto::ICryptoProvider
{
public:
    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "native";
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return keyhop::security::secureRandomFill(out);
    }

    [[nodiscard]] keyhop::crypto::X25519KeyPair generateKeyPair() override
    {
        keyhop::crypto::X25519KeyPair pair{};
        pair.secretKey.resize(keyhop::crypto::g_x25519KeyBytes);
        if (!randomBytes(std::span<std::uint8_t>{ pair.secretKey }))
        {
            keyhop::security::secureRelease(pair.secretKey);
            throw std::runtime_error("generateKeyPair: CSPRNG failure");
        }
        crypto_x25519_public_key(pair.publicKey.data(), pair.secretKey.data());
        return pair;
    }

    [[nodiscard]] keyhop::crypto::PublicKey derivePublicKey(std::span<const std::uint8_t> secretKey) const override
    {
        requireExactSize(secretKey, keyhop::crypto::g_x25519KeyBytes, "derivePublicKey: secretKey");

        keyhop::crypto::PublicKey publicKey{};
        crypto_x25519_public_key(publicKey.data(), secretKey.data());
        return publicKey;
    }

    [[nodiscard]] keyhop::security::SecureBuffer keyAgreement(std::span<const std::uint8_t> secretKey,
                                                              std::span<const std::uint8_t> peerPublicKey) const override
    {
        requireExactSize(secretKey, keyhop::crypto::g_x25519KeyBytes, "keyAgreement: secretKey");
        requireExactSize(peerPublicKey, keyhop::crypto::g_x25519KeyBytes, "keyAgreement: peerPublicKey");

        keyhop::security::SecureBuffer shared{};
        shared.resize(keyhop::crypto::g_x25519KeyBytes);
        crypto_x25519(shared.data(), secretKey.data(), peerPublicKey.data());

        if (keyhop::security::isAllZero(shared))
        {
            keyhop::security::secureRelease(shared);
            throw std::runtime_error("keyAgreement: low-order peer key");
        }
        return shared;
    }

    [[nodiscard]] keyhop::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> inputKey,
                                                              std::span<const std::byte> context,
                                                              std::size_t outBytes) const override
    {
        if (inputKey.empty() || inputKey.size() > keyhop::crypto::g_subkeyMaxBytes)
        {
            throw std::invalid_argument("deriveSubkey: invalid inputKey size");
        }
        if (context.empty())
        {
            throw std::invalid_argument("deriveSubkey: empty context");
        }
        if (outBytes == 0U || outBytes > keyhop::crypto::g_subkeyMaxBytes)
        {
            throw std::invalid_argument("deriveSubkey: invalid outBytes");
        }

        keyhop::security::SecureBuffer out{};
        out.resize(outBytes);
        const auto message{ asU8(context) };
        crypto_blake2b_keyed(out.data(), out.size(), inputKey.data(), inputKey.size(), message.data(), message.size());
        return out;
    }

    [[nodiscard]] keyhop::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                      std::span<const std::byte> plainText,
                                                      std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, keyhop::crypto::g_aeadKeyBytes, "aeadEncrypt: key");

        keyhop::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = keyhop::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8(associatedData).data(),
                          associatedData.size(), asU8(plainText).data(), plainText.size());

        return box;
    }

    [[nodiscard]] std::optional<keyhop::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const keyhop::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, keyhop::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        if (box.cipherText.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("aeadDecrypt: cipherText too large");
        }

        keyhop::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = keyhop::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        const int rc = crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8(associatedData).data(),
                                        associatedData.size(), box.cipherText.data(), box.cipherText.size());
        if (rc != 0)
        {
            keyhop::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<keyhop::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace keyhop::crypto::providers
