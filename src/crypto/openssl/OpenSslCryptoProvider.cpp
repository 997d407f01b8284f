#include "keyhop/crypto/providers/ProviderFactory.hpp"
#include "keyhop/security/SecureBuffer.hpp"
#include "keyhop/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace keyhop::crypto::providers
{
namespace
{

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

EvpMacPtr fetchBlake2bMac()
{
    // OpenSSL MAC algorithm names are string-based. Try common variants.
    constexpr std::array<const char*, 2> kNames{ "BLAKE2BMAC", "BLAKE2B-MAC" };
    for (const char* name : kNames)
    {
        if (EVP_MAC * mac{ EVP_MAC_fetch(nullptr, name, nullptr) }; mac != nullptr)
        {
            return EvpMacPtr{ mac, &EVP_MAC_free };
        }
    }
    return EvpMacPtr{ nullptr, &EVP_MAC_free };
}

EvpPkeyPtr x25519PrivateKey(std::span<const std::uint8_t> secretKey)
{
    EvpPkeyPtr key{ EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, secretKey.data(), secretKey.size()),
                    &EVP_PKEY_free };
    if (!key)
    {
        throw std::runtime_error("x25519: EVP_PKEY_new_raw_private_key failed");
    }
    return key;
}

keyhop::crypto::PublicKey rawPublicKey(const EVP_PKEY* key)
{
    keyhop::crypto::PublicKey publicKey{};
    std::size_t len{ publicKey.size() };
    if (EVP_PKEY_get_raw_public_key(key, publicKey.data(), &len) != 1 || len != publicKey.size())
    {
        throw std::runtime_error("x25519: EVP_PKEY_get_raw_public_key failed");
    }
    return publicKey;
}

class OpenSslCryptoProvider final : public keyhop::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_blake2bMac{ fetchBlake2bMac() }
    {
        if (!m_blake2bMac)
        {
            throw std::runtime_error("OpenSslCryptoProvider: BLAKE2BMAC not available");
        }
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "openssl";
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return keyhop::security::secureRandomFill(out);
    }

    [[nodiscard]] keyhop::crypto::X25519KeyPair generateKeyPair() override
    {
        EvpPkeyCtxPtr ctx{ EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr), &EVP_PKEY_CTX_free };
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1)
        {
            throw std::runtime_error("generateKeyPair: EVP_PKEY_keygen_init failed");
        }

        EVP_PKEY* raw{ nullptr };
        if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr)
        {
            throw std::runtime_error("generateKeyPair: EVP_PKEY_keygen failed");
        }
        const EvpPkeyPtr key{ raw, &EVP_PKEY_free };

        keyhop::crypto::X25519KeyPair pair{};
        pair.secretKey.resize(keyhop::crypto::g_x25519KeyBytes);
        std::size_t len{ pair.secretKey.size() };
        if (EVP_PKEY_get_raw_private_key(key.get(), pair.secretKey.data(), &len) != 1 || len != pair.secretKey.size())
        {
            keyhop::security::secureRelease(pair.secretKey);
            throw std::runtime_error("generateKeyPair: EVP_PKEY_get_raw_private_key failed");
        }
        pair.publicKey = rawPublicKey(key.get());
        return pair;
    }

    [[nodiscard]] keyhop::crypto::PublicKey derivePublicKey(std::span<const std::uint8_t> secretKey) const override
    {
        requireExactSize(secretKey, keyhop::crypto::g_x25519KeyBytes, "derivePublicKey: secretKey");
        const auto key{ x25519PrivateKey(secretKey) };
        return rawPublicKey(key.get());
    }

    [[nodiscard]] keyhop::security::SecureBuffer keyAgreement(std::span<const std::uint8_t> secretKey,
                                                              std::span<const std::uint8_t> peerPublicKey) const override
    {
        requireExactSize(secretKey, keyhop::crypto::g_x25519KeyBytes, "keyAgreement: secretKey");
        requireExactSize(peerPublicKey, keyhop::crypto::g_x25519KeyBytes, "keyAgreement: peerPublicKey");

        const auto ours{ x25519PrivateKey(secretKey) };
        const EvpPkeyPtr peer{ EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, peerPublicKey.data(),
                                                           peerPublicKey.size()),
                               &EVP_PKEY_free };
        if (!peer)
        {
            throw std::runtime_error("keyAgreement: EVP_PKEY_new_raw_public_key failed");
        }

        EvpPkeyCtxPtr ctx{ EVP_PKEY_CTX_new(ours.get(), nullptr), &EVP_PKEY_CTX_free };
        if (!ctx || EVP_PKEY_derive_init(ctx.get()) != 1)
        {
            throw std::runtime_error("keyAgreement: EVP_PKEY_derive_init failed");
        }
        // OpenSSL rejects an all-zero shared secret here, which covers low-order peer keys.
        if (EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) != 1)
        {
            throw std::runtime_error("keyAgreement: EVP_PKEY_derive_set_peer failed");
        }

        keyhop::security::SecureBuffer shared{};
        shared.resize(keyhop::crypto::g_x25519KeyBytes);
        std::size_t len{ shared.size() };
        if (EVP_PKEY_derive(ctx.get(), shared.data(), &len) != 1 || len != shared.size())
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

        EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(m_blake2bMac.get()), &EVP_MAC_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveSubkey: EVP_MAC_CTX_new failed");
        }

        std::size_t outSize{ outBytes };
        OSSL_PARAM params[]{
            OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &outSize),
            OSSL_PARAM_construct_end(),
        };

        if (EVP_MAC_init(ctx.get(), inputKey.data(), inputKey.size(), params) != 1)
        {
            throw std::runtime_error("deriveSubkey: EVP_MAC_init failed");
        }

        const auto* msg{ reinterpret_cast<const unsigned char*>(context.data()) };
        if (EVP_MAC_update(ctx.get(), msg, context.size()) != 1)
        {
            throw std::runtime_error("deriveSubkey: EVP_MAC_update failed");
        }

        keyhop::security::SecureBuffer out{};
        out.resize(outBytes);
        std::size_t written{ out.size() };
        if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
        {
            keyhop::security::secureRelease(out);
            throw std::runtime_error("deriveSubkey: EVP_MAC_final failed");
        }

        return out;
    }

    [[nodiscard]] keyhop::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                      std::span<const std::byte> plainText,
                                                      std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, keyhop::crypto::g_aeadKeyBytes, "aeadEncrypt: key");
        if (plainText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadEncrypt: plainText too large");
        }
        if (associatedData.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadEncrypt: associatedData too large");
        }

        keyhop::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }

        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: add aad failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        if (!plainText.empty())
        {
            const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
            if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, ptPtr,
                                  static_cast<int>(plainText.size())) != 1)
            {
                throw std::runtime_error("aeadEncrypt: encrypt update failed");
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        box.cipherText.resize(static_cast<std::size_t>(outLen));

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }

        return box;
    }

    [[nodiscard]] std::optional<keyhop::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const keyhop::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, keyhop::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        if (associatedData.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadDecrypt: associatedData too large");
        }
        if (box.cipherText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadDecrypt: cipherText too large");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }

        if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadDecrypt: add aad failed");
        }

        keyhop::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        int outLen{ 0 };
        if (!box.cipherText.empty() && EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                                                         static_cast<int>(box.cipherText.size())) != 1)
        {
            keyhop::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            keyhop::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, keyhop::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 16> finalScratch{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            keyhop::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(static_cast<std::size_t>(outLen));

        return plainText;
    }

private:
    EvpMacPtr m_blake2bMac{ nullptr, &EVP_MAC_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<keyhop::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace keyhop::crypto::providers
