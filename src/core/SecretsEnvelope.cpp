#include "SecretsEnvelope.hpp"
#include "keyhop/core/ErrorMapping.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include <algorithm>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace keyhop::core::detail
{
namespace
{

constexpr std::size_t g_kEphemeralOffset{ g_kEnvelopeMagic.size() };
constexpr std::size_t g_kNonceOffset{ g_kEphemeralOffset + keyhop::crypto::g_x25519KeyBytes };
constexpr std::size_t g_kTagOffset{ g_kNonceOffset + keyhop::crypto::g_aeadNonceBytes };
constexpr std::size_t g_kCipherTextOffset{ g_kTagOffset + keyhop::crypto::g_aeadTagBytes };

[[nodiscard]] std::vector<std::byte> keyContext(std::span<const std::uint8_t> ephemeral,
                                                std::span<const std::uint8_t> recipient)
{
    std::vector<std::byte> out{};
    out.reserve(g_kEnvelopeKeyLabel.size() + ephemeral.size() + recipient.size());
    for (const char c : g_kEnvelopeKeyLabel)
    {
        out.push_back(static_cast<std::byte>(c));
    }
    for (const std::uint8_t b : ephemeral)
    {
        out.push_back(static_cast<std::byte>(b));
    }
    for (const std::uint8_t b : recipient)
    {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

[[nodiscard]] std::vector<std::byte> associatedData(std::span<const std::uint8_t> ephemeral,
                                                    std::span<const std::uint8_t> recipient)
{
    std::vector<std::byte> out{};
    out.reserve(g_kEnvelopeMagic.size() + ephemeral.size() + recipient.size());
    for (const std::uint8_t b : g_kEnvelopeMagic)
    {
        out.push_back(static_cast<std::byte>(b));
    }
    for (const std::uint8_t b : ephemeral)
    {
        out.push_back(static_cast<std::byte>(b));
    }
    for (const std::uint8_t b : recipient)
    {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

[[nodiscard]] keyhop::security::SecureBuffer payloadKey(keyhop::crypto::ICryptoProvider& crypto,
                                                        std::span<const std::uint8_t> secretKey,
                                                        const keyhop::crypto::PublicKey& peer,
                                                        const keyhop::crypto::PublicKey& ephemeral,
                                                        const keyhop::crypto::PublicKey& recipient)
{
    auto shared{ crypto.keyAgreement(secretKey, peer) };
    auto wipeShared{ keyhop::security::scopeWipe(shared) };
    const auto context{ keyContext(ephemeral, recipient) };
    return crypto.deriveSubkey(shared, context, keyhop::crypto::g_aeadKeyBytes);
}

[[nodiscard]] Error envelopeError(ErrorCode code, std::string message)
{
    return Error{ ErrorKind::Crypto, code, std::move(message) };
}

} // namespace

std::vector<std::uint8_t> sealEnvelope(keyhop::crypto::ICryptoProvider& crypto,
                                       const keyhop::crypto::PublicKey& recipient,
                                       std::span<const std::byte> plainText)
{
    auto ephemeral{ crypto.generateKeyPair() };
    auto wipeEphemeral{ keyhop::security::scopeWipe(ephemeral.secretKey) };

    auto key{ payloadKey(crypto, ephemeral.secretKey, recipient, ephemeral.publicKey, recipient) };
    auto wipeKey{ keyhop::security::scopeWipe(key) };

    const auto ad{ associatedData(ephemeral.publicKey, recipient) };
    const auto box{ crypto.aeadEncrypt(key, plainText, ad) };

    std::vector<std::uint8_t> out{};
    out.reserve(g_kEnvelopeHeaderBytes + box.cipherText.size());
    out.insert(out.end(), g_kEnvelopeMagic.begin(), g_kEnvelopeMagic.end());
    out.insert(out.end(), ephemeral.publicKey.begin(), ephemeral.publicKey.end());
    out.insert(out.end(), box.nonce.begin(), box.nonce.end());
    out.insert(out.end(), box.tag.begin(), box.tag.end());
    out.insert(out.end(), box.cipherText.begin(), box.cipherText.end());
    return out;
}

Result<keyhop::security::SecureBuffer> openEnvelope(keyhop::crypto::ICryptoProvider& crypto,
                                                    std::span<const std::uint8_t> identity,
                                                    std::span<const std::uint8_t> envelope) noexcept
{
    try
    {
        if (envelope.size() < g_kEnvelopeMagic.size() ||
            !std::equal(g_kEnvelopeMagic.begin(), g_kEnvelopeMagic.end(), envelope.begin()))
        {
            if (envelope.size() < g_kEnvelopeMagic.size() &&
                std::equal(envelope.begin(), envelope.end(), g_kEnvelopeMagic.begin()))
            {
                return envelopeError(ErrorCode::TruncatedEnvelope, "secrets file is truncated");
            }
            return envelopeError(ErrorCode::NotAnEnvelope, "secrets file is not a keyhop envelope");
        }
        if (envelope.size() < g_kEnvelopeHeaderBytes)
        {
            return envelopeError(ErrorCode::TruncatedEnvelope, "secrets file is truncated");
        }

        keyhop::crypto::PublicKey ephemeral{};
        std::copy_n(envelope.begin() + static_cast<std::ptrdiff_t>(g_kEphemeralOffset), ephemeral.size(),
                    ephemeral.begin());

        keyhop::crypto::AeadBox box{};
        std::copy_n(envelope.begin() + static_cast<std::ptrdiff_t>(g_kNonceOffset), box.nonce.size(),
                    box.nonce.begin());
        std::copy_n(envelope.begin() + static_cast<std::ptrdiff_t>(g_kTagOffset), box.tag.size(), box.tag.begin());
        box.cipherText.assign(envelope.begin() + static_cast<std::ptrdiff_t>(g_kCipherTextOffset), envelope.end());

        const auto recipient{ crypto.derivePublicKey(identity) };

        keyhop::security::SecureBuffer key{};
        try
        {
            key = payloadKey(crypto, identity, ephemeral, ephemeral, recipient);
        }
        catch (const std::runtime_error&)
        {
            // A low-order ephemeral key can only come from a forged envelope.
            return envelopeError(ErrorCode::AuthenticationFailed, "secrets envelope failed authentication");
        }
        auto wipeKey{ keyhop::security::scopeWipe(key) };

        const auto ad{ associatedData(ephemeral, recipient) };
        auto plain{ crypto.aeadDecrypt(key, box, ad) };
        if (!plain)
        {
            return envelopeError(ErrorCode::AuthenticationFailed, "secrets envelope failed authentication");
        }
        return std::move(*plain);
    }
    catch (const std::exception& e)
    {
        return cryptoBackendError(e.what());
    }
}

} // namespace keyhop::core::detail
