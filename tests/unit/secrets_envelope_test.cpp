#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "SecretsEnvelope.hpp"
#include "keyhop/security/SecureString.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

std::span<const std::byte> textBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

} // namespace

TEST(SecretsEnvelope, LayoutHasMagicAndFixedHeader)
{
    auto crypto{ keyhop::test_utils::makeDefaultCryptoProvider() };
    ASSERT_TRUE(crypto);
    const auto recipient{ crypto->generateKeyPair() };

    constexpr std::string_view kPlain{ "A=1\n" };
    const auto blob{ keyhop::core::detail::sealEnvelope(*crypto, recipient.publicKey, textBytes(kPlain)) };

    EXPECT_EQ(keyhop::core::detail::g_kEnvelopeHeaderBytes, 68U);
    ASSERT_EQ(blob.size(), 68U + kPlain.size());
    EXPECT_TRUE(std::equal(keyhop::core::detail::g_kEnvelopeMagic.begin(), keyhop::core::detail::g_kEnvelopeMagic.end(),
                           blob.begin()));
}

TEST(SecretsEnvelope, FreshEphemeralKeyPerSeal)
{
    auto crypto{ keyhop::test_utils::makeDefaultCryptoProvider() };
    ASSERT_TRUE(crypto);
    const auto recipient{ crypto->generateKeyPair() };

    const auto a{ keyhop::core::detail::sealEnvelope(*crypto, recipient.publicKey, textBytes("same")) };
    const auto b{ keyhop::core::detail::sealEnvelope(*crypto, recipient.publicKey, textBytes("same")) };
    EXPECT_FALSE(std::equal(a.begin() + 8, a.begin() + 40, b.begin() + 8));
}

TEST(SecretsEnvelope, OpensWithRecipientIdentity)
{
    auto crypto{ keyhop::test_utils::makeDefaultCryptoProvider() };
    ASSERT_TRUE(crypto);
    const auto recipient{ crypto->generateKeyPair() };
    const auto blob{ keyhop::core::detail::sealEnvelope(*crypto, recipient.publicKey, textBytes("K=V\n")) };

    const auto opened{ keyhop::core::detail::openEnvelope(*crypto, recipient.secretKey, blob) };
    ASSERT_TRUE(std::holds_alternative<keyhop::security::SecureBuffer>(opened));
    EXPECT_EQ(keyhop::security::asStringView(
                  keyhop::security::secureStringFrom(std::get<keyhop::security::SecureBuffer>(opened))),
              "K=V\n");
}

TEST(SecretsEnvelope, ShortInputsAreClassified)
{
    auto crypto{ keyhop::test_utils::makeDefaultCryptoProvider() };
    ASSERT_TRUE(crypto);
    const auto identity{ crypto->generateKeyPair() };

    const std::vector<std::uint8_t> empty{};
    const std::vector<std::uint8_t> partialMagic{ 'K', 'H', 'S' };
    const std::vector<std::uint8_t> magicOnly{ 'K', 'H', 'S', 'E', 'C', 'R', 'E', 'T' };
    const std::vector<std::uint8_t> junk{ 'n', 'o', 'p', 'e', '!', '!', '!', '!', '!' };

    const auto codeOf = [&](const std::vector<std::uint8_t>& blob) {
        const auto res{ keyhop::core::detail::openEnvelope(*crypto, identity.secretKey, blob) };
        EXPECT_TRUE(std::holds_alternative<keyhop::core::Error>(res));
        EXPECT_EQ(std::get<keyhop::core::Error>(res).kind, keyhop::core::ErrorKind::Crypto);
        return std::get<keyhop::core::Error>(res).code;
    };

    EXPECT_EQ(codeOf(empty), keyhop::core::ErrorCode::TruncatedEnvelope);
    EXPECT_EQ(codeOf(partialMagic), keyhop::core::ErrorCode::TruncatedEnvelope);
    EXPECT_EQ(codeOf(magicOnly), keyhop::core::ErrorCode::TruncatedEnvelope);
    EXPECT_EQ(codeOf(junk), keyhop::core::ErrorCode::NotAnEnvelope);
}
