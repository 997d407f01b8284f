#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <variant>

#include "KeyLines.hpp"
#include "keyhop/core/KeyStore.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

struct KeyStoreFixture
{
    std::unique_ptr<keyhop::crypto::ICryptoProvider> crypto{ keyhop::test_utils::makeDefaultCryptoProvider() };
    keyhop::test_utils::TempDir dir{ "key_store_" };
};

std::string lineAt(const std::string& content, std::size_t index)
{
    std::size_t start{ 0U };
    for (std::size_t i{}; i < index; ++i)
    {
        start = content.find('\n', start) + 1U;
    }
    return content.substr(start, content.find('\n', start) - start);
}

} // namespace

TEST(KeyStore, GeneratedFileHasTwoPrefixedLines)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    ASSERT_FALSE(f.dir.path().empty());
    keyhop::core::KeyStore keys{ *f.crypto };

    const auto keyPath{ f.dir.path() / "keyhop.key" };
    const auto recipient{ keys.generateKeyFile(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::crypto::PublicKey>(recipient));

    const auto content{ keyhop::test_utils::readTextFile(keyPath) };
    const auto identityLine{ lineAt(content, 0U) };
    const auto recipientLine{ lineAt(content, 1U) };
    EXPECT_TRUE(identityLine.starts_with("KEYHOP-SECRET-KEY-"));
    EXPECT_EQ(identityLine.size(), 18U + 64U);
    EXPECT_TRUE(recipientLine.starts_with("keyhop1"));
    EXPECT_EQ(recipientLine.size(), 7U + 64U);
    EXPECT_EQ(content.back(), '\n');
    EXPECT_EQ(recipientLine, keyhop::core::detail::encodeRecipientLine(std::get<keyhop::crypto::PublicKey>(recipient)));

#if !defined(_WIN32)
    EXPECT_EQ(keyhop::storage::filePermissions(keyPath), keyhop::storage::g_privateFilePerms);
#endif
}

TEST(KeyStore, LoadsKeyPairThatMatches)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto keyPath{ f.dir.path() / "keyhop.key" };
    const auto recipient{ keys.generateKeyFile(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::crypto::PublicKey>(recipient));

    const auto pair{ keys.loadKeyPair(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::KeyPair>(pair));
    EXPECT_EQ(std::get<keyhop::core::KeyPair>(pair).recipient, std::get<keyhop::crypto::PublicKey>(recipient));
    EXPECT_EQ(std::get<keyhop::core::KeyPair>(pair).identity.size(), keyhop::crypto::g_x25519KeyBytes);
}

TEST(KeyStore, AcceptsCrlfLineEndings)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto keyPath{ f.dir.path() / "keyhop.key" };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(keyPath)));

    const auto content{ keyhop::test_utils::readTextFile(keyPath) };
    keyhop::test_utils::writeTextFile(keyPath, lineAt(content, 0U) + "\r\n" + lineAt(content, 1U) + "\r\n");
    EXPECT_TRUE(std::holds_alternative<keyhop::core::KeyPair>(keys.loadKeyPair(keyPath)));
}

TEST(KeyStore, IdentityOnlyFileIsRejectedForBothHalves)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto keyPath{ f.dir.path() / "keyhop.key" };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(keyPath)));

    const auto content{ keyhop::test_utils::readTextFile(keyPath) };
    keyhop::test_utils::writeTextFile(keyPath, lineAt(content, 0U) + "\n");

    const auto identity{ keys.loadIdentity(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(identity));
    EXPECT_EQ(std::get<keyhop::core::Error>(identity).kind, keyhop::core::ErrorKind::Format);
    EXPECT_EQ(std::get<keyhop::core::Error>(identity).code, keyhop::core::ErrorCode::KeyFileMissingRecipient);

    const auto recipient{ keys.loadRecipient(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(recipient));
    EXPECT_EQ(std::get<keyhop::core::Error>(recipient).code, keyhop::core::ErrorCode::KeyFileMissingRecipient);
}

TEST(KeyStore, CorruptedLinesAreFormatErrors)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto keyPath{ f.dir.path() / "keyhop.key" };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(keyPath)));
    const auto content{ keyhop::test_utils::readTextFile(keyPath) };

    auto identity{ lineAt(content, 0U) };
    identity.replace(18U, 1U, "z");
    keyhop::test_utils::writeTextFile(keyPath, identity + "\n" + lineAt(content, 1U) + "\n");
    const auto badIdentity{ keys.loadIdentity(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(badIdentity));
    EXPECT_EQ(std::get<keyhop::core::Error>(badIdentity).code, keyhop::core::ErrorCode::KeyFileCorrupted);
    EXPECT_EQ(std::get<keyhop::core::Error>(badIdentity).kind, keyhop::core::ErrorKind::Format);

    keyhop::test_utils::writeTextFile(keyPath, lineAt(content, 0U) + "\nkeyhop1short\n");
    const auto badRecipient{ keys.loadRecipient(keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(badRecipient));
    EXPECT_EQ(std::get<keyhop::core::Error>(badRecipient).code, keyhop::core::ErrorCode::KeyFileCorrupted);
}

TEST(KeyStore, MismatchedRecipientIsDetected)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto a{ f.dir.path() / "a.key" };
    const auto b{ f.dir.path() / "b.key" };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(a)));
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(b)));

    const auto mixed{ f.dir.path() / "mixed.key" };
    keyhop::test_utils::writeTextFile(mixed, lineAt(keyhop::test_utils::readTextFile(a), 0U) + "\n" +
                                                 lineAt(keyhop::test_utils::readTextFile(b), 1U) + "\n");
    const auto pair{ keys.loadKeyPair(mixed) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(pair));
    EXPECT_EQ(std::get<keyhop::core::Error>(pair).code, keyhop::core::ErrorCode::KeyPairMismatch);
    EXPECT_FALSE(std::get<keyhop::core::Error>(pair).hint().empty());
}

TEST(KeyStore, MissingFileIsNotFoundWithHint)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto res{ keys.loadRecipient(f.dir.path() / "absent.key") };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(res));
    const auto& err{ std::get<keyhop::core::Error>(res) };
    EXPECT_EQ(err.kind, keyhop::core::ErrorKind::Storage);
    EXPECT_EQ(err.code, keyhop::core::ErrorCode::NotFound);
    EXPECT_NE(err.hint().find("keyhop init"), std::string_view::npos);
}

TEST(KeyStore, EnsureKeyExistsCreatesOnceAndNeverReplaces)
{
    KeyStoreFixture f{};
    ASSERT_TRUE(f.crypto);
    keyhop::core::KeyStore keys{ *f.crypto };
    const auto configDir{ f.dir.path() / "nested" / "config" };

    const auto first{ keys.ensureKeyExists(configDir) };
    ASSERT_TRUE(std::holds_alternative<bool>(first));
    EXPECT_TRUE(std::get<bool>(first));
    const auto keyPath{ keyhop::core::KeyStore::keyPathFor(configDir) };
    EXPECT_EQ(keyPath, configDir / "keyhop.key");
    const auto content{ keyhop::test_utils::readTextFile(keyPath) };

    const auto second{ keys.ensureKeyExists(configDir) };
    ASSERT_TRUE(std::holds_alternative<bool>(second));
    EXPECT_FALSE(std::get<bool>(second));
    EXPECT_EQ(keyhop::test_utils::readTextFile(keyPath), content);
}

TEST(KeyLines, RecipientDecodeRejectsUppercase)
{
    keyhop::crypto::PublicKey key{};
    key[0] = 0xAB;
    const auto line{ keyhop::core::detail::encodeRecipientLine(key) };
    EXPECT_TRUE(keyhop::core::detail::decodeRecipientLine(line).has_value());

    auto upper{ line };
    upper[7] = 'A';
    EXPECT_FALSE(keyhop::core::detail::decodeRecipientLine(upper).has_value());
}
