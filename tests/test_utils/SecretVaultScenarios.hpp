#ifndef KEYHOP_TESTS_TEST_UTILS_SECRETVAULTSCENARIOS_HPP
#define KEYHOP_TESTS_TEST_UTILS_SECRETVAULTSCENARIOS_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/core/KeyRotator.hpp"
#include "keyhop/core/KeyStore.hpp"
#include "keyhop/core/SecretVault.hpp"
#include "keyhop/crypto/ICryptoProvider.hpp"
#include "keyhop/security/SecretBytes.hpp"
#include "keyhop/security/SecureString.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "test_utils/TestUtils.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Scenarios shared by the per-provider suites. Each one uses ASSERT_*, so callers wrap them
// in ASSERT_NO_FATAL_FAILURE.
namespace keyhop::test_utils
{

constexpr std::string_view g_samplePlainText{ "ANTHROPIC_AUTH_TOKEN=sk-ant-0001\nOPENAI_API_KEY=sk-proj-abc=def\n" };

struct VaultFixturePaths final
{
    std::filesystem::path keyPath;
    std::filesystem::path secretsPath;
};

[[nodiscard]] inline VaultFixturePaths vaultPaths(const std::filesystem::path& dir)
{
    return { dir / "keyhop.key", dir / "secrets.enc" };
}

inline void writeBytes(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes)
{
    keyhop::storage::writeFileAtomic(path, std::as_bytes(std::span{ bytes }));
}

inline void expectDecryptsTo(keyhop::core::SecretVault& vault, const VaultFixturePaths& paths,
                             std::string_view expected)
{
    const auto plain{ vault.decryptSecrets(paths.secretsPath, paths.keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::security::SecureString>(plain))
        << std::get<keyhop::core::Error>(plain).describe();
    EXPECT_EQ(keyhop::security::asStringView(std::get<keyhop::security::SecureString>(plain)), expected);
}

inline void runRoundTrip(keyhop::crypto::ICryptoProvider& crypto, std::string_view tempPrefix)
{
    const TempDir dir{ tempPrefix };
    ASSERT_FALSE(dir.path().empty()) << "failed to create temp dir";
    const auto paths{ vaultPaths(dir.path()) };

    keyhop::core::SecretVault vault{ crypto };
    const auto noKey{ vault.encryptSecrets(paths.secretsPath, paths.keyPath, g_samplePlainText) };
    ASSERT_TRUE(keyhop::core::isError(noKey));
    EXPECT_EQ(std::get<keyhop::core::Error>(noKey).code, keyhop::core::ErrorCode::NotFound);
    EXPECT_FALSE(std::filesystem::exists(paths.secretsPath));

    keyhop::core::KeyStore keys{ crypto };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(paths.keyPath)));

    ASSERT_FALSE(keyhop::core::isError(vault.encryptSecrets(paths.secretsPath, paths.keyPath, g_samplePlainText)));
    ASSERT_NO_FATAL_FAILURE(expectDecryptsTo(vault, paths, g_samplePlainText));

    // Empty payloads are valid and produce a header-only envelope.
    ASSERT_FALSE(keyhop::core::isError(vault.encryptSecrets(paths.secretsPath, paths.keyPath, "")));
    ASSERT_NO_FATAL_FAILURE(expectDecryptsTo(vault, paths, ""));
    EXPECT_EQ(std::filesystem::file_size(paths.secretsPath), 68U);

    auto bytes{ vault.decryptSecretsBytes(paths.secretsPath, paths.keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::security::SecretBytes>(bytes));
    auto& secret{ std::get<keyhop::security::SecretBytes>(bytes) };
    EXPECT_TRUE(secret.empty());
    secret.close();
    EXPECT_TRUE(secret.closed());

#if !defined(_WIN32)
    EXPECT_EQ(keyhop::storage::filePermissions(paths.secretsPath), keyhop::storage::g_privateFilePerms);
#endif
}

inline void runTamperDetection(keyhop::crypto::ICryptoProvider& crypto, std::string_view tempPrefix)
{
    const TempDir dir{ tempPrefix };
    ASSERT_FALSE(dir.path().empty()) << "failed to create temp dir";
    const auto paths{ vaultPaths(dir.path()) };

    keyhop::core::KeyStore keys{ crypto };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(paths.keyPath)));
    keyhop::core::SecretVault vault{ crypto };
    ASSERT_FALSE(keyhop::core::isError(vault.encryptSecrets(paths.secretsPath, paths.keyPath, g_samplePlainText)));

    const auto original{ keyhop::storage::readBinaryFile(paths.secretsPath) };
    ASSERT_GT(original.size(), 68U);

    // One position in each envelope field: magic, ephemeral key, nonce, tag, ciphertext.
    const std::vector<std::size_t> positions{ 0U, 8U, 39U, 40U, 52U, 67U, 68U, original.size() - 1U };
    for (const std::size_t pos : positions)
    {
        auto tampered{ original };
        tampered[pos] ^= 0x01U;
        writeBytes(paths.secretsPath, tampered);

        const auto res{ vault.decryptSecrets(paths.secretsPath, paths.keyPath) };
        ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(res)) << "flip at " << pos << " went unnoticed";
        const auto& err{ std::get<keyhop::core::Error>(res) };
        EXPECT_EQ(err.kind, keyhop::core::ErrorKind::Crypto) << "flip at " << pos;
        if (pos < 8U)
        {
            EXPECT_EQ(err.code, keyhop::core::ErrorCode::NotAnEnvelope);
        }
        EXPECT_FALSE(err.hint().empty());
    }

    auto half{ original };
    half.resize(original.size() / 2U);
    writeBytes(paths.secretsPath, half);
    const auto truncated{ vault.decryptSecrets(paths.secretsPath, paths.keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(truncated));
    EXPECT_EQ(std::get<keyhop::core::Error>(truncated).kind, keyhop::core::ErrorKind::Crypto);

    // A foreign key opens nothing.
    const auto otherKey{ dir.path() / "other.key" };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(otherKey)));
    writeBytes(paths.secretsPath, original);
    const auto foreign{ vault.decryptSecrets(paths.secretsPath, otherKey) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(foreign));
    EXPECT_EQ(std::get<keyhop::core::Error>(foreign).code, keyhop::core::ErrorCode::AuthenticationFailed);
}

inline void runKeyFileFormats(keyhop::crypto::ICryptoProvider& crypto, std::string_view tempPrefix)
{
    const TempDir dir{ tempPrefix };
    ASSERT_FALSE(dir.path().empty()) << "failed to create temp dir";
    keyhop::core::KeyStore keys{ crypto };

    const auto empty{ dir.path() / "empty.key" };
    writeTextFile(empty, "");
    const auto emptyRes{ keys.loadRecipient(empty) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(emptyRes));
    EXPECT_EQ(std::get<keyhop::core::Error>(emptyRes).kind, keyhop::core::ErrorKind::Format);
    EXPECT_EQ(std::get<keyhop::core::Error>(emptyRes).code, keyhop::core::ErrorCode::KeyFileEmpty);
    const auto emptyIdentity{ keys.loadIdentity(empty) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(emptyIdentity));
    EXPECT_EQ(std::get<keyhop::core::Error>(emptyIdentity).code, keyhop::core::ErrorCode::KeyFileEmpty);

    const auto good{ dir.path() / "good.key" };
    ASSERT_FALSE(keyhop::core::isError(keys.generateKeyFile(good)));
    const auto content{ readTextFile(good) };
    const auto firstLine{ content.substr(0, content.find('\n') + 1U) };

    const auto oneLine{ dir.path() / "one-line.key" };
    writeTextFile(oneLine, firstLine);
    const auto oneLineRes{ keys.loadRecipient(oneLine) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(oneLineRes));
    EXPECT_EQ(std::get<keyhop::core::Error>(oneLineRes).kind, keyhop::core::ErrorKind::Format);
    EXPECT_EQ(std::get<keyhop::core::Error>(oneLineRes).code, keyhop::core::ErrorCode::KeyFileMissingRecipient);
    const auto oneLineIdentity{ keys.loadIdentity(oneLine) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(oneLineIdentity));
    EXPECT_EQ(std::get<keyhop::core::Error>(oneLineIdentity).kind, keyhop::core::ErrorKind::Format);
    EXPECT_EQ(std::get<keyhop::core::Error>(oneLineIdentity).code,
              keyhop::core::ErrorCode::KeyFileMissingRecipient);
    EXPECT_TRUE(std::holds_alternative<keyhop::core::KeyPair>(keys.loadKeyPair(good)));

    // A blob sealed for the full key must not open through the truncated copy.
    const auto secretsPath{ dir.path() / "secrets.enc" };
    keyhop::core::SecretVault vault{ crypto };
    ASSERT_FALSE(keyhop::core::isError(vault.encryptSecrets(secretsPath, good, g_samplePlainText)));
    const auto viaOneLine{ vault.decryptSecrets(secretsPath, oneLine) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::Error>(viaOneLine));
    EXPECT_EQ(std::get<keyhop::core::Error>(viaOneLine).code, keyhop::core::ErrorCode::KeyFileMissingRecipient);
}

inline void runRotationPreservesSecrets(keyhop::crypto::ICryptoProvider& crypto, std::string_view tempPrefix)
{
    const TempDir dir{ tempPrefix };
    ASSERT_FALSE(dir.path().empty()) << "failed to create temp dir";
    const auto paths{ vaultPaths(dir.path()) };

    keyhop::core::KeyStore keys{ crypto };
    const auto before{ keys.generateKeyFile(paths.keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::crypto::PublicKey>(before));
    keyhop::core::SecretVault vault{ crypto };
    ASSERT_FALSE(keyhop::core::isError(vault.encryptSecrets(paths.secretsPath, paths.keyPath, g_samplePlainText)));

    keyhop::core::KeyRotator rotator{ crypto };
    const keyhop::core::RotationPaths rotation{ paths.keyPath, paths.secretsPath };
    const auto outcome{ rotator.rotate(rotation) };
    ASSERT_TRUE(std::holds_alternative<keyhop::core::RotationOutcome>(outcome))
        << std::get<keyhop::core::Error>(outcome).describe();
    EXPECT_EQ(std::get<keyhop::core::RotationOutcome>(outcome), keyhop::core::RotationOutcome::Reencrypted);
    EXPECT_EQ(rotator.state(), keyhop::core::RotationState::Done);

    const auto after{ keys.loadRecipient(paths.keyPath) };
    ASSERT_TRUE(std::holds_alternative<keyhop::crypto::PublicKey>(after));
    EXPECT_NE(std::get<keyhop::crypto::PublicKey>(after), std::get<keyhop::crypto::PublicKey>(before));
    EXPECT_FALSE(std::filesystem::exists(rotation.backupPath()));
    ASSERT_NO_FATAL_FAILURE(expectDecryptsTo(vault, paths, g_samplePlainText));
}

} // namespace keyhop::test_utils

#endif // KEYHOP_TESTS_TEST_UTILS_SECRETVAULTSCENARIOS_HPP
