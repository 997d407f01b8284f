#include "keyhop/core/KeyStore.hpp"
#include "keyhop/core/ErrorMapping.hpp"
#include "KeyLines.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include "keyhop/security/SecureEquals.hpp"
#include "keyhop/security/SecureString.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace keyhop::core
{
namespace
{

constexpr std::string_view g_kHintLayout{ "key file should contain identity and recipient lines" };
constexpr std::string_view g_kHintCorrupted{ "key file may be corrupted or malformed" };
constexpr std::string_view g_kHintMismatch{ "recipient line does not belong to the identity; restore the key file from a backup" };
constexpr std::string_view g_kHintRegenerate{ "run `keyhop init` to create a key, or restore it from a backup" };

struct KeyFileLines final
{
    std::string_view identity;
    std::string_view recipient;
};

[[nodiscard]] Error formatError(ErrorCode code, std::string message, const std::filesystem::path& keyPath,
                                std::string_view hint)
{
    Error err{ ErrorKind::Format, code, std::move(message) };
    err.withContext(g_contextPath, keyPath.string());
    if (!hint.empty())
    {
        err.withContext(g_contextHint, std::string{ hint });
    }
    return err;
}

[[nodiscard]] Result<keyhop::security::SecureString> readKeyFile(const std::filesystem::path& keyPath) noexcept
{
    try
    {
        return keyhop::storage::readSecureFile(keyPath);
    }
    catch (const keyhop::storage::FileNotFound& e)
    {
        return detail::storageError(e, g_kHintRegenerate);
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return detail::storageError(e);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory reading key file" }.withContext(
            g_contextPath, keyPath.string());
    }
}

// Views point into `content`. Line 1 is the identity and line 2 the recipient.
[[nodiscard]] Result<KeyFileLines> splitKeyFile(std::string_view content, const std::filesystem::path& keyPath)
{
    const auto firstEnd{ content.find('\n') };
    const auto first{ detail::trimCarriageReturn(content.substr(0, firstEnd)) };
    if (first.empty())
    {
        return formatError(ErrorCode::KeyFileEmpty, "key file is empty", keyPath, g_kHintRegenerate);
    }
    if (firstEnd == std::string_view::npos)
    {
        return formatError(ErrorCode::KeyFileMissingRecipient, "key file is missing recipient line", keyPath,
                           g_kHintLayout);
    }

    const auto rest{ content.substr(firstEnd + 1U) };
    const auto second{ detail::trimCarriageReturn(rest.substr(0, rest.find('\n'))) };
    if (second.empty())
    {
        return formatError(ErrorCode::KeyFileMissingRecipient, "key file is missing recipient line", keyPath,
                           g_kHintLayout);
    }
    return KeyFileLines{ first, second };
}

[[nodiscard]] Result<keyhop::security::SecureBuffer> parseIdentity(std::string_view line,
                                                                   const std::filesystem::path& keyPath)
{
    keyhop::security::SecureBuffer identity{};
    identity.resize(keyhop::crypto::g_x25519KeyBytes);
    if (!detail::decodeIdentityLine(line, identity))
    {
        keyhop::security::secureRelease(identity);
        return formatError(ErrorCode::KeyFileCorrupted, "failed to parse identity from key file", keyPath,
                           g_kHintCorrupted);
    }
    return identity;
}

[[nodiscard]] Result<keyhop::crypto::PublicKey> parseRecipient(std::string_view line,
                                                               const std::filesystem::path& keyPath)
{
    const auto recipient{ detail::decodeRecipientLine(line) };
    if (!recipient)
    {
        return formatError(ErrorCode::KeyFileCorrupted, "failed to parse recipient from key file", keyPath,
                           g_kHintCorrupted);
    }
    return *recipient;
}

[[nodiscard]] keyhop::security::SecureString encodeKeyFile(const keyhop::crypto::X25519KeyPair& pair)
{
    auto content{ detail::encodeIdentityLine(pair.secretKey) };
    content.push_back('\n');
    keyhop::security::secureAppend(content, detail::encodeRecipientLine(pair.publicKey));
    content.push_back('\n');
    return content;
}

[[nodiscard]] Error generationError(const std::exception& e, const std::filesystem::path& keyPath)
{
    return Error{ ErrorKind::Crypto, ErrorCode::RandomFailed, std::string{ "key generation failed: " } + e.what() }
        .withContext(g_contextPath, keyPath.string());
}

} // namespace

KeyStore::KeyStore(keyhop::crypto::ICryptoProvider& crypto) noexcept : m_crypto(crypto)
{
}

std::filesystem::path KeyStore::keyPathFor(const std::filesystem::path& configDir, std::string_view keyFileName)
{
    return configDir / std::filesystem::path{ keyFileName };
}

Result<keyhop::crypto::PublicKey> KeyStore::generateKeyFile(const std::filesystem::path& keyPath) noexcept
{
    try
    {
        const auto pair{ m_crypto.generateKeyPair() };
        auto content{ encodeKeyFile(pair) };
        auto wipeContent{ keyhop::security::scopeWipe(content) };
        keyhop::storage::writeFileAtomic(keyPath, keyhop::security::asBytes(content));
        keyhop::log::Registry::keystore()->info("wrote key file {}", keyPath.string());
        return pair.publicKey;
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return detail::storageError(e);
    }
    catch (const std::runtime_error& e)
    {
        return generationError(e, keyPath);
    }
    catch (const std::exception& e)
    {
        return detail::cryptoBackendError(e.what()).withContext(g_contextPath, keyPath.string());
    }
}

Result<keyhop::security::SecureBuffer> KeyStore::loadIdentity(const std::filesystem::path& keyPath) const noexcept
{
    auto content{ readKeyFile(keyPath) };
    if (auto* err{ std::get_if<Error>(&content) })
    {
        return std::move(*err);
    }
    auto& text{ std::get<keyhop::security::SecureString>(content) };
    auto wipeText{ keyhop::security::scopeWipe(text) };

    try
    {
        auto lines{ splitKeyFile(keyhop::security::asStringView(text), keyPath) };
        if (auto* err{ std::get_if<Error>(&lines) })
        {
            return std::move(*err);
        }
        return parseIdentity(std::get<KeyFileLines>(lines).identity, keyPath);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory parsing key file" };
    }
}

Result<keyhop::crypto::PublicKey> KeyStore::loadRecipient(const std::filesystem::path& keyPath) const noexcept
{
    auto content{ readKeyFile(keyPath) };
    if (auto* err{ std::get_if<Error>(&content) })
    {
        return std::move(*err);
    }
    auto& text{ std::get<keyhop::security::SecureString>(content) };
    auto wipeText{ keyhop::security::scopeWipe(text) };

    try
    {
        auto lines{ splitKeyFile(keyhop::security::asStringView(text), keyPath) };
        if (auto* err{ std::get_if<Error>(&lines) })
        {
            return std::move(*err);
        }
        return parseRecipient(std::get<KeyFileLines>(lines).recipient, keyPath);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory parsing key file" };
    }
}

Result<KeyPair> KeyStore::loadKeyPair(const std::filesystem::path& keyPath) const noexcept
{
    auto content{ readKeyFile(keyPath) };
    if (auto* err{ std::get_if<Error>(&content) })
    {
        return std::move(*err);
    }
    auto& text{ std::get<keyhop::security::SecureString>(content) };
    auto wipeText{ keyhop::security::scopeWipe(text) };

    try
    {
        auto lines{ splitKeyFile(keyhop::security::asStringView(text), keyPath) };
        if (auto* err{ std::get_if<Error>(&lines) })
        {
            return std::move(*err);
        }
        const auto& parts{ std::get<KeyFileLines>(lines) };

        auto identity{ parseIdentity(parts.identity, keyPath) };
        if (auto* err{ std::get_if<Error>(&identity) })
        {
            return std::move(*err);
        }
        auto recipient{ parseRecipient(parts.recipient, keyPath) };
        if (auto* err{ std::get_if<Error>(&recipient) })
        {
            return std::move(*err);
        }

        KeyPair pair{};
        pair.identity = std::move(std::get<keyhop::security::SecureBuffer>(identity));
        pair.recipient = std::get<keyhop::crypto::PublicKey>(recipient);

        const auto derived{ m_crypto.derivePublicKey(pair.identity) };
        if (!keyhop::security::secureEquals(derived, pair.recipient))
        {
            keyhop::security::secureRelease(pair.identity);
            return formatError(ErrorCode::KeyPairMismatch, "key file recipient does not match its identity", keyPath,
                               g_kHintMismatch);
        }
        return pair;
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory parsing key file" };
    }
    catch (const std::exception& e)
    {
        return detail::cryptoBackendError(e.what()).withContext(g_contextPath, keyPath.string());
    }
}

Result<bool> KeyStore::ensureKeyExists(const std::filesystem::path& configDir, std::string_view keyFileName) noexcept
{
    std::filesystem::path keyPath{};
    try
    {
        keyPath = keyPathFor(configDir, keyFileName);
        if (keyhop::storage::fileExists(keyPath))
        {
            return false;
        }
        if (!keyhop::storage::fileExists(configDir))
        {
            keyhop::storage::createPrivateDirectory(configDir);
        }

        const auto pair{ m_crypto.generateKeyPair() };
        auto content{ encodeKeyFile(pair) };
        auto wipeContent{ keyhop::security::scopeWipe(content) };

        // Publishing never replaces: if someone else created the key since the check above,
        // their key stays and this one is discarded.
        const bool created{ keyhop::storage::publishFileIfAbsent(keyPath, keyhop::security::asBytes(content)) };
        if (created)
        {
            keyhop::log::Registry::keystore()->info("created key file {}", keyPath.string());
        }
        else
        {
            keyhop::log::Registry::keystore()->info("key file {} appeared concurrently, keeping it", keyPath.string());
        }
        return created;
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return detail::storageError(e);
    }
    catch (const std::runtime_error& e)
    {
        return generationError(e, keyPath);
    }
    catch (const std::exception& e)
    {
        return detail::cryptoBackendError(e.what()).withContext(g_contextPath, keyPath.string());
    }
}

} // namespace keyhop::core
