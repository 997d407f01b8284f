#include "keyhop/core/SecretVault.hpp"
#include "keyhop/core/ErrorMapping.hpp"
#include "SecretsEnvelope.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <exception>
#include <new>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace keyhop::core
{
namespace
{

constexpr std::string_view g_kHintRestore{
    "the secrets file does not open with this key; restore the key or the secrets file from a backup, "
    "or recover the key from its recovery phrase"
};
constexpr std::string_view g_kHintNoSecrets{ "no secrets stored yet; add one with `keyhop set NAME`" };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] std::span<const std::uint8_t> asU8(const keyhop::security::SecureString& s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

} // namespace

SecretVault::SecretVault(keyhop::crypto::ICryptoProvider& crypto) noexcept : m_crypto(crypto), m_keys(crypto)
{
}

Result<std::monostate> SecretVault::encryptSecrets(const std::filesystem::path& secretsPath,
                                                   const std::filesystem::path& keyPath,
                                                   std::string_view plainText) noexcept
{
    const auto recipient{ m_keys.loadRecipient(keyPath) };
    if (const auto* err{ std::get_if<Error>(&recipient) })
    {
        return *err;
    }

    try
    {
        const auto envelope{ detail::sealEnvelope(m_crypto, std::get<keyhop::crypto::PublicKey>(recipient),
                                                  asBytes(plainText)) };
        keyhop::storage::writeFileAtomic(secretsPath, std::as_bytes(std::span{ envelope }));
        keyhop::log::Registry::vault()->debug("encrypted secrets to {}", secretsPath.string());
        return std::monostate{};
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return detail::storageError(e);
    }
    catch (const std::exception& e)
    {
        return detail::cryptoBackendError(std::string{ "encryption failed: " } + e.what())
            .withContext(g_contextPath, secretsPath.string());
    }
}

Result<keyhop::security::SecureString> SecretVault::decryptSecrets(const std::filesystem::path& secretsPath,
                                                                   const std::filesystem::path& keyPath) noexcept
{
    auto identity{ m_keys.loadIdentity(keyPath) };
    if (auto* err{ std::get_if<Error>(&identity) })
    {
        return std::move(*err);
    }
    auto& secretKey{ std::get<keyhop::security::SecureBuffer>(identity) };
    auto wipeIdentity{ keyhop::security::scopeWipe(secretKey) };

    keyhop::security::SecureString envelope{};
    try
    {
        envelope = keyhop::storage::readSecureFile(secretsPath);
    }
    catch (const keyhop::storage::FileNotFound& e)
    {
        return detail::storageError(e, g_kHintNoSecrets);
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return detail::storageError(e);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory reading secrets file" };
    }

    auto opened{ detail::openEnvelope(m_crypto, secretKey, asU8(envelope)) };
    if (auto* err{ std::get_if<Error>(&opened) })
    {
        err->withContext(g_contextPath, secretsPath.string());
        if (err->code != ErrorCode::CryptoBackendFailure)
        {
            err->withContext(g_contextHint, std::string{ g_kHintRestore });
        }
        keyhop::log::Registry::vault()->warn("cannot decrypt {}: {}", secretsPath.string(), toString(err->code));
        return std::move(*err);
    }

    auto& plain{ std::get<keyhop::security::SecureBuffer>(opened) };
    try
    {
        return keyhop::security::secureStringFrom(plain);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory holding decrypted secrets" };
    }
}

Result<keyhop::security::SecretBytes> SecretVault::decryptSecretsBytes(const std::filesystem::path& secretsPath,
                                                                       const std::filesystem::path& keyPath) noexcept
{
    auto plain{ decryptSecrets(secretsPath, keyPath) };
    if (auto* err{ std::get_if<Error>(&plain) })
    {
        return std::move(*err);
    }
    return keyhop::security::SecretBytes{ std::move(std::get<keyhop::security::SecureString>(plain)) };
}

Result<bool> SecretVault::secretsExist(const std::filesystem::path& secretsPath) const noexcept
{
    try
    {
        return keyhop::storage::fileExists(secretsPath);
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return detail::storageError(e);
    }
}

} // namespace keyhop::core
