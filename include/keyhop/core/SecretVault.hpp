#ifndef INCLUDE_KEYHOP_CORE_SECRETVAULT_HPP
#define INCLUDE_KEYHOP_CORE_SECRETVAULT_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/core/KeyStore.hpp"
#include "keyhop/crypto/ICryptoProvider.hpp"
#include "keyhop/security/SecretBytes.hpp"
#include "keyhop/security/SecureString.hpp"
#include <filesystem>
#include <string_view>
#include <variant>

namespace keyhop::core
{

constexpr std::string_view g_defaultSecretsFileName{ "secrets.enc" };

// Encrypted-at-rest secrets blob bound to a KeyStore key file.
class SecretVault final
{
public:
    explicit SecretVault(keyhop::crypto::ICryptoProvider& crypto) noexcept;

    // Encrypts `plainText` to the key file's recipient and replaces `secretsPath` atomically.
    // On any failure the previous blob (if any) is left as it was.
    [[nodiscard]] Result<std::monostate> encryptSecrets(const std::filesystem::path& secretsPath,
                                                        const std::filesystem::path& keyPath,
                                                        std::string_view plainText) noexcept;

    [[nodiscard]] Result<keyhop::security::SecureString> decryptSecrets(const std::filesystem::path& secretsPath,
                                                                        const std::filesystem::path& keyPath) noexcept;

    // Same as decryptSecrets, wrapped in a handle that wipes on close.
    [[nodiscard]] Result<keyhop::security::SecretBytes> decryptSecretsBytes(const std::filesystem::path& secretsPath,
                                                                           const std::filesystem::path& keyPath) noexcept;

    [[nodiscard]] Result<bool> secretsExist(const std::filesystem::path& secretsPath) const noexcept;

    [[nodiscard]] const KeyStore& keyStore() const noexcept
    {
        return m_keys;
    }

private:
    keyhop::crypto::ICryptoProvider& m_crypto;
    KeyStore m_keys;
};

} // namespace keyhop::core

#endif // INCLUDE_KEYHOP_CORE_SECRETVAULT_HPP
