#ifndef INCLUDE_KEYHOP_CORE_KEYSTORE_HPP
#define INCLUDE_KEYHOP_CORE_KEYSTORE_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/crypto/ICryptoProvider.hpp"
#include "keyhop/security/SecureBuffer.hpp"
#include <filesystem>
#include <string_view>

namespace keyhop::core
{

constexpr std::string_view g_defaultKeyFileName{ "keyhop.key" };

// Private identity plus the recipient it belongs to.
struct KeyPair final
{
    keyhop::security::SecureBuffer identity;
    keyhop::crypto::PublicKey recipient{};
};

// Key file on disk: two lines, identity first and recipient second, mode 0600.
// Key paths are always explicit; there is no process-wide "current key".
class KeyStore final
{
public:
    explicit KeyStore(keyhop::crypto::ICryptoProvider& crypto) noexcept;

    // Writes a fresh key pair to `keyPath`, replacing any file there, via temp-then-rename.
    // Returns the new recipient.
    [[nodiscard]] Result<keyhop::crypto::PublicKey> generateKeyFile(const std::filesystem::path& keyPath) noexcept;

    [[nodiscard]] Result<keyhop::security::SecureBuffer> loadIdentity(const std::filesystem::path& keyPath) const noexcept;

    [[nodiscard]] Result<keyhop::crypto::PublicKey> loadRecipient(const std::filesystem::path& keyPath) const noexcept;

    // Both lines, plus a constant-time check that the recipient matches the identity.
    [[nodiscard]] Result<KeyPair> loadKeyPair(const std::filesystem::path& keyPath) const noexcept;

    // Creates `<configDir>/<keyFileName>` unless it exists. Returns true when this call created it.
    // A concurrent creator that publishes first wins; this call then returns false and leaves
    // that key untouched.
    [[nodiscard]] Result<bool> ensureKeyExists(const std::filesystem::path& configDir,
                                               std::string_view keyFileName = g_defaultKeyFileName) noexcept;

    [[nodiscard]] static std::filesystem::path keyPathFor(const std::filesystem::path& configDir,
                                                          std::string_view keyFileName = g_defaultKeyFileName);

private:
    keyhop::crypto::ICryptoProvider& m_crypto;
};

} // namespace keyhop::core

#endif // INCLUDE_KEYHOP_CORE_KEYSTORE_HPP
