#ifndef INCLUDE_KEYHOP_CORE_KEYROTATOR_HPP
#define INCLUDE_KEYHOP_CORE_KEYROTATOR_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/core/KeyStore.hpp"
#include "keyhop/core/SecretVault.hpp"
#include "keyhop/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string_view>
#include <vector>

namespace keyhop::core
{

enum class RotationState : std::uint8_t
{
    Idle,
    CheckSecrets,
    ReplaceKeyOnly,
    DecryptOld,
    BackupOldKey,
    ReplaceKey,
    ReencryptWithNew,
    DeleteBackup,
    RestoreOldKeyFromBackup,
    // Stopped before anything on disk changed.
    Aborted,
    Done,
    // Rollback failed; the backup file is the only key that opens the secrets.
    Fatal,
};

enum class RotationOutcome : std::uint8_t
{
    KeyOnly,
    Reencrypted,
};

constexpr std::string_view g_backupSuffix{ ".backup" };

struct RotationPaths final
{
    std::filesystem::path keyPath;
    std::filesystem::path secretsPath;

    [[nodiscard]] std::filesystem::path backupPath() const
    {
        std::filesystem::path backup{ keyPath };
        backup += g_backupSuffix;
        return backup;
    }
};

using TransitionObserver = std::function<void(RotationState from, RotationState to)>;

[[nodiscard]] std::string_view toString(RotationState state) noexcept;

// Replaces a key pair and re-encrypts the secrets blob under it.
//
// The old key is backed up to `<key>.backup` before replacement and restored if re-encryption
// fails, so after every call at least one key file on disk opens the current secrets file.
class KeyRotator final
{
public:
    explicit KeyRotator(keyhop::crypto::ICryptoProvider& crypto) noexcept;

    // Called after every state change, before the new state's work runs.
    void setObserver(TransitionObserver observer);

    [[nodiscard]] Result<RotationOutcome> rotate(const RotationPaths& paths) noexcept;

    [[nodiscard]] RotationState state() const noexcept
    {
        return m_state;
    }

    // States visited by the last rotate() call, starting with Idle.
    [[nodiscard]] const std::vector<RotationState>& trace() const noexcept
    {
        return m_trace;
    }

private:
    void transition(RotationState next) noexcept;
    [[nodiscard]] Error abandon(Error err) noexcept;
    [[nodiscard]] Result<RotationOutcome> rollback(const RotationPaths& paths, Error cause) noexcept;
    void deleteBackup(const RotationPaths& paths) noexcept;

    KeyStore m_keys;
    SecretVault m_vault;
    TransitionObserver m_observer;
    RotationState m_state{ RotationState::Idle };
    std::vector<RotationState> m_trace;
};

} // namespace keyhop::core

#endif // INCLUDE_KEYHOP_CORE_KEYROTATOR_HPP
