#include "keyhop/core/KeyRotator.hpp"
#include "keyhop/core/ErrorMapping.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include "keyhop/security/SecureString.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <exception>
#include <new>
#include <string>
#include <utility>
#include <variant>

namespace keyhop::core
{

std::string_view toString(RotationState state) noexcept
{
    switch (state)
    {
    case RotationState::Idle:
        return "Idle";
    case RotationState::CheckSecrets:
        return "CheckSecrets";
    case RotationState::ReplaceKeyOnly:
        return "ReplaceKeyOnly";
    case RotationState::DecryptOld:
        return "DecryptOld";
    case RotationState::BackupOldKey:
        return "BackupOldKey";
    case RotationState::ReplaceKey:
        return "ReplaceKey";
    case RotationState::ReencryptWithNew:
        return "ReencryptWithNew";
    case RotationState::DeleteBackup:
        return "DeleteBackup";
    case RotationState::RestoreOldKeyFromBackup:
        return "RestoreOldKeyFromBackup";
    case RotationState::Aborted:
        return "Aborted";
    case RotationState::Done:
        return "Done";
    case RotationState::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

KeyRotator::KeyRotator(keyhop::crypto::ICryptoProvider& crypto) noexcept : m_keys(crypto), m_vault(crypto)
{
}

void KeyRotator::setObserver(TransitionObserver observer)
{
    m_observer = std::move(observer);
}

void KeyRotator::transition(RotationState next) noexcept
{
    const RotationState from{ m_state };
    m_state = next;
    try
    {
        m_trace.push_back(next);
        keyhop::log::Registry::rotate()->debug("{} -> {}", toString(from), toString(next));
        if (m_observer)
        {
            m_observer(from, next);
        }
    }
    catch (const std::exception& e)
    {
        keyhop::log::Registry::rotate()->error("transition observer failed: {}", e.what());
    }
}

Error KeyRotator::abandon(Error err) noexcept
{
    keyhop::log::Registry::rotate()->warn("rotation aborted in {}: {}", toString(m_state), toString(err.code));
    transition(RotationState::Aborted);
    return err;
}

void KeyRotator::deleteBackup(const RotationPaths& paths) noexcept
{
    try
    {
        (void)keyhop::storage::removeFile(paths.backupPath());
    }
    catch (const std::exception& e)
    {
        // The rotation itself succeeded; a stale backup only holds the retired key.
        keyhop::log::Registry::rotate()->warn("could not delete key backup: {}", e.what());
    }
}

Result<RotationOutcome> KeyRotator::rollback(const RotationPaths& paths, Error cause) noexcept
{
    transition(RotationState::RestoreOldKeyFromBackup);
    try
    {
        keyhop::storage::renameFile(paths.backupPath(), paths.keyPath);
    }
    catch (const std::exception& e)
    {
        const std::string backup{ paths.backupPath().string() };
        keyhop::log::Registry::rotate()->critical("rollback failed, old key left at {}: {}", backup, e.what());
        transition(RotationState::Fatal);

        Error err{ ErrorKind::Storage, ErrorCode::ManualRecoveryRequired,
                   "key rotation failed and the old key could not be restored" };
        err.withContext(g_contextBackupPath, backup);
        err.withContext(g_contextPath, paths.keyPath.string());
        err.withContext(g_contextHint, "copy " + backup + " over " + paths.keyPath.string() +
                                           " to regain access to the secrets");
        return err;
    }

    keyhop::log::Registry::rotate()->warn("re-encryption failed, old key restored");
    transition(RotationState::Done);
    cause.withContext(g_contextRollback, "restored");
    return cause;
}

Result<RotationOutcome> KeyRotator::rotate(const RotationPaths& paths) noexcept
{
    m_trace.clear();
    m_state = RotationState::Idle;
    try
    {
        m_trace.push_back(RotationState::Idle);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory" };
    }

    transition(RotationState::CheckSecrets);
    const auto exists{ m_vault.secretsExist(paths.secretsPath) };
    if (const auto* err{ std::get_if<Error>(&exists) })
    {
        return abandon(*err);
    }

    if (!std::get<bool>(exists))
    {
        transition(RotationState::ReplaceKeyOnly);
        const auto replaced{ m_keys.generateKeyFile(paths.keyPath) };
        if (const auto* err{ std::get_if<Error>(&replaced) })
        {
            return abandon(*err);
        }
        keyhop::log::Registry::rotate()->info("rotated key {} (no secrets to re-encrypt)", paths.keyPath.string());
        transition(RotationState::Done);
        return RotationOutcome::KeyOnly;
    }

    transition(RotationState::DecryptOld);
    auto decrypted{ m_vault.decryptSecrets(paths.secretsPath, paths.keyPath) };
    if (auto* err{ std::get_if<Error>(&decrypted) })
    {
        return abandon(std::move(*err));
    }
    auto& plainText{ std::get<keyhop::security::SecureString>(decrypted) };
    auto wipePlainText{ keyhop::security::scopeWipe(plainText) };

    transition(RotationState::BackupOldKey);
    try
    {
        keyhop::storage::copyFilePrivate(paths.keyPath, paths.backupPath());
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return abandon(detail::storageError(e));
    }
    catch (const std::bad_alloc&)
    {
        return abandon(Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory backing up key" });
    }

    transition(RotationState::ReplaceKey);
    const auto replaced{ m_keys.generateKeyFile(paths.keyPath) };
    if (const auto* err{ std::get_if<Error>(&replaced) })
    {
        // The rename never happened, so the old key is still in place.
        deleteBackup(paths);
        return abandon(*err);
    }

    transition(RotationState::ReencryptWithNew);
    const auto reencrypted{ m_vault.encryptSecrets(paths.secretsPath, paths.keyPath,
                                                   keyhop::security::asStringView(plainText)) };
    if (const auto* err{ std::get_if<Error>(&reencrypted) })
    {
        return rollback(paths, *err);
    }

    transition(RotationState::DeleteBackup);
    deleteBackup(paths);
    keyhop::log::Registry::rotate()->info("rotated key {} and re-encrypted {}", paths.keyPath.string(),
                                          paths.secretsPath.string());
    transition(RotationState::Done);
    return RotationOutcome::Reencrypted;
}

} // namespace keyhop::core
