#ifndef INCLUDE_KEYHOP_STORAGE_SECUREFILESYSTEM_HPP
#define INCLUDE_KEYHOP_STORAGE_SECUREFILESYSTEM_HPP

#include "keyhop/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace keyhop::storage
{

// Owner-only permissions used for every file and directory this library creates.
constexpr std::filesystem::perms g_privateFilePerms{ std::filesystem::perms::owner_read |
                                                     std::filesystem::perms::owner_write };
constexpr std::filesystem::perms g_privateDirPerms{ std::filesystem::perms::owner_all };
constexpr std::filesystem::perms g_privateExecPerms{ std::filesystem::perms::owner_all };

// A private temp file created beside `target` and published only by an explicit commit.
// Dropping an uncommitted PendingFile removes the temp file.
//
// All failures throw StorageError carrying the offending path.
class PendingFile final
{
public:
    explicit PendingFile(std::filesystem::path target,
                         std::filesystem::perms perms = g_privateFilePerms);

    PendingFile(const PendingFile&) = delete;
    PendingFile& operator=(const PendingFile&) = delete;
    PendingFile(PendingFile&&) = delete;
    PendingFile& operator=(PendingFile&&) = delete;
    ~PendingFile() noexcept;

    void write(std::span<const std::byte> bytes);

    // Flushes and renames over the target, replacing whatever is there.
    void commitReplace();

    // Flushes and links to the target without replacing it.
    // Returns false (and discards the temp file) when the target already exists.
    [[nodiscard]] bool commitNoReplace();

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept
    {
        return m_tempPath;
    }
    [[nodiscard]] const std::filesystem::path& target() const noexcept
    {
        return m_target;
    }

private:
    void flushAndClose();
    void discard() noexcept;

    std::filesystem::path m_target;
    std::filesystem::path m_tempPath;
    int m_fd{ -1 };
    bool m_committed{ false };
};

// Replaces `path` with `bytes` through temp-then-rename; readers see either the old or the new file.
void writeFileAtomic(const std::filesystem::path& path, std::span<const std::byte> bytes,
                     std::filesystem::perms perms = g_privateFilePerms);

// Writes `bytes` to `path` only if nothing exists there. Returns false when it already did.
[[nodiscard]] bool publishFileIfAbsent(const std::filesystem::path& path, std::span<const std::byte> bytes);

// Reads the whole file into wiping memory. Throws FileNotFound or StorageError.
[[nodiscard]] keyhop::security::SecureString readSecureFile(const std::filesystem::path& path);

[[nodiscard]] std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path);

[[nodiscard]] bool fileExists(const std::filesystem::path& path);

// Copies `from` to `to` atomically with owner-only permissions.
void copyFilePrivate(const std::filesystem::path& from, const std::filesystem::path& to);

void renameFile(const std::filesystem::path& from, const std::filesystem::path& to);

// Returns false if there was nothing to remove.
bool removeFile(const std::filesystem::path& path);

// Creates `path` (and parents) and restricts the leaf to the owner.
void createPrivateDirectory(const std::filesystem::path& path);

// Creates `<base>/<prefix><random hex>` with owner-only permissions. Never reuses an existing name.
[[nodiscard]] std::filesystem::path createUniqueDirectory(const std::filesystem::path& base, std::string_view prefix);

// Exclusively creates `<dir>/<prefix><random hex><suffix>` holding `bytes`.
[[nodiscard]] std::filesystem::path createUniqueFile(const std::filesystem::path& dir, std::string_view prefix,
                                                     std::string_view suffix, std::span<const std::byte> bytes,
                                                     std::filesystem::perms perms = g_privateFilePerms);

// Permission bits of an existing file, owner/group/other only.
[[nodiscard]] std::filesystem::perms filePermissions(const std::filesystem::path& path);

} // namespace keyhop::storage

#endif // INCLUDE_KEYHOP_STORAGE_SECUREFILESYSTEM_HPP
