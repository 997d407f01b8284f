#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

std::span<const std::byte> textBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

std::size_t entryCount(const std::filesystem::path& dir)
{
    std::size_t n{ 0U };
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator{ dir })
    {
        ++n;
    }
    return n;
}

} // namespace

TEST(SecureFileSystem, WriteFileAtomicReplacesAndLeavesNoTemp)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "secrets.enc" };

    keyhop::storage::writeFileAtomic(file, textBytes("first"));
    keyhop::storage::writeFileAtomic(file, textBytes("second"));

    EXPECT_EQ(keyhop::security::asStringView(keyhop::storage::readSecureFile(file)), "second");
    EXPECT_EQ(entryCount(dir.path()), 1U);
#if !defined(_WIN32)
    EXPECT_EQ(keyhop::storage::filePermissions(file), keyhop::storage::g_privateFilePerms);
#endif
}

TEST(SecureFileSystem, PendingFileDiscardedWithoutCommit)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "keyhop.key" };

    std::filesystem::path temp{};
    {
        keyhop::storage::PendingFile pending{ file };
        temp = pending.tempPath();
        pending.write(textBytes("never published"));
        EXPECT_TRUE(std::filesystem::exists(temp));
        EXPECT_EQ(temp.parent_path(), dir.path());
    }
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST(SecureFileSystem, PublishIfAbsentNeverReplaces)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "keyhop.key" };

    EXPECT_TRUE(keyhop::storage::publishFileIfAbsent(file, textBytes("winner")));
    EXPECT_FALSE(keyhop::storage::publishFileIfAbsent(file, textBytes("loser")));
    EXPECT_EQ(keyhop::test_utils::readTextFile(file), "winner");
    EXPECT_EQ(entryCount(dir.path()), 1U);
}

TEST(SecureFileSystem, MissingFileThrowsFileNotFound)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());
    const auto missing{ dir.path() / "absent" };

    EXPECT_FALSE(keyhop::storage::fileExists(missing));
    EXPECT_THROW((void)keyhop::storage::readSecureFile(missing), keyhop::storage::FileNotFound);
    EXPECT_FALSE(keyhop::storage::removeFile(missing));

    try
    {
        keyhop::storage::renameFile(missing, dir.path() / "other");
        FAIL() << "rename of a missing file succeeded";
    }
    catch (const keyhop::storage::StorageError& e)
    {
        EXPECT_EQ(e.path(), missing);
        EXPECT_NE(std::string{ e.what() }.find("absent"), std::string::npos);
    }
}

TEST(SecureFileSystem, CopyFilePrivateAndRemove)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());
    const auto from{ dir.path() / "keyhop.key" };
    const auto to{ dir.path() / "keyhop.key.backup" };

    keyhop::test_utils::writeTextFile(from, "KEY\n");
    keyhop::storage::copyFilePrivate(from, to);
    EXPECT_EQ(keyhop::test_utils::readTextFile(to), "KEY\n");
#if !defined(_WIN32)
    EXPECT_EQ(keyhop::storage::filePermissions(to), keyhop::storage::g_privateFilePerms);
#endif
    EXPECT_TRUE(keyhop::storage::removeFile(to));
    EXPECT_FALSE(std::filesystem::exists(to));
}

TEST(SecureFileSystem, UniqueNamesDoNotCollide)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());

    const auto a{ keyhop::storage::createUniqueDirectory(dir.path(), "auth-") };
    const auto b{ keyhop::storage::createUniqueDirectory(dir.path(), "auth-") };
    EXPECT_NE(a, b);
#if !defined(_WIN32)
    EXPECT_EQ(keyhop::storage::filePermissions(a), keyhop::storage::g_privateDirPerms);
#endif

    const auto f{ keyhop::storage::createUniqueFile(a, "token-", ".txt", textBytes("t")) };
    EXPECT_EQ(f.parent_path(), a);
    EXPECT_EQ(f.extension(), ".txt");
    EXPECT_EQ(f.filename().string().rfind("token-", 0), 0U);
    EXPECT_EQ(keyhop::test_utils::readTextFile(f), "t");
}

TEST(SecureFileSystem, CreatePrivateDirectoryIsIdempotent)
{
    const keyhop::test_utils::TempDir dir{ "storage_" };
    ASSERT_FALSE(dir.path().empty());
    const auto nested{ dir.path() / "a" / "b" };

    keyhop::storage::createPrivateDirectory(nested);
    keyhop::storage::createPrivateDirectory(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
#if !defined(_WIN32)
    EXPECT_EQ(keyhop::storage::filePermissions(nested), keyhop::storage::g_privateDirPerms);
#endif
}
