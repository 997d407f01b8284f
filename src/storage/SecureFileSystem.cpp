#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/security/SecureRandom.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace keyhop::storage
{
namespace
{

constexpr std::size_t g_kNameTokenBytes{ 8U };
constexpr int g_kMaxNameAttempts{ 16 };
constexpr std::size_t g_kReadChunk{ 4096U };

[[noreturn]] void throwIoError(const std::string& what, const std::filesystem::path& path, int err)
{
    std::string message{ "storage: " + what + " '" + path.string() + "'" };
    if (err != 0)
    {
        message += ": ";
        message += std::generic_category().message(err);
    }
    if (err == ENOENT)
    {
        throw FileNotFound(message, path, err);
    }
    throw StorageError(message, path, err);
}

[[nodiscard]] std::string randomNameToken(const std::filesystem::path& where)
{
    auto token{ keyhop::security::randomHexToken(g_kNameTokenBytes) };
    if (!token)
    {
        throw StorageError("storage: CSPRNG failure while naming a file", where);
    }
    return *std::move(token);
}

#if defined(_WIN32)

[[nodiscard]] int openExclusive(const std::filesystem::path& path, [[maybe_unused]] std::filesystem::perms perms)
{
    int fd{ -1 };
    const errno_t rc{ ::_wsopen_s(&fd, path.c_str(), _O_WRONLY | _O_CREAT | _O_EXCL | _O_BINARY | _O_NOINHERIT,
                                  _SH_DENYRW, _S_IREAD | _S_IWRITE) };
    if (rc != 0)
    {
        errno = rc;
        return -1;
    }
    return fd;
}

[[nodiscard]] int openForRead(const std::filesystem::path& path)
{
    int fd{ -1 };
    const errno_t rc{ ::_wsopen_s(&fd, path.c_str(), _O_RDONLY | _O_BINARY | _O_NOINHERIT, _SH_DENYWR, 0) };
    if (rc != 0)
    {
        errno = rc;
        return -1;
    }
    return fd;
}

[[nodiscard]] long long writeSome(int fd, const std::byte* data, std::size_t size)
{
    constexpr std::size_t kMaxChunk{ 1U << 30U };
    const std::size_t chunk{ size > kMaxChunk ? kMaxChunk : size };
    return ::_write(fd, data, static_cast<unsigned int>(chunk));
}

[[nodiscard]] long long readSome(int fd, char* data, std::size_t size)
{
    return ::_read(fd, data, static_cast<unsigned int>(size));
}

[[nodiscard]] bool syncFile(int fd)
{
    return ::_commit(fd) == 0;
}

int closeFile(int fd)
{
    return ::_close(fd);
}

[[nodiscard]] bool moveFile(const std::filesystem::path& from, const std::filesystem::path& to, bool replace)
{
    const DWORD flags{ static_cast<DWORD>(MOVEFILE_WRITE_THROUGH | (replace ? MOVEFILE_REPLACE_EXISTING : 0)) };
    if (::MoveFileExW(from.c_str(), to.c_str(), flags) == 0)
    {
        const DWORD err{ ::GetLastError() };
        errno = (err == ERROR_ALREADY_EXISTS || err == ERROR_FILE_EXISTS) ? EEXIST : EIO;
        return false;
    }
    return true;
}

#else

[[nodiscard]] int openExclusive(const std::filesystem::path& path, std::filesystem::perms perms)
{
    const auto mode{ static_cast<mode_t>(perms & std::filesystem::perms::mask) };
    int fd{ -1 };
    do
    {
        fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, mode);
    } while (fd < 0 && errno == EINTR);
    // fchmod pins the exact mode regardless of the process umask.
    if (fd >= 0 && ::fchmod(fd, mode) != 0)
    {
        const int err{ errno };
        ::close(fd);
        ::unlink(path.c_str());
        errno = err;
        return -1;
    }
    return fd;
}

[[nodiscard]] int openForRead(const std::filesystem::path& path)
{
    int fd{ -1 };
    do
    {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

[[nodiscard]] ssize_t writeSome(int fd, const std::byte* data, std::size_t size)
{
    return ::write(fd, data, size);
}

[[nodiscard]] ssize_t readSome(int fd, char* data, std::size_t size)
{
    return ::read(fd, data, size);
}

[[nodiscard]] bool syncFile(int fd)
{
    return ::fsync(fd) == 0;
}

int closeFile(int fd)
{
    return ::close(fd);
}

[[nodiscard]] bool moveFile(const std::filesystem::path& from, const std::filesystem::path& to, bool replace)
{
    if (replace)
    {
        return ::rename(from.c_str(), to.c_str()) == 0;
    }
    // link(2) refuses to overwrite; the temp name is unlinked by the caller afterwards.
    return ::link(from.c_str(), to.c_str()) == 0;
}

#endif

void writeAll(int fd, std::span<const std::byte> bytes, const std::filesystem::path& path)
{
    const std::byte* ptr{ bytes.data() };
    std::size_t remaining{ bytes.size() };
    while (remaining > 0U)
    {
        const auto written{ writeSome(fd, ptr, remaining) };
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throwIoError("write failed", path, errno);
        }
        if (written == 0)
        {
            throwIoError("short write", path, EIO);
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

} // namespace

PendingFile::PendingFile(std::filesystem::path target, std::filesystem::perms perms) : m_target(std::move(target))
{
    const auto dir{ m_target.has_parent_path() ? m_target.parent_path() : std::filesystem::path{ "." } };
    const std::string base{ "." + m_target.filename().string() + ".tmp-" };

    for (int attempt{}; attempt < g_kMaxNameAttempts; ++attempt)
    {
        auto candidate{ dir / (base + randomNameToken(dir)) };
        m_fd = openExclusive(candidate, perms);
        if (m_fd >= 0)
        {
            m_tempPath = std::move(candidate);
            return;
        }
        if (errno != EEXIST)
        {
            throwIoError("cannot create temp file for", m_target, errno);
        }
    }
    throwIoError("cannot find a free temp name for", m_target, EEXIST);
}

PendingFile::~PendingFile() noexcept
{
    discard();
}

void PendingFile::write(std::span<const std::byte> bytes)
{
    if (m_fd < 0)
    {
        throw StorageError("storage: write after commit", m_target);
    }
    writeAll(m_fd, bytes, m_tempPath);
}

void PendingFile::flushAndClose()
{
    if (m_fd < 0)
    {
        throw StorageError("storage: file already committed", m_target);
    }
    if (!syncFile(m_fd))
    {
        throwIoError("fsync failed", m_tempPath, errno);
    }
    const int fd{ m_fd };
    m_fd = -1;
    if (closeFile(fd) != 0)
    {
        throwIoError("close failed", m_tempPath, errno);
    }
}

void PendingFile::commitReplace()
{
    flushAndClose();
    if (!moveFile(m_tempPath, m_target, true))
    {
        throwIoError("rename failed onto", m_target, errno);
    }
    m_committed = true;
}

bool PendingFile::commitNoReplace()
{
    flushAndClose();
    if (!moveFile(m_tempPath, m_target, false))
    {
        if (errno == EEXIST)
        {
            discard();
            return false;
        }
        throwIoError("publish failed onto", m_target, errno);
    }
#if defined(_WIN32)
    m_committed = true;
#else
    // The target is now a second link to the temp inode; drop the temp name.
    m_committed = true;
    std::error_code ec{};
    std::filesystem::remove(m_tempPath, ec);
    if (ec)
    {
        // The target is already complete; only a stray hidden name is left behind.
        keyhop::log::Registry::storage()->warn("cannot remove temp link '{}': {}", m_tempPath.string(), ec.message());
    }
#endif
    return true;
}

void PendingFile::discard() noexcept
{
    if (m_fd >= 0)
    {
        (void)closeFile(m_fd);
        m_fd = -1;
    }
    if (!m_committed && !m_tempPath.empty())
    {
        std::error_code ec{};
        std::filesystem::remove(m_tempPath, ec);
        m_tempPath.clear();
    }
}

void writeFileAtomic(const std::filesystem::path& path, std::span<const std::byte> bytes, std::filesystem::perms perms)
{
    PendingFile pending{ path, perms };
    pending.write(bytes);
    pending.commitReplace();
}

bool publishFileIfAbsent(const std::filesystem::path& path, std::span<const std::byte> bytes)
{
    PendingFile pending{ path };
    pending.write(bytes);
    return pending.commitNoReplace();
}

keyhop::security::SecureString readSecureFile(const std::filesystem::path& path)
{
    const int fd{ openForRead(path) };
    if (fd < 0)
    {
        throwIoError("cannot open", path, errno);
    }

    keyhop::security::SecureString out{};
    std::array<char, g_kReadChunk> chunk{};
    for (;;)
    {
        const auto got{ readSome(fd, chunk.data(), chunk.size()) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const int err{ errno };
            (void)closeFile(fd);
            keyhop::security::secureWipe(std::span<char>{ chunk });
            keyhop::security::secureRelease(out);
            throwIoError("read failed", path, err);
        }
        if (got == 0)
        {
            break;
        }
        keyhop::security::secureAppend(out, std::string_view{ chunk.data(), static_cast<std::size_t>(got) });
    }
    keyhop::security::secureWipe(std::span<char>{ chunk });
    (void)closeFile(fd);
    return out;
}

std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path)
{
    auto contents{ readSecureFile(path) };
    std::vector<std::uint8_t> out(contents.size());
    if (!contents.empty())
    {
        std::memcpy(out.data(), contents.data(), contents.size());
    }
    return out;
}

bool fileExists(const std::filesystem::path& path)
{
    std::error_code ec{};
    const auto status{ std::filesystem::symlink_status(path, ec) };
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        throwIoError("cannot stat", path, ec.value());
    }
    return std::filesystem::exists(status);
}

void copyFilePrivate(const std::filesystem::path& from, const std::filesystem::path& to)
{
    const auto contents{ readSecureFile(from) };
    writeFileAtomic(to, keyhop::security::asBytes(contents));
}

void renameFile(const std::filesystem::path& from, const std::filesystem::path& to)
{
    if (!moveFile(from, to, true))
    {
        throwIoError("rename failed from", from, errno);
    }
}

bool removeFile(const std::filesystem::path& path)
{
    std::error_code ec{};
    const bool removed{ std::filesystem::remove(path, ec) };
    if (ec)
    {
        throwIoError("cannot remove", path, ec.value());
    }
    return removed;
}

void createPrivateDirectory(const std::filesystem::path& path)
{
    std::error_code ec{};
    std::filesystem::create_directories(path, ec);
    if (ec)
    {
        throwIoError("cannot create directory", path, ec.value());
    }
    std::filesystem::permissions(path, g_privateDirPerms, std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throwIoError("cannot restrict directory", path, ec.value());
    }
}

std::filesystem::path createUniqueDirectory(const std::filesystem::path& base, std::string_view prefix)
{
    for (int attempt{}; attempt < g_kMaxNameAttempts; ++attempt)
    {
        auto candidate{ base / (std::string{ prefix } + randomNameToken(base)) };
#if defined(_WIN32)
        if (::CreateDirectoryW(candidate.c_str(), nullptr) != 0)
        {
            return candidate;
        }
        if (::GetLastError() != ERROR_ALREADY_EXISTS)
        {
            throwIoError("cannot create directory", candidate, EIO);
        }
#else
        if (::mkdir(candidate.c_str(), static_cast<mode_t>(g_privateDirPerms)) == 0)
        {
            return candidate;
        }
        if (errno != EEXIST)
        {
            throwIoError("cannot create directory", candidate, errno);
        }
#endif
    }
    throwIoError("cannot find a free directory name in", base, EEXIST);
}

std::filesystem::path createUniqueFile(const std::filesystem::path& dir, std::string_view prefix,
                                       std::string_view suffix, std::span<const std::byte> bytes,
                                       std::filesystem::perms perms)
{
    for (int attempt{}; attempt < g_kMaxNameAttempts; ++attempt)
    {
        auto candidate{ dir / (std::string{ prefix } + randomNameToken(dir) + std::string{ suffix }) };
        const int fd{ openExclusive(candidate, perms) };
        if (fd < 0)
        {
            if (errno == EEXIST)
            {
                continue;
            }
            throwIoError("cannot create", candidate, errno);
        }

        try
        {
            writeAll(fd, bytes, candidate);
        }
        catch (const StorageError&)
        {
            (void)closeFile(fd);
            std::error_code ec{};
            std::filesystem::remove(candidate, ec);
            throw;
        }
        if (closeFile(fd) != 0)
        {
            const int err{ errno };
            std::error_code ec{};
            std::filesystem::remove(candidate, ec);
            throwIoError("close failed", candidate, err);
        }
        return candidate;
    }
    throwIoError("cannot find a free file name in", dir, EEXIST);
}

std::filesystem::perms filePermissions(const std::filesystem::path& path)
{
    std::error_code ec{};
    const auto status{ std::filesystem::status(path, ec) };
    if (ec)
    {
        throwIoError("cannot stat", path, ec.value());
    }
    return status.permissions() & std::filesystem::perms::mask;
}

} // namespace keyhop::storage
