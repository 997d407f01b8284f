#ifndef KEYHOP_TESTS_TEST_UTILS_TESTUTILS_HPP
#define KEYHOP_TESTS_TEST_UTILS_TESTUTILS_HPP

#include "keyhop/crypto/providers/ProviderFactory.hpp"
#include "keyhop/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace keyhop::test_utils
{

[[nodiscard]] inline std::optional<std::string> getEnv(std::string_view name);

namespace detail
{

[[nodiscard]] inline std::filesystem::path xdgRuntimeRoot() noexcept
{
    std::filesystem::path root{};
    if (const auto xdgRuntimeDir{ getEnv("XDG_RUNTIME_DIR") }; xdgRuntimeDir.has_value() && !xdgRuntimeDir->empty())
    {
        root = std::filesystem::path{ *xdgRuntimeDir };
    }
    return root;
}

// The shared base must be private to this user, or nothing is created under it.
[[nodiscard]] inline bool tryPrepareBaseDir(const std::filesystem::path& candidate) noexcept
{
    std::error_code ec{};
    if (!std::filesystem::create_directories(candidate, ec) && ec)
    {
        return false;
    }
    if (!std::filesystem::is_directory(candidate, ec) || ec)
    {
        return false;
    }
#if !defined(_WIN32)
    std::filesystem::permissions(candidate, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace,
                                 ec);
    if (ec)
    {
        return false;
    }
    const auto perms{ std::filesystem::status(candidate, ec).permissions() };
    if (ec)
    {
        return false;
    }
    const auto publicBits{ std::filesystem::perms::group_all | std::filesystem::perms::others_all };
    return ((perms & publicBits) == std::filesystem::perms::none);
#else
    return true;
#endif
}

} // namespace detail

[[nodiscard]] inline std::optional<std::string> getEnv(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }

#if defined(_WIN32)
    char* value{ nullptr };
    std::size_t len{ 0U };
    if (_dupenv_s(&value, &len, std::string{ name }.c_str()) != 0 || value == nullptr)
    {
        return std::nullopt;
    }
    std::string out{ value };
    std::free(value);
    return out;
#else
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
#endif
}

// Sets (or unsets, for std::nullopt) an environment variable and restores the old value on scope exit.
class ScopedEnv final
{
public:
    ScopedEnv(std::string name, const std::optional<std::string>& value) : m_name{ std::move(name) }, m_old{ getEnv(m_name) }
    {
        apply(value);
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
    ScopedEnv(ScopedEnv&&) = delete;
    ScopedEnv& operator=(ScopedEnv&&) = delete;

    ~ScopedEnv()
    {
        apply(m_old);
    }

private:
    void apply(const std::optional<std::string>& value) const
    {
#if defined(_WIN32)
        _putenv_s(m_name.c_str(), value ? value->c_str() : "");
#else
        if (value)
        {
            setenv(m_name.c_str(), value->c_str(), 1);
        }
        else
        {
            unsetenv(m_name.c_str());
        }
#endif
    }

    std::string m_name;
    std::optional<std::string> m_old;
};

// Creates a unique directory inside the OS temp dir using OS CSPRNG.
// The name is intentionally non-predictable to avoid security-sensitive patterns in publicly writable temp folders.
[[nodiscard]] inline std::filesystem::path makeSecureTempDir(std::string_view prefix)
{
    constexpr std::size_t kTokenBytes{ 16U };
    constexpr std::size_t kMaxAttempts{ 16U };

    std::filesystem::path base{};
    {
        const std::array<std::filesystem::path, 2> roots{ detail::xdgRuntimeRoot(),
                                                          std::filesystem::temp_directory_path() };
        for (const auto& root : roots)
        {
            if (root.empty())
            {
                continue;
            }
            const auto candidate{ root / std::filesystem::path{ "keyhop_tests" } };
            if (detail::tryPrepareBaseDir(candidate))
            {
                base = candidate;
                break;
            }
        }
    }
    if (base.empty())
    {
        return {};
    }

    for (std::size_t attempt{}; attempt < kMaxAttempts; ++attempt)
    {
        const auto token{ keyhop::security::randomHexToken(kTokenBytes) };
        if (!token)
        {
            break;
        }
        const auto dir{ base / std::filesystem::path{ std::string{ prefix } + *token } };

        std::error_code ec{};
        if (std::filesystem::create_directory(dir, ec) && !ec)
        {
#if !defined(_WIN32)
            std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
            if (ec)
            {
                std::filesystem::remove_all(dir, ec);
                continue;
            }
#endif
            return dir;
        }
    }

    return {};
}

// Removes the directory tree when the test ends.
class TempDir final
{
public:
    explicit TempDir(std::string_view prefix) : m_path{ makeSecureTempDir(prefix) }
    {
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    ~TempDir()
    {
        std::error_code ec{};
        if (!m_path.empty())
        {
            std::filesystem::remove_all(m_path, ec);
        }
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_path;
    }

private:
    std::filesystem::path m_path;
};

[[nodiscard]] inline std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    return std::string{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

inline void writeTextFile(const std::filesystem::path& path, std::string_view content)
{
    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

// The preferred provider compiled into this build.
[[nodiscard]] inline std::unique_ptr<keyhop::crypto::ICryptoProvider> makeDefaultCryptoProvider()
{
    const auto names{ keyhop::crypto::providers::availableCryptoProviders() };
    if (names.empty())
    {
        return nullptr;
    }
    return keyhop::crypto::providers::makeCryptoProvider(names.front());
}

} // namespace keyhop::test_utils

#endif // KEYHOP_TESTS_TEST_UTILS_TESTUTILS_HPP
