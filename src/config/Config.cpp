#include "keyhop/config/Config.hpp"
#include "ConfigYaml.hpp"
#include "keyhop/crypto/providers/ProviderFactory.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <cstdlib>
#include <exception>
#include <new>
#include <span>
#include <utility>

namespace keyhop::config
{
namespace
{

using keyhop::core::Error;
using keyhop::core::ErrorCode;
using keyhop::core::ErrorKind;

[[nodiscard]] std::optional<std::string> getEnv(std::string_view name)
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string{ value };
}

[[nodiscard]] std::filesystem::path resolveAgainst(const std::filesystem::path& configDir, const std::string& file)
{
    const std::filesystem::path p{ file };
    if (p.is_absolute())
    {
        return p;
    }
    return configDir / p;
}

[[nodiscard]] Error formatError(std::string message, const std::filesystem::path& file)
{
    return Error{ ErrorKind::Format, ErrorCode::InvalidArgument, std::move(message) }.withContext(
        keyhop::core::g_contextPath, file.string());
}

[[nodiscard]] std::optional<Error> validate(const Config& config, const std::filesystem::path& file)
{
    if (!config.cryptoProvider.empty() && config.cryptoProvider != keyhop::crypto::providers::g_nativeProviderName &&
        config.cryptoProvider != keyhop::crypto::providers::g_openSslProviderName)
    {
        return formatError("unknown crypto_provider '" + config.cryptoProvider + "'", file)
            .withContext(keyhop::core::g_contextHint, "use 'native' or 'openssl'");
    }
    if (config.keyFile.empty())
    {
        return formatError("key_file must not be empty", file);
    }
    if (config.secretsFile.empty())
    {
        return formatError("secrets_file must not be empty", file);
    }
    if (!keyhop::log::Registry::parseLevel(config.logLevel))
    {
        return formatError("unknown log_level '" + config.logLevel + "'", file)
            .withContext(keyhop::core::g_contextHint, "use trace, debug, info, warn, error, critical or off");
    }
    return std::nullopt;
}

} // namespace

std::filesystem::path Config::keyPath(const std::filesystem::path& configDir) const
{
    return resolveAgainst(configDir, keyFile);
}

std::filesystem::path Config::secretsPath(const std::filesystem::path& configDir) const
{
    return resolveAgainst(configDir, secretsFile);
}

keyhop::core::Result<Config> loadConfig(const std::filesystem::path& configDir) noexcept
{
    try
    {
        const auto file{ configDir / std::filesystem::path{ g_configFileName } };
        if (!keyhop::storage::fileExists(file))
        {
            keyhop::log::Registry::config()->debug("no {}, using defaults", file.string());
            return Config{};
        }

        Config config{};
        const YAML::Node root{ YAML::LoadFile(file.string()) };
        if (!root.IsNull() && !YAML::convert<Config>::decode(root, config))
        {
            return formatError("configuration must be a YAML mapping", file);
        }
        if (auto err{ validate(config, file) })
        {
            return *std::move(err);
        }
        keyhop::log::Registry::config()->debug("loaded {}", file.string());
        return config;
    }
    catch (const YAML::Exception& e)
    {
        return Error{ ErrorKind::Format, ErrorCode::InvalidArgument, std::string{ "invalid configuration: " } + e.what() }
            .withContext(keyhop::core::g_contextPath, (configDir / std::filesystem::path{ g_configFileName }).string());
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, e.what() }.withContext(keyhop::core::g_contextPath,
                                                                                       e.path().string());
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory loading configuration" };
    }
}

keyhop::core::Result<std::monostate> saveConfig(const std::filesystem::path& configDir, const Config& config) noexcept
{
    try
    {
        const auto file{ configDir / std::filesystem::path{ g_configFileName } };
        if (auto err{ validate(config, file) })
        {
            return *std::move(err);
        }
        if (!keyhop::storage::fileExists(configDir))
        {
            keyhop::storage::createPrivateDirectory(configDir);
        }

        YAML::Emitter out;
        out << YAML::convert<Config>::encode(config);
        out << YAML::Newline;
        if (!out.good())
        {
            return Error{ ErrorKind::Format, ErrorCode::InvalidArgument, out.GetLastError() };
        }
        keyhop::storage::writeFileAtomic(
            file, std::as_bytes(std::span<const char>{ out.c_str(), static_cast<std::size_t>(out.size()) }));
        keyhop::log::Registry::config()->info("saved {}", file.string());
        return std::monostate{};
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, e.what() }.withContext(keyhop::core::g_contextPath,
                                                                                       e.path().string());
    }
    catch (const YAML::Exception& e)
    {
        return Error{ ErrorKind::Format, ErrorCode::InvalidArgument, e.what() };
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory saving configuration" };
    }
}

keyhop::core::Result<std::filesystem::path> resolveConfigDir(const std::optional<std::filesystem::path>& explicitDir) noexcept
{
    try
    {
        if (explicitDir && !explicitDir->empty())
        {
            return *explicitDir;
        }
        if (auto dir{ getEnv(g_configDirEnvVar) })
        {
            return std::filesystem::path{ *dir };
        }
#if defined(_WIN32)
        if (auto appData{ getEnv("APPDATA") })
        {
            return std::filesystem::path{ *appData } / std::filesystem::path{ g_appDirName };
        }
#else
        if (auto xdg{ getEnv("XDG_CONFIG_HOME") })
        {
            return std::filesystem::path{ *xdg } / std::filesystem::path{ g_appDirName };
        }
        if (auto home{ getEnv("HOME") })
        {
            return std::filesystem::path{ *home } / ".config" / std::filesystem::path{ g_appDirName };
        }
#endif
        return Error{ ErrorKind::Validation, ErrorCode::NotFound, "cannot determine the configuration directory" }
            .withContext(keyhop::core::g_contextHint,
                         std::string{ "pass --config-dir or set " } + std::string{ g_configDirEnvVar });
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory resolving configuration directory" };
    }
}

} // namespace keyhop::config
