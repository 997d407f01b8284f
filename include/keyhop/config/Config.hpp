#ifndef INCLUDE_KEYHOP_CONFIG_CONFIG_HPP
#define INCLUDE_KEYHOP_CONFIG_CONFIG_HPP

#include "keyhop/core/Error.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace keyhop::config
{

constexpr std::string_view g_configFileName{ "config.yaml" };
constexpr std::string_view g_configDirEnvVar{ "KEYHOP_CONFIG_DIR" };
constexpr std::string_view g_logLevelEnvVar{ "KEYHOP_LOG_LEVEL" };
constexpr std::string_view g_appDirName{ "keyhop" };

struct Config final
{
    // Empty selects the first provider compiled into this build.
    std::string cryptoProvider;
    std::string keyFile{ "keyhop.key" };
    std::string secretsFile{ "secrets.enc" };
    std::string tokenEnvVar{ "ANTHROPIC_AUTH_TOKEN" };
    // Empty means the system temp directory.
    std::string tempDir;
    std::string logLevel{ "warn" };

    // Relative file names resolve against the configuration directory.
    [[nodiscard]] std::filesystem::path keyPath(const std::filesystem::path& configDir) const;
    [[nodiscard]] std::filesystem::path secretsPath(const std::filesystem::path& configDir) const;
};

// `<configDir>/config.yaml`; a missing file yields the defaults. Malformed YAML, an unknown
// provider or log level, or an empty file name is a format error.
[[nodiscard]] keyhop::core::Result<Config> loadConfig(const std::filesystem::path& configDir) noexcept;

// Writes `<configDir>/config.yaml` (0600) atomically, creating the directory if needed.
[[nodiscard]] keyhop::core::Result<std::monostate> saveConfig(const std::filesystem::path& configDir,
                                                              const Config& config) noexcept;

// First match wins: `explicitDir`, $KEYHOP_CONFIG_DIR, $XDG_CONFIG_HOME/keyhop, $HOME/.config/keyhop
// (%APPDATA%\keyhop on Windows).
[[nodiscard]] keyhop::core::Result<std::filesystem::path>
resolveConfigDir(const std::optional<std::filesystem::path>& explicitDir = std::nullopt) noexcept;

} // namespace keyhop::config

#endif // INCLUDE_KEYHOP_CONFIG_CONFIG_HPP
