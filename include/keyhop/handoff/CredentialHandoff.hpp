#ifndef INCLUDE_KEYHOP_HANDOFF_CREDENTIALHANDOFF_HPP
#define INCLUDE_KEYHOP_HANDOFF_CREDENTIALHANDOFF_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keyhop::handoff
{

constexpr std::string_view g_defaultTokenEnvVar{ "ANTHROPIC_AUTH_TOKEN" };

enum class ScriptFlavor : std::uint8_t
{
    Posix,
    PowerShell,
};

enum class ExecutionMode : std::uint8_t
{
    // The script is executable on its own (shebang).
    Direct,
    // The script must be passed to an interpreter (PowerShell).
    Interpreter,
};

struct LauncherScript final
{
    std::filesystem::path scriptPath;
    ExecutionMode executionMode{ ExecutionMode::Direct };
};

[[nodiscard]] ScriptFlavor hostScriptFlavor() noexcept;

// Private per-invocation directory (0700) under `base`, or under the system temp dir if empty.
[[nodiscard]] keyhop::core::Result<std::filesystem::path>
createTempAuthDir(const std::filesystem::path& base = {}) noexcept;

// Writes `secret` verbatim to a new `token-*` file (0600) in `dir`. An empty secret is a validation error.
[[nodiscard]] keyhop::core::Result<std::filesystem::path> writeTokenFile(const std::filesystem::path& dir,
                                                                         std::string_view secret) noexcept;

// Writes a launcher that loads the token file into `envVarName`, deletes the token file, then runs
// `targetBinary` with `targetArgs`. The script holds the token path but never the secret.
// An empty `envVarName` selects g_defaultTokenEnvVar.
[[nodiscard]] keyhop::core::Result<LauncherScript>
generateLauncherScript(const std::filesystem::path& dir, const std::filesystem::path& tokenPath,
                       std::string_view targetBinary, const std::vector<std::string>& targetArgs,
                       std::string_view envVarName = g_defaultTokenEnvVar,
                       ScriptFlavor flavor = hostScriptFlavor()) noexcept;

// PowerShell single-quoted literal: '' for ', and a backtick before ` $ " ; |, with
// `n `r `t `b `0 for the matching control characters.
[[nodiscard]] std::string escapeShellArg(std::string_view arg);

// POSIX sh single-quoted literal; ' becomes '\''.
[[nodiscard]] std::string quotePosixShellArg(std::string_view arg);

// [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] bool isValidEnvVarName(std::string_view name) noexcept;

// argv that runs the launcher according to its execution mode.
[[nodiscard]] std::vector<std::string> launcherCommand(const LauncherScript& script);

// Runs the launcher with inherited stdio and waits. Returns the child's exit status
// (128 + signal number if it was killed).
[[nodiscard]] keyhop::core::Result<int> runLauncher(const LauncherScript& script) noexcept;

struct RemoveDirectory final
{
    std::filesystem::path dir;

    void operator()() const noexcept;
};

// Removes the temp auth directory and everything in it when the scope ends, unless released.
using TempAuthDirGuard = keyhop::security::ScopeExit<RemoveDirectory>;

[[nodiscard]] inline TempAuthDirGuard guardTempAuthDir(std::filesystem::path dir)
{
    return TempAuthDirGuard{ RemoveDirectory{ std::move(dir) } };
}

} // namespace keyhop::handoff

#endif // INCLUDE_KEYHOP_HANDOFF_CREDENTIALHANDOFF_HPP
