#include "keyhop/handoff/CredentialHandoff.hpp"
#include "keyhop/core/ErrorMapping.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/storage/SecureFileSystem.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <cerrno>
#include <exception>
#include <new>
#include <span>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <process.h>
#elif defined(__linux__) || defined(__APPLE__)
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace keyhop::handoff
{
namespace
{

using keyhop::core::Error;
using keyhop::core::ErrorCode;
using keyhop::core::ErrorKind;

constexpr std::string_view g_kAuthDirPrefix{ "keyhop-auth-" };
constexpr std::string_view g_kTokenPrefix{ "token-" };
constexpr std::string_view g_kLauncherPrefix{ "launcher-" };
constexpr std::string_view g_kPowerShellSuffix{ ".ps1" };
constexpr std::string_view g_kGeneratedBanner{ "# Generated by keyhop - DO NOT EDIT" };
constexpr std::string_view g_kPowerShellExe{ "powershell" };
constexpr int g_kSignalExitBase{ 128 };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] Error validationError(ErrorCode code, std::string message)
{
    return Error{ ErrorKind::Validation, code, std::move(message) };
}

[[nodiscard]] std::string posixScript(const std::filesystem::path& tokenPath, std::string_view targetBinary,
                                      const std::vector<std::string>& targetArgs, std::string_view envVar)
{
    const auto token{ quotePosixShellArg(tokenPath.string()) };

    std::string script{ "#!/bin/sh\n" };
    script += g_kGeneratedBanner;
    script += '\n';
    script += envVar;
    script += "=$(cat " + token + ")\n";
    script += "keyhop_status=$?\n";
    script += "rm -f " + token + "\n";
    script += "if [ \"$keyhop_status\" -ne 0 ]; then exit 1; fi\n";
    script += "export ";
    script += envVar;
    script += "\nexec " + quotePosixShellArg(targetBinary);
    for (const auto& arg : targetArgs)
    {
        script += ' ';
        script += quotePosixShellArg(arg);
    }
    script += '\n';
    return script;
}

// Literal PowerShell path: only `'` is special inside single quotes.
[[nodiscard]] std::string quotePowerShellPath(std::string_view path)
{
    std::string out{ "'" };
    for (const char c : path)
    {
        out.push_back(c);
        if (c == '\'')
        {
            out.push_back('\'');
        }
    }
    out.push_back('\'');
    return out;
}

[[nodiscard]] std::string powerShellScript(const std::filesystem::path& tokenPath, std::string_view targetBinary,
                                           const std::vector<std::string>& targetArgs, std::string_view envVar)
{
    const auto token{ quotePowerShellPath(tokenPath.string()) };

    std::string script{ g_kGeneratedBanner };
    script += "\r\n$env:";
    script += envVar;
    script += " = Get-Content -LiteralPath " + token + " -Raw\r\n";
    script += "Remove-Item -LiteralPath " + token + " -Force\r\n";
    script += "& " + quotePowerShellPath(targetBinary);
    for (const auto& arg : targetArgs)
    {
        script += ' ';
        script += escapeShellArg(arg);
    }
    script += "\r\nexit $LASTEXITCODE\r\n";
    return script;
}

} // namespace

ScriptFlavor hostScriptFlavor() noexcept
{
#if defined(_WIN32)
    return ScriptFlavor::PowerShell;
#else
    return ScriptFlavor::Posix;
#endif
}

bool isValidEnvVarName(std::string_view name) noexcept
{
    if (name.empty())
    {
        return false;
    }
    const auto isAlpha{ [](char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'; } };
    if (!isAlpha(name.front()))
    {
        return false;
    }
    for (const char c : name.substr(1))
    {
        if (!isAlpha(c) && !(c >= '0' && c <= '9'))
        {
            return false;
        }
    }
    return true;
}

std::string escapeShellArg(std::string_view arg)
{
    std::string out{};
    out.reserve(arg.size() + 2U);
    out.push_back('\'');
    for (const char c : arg)
    {
        switch (c)
        {
        case '\'':
            out += "''";
            break;
        case '`':
            out += "``";
            break;
        case '$':
            out += "`$";
            break;
        case '"':
            out += "`\"";
            break;
        case ';':
            out += "`;";
            break;
        case '|':
            out += "`|";
            break;
        case '\n':
            out += "`n";
            break;
        case '\r':
            out += "`r";
            break;
        case '\t':
            out += "`t";
            break;
        case '\b':
            out += "`b";
            break;
        case '\0':
            out += "`0";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    out.push_back('\'');
    return out;
}

std::string quotePosixShellArg(std::string_view arg)
{
    std::string out{};
    out.reserve(arg.size() + 2U);
    out.push_back('\'');
    for (const char c : arg)
    {
        if (c == '\'')
        {
            out += "'\\''";
        }
        else
        {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

keyhop::core::Result<std::filesystem::path> createTempAuthDir(const std::filesystem::path& base) noexcept
{
    try
    {
        const auto root{ base.empty() ? std::filesystem::temp_directory_path() : base };
        auto dir{ keyhop::storage::createUniqueDirectory(root, g_kAuthDirPrefix) };
        keyhop::log::Registry::handoff()->debug("created auth dir {}", dir.string());
        return dir;
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return keyhop::core::detail::storageError(e);
    }
    catch (const std::filesystem::filesystem_error& e)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, e.what() };
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory creating auth dir" };
    }
}

keyhop::core::Result<std::filesystem::path> writeTokenFile(const std::filesystem::path& dir,
                                                           std::string_view secret) noexcept
{
    if (secret.empty())
    {
        return validationError(ErrorCode::EmptyArgument, "token cannot be empty");
    }
    try
    {
        auto path{ keyhop::storage::createUniqueFile(dir, g_kTokenPrefix, {}, asBytes(secret)) };
        keyhop::log::Registry::handoff()->debug("staged token file {}", path.string());
        return path;
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return keyhop::core::detail::storageError(e);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory writing token file" };
    }
}

keyhop::core::Result<LauncherScript> generateLauncherScript(const std::filesystem::path& dir,
                                                            const std::filesystem::path& tokenPath,
                                                            std::string_view targetBinary,
                                                            const std::vector<std::string>& targetArgs,
                                                            std::string_view envVarName, ScriptFlavor flavor) noexcept
{
    if (tokenPath.empty())
    {
        return validationError(ErrorCode::EmptyArgument, "token path cannot be empty");
    }
    if (targetBinary.empty())
    {
        return validationError(ErrorCode::EmptyArgument, "target binary cannot be empty");
    }
    const std::string_view envVar{ envVarName.empty() ? g_defaultTokenEnvVar : envVarName };
    if (!isValidEnvVarName(envVar))
    {
        try
        {
            return validationError(ErrorCode::InvalidArgument,
                                   "environment variable name must match [A-Za-z_][A-Za-z0-9_]*")
                .withContext("env_var", std::string{ envVar });
        }
        catch (const std::bad_alloc&)
        {
            return Error{ ErrorKind::Validation, ErrorCode::InvalidArgument, {} };
        }
    }

    try
    {
        LauncherScript out{};
        if (flavor == ScriptFlavor::PowerShell)
        {
            const auto script{ powerShellScript(tokenPath, targetBinary, targetArgs, envVar) };
            out.scriptPath = keyhop::storage::createUniqueFile(dir, g_kLauncherPrefix, g_kPowerShellSuffix,
                                                               asBytes(script));
            out.executionMode = ExecutionMode::Interpreter;
        }
        else
        {
            const auto script{ posixScript(tokenPath, targetBinary, targetArgs, envVar) };
            out.scriptPath = keyhop::storage::createUniqueFile(dir, g_kLauncherPrefix, {}, asBytes(script),
                                                               keyhop::storage::g_privateExecPerms);
            out.executionMode = ExecutionMode::Direct;
        }
        keyhop::log::Registry::handoff()->debug("wrote launcher {} for {}", out.scriptPath.string(), targetBinary);
        return out;
    }
    catch (const keyhop::storage::StorageError& e)
    {
        return keyhop::core::detail::storageError(e);
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory writing launcher" };
    }
}

std::vector<std::string> launcherCommand(const LauncherScript& script)
{
    if (script.executionMode == ExecutionMode::Interpreter)
    {
        return { std::string{ g_kPowerShellExe }, "-NoProfile", "-ExecutionPolicy", "Bypass", "-File",
                 script.scriptPath.string() };
    }
    return { script.scriptPath.string() };
}

keyhop::core::Result<int> runLauncher(const LauncherScript& script) noexcept
{
    try
    {
        const auto command{ launcherCommand(script) };

#if defined(_WIN32)
        std::vector<std::wstring> wide{};
        wide.reserve(command.size());
        for (const auto& arg : command)
        {
            wide.push_back(std::filesystem::path{ arg }.wstring());
        }
        std::vector<const wchar_t*> argv{};
        for (const auto& arg : wide)
        {
            argv.push_back(arg.c_str());
        }
        argv.push_back(nullptr);

        const intptr_t status{ ::_wspawnvp(_P_WAIT, argv.front(), argv.data()) };
        if (status == -1)
        {
            return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "failed to start launcher" }.withContext(
                keyhop::core::g_contextPath, script.scriptPath.string());
        }
        return static_cast<int>(status);
#else
        std::vector<char*> argv{};
        argv.reserve(command.size() + 1U);
        for (const auto& arg : command)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        const pid_t pid{ ::fork() };
        if (pid < 0)
        {
            return Error{ ErrorKind::Storage, ErrorCode::IoFailure,
                          std::string{ "fork failed: " } + std::generic_category().message(errno) };
        }
        if (pid == 0)
        {
            ::execv(argv.front(), argv.data());
            ::_exit(127);
        }

        int status{ 0 };
        pid_t waited{ -1 };
        do
        {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
        if (waited < 0)
        {
            return Error{ ErrorKind::Storage, ErrorCode::IoFailure,
                          std::string{ "waitpid failed: " } + std::generic_category().message(errno) };
        }

        if (WIFEXITED(status))
        {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status))
        {
            return g_kSignalExitBase + WTERMSIG(status);
        }
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "launcher ended in an unexpected state" };
#endif
    }
    catch (const std::bad_alloc&)
    {
        return Error{ ErrorKind::Storage, ErrorCode::IoFailure, "out of memory starting launcher" };
    }
}

void RemoveDirectory::operator()() const noexcept
{
    if (dir.empty())
    {
        return;
    }
    std::error_code ec{};
    std::filesystem::remove_all(dir, ec);
    if (ec)
    {
        try
        {
            keyhop::log::Registry::handoff()->warn("could not remove auth dir {}: {}", dir.string(), ec.message());
        }
        catch (const std::exception&)
        {
            // Logging is best effort during cleanup.
            return;
        }
    }
}

} // namespace keyhop::handoff
