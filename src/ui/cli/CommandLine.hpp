#ifndef KEYHOP_SRC_UI_CLI_COMMANDLINE_HPP
#define KEYHOP_SRC_UI_CLI_COMMANDLINE_HPP

#include "keyhop/config/Config.hpp"
#include "keyhop/core/Error.hpp"
#include "keyhop/core/SecretsCodec.hpp"
#include "keyhop/crypto/ICryptoProvider.hpp"
#include "keyhop/security/SecureString.hpp"

#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyhop::ui::cli
{

// In tests: returns a pre-determined string.
using SecretReader = std::function<keyhop::security::SecureString(const std::string&)>;

constexpr int g_exitOk{ 0 };
constexpr int g_exitFailure{ 1 };

// Everything a command needs once the configuration directory is known.
struct Workspace final
{
    std::filesystem::path configDir;
    keyhop::config::Config config;
    std::unique_ptr<keyhop::crypto::ICryptoProvider> crypto;

    [[nodiscard]] std::filesystem::path keyPath() const
    {
        return config.keyPath(configDir);
    }
    [[nodiscard]] std::filesystem::path secretsPath() const
    {
        return config.secretsPath(configDir);
    }
};

// `keyhop [--config-dir DIR] <command>`. Each run() parses one argv and executes one command.
class CommandLine final
{
public:
    CommandLine(std::istream& in, std::ostream& out, std::ostream& err, SecretReader secretReader);

    // `args[0]` is the program name. Returns the process exit code; for `run` that is the
    // target's exit status.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    std::istream& m_in;
    std::ostream& m_out;
    std::ostream& m_err;
    SecretReader m_secretReader;

    std::string m_configDirArg;
    int m_exitCode{ g_exitOk };

    [[nodiscard]] keyhop::core::Result<Workspace> openWorkspace();
    [[nodiscard]] keyhop::core::Result<keyhop::core::SecretMap> loadSecrets(const Workspace& ws);
    [[nodiscard]] int report(const keyhop::core::Error& error);

    int doInit();
    int doSet(const std::string& name);
    int doUnset(const std::string& name);
    int doList();
    int doRotate(bool assumeYes);
    int doRun(const std::string& name, const std::string& envVar, const std::vector<std::string>& command);
};

// Remediation printed after the error when the error carries no hint of its own.
[[nodiscard]] std::string remediationFor(const keyhop::core::Error& error);

// Names must be non-empty and free of '=', '\r' and '\n' to survive the KEY=VALUE format.
[[nodiscard]] bool isValidSecretName(std::string_view name) noexcept;

} // namespace keyhop::ui::cli

#endif // KEYHOP_SRC_UI_CLI_COMMANDLINE_HPP
