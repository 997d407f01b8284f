#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"
#include "keyhop/core/KeyRotator.hpp"
#include "keyhop/core/KeyStore.hpp"
#include "keyhop/core/SecretVault.hpp"
#include "keyhop/crypto/providers/ProviderFactory.hpp"
#include "keyhop/handoff/CredentialHandoff.hpp"
#include "keyhop/log/Registry.hpp"
#include "keyhop/security/ScopeWipe.hpp"
#include "keyhop/security/SecretBytes.hpp"

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <exception>
#include <new>
#include <system_error>
#include <utility>
#include <variant>

namespace keyhop::ui::cli
{

namespace
{

using keyhop::core::Error;
using keyhop::core::ErrorCode;
using keyhop::core::ErrorKind;
using keyhop::core::Result;

[[nodiscard]] spdlog::level::level_enum effectiveLogLevel(const keyhop::config::Config& config)
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    if (const char* env{ std::getenv(std::string{ keyhop::config::g_logLevelEnvVar }.c_str()) }; env != nullptr)
    {
        if (auto level{ keyhop::log::Registry::parseLevel(env) })
        {
            return *level;
        }
    }
    return keyhop::log::Registry::parseLevel(config.logLevel).value_or(spdlog::level::warn);
}

[[nodiscard]] Error validationError(ErrorCode code, std::string message)
{
    return Error{ ErrorKind::Validation, code, std::move(message) };
}

} // namespace

CommandLine::CommandLine(std::istream& in, std::ostream& out, std::ostream& err, SecretReader secretReader)
    : m_in(in), m_out(out), m_err(err), m_secretReader(std::move(secretReader))
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    m_configDirArg.clear();
    m_exitCode = g_exitOk;

    CLI::App app{ "keyhop - encrypted API credentials handed to child processes" };
    app.require_subcommand(1);
    app.fallthrough();

    // Subcommand callbacks run once the whole line is parsed, so this is set before any of them.
    // fallthrough() lets it follow the subcommand as well.
    app.add_option("--config-dir", m_configDirArg, "Configuration directory");

    // INIT
    app.add_subcommand("init", "Create the configuration directory and key pair")->callback([this]() {
        m_exitCode = doInit();
    });

    // SET
    std::string nameArg;
    auto* subSet = app.add_subcommand("set", "Store a secret (prompts for the value)");
    subSet->add_option("name", nameArg, "Secret name")->required();
    subSet->callback([&]() { m_exitCode = doSet(nameArg); });

    // UNSET
    auto* subUnset = app.add_subcommand("unset", "Remove a secret");
    subUnset->add_option("name", nameArg, "Secret name")->required();
    subUnset->callback([&]() { m_exitCode = doUnset(nameArg); });

    // LIST
    app.add_subcommand("list", "List secret names")->callback([this]() { m_exitCode = doList(); });

    // ROTATE
    bool assumeYes{ false };
    auto* subRotate = app.add_subcommand("rotate", "Replace the key pair and re-encrypt the secrets");
    subRotate->add_flag("-y,--yes", assumeYes, "Do not ask for confirmation");
    subRotate->callback([&]() { m_exitCode = doRotate(assumeYes); });

    // RUN
    std::string envArg;
    std::vector<std::string> commandArgs;
    auto* subRun = app.add_subcommand("run", "Run a program with a secret in its environment");
    subRun->add_option("name", nameArg, "Secret name")->required();
    subRun->add_option("--env", envArg, "Environment variable that receives the secret");
    subRun->add_option("command", commandArgs, "Program and its arguments (after --)")->required();
    subRun->callback([&]() { m_exitCode = doRun(nameArg, envArg, commandArgs); });

    try
    {
        std::vector<const char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(arg.c_str());
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e, m_out, m_err);
    }
    catch (const std::bad_alloc&)
    {
        m_err << "error: out of memory\n";
        return g_exitFailure;
    }
    return m_exitCode;
}

Result<Workspace> CommandLine::openWorkspace()
{
    std::optional<std::filesystem::path> explicitDir{};
    if (!m_configDirArg.empty())
    {
        explicitDir = std::filesystem::path{ m_configDirArg };
    }
    auto dir{ keyhop::config::resolveConfigDir(explicitDir) };
    if (auto* err{ std::get_if<Error>(&dir) })
    {
        return std::move(*err);
    }

    Workspace ws{};
    ws.configDir = std::move(std::get<std::filesystem::path>(dir));

    auto config{ keyhop::config::loadConfig(ws.configDir) };
    if (auto* err{ std::get_if<Error>(&config) })
    {
        return std::move(*err);
    }
    ws.config = std::move(std::get<keyhop::config::Config>(config));

    keyhop::log::Registry::init(effectiveLogLevel(ws.config));

    std::string_view providerName{ ws.config.cryptoProvider };
    const auto available{ keyhop::crypto::providers::availableCryptoProviders() };
    if (providerName.empty() && !available.empty())
    {
        providerName = available.front();
    }
    try
    {
        ws.crypto = keyhop::crypto::providers::makeCryptoProvider(providerName);
    }
    catch (const std::exception& e)
    {
        return Error{ ErrorKind::Crypto, ErrorCode::CryptoBackendFailure, e.what() };
    }
    if (!ws.crypto)
    {
        return validationError(ErrorCode::InvalidArgument,
                               "crypto provider '" + std::string{ providerName } + "' is not available in this build");
    }
    keyhop::log::Registry::keyhop()->debug("config dir {}, provider {}", ws.configDir.string(), ws.crypto->name());
    return ws;
}

Result<keyhop::core::SecretMap> CommandLine::loadSecrets(const Workspace& ws)
{
    keyhop::core::SecretVault vault{ *ws.crypto };
    const auto exists{ vault.secretsExist(ws.secretsPath()) };
    if (const auto* err{ std::get_if<Error>(&exists) })
    {
        return *err;
    }
    if (!std::get<bool>(exists))
    {
        return keyhop::core::SecretMap{};
    }

    auto plain{ vault.decryptSecretsBytes(ws.secretsPath(), ws.keyPath()) };
    if (auto* err{ std::get_if<Error>(&plain) })
    {
        return std::move(*err);
    }
    auto& bytes{ std::get<keyhop::security::SecretBytes>(plain) };
    auto secrets{ keyhop::core::parseSecrets(bytes.str()) };
    bytes.close();
    return secrets;
}

int CommandLine::report(const Error& error)
{
    keyhop::log::Registry::keyhop()->debug("{}", error.describe());

    if (error.isCritical())
    {
        m_err << "CRITICAL: ";
    }
    m_err << "error: " << error.message;
    if (const auto path{ error.contextValue(keyhop::core::g_contextPath) }; !path.empty())
    {
        m_err << " (" << path << ")";
    }
    m_err << "\n";

    if (const auto backup{ error.contextValue(keyhop::core::g_contextBackupPath) }; !backup.empty())
    {
        m_err << "backup: " << backup << "\n";
    }
    if (error.contextValue(keyhop::core::g_contextRollback) == "restored")
    {
        m_err << "the previous key was restored; your secrets are unchanged\n";
    }

    std::string hint{ error.hint() };
    if (hint.empty())
    {
        hint = remediationFor(error);
    }
    if (!hint.empty())
    {
        m_err << "hint: " << hint << "\n";
    }
    return g_exitFailure;
}

int CommandLine::doInit()
{
    auto opened{ openWorkspace() };
    if (const auto* err{ std::get_if<Error>(&opened) })
    {
        return report(*err);
    }
    const auto& ws{ std::get<Workspace>(opened) };

    const auto configFile{ ws.configDir / std::filesystem::path{ keyhop::config::g_configFileName } };
    std::error_code ec{};
    if (!std::filesystem::exists(configFile, ec) && !ec)
    {
        const auto saved{ keyhop::config::saveConfig(ws.configDir, ws.config) };
        if (const auto* err{ std::get_if<Error>(&saved) })
        {
            return report(*err);
        }
    }

    const auto keyPath{ ws.keyPath() };
    keyhop::core::KeyStore keys{ *ws.crypto };
    const auto created{ keys.ensureKeyExists(keyPath.parent_path(), keyPath.filename().string()) };
    if (const auto* err{ std::get_if<Error>(&created) })
    {
        return report(*err);
    }

    if (std::get<bool>(created))
    {
        m_out << "Created key pair at " << keyPath.string() << "\n";
    }
    else
    {
        m_out << "Key pair already exists at " << keyPath.string() << "\n";
    }
    return g_exitOk;
}

int CommandLine::doSet(const std::string& name)
{
    if (!isValidSecretName(name))
    {
        return report(validationError(ErrorCode::InvalidArgument, "invalid secret name")
                          .withContext(keyhop::core::g_contextHint, "names must not contain '=' or line breaks"));
    }

    auto opened{ openWorkspace() };
    if (const auto* err{ std::get_if<Error>(&opened) })
    {
        return report(*err);
    }
    const auto& ws{ std::get<Workspace>(opened) };

    const auto keyPath{ ws.keyPath() };
    keyhop::core::KeyStore keys{ *ws.crypto };
    const auto created{ keys.ensureKeyExists(keyPath.parent_path(), keyPath.filename().string()) };
    if (const auto* err{ std::get_if<Error>(&created) })
    {
        return report(*err);
    }

    auto loaded{ loadSecrets(ws) };
    if (const auto* err{ std::get_if<Error>(&loaded) })
    {
        return report(*err);
    }
    auto& secrets{ std::get<keyhop::core::SecretMap>(loaded) };

    auto value{ m_secretReader("Value for " + name + ": ") };
    auto wipeValue{ keyhop::security::scopeWipe(value) };
    const auto valueView{ keyhop::security::asStringView(value) };
    if (valueView.empty())
    {
        return report(validationError(ErrorCode::EmptyArgument, "no value entered"));
    }
    if (valueView.find_first_of("\r\n") != std::string_view::npos)
    {
        return report(validationError(ErrorCode::InvalidArgument, "values must be a single line"));
    }

    secrets.insert_or_assign(name, value);
    auto text{ keyhop::core::formatSecrets(secrets) };
    auto wipeText{ keyhop::security::scopeWipe(text) };

    keyhop::core::SecretVault vault{ *ws.crypto };
    const auto saved{ vault.encryptSecrets(ws.secretsPath(), keyPath, keyhop::security::asStringView(text)) };
    if (const auto* err{ std::get_if<Error>(&saved) })
    {
        return report(*err);
    }
    m_out << "Stored " << name << "\n";
    return g_exitOk;
}

int CommandLine::doUnset(const std::string& name)
{
    auto opened{ openWorkspace() };
    if (const auto* err{ std::get_if<Error>(&opened) })
    {
        return report(*err);
    }
    const auto& ws{ std::get<Workspace>(opened) };

    auto loaded{ loadSecrets(ws) };
    if (const auto* err{ std::get_if<Error>(&loaded) })
    {
        return report(*err);
    }
    auto& secrets{ std::get<keyhop::core::SecretMap>(loaded) };

    const auto it{ secrets.find(name) };
    if (it == secrets.end())
    {
        return report(validationError(ErrorCode::NotFound, "no secret named '" + name + "'")
                          .withContext(keyhop::core::g_contextHint, "see `keyhop list`"));
    }
    keyhop::security::secureRelease(it->second);
    secrets.erase(it);

    auto text{ keyhop::core::formatSecrets(secrets) };
    auto wipeText{ keyhop::security::scopeWipe(text) };

    keyhop::core::SecretVault vault{ *ws.crypto };
    const auto saved{ vault.encryptSecrets(ws.secretsPath(), ws.keyPath(), keyhop::security::asStringView(text)) };
    if (const auto* err{ std::get_if<Error>(&saved) })
    {
        return report(*err);
    }
    m_out << "Removed " << name << "\n";
    return g_exitOk;
}

int CommandLine::doList()
{
    auto opened{ openWorkspace() };
    if (const auto* err{ std::get_if<Error>(&opened) })
    {
        return report(*err);
    }
    const auto& ws{ std::get<Workspace>(opened) };

    const auto loaded{ loadSecrets(ws) };
    if (const auto* err{ std::get_if<Error>(&loaded) })
    {
        return report(*err);
    }
    const auto& secrets{ std::get<keyhop::core::SecretMap>(loaded) };

    if (secrets.empty())
    {
        m_out << "(empty)\n";
        return g_exitOk;
    }
    for (const auto& entry : secrets)
    {
        m_out << " - " << entry.first << "\n";
    }
    return g_exitOk;
}

int CommandLine::doRotate(bool assumeYes)
{
    auto opened{ openWorkspace() };
    if (const auto* err{ std::get_if<Error>(&opened) })
    {
        return report(*err);
    }
    const auto& ws{ std::get<Workspace>(opened) };

    if (!assumeYes && !confirm("Replace the key pair and re-encrypt all secrets?", m_in, m_out))
    {
        m_out << "Rotation cancelled.\n";
        return g_exitOk;
    }

    keyhop::core::KeyRotator rotator{ *ws.crypto };
    const auto result{ rotator.rotate(keyhop::core::RotationPaths{ ws.keyPath(), ws.secretsPath() }) };
    if (const auto* err{ std::get_if<Error>(&result) })
    {
        return report(*err);
    }

    if (std::get<keyhop::core::RotationOutcome>(result) == keyhop::core::RotationOutcome::Reencrypted)
    {
        m_out << "Key rotated; secrets re-encrypted.\n";
    }
    else
    {
        m_out << "Key rotated.\n";
    }
    return g_exitOk;
}

int CommandLine::doRun(const std::string& name, const std::string& envVar, const std::vector<std::string>& command)
{
    auto opened{ openWorkspace() };
    if (const auto* err{ std::get_if<Error>(&opened) })
    {
        return report(*err);
    }
    const auto& ws{ std::get<Workspace>(opened) };

    const std::string& variable{ envVar.empty() ? ws.config.tokenEnvVar : envVar };
    if (!keyhop::handoff::isValidEnvVarName(variable))
    {
        return report(validationError(ErrorCode::InvalidArgument, "invalid environment variable name '" + variable + "'"));
    }

    auto loaded{ loadSecrets(ws) };
    if (const auto* err{ std::get_if<Error>(&loaded) })
    {
        return report(*err);
    }
    auto& secrets{ std::get<keyhop::core::SecretMap>(loaded) };

    const auto it{ secrets.find(name) };
    if (it == secrets.end())
    {
        return report(validationError(ErrorCode::NotFound, "no secret named '" + name + "'")
                          .withContext(keyhop::core::g_contextHint, "add it with `keyhop set " + name + "`"));
    }

    const std::filesystem::path base{ ws.config.tempDir };
    auto dir{ keyhop::handoff::createTempAuthDir(base) };
    if (const auto* err{ std::get_if<Error>(&dir) })
    {
        return report(*err);
    }
    const auto authDir{ std::get<std::filesystem::path>(dir) };
    auto removeAuthDir{ keyhop::handoff::guardTempAuthDir(authDir) };

    auto token{ keyhop::handoff::writeTokenFile(authDir, keyhop::security::asStringView(it->second)) };
    for (auto& entry : secrets)
    {
        keyhop::security::secureRelease(entry.second);
    }
    secrets.clear();
    if (const auto* err{ std::get_if<Error>(&token) })
    {
        return report(*err);
    }

    const std::vector<std::string> targetArgs(command.begin() + 1, command.end());
    const auto script{ keyhop::handoff::generateLauncherScript(authDir, std::get<std::filesystem::path>(token),
                                                               command.front(), targetArgs, variable) };
    if (const auto* err{ std::get_if<Error>(&script) })
    {
        return report(*err);
    }

    keyhop::log::Registry::keyhop()->info("running {} with {} set", command.front(), variable);
    const auto status{ keyhop::handoff::runLauncher(std::get<keyhop::handoff::LauncherScript>(script)) };
    if (const auto* err{ std::get_if<Error>(&status) })
    {
        return report(*err);
    }
    return std::get<int>(status);
}

std::string remediationFor(const Error& error)
{
    switch (error.code)
    {
    case ErrorCode::NotFound:
        return error.kind == ErrorKind::Storage ? "run `keyhop init` first" : std::string{};
    case ErrorCode::PermissionDenied:
        return "check that the file belongs to you and is not readable by others";
    case ErrorCode::KeyFileEmpty:
    case ErrorCode::KeyFileMissingRecipient:
    case ErrorCode::KeyFileCorrupted:
    case ErrorCode::KeyPairMismatch:
        return "the key file is damaged; restore it from a backup";
    case ErrorCode::NotAnEnvelope:
    case ErrorCode::TruncatedEnvelope:
    case ErrorCode::AuthenticationFailed:
        return "restore the secrets file or the key file from a backup";
    case ErrorCode::ManualRecoveryRequired:
        return "copy the backup over the key file by hand before running keyhop again";
    default:
        return {};
    }
}

bool isValidSecretName(std::string_view name) noexcept
{
    return !name.empty() && name.find_first_of("=\r\n") == std::string_view::npos;
}

} // namespace keyhop::ui::cli
