#ifndef KEYHOP_SRC_CONFIG_CONFIGYAML_HPP
#define KEYHOP_SRC_CONFIG_CONFIGYAML_HPP

#include "keyhop/config/Config.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace YAML
{

template <> struct convert<keyhop::config::Config>
{
    static Node encode(const keyhop::config::Config& rhs)
    {
        Node node;
        node["crypto_provider"] = rhs.cryptoProvider;
        node["key_file"] = rhs.keyFile;
        node["secrets_file"] = rhs.secretsFile;
        node["token_env_var"] = rhs.tokenEnvVar;
        node["temp_dir"] = rhs.tempDir;
        node["log_level"] = rhs.logLevel;
        return node;
    }

    static bool decode(const Node& node, keyhop::config::Config& rhs)
    {
        if (!node.IsMap())
        {
            return false;
        }
        const keyhop::config::Config defaults{};
        rhs.cryptoProvider = node["crypto_provider"].as<std::string>(defaults.cryptoProvider);
        rhs.keyFile = node["key_file"].as<std::string>(defaults.keyFile);
        rhs.secretsFile = node["secrets_file"].as<std::string>(defaults.secretsFile);
        rhs.tokenEnvVar = node["token_env_var"].as<std::string>(defaults.tokenEnvVar);
        rhs.tempDir = node["temp_dir"].as<std::string>(defaults.tempDir);
        rhs.logLevel = node["log_level"].as<std::string>(defaults.logLevel);
        return true;
    }
};

} // namespace YAML

#endif // KEYHOP_SRC_CONFIG_CONFIGYAML_HPP
