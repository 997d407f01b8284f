#include "keyhop/core/SecretsCodec.hpp"
#include "keyhop/log/Registry.hpp"
#include <cstddef>

namespace keyhop::core
{

SecretMap parseSecrets(std::string_view text)
{
    SecretMap out{};
    std::size_t lineNo{ 0U };
    while (!text.empty())
    {
        ++lineNo;
        const auto end{ text.find('\n') };
        const auto line{ text.substr(0, end) };
        text = (end == std::string_view::npos) ? std::string_view{} : text.substr(end + 1U);

        if (line.empty())
        {
            continue;
        }
        const auto eq{ line.find('=') };
        if (eq == std::string_view::npos)
        {
            continue;
        }
        const auto key{ line.substr(0, eq) };
        const auto value{ line.substr(eq + 1U) };
        if (key.empty() || value.empty())
        {
            // Never log the line itself: it may hold a value.
            keyhop::log::Registry::vault()->warn("skipping malformed secret entry on line {}", lineNo);
            continue;
        }
        out.insert_or_assign(std::string{ key }, keyhop::security::secureStringFrom(value));
    }
    return out;
}

keyhop::security::SecureString formatSecrets(const SecretMap& secrets)
{
    keyhop::security::SecureString out{};
    for (const auto& [key, value] : secrets)
    {
        const auto v{ keyhop::security::asStringView(value) };
        if (key.empty() || v.empty())
        {
            continue;
        }
        if (key.find_first_of("=\n") != std::string::npos || v.find('\n') != std::string_view::npos)
        {
            keyhop::log::Registry::vault()->warn("skipping secret '{}': name or value is not storable", key);
            continue;
        }
        keyhop::security::secureAppend(out, key);
        out.push_back('=');
        keyhop::security::secureAppend(out, v);
        out.push_back('\n');
    }
    return out;
}

} // namespace keyhop::core
