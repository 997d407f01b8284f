#ifndef INCLUDE_KEYHOP_CORE_SECRETSCODEC_HPP
#define INCLUDE_KEYHOP_CORE_SECRETSCODEC_HPP

#include "keyhop/security/SecureString.hpp"
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace keyhop::core
{

// Secret names are not sensitive; values are.
using SecretMap = std::map<std::string, keyhop::security::SecureString, std::less<>>;

// Newline-separated KEY=VALUE records. Blank lines, lines without '=', and records with an empty
// key or value are skipped. The split is on the first '='; later duplicates win.
[[nodiscard]] SecretMap parseSecrets(std::string_view text);

// Sorted by key, one "KEY=VALUE\n" per entry. Entries with an empty key or value, a newline
// in either, or '=' in the key are left out since they could not be parsed back.
[[nodiscard]] keyhop::security::SecureString formatSecrets(const SecretMap& secrets);

} // namespace keyhop::core

#endif // INCLUDE_KEYHOP_CORE_SECRETSCODEC_HPP
