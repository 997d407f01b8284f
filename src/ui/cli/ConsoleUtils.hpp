#ifndef KEYHOP_SRC_UI_CLI_CONSOLEUTILS_HPP
#define KEYHOP_SRC_UI_CLI_CONSOLEUTILS_HPP

#include "keyhop/security/SecureString.hpp"
#include <iosfwd>
#include <string>

namespace keyhop::ui::cli
{

// Keeps decrypted pages out of swap and disables core dumps. Returns false if either step
// failed (commonly RLIMIT_MEMLOCK for unprivileged users); callers carry on regardless.
[[nodiscard]] bool lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo off. A trailing '\r' is dropped.
[[nodiscard]] keyhop::security::SecureString readSecret(const std::string& prompt);

// Prints `prompt [y/N] ` and reads one line; only "y" or "yes" (any case) confirm.
[[nodiscard]] bool confirm(const std::string& prompt, std::istream& in, std::ostream& out);

} // namespace keyhop::ui::cli

#endif // KEYHOP_SRC_UI_CLI_CONSOLEUTILS_HPP
