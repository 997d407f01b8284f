#ifndef INCLUDE_KEYHOP_CORE_ERROR_HPP
#define INCLUDE_KEYHOP_CORE_ERROR_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace keyhop::core
{

enum class ErrorKind : std::uint8_t
{
    Storage,
    Format,
    Crypto,
    Validation,
};

enum class ErrorCode : std::uint8_t
{
    NotFound,
    PermissionDenied,
    IoFailure,
    KeyFileEmpty,
    KeyFileMissingRecipient,
    KeyFileCorrupted,
    KeyPairMismatch,
    NotAnEnvelope,
    TruncatedEnvelope,
    AuthenticationFailed,
    RandomFailed,
    CryptoBackendFailure,
    EmptyArgument,
    InvalidArgument,
    ManualRecoveryRequired,
};

constexpr std::string_view g_contextPath{ "path" };
constexpr std::string_view g_contextHint{ "hint" };
constexpr std::string_view g_contextBackupPath{ "backup_path" };
constexpr std::string_view g_contextRollback{ "rollback" };

// Failure reported by every keyhop service call. `context` carries non-secret details
// such as the file involved and a remediation hint; it never holds key or secret material.
struct Error final
{
    ErrorKind kind{ ErrorKind::Storage };
    ErrorCode code{ ErrorCode::IoFailure };
    std::string message;
    std::map<std::string, std::string, std::less<>> context;

    Error() = default;
    Error(ErrorKind k, ErrorCode c, std::string msg) : kind(k), code(c), message(std::move(msg))
    {
    }

    Error& withContext(std::string_view key, std::string value) &;
    [[nodiscard]] Error&& withContext(std::string_view key, std::string value) &&;

    [[nodiscard]] std::string_view contextValue(std::string_view key) const noexcept;
    [[nodiscard]] std::string_view hint() const noexcept
    {
        return contextValue(g_contextHint);
    }

    // True when automatic recovery failed and a human must act (see ManualRecoveryRequired).
    [[nodiscard]] bool isCritical() const noexcept
    {
        return code == ErrorCode::ManualRecoveryRequired;
    }

    // "<kind> error (<code>): <message> [key=value, ...]"
    [[nodiscard]] std::string describe() const;
};

template <class T> using Result = std::variant<T, Error>;

[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;
[[nodiscard]] std::string_view toString(ErrorCode code) noexcept;

template <class T> [[nodiscard]] bool isError(const Result<T>& r) noexcept
{
    return std::holds_alternative<Error>(r);
}

} // namespace keyhop::core

#endif // INCLUDE_KEYHOP_CORE_ERROR_HPP
