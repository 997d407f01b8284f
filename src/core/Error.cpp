#include "keyhop/core/Error.hpp"
#include <utility>

namespace keyhop::core
{

Error& Error::withContext(std::string_view key, std::string value) &
{
    context.insert_or_assign(std::string{ key }, std::move(value));
    return *this;
}

Error&& Error::withContext(std::string_view key, std::string value) &&
{
    context.insert_or_assign(std::string{ key }, std::move(value));
    return std::move(*this);
}

std::string_view Error::contextValue(std::string_view key) const noexcept
{
    const auto it{ context.find(key) };
    if (it == context.end())
    {
        return {};
    }
    return it->second;
}

std::string Error::describe() const
{
    std::string out{ toString(kind) };
    out += " error (";
    out += toString(code);
    out += "): ";
    out += message;
    if (!context.empty())
    {
        out += " [";
        bool first{ true };
        for (const auto& [key, value] : context)
        {
            if (!first)
            {
                out += ", ";
            }
            first = false;
            out += key;
            out += '=';
            out += value;
        }
        out += ']';
    }
    return out;
}

std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::Storage:
        return "storage";
    case ErrorKind::Format:
        return "format";
    case ErrorKind::Crypto:
        return "crypto";
    case ErrorKind::Validation:
        return "validation";
    }
    return "unknown";
}

std::string_view toString(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::NotFound:
        return "not_found";
    case ErrorCode::PermissionDenied:
        return "permission_denied";
    case ErrorCode::IoFailure:
        return "io_failure";
    case ErrorCode::KeyFileEmpty:
        return "key_file_empty";
    case ErrorCode::KeyFileMissingRecipient:
        return "key_file_missing_recipient";
    case ErrorCode::KeyFileCorrupted:
        return "key_file_corrupted";
    case ErrorCode::KeyPairMismatch:
        return "key_pair_mismatch";
    case ErrorCode::NotAnEnvelope:
        return "not_an_envelope";
    case ErrorCode::TruncatedEnvelope:
        return "truncated_envelope";
    case ErrorCode::AuthenticationFailed:
        return "authentication_failed";
    case ErrorCode::RandomFailed:
        return "random_failed";
    case ErrorCode::CryptoBackendFailure:
        return "crypto_backend_failure";
    case ErrorCode::EmptyArgument:
        return "empty_argument";
    case ErrorCode::InvalidArgument:
        return "invalid_argument";
    case ErrorCode::ManualRecoveryRequired:
        return "manual_recovery_required";
    }
    return "unknown";
}

} // namespace keyhop::core
