#ifndef INCLUDE_KEYHOP_CORE_ERRORMAPPING_HPP
#define INCLUDE_KEYHOP_CORE_ERRORMAPPING_HPP

#include "keyhop/core/Error.hpp"
#include "keyhop/storage/StorageErrors.hpp"
#include <cerrno>
#include <string>
#include <string_view>

namespace keyhop::core::detail
{

constexpr std::string_view g_kHintCheckPermissions{ "check that the file exists and is readable by the current user" };

[[nodiscard]] inline Error storageError(const keyhop::storage::StorageError& e, std::string_view hint = {})
{
    ErrorCode code{ ErrorCode::IoFailure };
    if (e.errorCode() == ENOENT)
    {
        code = ErrorCode::NotFound;
    }
    else if (e.errorCode() == EACCES || e.errorCode() == EPERM)
    {
        code = ErrorCode::PermissionDenied;
    }

    Error err{ ErrorKind::Storage, code, e.what() };
    err.withContext(g_contextPath, e.path().string());
    if (!hint.empty())
    {
        err.withContext(g_contextHint, std::string{ hint });
    }
    else if (code == ErrorCode::PermissionDenied)
    {
        err.withContext(g_contextHint, std::string{ g_kHintCheckPermissions });
    }
    return err;
}

[[nodiscard]] inline Error cryptoBackendError(std::string_view what)
{
    return Error{ ErrorKind::Crypto, ErrorCode::CryptoBackendFailure, std::string{ what } };
}

} // namespace keyhop::core::detail

#endif // INCLUDE_KEYHOP_CORE_ERRORMAPPING_HPP
