#ifndef INCLUDE_KEYHOP_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_KEYHOP_STORAGE_STORAGEERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace keyhop::storage
{

// I/O failure on a specific file. `errorCode()` is the errno seen by the failing call (0 if unknown).
class StorageError : public std::runtime_error
{
public:
    StorageError(const std::string& what, std::filesystem::path path, int errorCode = 0)
        : std::runtime_error(what), m_path(std::move(path)), m_errorCode(errorCode)
    {
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_path;
    }
    [[nodiscard]] int errorCode() const noexcept
    {
        return m_errorCode;
    }

private:
    std::filesystem::path m_path;
    int m_errorCode{ 0 };
};

class FileNotFound final : public StorageError
{
public:
    using StorageError::StorageError;
};

} // namespace keyhop::storage

#endif // INCLUDE_KEYHOP_STORAGE_STORAGEERRORS_HPP
