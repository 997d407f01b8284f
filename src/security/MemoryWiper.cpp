#include "keyhop/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#else
#include <string.h>
#endif

namespace keyhop::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    // No explicit_bzero in this libc.
    volatile std::byte* p{ bytes.data() };
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        p[i] = std::byte{};
    }
#endif
}

void secureWipe(std::string& s) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<char>{ s.data(), s.size() }));
    s.clear();
}

} // namespace keyhop::security
