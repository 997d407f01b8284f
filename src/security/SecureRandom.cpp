#include "keyhop/security/SecureRandom.hpp"
#include <array>
#include <cerrno>
#include <cstddef>
#include <limits>
#include <vector>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#elif defined(__APPLE__)
#include <sys/random.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace keyhop::security
{
bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    if (out.empty())
    {
        return true;
    }
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };
#if defined(_WIN32)

    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };

        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(outPtr), static_cast<ULONG>(chunk),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }

        remaining -= chunk;
        outPtr += chunk;
    }

#elif defined(__APPLE__)
    // getentropy() caps each request at 256 bytes.
    constexpr std::size_t kMaxChunk{ 256U };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
        if (::getentropy(outPtr, chunk) != 0)
        {
            return false;
        }
        remaining -= chunk;
        outPtr += chunk;
    }

#elif defined(__linux__)
    while (remaining > 0U)
    {
        const ssize_t received{ ::getrandom(outPtr, remaining, 0) };
        if (received > 0)
        {
            const auto count{ static_cast<std::size_t>(received) };
            if (count > remaining)
            {
                return false;
            }
            remaining -= count;
            outPtr += count;
            continue;
        }
        if (received < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }

#endif
    return true;
}

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

std::optional<std::string> randomHexToken(std::size_t byteCount)
{
    std::vector<std::uint8_t> rnd(byteCount);
    if (!secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        return std::nullopt;
    }
    return toHex(std::span<const std::uint8_t>{ rnd });
}

} // namespace keyhop::security
