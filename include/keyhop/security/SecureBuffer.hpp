#ifndef INCLUDE_KEYHOP_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_KEYHOP_SECURITY_SECUREBUFFER_HPP

#include "keyhop/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

namespace keyhop::security
{

// Allocator that wipes every block before handing it back to the heap, so growth,
// shrink-to-fit and destruction of a container never leave plaintext behind.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(p), n * sizeof(T) });
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& a, [[maybe_unused]] const ZeroAllocator<U>& b) noexcept
{
    return true;
}

using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

// Zeros the contents but keeps the size.
inline void secureWipeSize(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
}

// Zeros the contents and gives the allocation back.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipeSize(b);
    SecureBuffer empty{};
    b.swap(empty);
}

} // namespace keyhop::security

#endif // INCLUDE_KEYHOP_SECURITY_SECUREBUFFER_HPP
