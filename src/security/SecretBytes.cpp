#include "keyhop/security/SecretBytes.hpp"

#include <utility>

namespace keyhop::security
{

SecretBytes::SecretBytes(SecureString data) noexcept : m_data{ std::move(data) }
{
}

SecretBytes::SecretBytes(SecretBytes&& other) noexcept : m_data{}, m_closed{ other.m_closed }
{
    m_data.swap(other.m_data);
    other.m_closed = true;
}

SecretBytes& SecretBytes::operator=(SecretBytes&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    close();
    m_data.swap(other.m_data);
    m_closed = other.m_closed;
    other.m_closed = true;
    return *this;
}

SecretBytes::~SecretBytes() noexcept
{
    close();
}

std::string_view SecretBytes::str() const noexcept
{
    return asStringView(m_data);
}

std::span<const std::byte> SecretBytes::bytes() const noexcept
{
    return asBytes(m_data);
}

std::size_t SecretBytes::size() const noexcept
{
    return m_data.size();
}

bool SecretBytes::empty() const noexcept
{
    return m_data.empty();
}

bool SecretBytes::closed() const noexcept
{
    return m_closed;
}

void SecretBytes::clear() noexcept
{
    secureWipeSize(m_data);
}

void SecretBytes::close() noexcept
{
    clear();
    secureRelease(m_data);
    m_closed = true;
}

} // namespace keyhop::security
