#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "keyhop/security/SecureString.hpp"

TEST(SecureString, AsStringViewEmptyIsSafe)
{
    const keyhop::security::SecureString s{};
    EXPECT_TRUE(keyhop::security::asStringView(s).empty());
}

TEST(SecureString, SecureStringFromCopiesBytes)
{
    constexpr std::string_view input{ "sk-ant-123" };
    const auto s{ keyhop::security::secureStringFrom(input) };
    EXPECT_EQ(keyhop::security::asStringView(s), input);
}

TEST(SecureString, FromSecureBufferPreservesBytePatterns)
{
    const keyhop::security::SecureBuffer b{ 0x00U, 0x7FU, 0x80U, 0xFFU };

    const auto s{ keyhop::security::secureStringFrom(b) };

    ASSERT_EQ(s.size(), b.size());
    for (std::size_t i{ 0U }; i < b.size(); ++i)
    {
        EXPECT_EQ(static_cast<std::uint8_t>(static_cast<unsigned char>(s[i])), b[i]);
    }
}

TEST(SecureString, SecureAppendExtends)
{
    auto s{ keyhop::security::secureStringFrom("KEY=") };
    keyhop::security::secureAppend(s, "value");
    EXPECT_EQ(keyhop::security::asStringView(s), "KEY=value");
}

TEST(SecureString, SecureReleaseEmpties)
{
    auto s{ keyhop::security::secureStringFrom("secret-data") };
    keyhop::security::secureRelease(s);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);
}
