#include <gtest/gtest.h>

#include <string>

#include "keyhop/core/Error.hpp"

TEST(Error, DescribeIncludesKindCodeAndContext)
{
    keyhop::core::Error err{ keyhop::core::ErrorKind::Format, keyhop::core::ErrorCode::KeyFileEmpty,
                             "key file is empty" };
    err.withContext(keyhop::core::g_contextPath, "/tmp/k");

    const auto text{ err.describe() };
    EXPECT_EQ(text, "format error (key_file_empty): key file is empty [path=/tmp/k]");
}

TEST(Error, ContextValueMissingIsEmpty)
{
    const keyhop::core::Error err{};
    EXPECT_TRUE(err.contextValue("nope").empty());
    EXPECT_TRUE(err.hint().empty());
    EXPECT_EQ(err.describe().find('['), std::string::npos);
}

TEST(Error, WithContextOverwritesAndChains)
{
    auto err{ keyhop::core::Error{ keyhop::core::ErrorKind::Storage, keyhop::core::ErrorCode::NotFound, "missing" }
                  .withContext(keyhop::core::g_contextHint, "first")
                  .withContext(keyhop::core::g_contextHint, "second") };
    EXPECT_EQ(err.hint(), "second");
    EXPECT_EQ(err.context.size(), 1U);
}

TEST(Error, OnlyManualRecoveryIsCritical)
{
    const keyhop::core::Error fatal{ keyhop::core::ErrorKind::Storage, keyhop::core::ErrorCode::ManualRecoveryRequired,
                                     "x" };
    const keyhop::core::Error plain{ keyhop::core::ErrorKind::Crypto, keyhop::core::ErrorCode::AuthenticationFailed,
                                     "x" };
    EXPECT_TRUE(fatal.isCritical());
    EXPECT_FALSE(plain.isCritical());
}

TEST(Error, KindAndCodeNames)
{
    EXPECT_EQ(keyhop::core::toString(keyhop::core::ErrorKind::Validation), "validation");
    EXPECT_EQ(keyhop::core::toString(keyhop::core::ErrorCode::NotAnEnvelope), "not_an_envelope");
    EXPECT_EQ(keyhop::core::toString(keyhop::core::ErrorCode::ManualRecoveryRequired), "manual_recovery_required");
}

TEST(Error, IsErrorOnResult)
{
    const keyhop::core::Result<int> ok{ 1 };
    const keyhop::core::Result<int> bad{ keyhop::core::Error{} };
    EXPECT_FALSE(keyhop::core::isError(ok));
    EXPECT_TRUE(keyhop::core::isError(bad));
}
