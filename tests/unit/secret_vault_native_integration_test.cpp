#include "keyhop/crypto/providers/ProviderFactory.hpp"
#include "test_utils/SecretVaultScenarios.hpp"
#include <gtest/gtest.h>

TEST(SecretVault, RoundTripWithNativeProvider)
{
    auto crypto{ keyhop::crypto::providers::makeNativeCryptoProvider() };
    ASSERT_NO_FATAL_FAILURE(keyhop::test_utils::runRoundTrip(*crypto, "secret_vault_native_"));
}

TEST(SecretVault, DetectsTamperingWithNativeProvider)
{
    auto crypto{ keyhop::crypto::providers::makeNativeCryptoProvider() };
    ASSERT_NO_FATAL_FAILURE(keyhop::test_utils::runTamperDetection(*crypto, "secret_vault_native_"));
}

TEST(SecretVault, KeyFileFormatsWithNativeProvider)
{
    auto crypto{ keyhop::crypto::providers::makeNativeCryptoProvider() };
    ASSERT_NO_FATAL_FAILURE(keyhop::test_utils::runKeyFileFormats(*crypto, "secret_vault_native_"));
}

TEST(SecretVault, RotationPreservesSecretsWithNativeProvider)
{
    auto crypto{ keyhop::crypto::providers::makeNativeCryptoProvider() };
    ASSERT_NO_FATAL_FAILURE(keyhop::test_utils::runRotationPreservesSecrets(*crypto, "secret_vault_native_"));
}
