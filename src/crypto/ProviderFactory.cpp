#include "keyhop/crypto/providers/ProviderFactory.hpp"

namespace keyhop::crypto::providers
{

[[nodiscard]] std::vector<std::string_view> availableCryptoProviders()
{
    std::vector<std::string_view> names{};
#if defined(KEYHOP_ENABLE_MONOCYPHER) && KEYHOP_ENABLE_MONOCYPHER
    names.push_back(g_nativeProviderName);
#endif
#if defined(KEYHOP_ENABLE_OPENSSL) && KEYHOP_ENABLE_OPENSSL
    names.push_back(g_openSslProviderName);
#endif
    return names;
}

[[nodiscard]] std::unique_ptr<keyhop::crypto::ICryptoProvider> makeCryptoProvider(std::string_view name)
{
#if defined(KEYHOP_ENABLE_MONOCYPHER) && KEYHOP_ENABLE_MONOCYPHER
    if (name == g_nativeProviderName)
    {
        return makeNativeCryptoProvider();
    }
#endif
#if defined(KEYHOP_ENABLE_OPENSSL) && KEYHOP_ENABLE_OPENSSL
    if (name == g_openSslProviderName)
    {
        return makeOpenSslCryptoProvider();
    }
#endif
    (void)name;
    return nullptr;
}

} // namespace keyhop::crypto::providers
