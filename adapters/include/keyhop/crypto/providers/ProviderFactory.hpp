#ifndef INCLUDE_KEYHOP_CRYPTO_PROVIDERS_PROVIDERFACTORY_HPP
#define INCLUDE_KEYHOP_CRYPTO_PROVIDERS_PROVIDERFACTORY_HPP

#include "keyhop/crypto/ICryptoProvider.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace keyhop::crypto::providers
{

constexpr std::string_view g_nativeProviderName{ "native" };
constexpr std::string_view g_openSslProviderName{ "openssl" };

// Names of the providers compiled into this build, preferred first.
[[nodiscard]] std::vector<std::string_view> availableCryptoProviders();

// Returns nullptr when `name` is unknown or was not compiled in.
[[nodiscard]] std::unique_ptr<keyhop::crypto::ICryptoProvider> makeCryptoProvider(std::string_view name);

// Direct constructors; each is defined only by its own provider library.
[[nodiscard]] std::unique_ptr<keyhop::crypto::ICryptoProvider> makeNativeCryptoProvider();
// Throws std::runtime_error if BLAKE2BMAC cannot be fetched.
[[nodiscard]] std::unique_ptr<keyhop::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace keyhop::crypto::providers

#endif // INCLUDE_KEYHOP_CRYPTO_PROVIDERS_PROVIDERFACTORY_HPP
