#ifndef INCLUDE_PHOTOVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "photovault/crypto/ICryptoProvider.hpp"
#include <memory>

namespace photovault::crypto::providers
{

[[nodiscard]] std::unique_ptr<photovault::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace photovault::crypto::providers

#endif // INCLUDE_PHOTOVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
