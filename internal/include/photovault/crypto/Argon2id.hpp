#ifndef INCLUDE_PHOTOVAULT_CRYPTO_ARGON2ID_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_ARGON2ID_HPP

#include "photovault/crypto/KdfParams.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include <span>

namespace photovault::crypto
{

[[nodiscard]] photovault::security::SecureBuffer
deriveMasterKeyArgon2id(std::span<const std::byte> password, std::span<const std::uint8_t> salt, KdfParams params);

} // namespace photovault::crypto

#endif // INCLUDE_PHOTOVAULT_CRYPTO_ARGON2ID_HPP
