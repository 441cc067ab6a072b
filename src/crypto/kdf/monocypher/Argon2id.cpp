#include "photovault/crypto/Argon2id.hpp"

#include "photovault/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace photovault::crypto
{
namespace
{

void requireParamsSafe(const KdfParams& params)
{
    if (params.iterations == 0U || params.lanes == 0U || params.memoryKiB < 8U * params.lanes)
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: invalid parameters");
    }

    constexpr std::uint32_t memoryKiBCap{ 1024U * 1024U };
    constexpr std::uint32_t iterationsCap{ 10U };
    constexpr std::uint32_t lanesCap{ 16U };
    if (params.memoryKiB > memoryKiBCap || params.iterations > iterationsCap || params.lanes > lanesCap)
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: unsafe parameters");
    }
}

} // namespace

[[nodiscard]] photovault::security::SecureBuffer
deriveMasterKeyArgon2id(std::span<const std::byte> password, std::span<const std::uint8_t> salt, KdfParams params)
{
    if (password.empty())
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: empty password");
    }
    if (salt.size() != g_kdfSaltBytes)
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: invalid salt size");
    }
    requireParamsSafe(params);

    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: password too large");
    }

    // Monocypher wants nb_blocks * 1 KiB of caller-owned scratch, 8-byte aligned.
    constexpr std::size_t kU64WordsPerKiB{ 128U };
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerKiB))
    {
        throw std::bad_alloc{};
    }
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, photovault::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    photovault::security::SecureBuffer masterKey(g_kMasterKeyBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.lanes };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(masterKey.data(), static_cast<std::uint32_t>(masterKey.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return masterKey;
}

} // namespace photovault::crypto
