#ifndef INCLUDE_PHOTOVAULT_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_PHOTOVAULT_CRYPTO_KDFPARAMS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace photovault::crypto
{

constexpr std::size_t g_kdfSaltBytes{ 32 };
constexpr std::size_t g_kMasterKeyBytes{ 32 };
constexpr std::size_t g_kVerifierBytes{ 32 };

using KdfSalt = std::array<std::uint8_t, g_kdfSaltBytes>;

struct KdfParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t lanes;
};

// Everything needed to re-derive a key set from the same password later.
struct KdfSettings final
{
    KdfParams params{};
    KdfSalt salt{};
};

} // namespace photovault::crypto

#endif // INCLUDE_PHOTOVAULT_CRYPTO_KDFPARAMS_HPP
