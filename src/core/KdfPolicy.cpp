#include "photovault/core/KdfPolicy.hpp"
#include "photovault/security/SecureRandom.hpp"
#include <span>

namespace photovault::core
{

[[nodiscard]] photovault::crypto::KdfParams defaultKdfParams() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 3U };
    constexpr std::uint32_t kDefaultMemoryMiB{ 64U };
    constexpr std::uint32_t kKiBPerMiB{ 1024U };
    constexpr std::uint32_t kDefaultLanes{ 1U };

    return photovault::crypto::KdfParams{
        .iterations = kDefaultIterations,
        .memoryKiB = kDefaultMemoryMiB * kKiBPerMiB,
        .lanes = kDefaultLanes,
    };
}

[[nodiscard]] std::optional<photovault::crypto::KdfSettings>
makeKdfSettings(photovault::crypto::KdfParams params) noexcept
{
    photovault::crypto::KdfSettings settings{};
    settings.params = params;

    if (!photovault::security::secureRandomFill(std::span<std::uint8_t>{ settings.salt }))
    {
        return std::nullopt;
    }

    return settings;
}

[[nodiscard]] std::optional<photovault::crypto::KdfSettings> makeDefaultKdfSettings() noexcept
{
    return makeKdfSettings(defaultKdfParams());
}

} // namespace photovault::core
