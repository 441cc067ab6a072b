#ifndef INCLUDE_PHOTOVAULT_CORE_KDFPOLICY_HPP
#define INCLUDE_PHOTOVAULT_CORE_KDFPOLICY_HPP

#include "photovault/crypto/KdfParams.hpp"
#include <optional>

namespace photovault::core
{

[[nodiscard]] photovault::crypto::KdfParams defaultKdfParams() noexcept;

// Fresh random salt paired with `params`. std::nullopt when the CSPRNG fails.
[[nodiscard]] std::optional<photovault::crypto::KdfSettings> makeKdfSettings(photovault::crypto::KdfParams params) noexcept;

[[nodiscard]] std::optional<photovault::crypto::KdfSettings> makeDefaultKdfSettings() noexcept;

} // namespace photovault::core

#endif // INCLUDE_PHOTOVAULT_CORE_KDFPOLICY_HPP
