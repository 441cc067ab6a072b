#ifndef INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERREKEY_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERREKEY_HPP

#include "photovault/container/ContainerCodec.hpp"
#include "photovault/container/ContainerError.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include <filesystem>
#include <stop_token>
#include <string_view>
#include <variant>

namespace photovault::container
{

constexpr std::string_view g_kStagingSuffix{ ".reencrypt" };

// Re-encrypts one container under `newKeys`, carrying forward its media type and metadata.
// The original stays byte-for-byte intact until a single rename replaces it. Callers must not rotate the
// same path concurrently.
[[nodiscard]] ContainerResult<std::monostate> reencryptContainer(ContainerCodec& codec,
                                                                 const std::filesystem::path& path,
                                                                 const photovault::crypto::ContainerKeys& oldKeys,
                                                                 const photovault::crypto::ContainerKeys& newKeys,
                                                                 std::stop_token stop = {});

// Unique per call: <name>.reencrypt.<random hex>
[[nodiscard]] std::filesystem::path makeStagingPath(const std::filesystem::path& path);

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERREKEY_HPP
