#ifndef INCLUDE_PHOTOVAULT_CONTAINER_CONTAINEROPTIONS_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_CONTAINEROPTIONS_HPP

#include "photovault/container/ContainerFormat.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string_view>

namespace photovault::container
{

constexpr std::uint64_t g_kDefaultSecureDeleteCapBytes{ 100ULL * 1024ULL * 1024ULL };
constexpr std::string_view g_kDefaultTempDirName{ "PhotoVaultTemp" };

struct ContainerOptions final
{
    // Plaintext bytes per chunk for new containers. Readers always use the value stored in the header.
    std::uint32_t chunkSize{ g_kDefaultChunkSize };
    // Where decrypted temporary files go; empty selects <system temp>/PhotoVaultTemp.
    std::filesystem::path temporaryDirectory{};
    // Files larger than this are unlinked without overwrite passes.
    std::uint64_t secureDeleteCapBytes{ g_kDefaultSecureDeleteCapBytes };
};

// Cumulative plaintext bytes processed, invoked on the worker thread after each chunk.
using ProgressCallback = std::function<void(std::uint64_t)>;

[[nodiscard]] std::filesystem::path resolveTemporaryDirectory(const ContainerOptions& options);

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_CONTAINEROPTIONS_HPP
