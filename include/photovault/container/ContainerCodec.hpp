#ifndef INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERCODEC_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERCODEC_HPP

#include "photovault/container/ContainerError.hpp"
#include "photovault/container/ContainerFormat.hpp"
#include "photovault/container/ContainerOptions.hpp"
#include "photovault/container/MediaMetadata.hpp"
#include "photovault/container/PlaintextSource.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/security/SecureBuffer.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <variant>

namespace photovault::container
{

// Streaming SVF2 writer/reader. Holds no per-file state, so one instance may serve concurrent operations
// on different paths. Keys are borrowed for the duration of each call and never retained.
class ContainerCodec final
{
public:
    // Throws std::invalid_argument when options.chunkSize is 0 or above g_kMaxChunkSize.
    explicit ContainerCodec(photovault::crypto::ICryptoProvider& crypto, ContainerOptions options = {});

    [[nodiscard]] const ContainerOptions& options() const noexcept
    {
        return m_options;
    }

    // Refuses to overwrite `destination`. On any failure or cancellation the partial file is removed.
    [[nodiscard]] ContainerResult<std::monostate> writeContainer(IPlaintextSource& source, MediaType mediaType,
                                                                 const std::optional<MediaMetadata>& metadata,
                                                                 const photovault::crypto::ContainerKeys& keys,
                                                                 const std::filesystem::path& destination,
                                                                 const ProgressCallback& progress = {},
                                                                 std::stop_token stop = {});

    [[nodiscard]] ContainerResult<std::monostate>
    writeContainer(std::span<const std::byte> plainText, MediaType mediaType,
                   const std::optional<MediaMetadata>& metadata, const photovault::crypto::ContainerKeys& keys,
                   const std::filesystem::path& destination, const ProgressCallback& progress = {},
                   std::stop_token stop = {});

    [[nodiscard]] ContainerResult<std::monostate>
    writeContainerFromFile(const std::filesystem::path& sourcePath, MediaType mediaType,
                           const std::optional<MediaMetadata>& metadata, const photovault::crypto::ContainerKeys& keys,
                           const std::filesystem::path& destination, const ProgressCallback& progress = {},
                           std::stop_token stop = {});

    // Buffers the whole plaintext; meant for photos and other modest content.
    [[nodiscard]] ContainerResult<photovault::security::SecureBuffer>
    readContainer(const std::filesystem::path& path, const photovault::crypto::ContainerKeys& keys,
                  const ProgressCallback& progress = {}, std::stop_token stop = {});

    // Streams into a fresh file under the temporary directory. The caller deletes the returned file;
    // on failure the codec deletes it.
    [[nodiscard]] ContainerResult<std::filesystem::path>
    readContainerToTemporaryFile(const std::filesystem::path& path, const photovault::crypto::ContainerKeys& keys,
                                 const std::optional<std::string>& preferredExtension = std::nullopt,
                                 const ProgressCallback& progress = {}, std::stop_token stop = {});

    // Touches only the header and metadata block. std::nullopt when there is no metadata or the magic does
    // not match.
    [[nodiscard]] ContainerResult<std::optional<MediaMetadata>>
    readMetadata(const std::filesystem::path& path, const photovault::crypto::ContainerKeys& keys);

    // True when the metadata block, or else the first chunk, opens under `keys`. Cheaper than a full read;
    // used to tell which key set a container is currently sealed with.
    [[nodiscard]] ContainerResult<bool> authenticatesWith(const std::filesystem::path& path,
                                                          const photovault::crypto::ContainerKeys& keys);

    [[nodiscard]] static ContainerResult<ContainerInfo> readContainerInfo(const std::filesystem::path& path);

private:
    photovault::crypto::ICryptoProvider* m_crypto{ nullptr };
    ContainerOptions m_options{};
};

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERCODEC_HPP
