#ifndef INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERFORMAT_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERFORMAT_HPP

#include "photovault/crypto/ICryptoProvider.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace photovault::container
{

// SVF2 on-disk layout, all integers little-endian:
//   magic(8) version(1) mediaType(1) reserved(2) originalSize(u64) chunkSize(u32) [metadataLength(u32), v2+]
//   [metadata block]
//   { chunkLength(u32) nonce(12) ciphertext(chunkLength) tag(16) }*
//   chunkLength = 0, completion marker(8), EOF
constexpr std::size_t g_kMagicBytes{ 8U };
constexpr std::array<std::byte, g_kMagicBytes> g_kContainerMagic{
    std::byte{ 'S' }, std::byte{ 'V' }, std::byte{ 'S' }, std::byte{ 'T' },
    std::byte{ 'R' }, std::byte{ 'M' }, std::byte{ '0' }, std::byte{ '1' },
};
constexpr std::array<std::byte, g_kMagicBytes> g_kCompletionMarker{
    std::byte{ 'S' }, std::byte{ 'V' }, std::byte{ 'F' }, std::byte{ '2' },
    std::byte{ 'D' }, std::byte{ 'O' }, std::byte{ 'N' }, std::byte{ 'E' },
};

constexpr std::uint8_t g_kContainerVersionV1{ 1U };
constexpr std::uint8_t g_kContainerVersionV2{ 2U };
constexpr std::uint8_t g_kContainerVersionCurrent{ g_kContainerVersionV2 };

constexpr std::size_t g_kHeaderV1Bytes{ g_kMagicBytes + 1U + 1U + 2U + 8U + 4U };
constexpr std::size_t g_kHeaderV2Bytes{ g_kHeaderV1Bytes + 4U };
constexpr std::size_t g_kChunkLengthBytes{ 4U };
constexpr std::size_t g_kChunkOverheadBytes{ g_kChunkLengthBytes + photovault::crypto::g_aeadNonceBytes +
                                             photovault::crypto::g_aeadTagBytes };

constexpr std::uint32_t g_kDefaultChunkSize{ 4U * 1024U * 1024U };
// Readers refuse to allocate chunk buffers beyond this, whatever the header claims.
constexpr std::uint32_t g_kMaxChunkSize{ 64U * 1024U * 1024U };
// The metadata block is small structured data; anything larger is corruption.
constexpr std::uint32_t g_kMaxMetadataBytes{ 1024U * 1024U };

enum class MediaType : std::uint8_t
{
    Photo = 0x01U,
    Video = 0x02U,
};

struct ContainerHeader final
{
    std::uint8_t version{ g_kContainerVersionCurrent };
    MediaType mediaType{ MediaType::Photo };
    std::uint64_t originalSize{ 0U };
    std::uint32_t chunkSize{ g_kDefaultChunkSize };
    std::uint32_t metadataLength{ 0U };
};

// Plaintext header facts, available without keys.
struct ContainerInfo final
{
    ContainerHeader header{};
    // Exact serialized header; every chunk authenticates against these bytes.
    std::vector<std::byte> headerBytes;
};

[[nodiscard]] constexpr bool isSupportedVersion(std::uint8_t version) noexcept
{
    return version == g_kContainerVersionV1 || version == g_kContainerVersionV2;
}

// Serialized size for a supported version, 0 otherwise.
[[nodiscard]] constexpr std::size_t headerBytesFor(std::uint8_t version) noexcept
{
    if (version == g_kContainerVersionV1)
    {
        return g_kHeaderV1Bytes;
    }
    if (version == g_kContainerVersionV2)
    {
        return g_kHeaderV2Bytes;
    }
    return 0U;
}

// Throws std::invalid_argument for an unsupported version or metadata on a v1 header.
[[nodiscard]] std::vector<std::byte> encodeContainerHeader(const ContainerHeader& header);

// Expects exactly headerBytesFor(version) bytes starting with the magic; std::nullopt otherwise.
// Media-type bytes other than Video decode as Photo.
[[nodiscard]] std::optional<ContainerHeader> decodeContainerHeader(std::span<const std::byte> bytes) noexcept;

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERFORMAT_HPP
