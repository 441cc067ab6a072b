#include "photovault/container/ContainerFormat.hpp"

#include "LittleEndian.hpp"
#include <algorithm>
#include <stdexcept>

namespace photovault::container
{

std::vector<std::byte> encodeContainerHeader(const ContainerHeader& header)
{
    if (!isSupportedVersion(header.version))
    {
        throw std::invalid_argument("encodeContainerHeader: unsupported version");
    }
    if (header.version == g_kContainerVersionV1 && header.metadataLength != 0U)
    {
        throw std::invalid_argument("encodeContainerHeader: v1 headers cannot carry metadata");
    }

    std::vector<std::byte> out{};
    out.reserve(headerBytesFor(header.version));
    out.insert(out.end(), g_kContainerMagic.begin(), g_kContainerMagic.end());
    out.push_back(static_cast<std::byte>(header.version));
    out.push_back(static_cast<std::byte>(header.mediaType));
    out.push_back(std::byte{ 0 });
    out.push_back(std::byte{ 0 });
    detail::appendU64LE(out, header.originalSize);
    detail::appendU32LE(out, header.chunkSize);
    if (header.version >= g_kContainerVersionV2)
    {
        detail::appendU32LE(out, header.metadataLength);
    }
    return out;
}

std::optional<ContainerHeader> decodeContainerHeader(std::span<const std::byte> bytes) noexcept
{
    detail::ByteCursor cursor{ bytes };

    std::span<const std::byte> magic{};
    if (!cursor.take(g_kMagicBytes, magic) || !std::equal(magic.begin(), magic.end(), g_kContainerMagic.begin()))
    {
        return std::nullopt;
    }

    ContainerHeader header{};
    std::uint8_t mediaType{};
    std::span<const std::byte> reserved{};
    if (!cursor.readU8(header.version) || !isSupportedVersion(header.version) ||
        bytes.size() != headerBytesFor(header.version))
    {
        return std::nullopt;
    }
    if (!cursor.readU8(mediaType) || !cursor.take(2U, reserved) || !cursor.readU64(header.originalSize) ||
        !cursor.readU32(header.chunkSize))
    {
        return std::nullopt;
    }
    header.mediaType = (mediaType == static_cast<std::uint8_t>(MediaType::Video)) ? MediaType::Video : MediaType::Photo;

    header.metadataLength = 0U;
    if (header.version >= g_kContainerVersionV2 && !cursor.readU32(header.metadataLength))
    {
        return std::nullopt;
    }
    return header;
}

} // namespace photovault::container
