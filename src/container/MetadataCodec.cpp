#include "photovault/container/MetadataCodec.hpp"

#include "LittleEndian.hpp"
#include "photovault/crypto/IntegritySeal.hpp"
#include <bit>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace photovault::container
{
namespace
{

void appendString(std::vector<std::byte>& out, std::string_view s)
{
    if (s.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("encodeMetadata: string too long");
    }
    detail::appendU32LE(out, static_cast<std::uint32_t>(s.size()));
    const auto bytes{ std::as_bytes(std::span<const char>{ s.data(), s.size() }) };
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void appendDouble(std::vector<std::byte>& out, double v)
{
    detail::appendU64LE(out, std::bit_cast<std::uint64_t>(v));
}

[[nodiscard]] bool readString(detail::ByteCursor& cursor, std::string& out)
{
    std::uint32_t length{};
    std::span<const std::byte> bytes{};
    if (!cursor.readU32(length) || !cursor.take(length, bytes))
    {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return true;
}

[[nodiscard]] bool readDouble(detail::ByteCursor& cursor, double& out) noexcept
{
    std::uint64_t raw{};
    if (!cursor.readU64(raw))
    {
        return false;
    }
    out = std::bit_cast<double>(raw);
    return true;
}

} // namespace

std::vector<std::byte> encodeMetadata(const MediaMetadata& metadata)
{
    std::vector<std::byte> out{};
    out.push_back(static_cast<std::byte>(g_kMetadataEncodingV1));
    appendString(out, metadata.filename);
    detail::appendU64LE(out, static_cast<std::uint64_t>(metadata.creationDate.time_since_epoch().count()));

    std::uint8_t flags{ 0U };
    flags |= metadata.originalAssetIdentifier ? g_kMetaHasAssetId : 0U;
    flags |= metadata.durationSeconds ? g_kMetaHasDuration : 0U;
    flags |= metadata.location ? g_kMetaHasLocation : 0U;
    flags |= metadata.isFavorite ? g_kMetaHasFavorite : 0U;
    out.push_back(static_cast<std::byte>(flags));

    if (metadata.originalAssetIdentifier)
    {
        appendString(out, *metadata.originalAssetIdentifier);
    }
    if (metadata.durationSeconds)
    {
        appendDouble(out, *metadata.durationSeconds);
    }
    if (metadata.location)
    {
        appendDouble(out, metadata.location->latitude);
        appendDouble(out, metadata.location->longitude);
    }
    if (metadata.isFavorite)
    {
        out.push_back(static_cast<std::byte>(*metadata.isFavorite ? 1U : 0U));
    }
    return out;
}

std::optional<MediaMetadata> decodeMetadata(std::span<const std::byte> bytes)
{
    detail::ByteCursor cursor{ bytes };

    std::uint8_t version{};
    if (!cursor.readU8(version) || version != g_kMetadataEncodingV1)
    {
        return std::nullopt;
    }

    MediaMetadata out{};
    std::uint64_t createdNs{};
    std::uint8_t flags{};
    if (!readString(cursor, out.filename) || !cursor.readU64(createdNs) || !cursor.readU8(flags))
    {
        return std::nullopt;
    }
    if ((flags & static_cast<std::uint8_t>(~g_kMetaKnownFlags)) != 0U)
    {
        return std::nullopt;
    }
    out.creationDate = MediaMetadata::TimePoint{ std::chrono::nanoseconds{ static_cast<std::int64_t>(createdNs) } };

    if ((flags & g_kMetaHasAssetId) != 0U)
    {
        std::string assetId{};
        if (!readString(cursor, assetId))
        {
            return std::nullopt;
        }
        out.originalAssetIdentifier = std::move(assetId);
    }
    if ((flags & g_kMetaHasDuration) != 0U)
    {
        double duration{};
        if (!readDouble(cursor, duration))
        {
            return std::nullopt;
        }
        out.durationSeconds = duration;
    }
    if ((flags & g_kMetaHasLocation) != 0U)
    {
        GeoLocation location{};
        if (!readDouble(cursor, location.latitude) || !readDouble(cursor, location.longitude))
        {
            return std::nullopt;
        }
        out.location = location;
    }
    if ((flags & g_kMetaHasFavorite) != 0U)
    {
        std::uint8_t favorite{};
        if (!cursor.readU8(favorite) || favorite > 1U)
        {
            return std::nullopt;
        }
        out.isFavorite = (favorite == 1U);
    }

    if (cursor.remaining() != 0U)
    {
        return std::nullopt;
    }
    return out;
}

std::vector<std::uint8_t> sealMetadata(photovault::crypto::ICryptoProvider& crypto, const MediaMetadata& metadata,
                                       const photovault::crypto::ContainerKeys& keys)
{
    std::vector<std::byte> encoded{ encodeMetadata(metadata) };
    auto sealed{ photovault::crypto::sealWithIntegrity(crypto, std::span<const std::byte>{ encoded }, keys) };
    photovault::security::secureWipe(std::span<std::byte>{ encoded });
    return sealed;
}

std::optional<MediaMetadata> openMetadata(photovault::crypto::ICryptoProvider& crypto,
                                          std::span<const std::uint8_t> block,
                                          const photovault::crypto::ContainerKeys& keys)
{
    auto plain{ photovault::crypto::openWithIntegrity(crypto, block, keys) };
    if (!plain)
    {
        return std::nullopt;
    }
    return decodeMetadata(photovault::security::asBytes(*plain));
}

} // namespace photovault::container
