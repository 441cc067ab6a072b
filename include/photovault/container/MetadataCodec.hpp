#ifndef INCLUDE_PHOTOVAULT_CONTAINER_METADATACODEC_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_METADATACODEC_HPP

#include "photovault/container/MediaMetadata.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace photovault::container
{

constexpr std::uint8_t g_kMetadataEncodingV1{ 1U };

// Presence bits for the optional fields, in encoding order.
constexpr std::uint8_t g_kMetaHasAssetId{ 0x01U };
constexpr std::uint8_t g_kMetaHasDuration{ 0x02U };
constexpr std::uint8_t g_kMetaHasLocation{ 0x04U };
constexpr std::uint8_t g_kMetaHasFavorite{ 0x08U };
constexpr std::uint8_t g_kMetaKnownFlags{ g_kMetaHasAssetId | g_kMetaHasDuration | g_kMetaHasLocation |
                                          g_kMetaHasFavorite };

// Binary record: version(1) filename(u32 len + bytes) created(i64 ns since epoch) flags(1) [optionals...]
[[nodiscard]] std::vector<std::byte> encodeMetadata(const MediaMetadata& metadata);

// std::nullopt on any malformed input, including unknown flags and trailing bytes.
[[nodiscard]] std::optional<MediaMetadata> decodeMetadata(std::span<const std::byte> bytes);

// [nonce][HMAC][ciphertext||tag] ready to embed after the container header.
[[nodiscard]] std::vector<std::uint8_t> sealMetadata(photovault::crypto::ICryptoProvider& crypto,
                                                     const MediaMetadata& metadata,
                                                     const photovault::crypto::ContainerKeys& keys);

// std::nullopt when either the HMAC or the AEAD tag fails, or the record does not decode.
[[nodiscard]] std::optional<MediaMetadata> openMetadata(photovault::crypto::ICryptoProvider& crypto,
                                                        std::span<const std::uint8_t> block,
                                                        const photovault::crypto::ContainerKeys& keys);

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_METADATACODEC_HPP
