#include "photovault/container/ContainerCodec.hpp"

#include "LittleEndian.hpp"
#include "PosixFile.hpp"
#include "TemporaryFile.hpp"
#include "photovault/container/MetadataCodec.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace photovault::container
{
namespace
{

constexpr std::string_view g_kReasonNotContainer{ "file is not in valid SVF2 format" };
constexpr std::string_view g_kReasonIncompleteHeader{ "incomplete stream header" };
constexpr std::string_view g_kReasonMissingMarker{ "missing completion marker" };
constexpr std::string_view g_kReasonInvalidMarker{ "invalid completion marker" };
constexpr std::string_view g_kReasonTrailingData{ "unexpected data after completion marker" };
constexpr std::string_view g_kReasonChunkLength{ "corrupted chunk length" };
constexpr std::string_view g_kReasonTruncatedChunk{ "truncated chunk record" };
constexpr std::string_view g_kReasonChunkAuth{ "chunk authentication failed" };
constexpr std::string_view g_kReasonMetadataAuth{ "metadata authentication failed" };
constexpr std::string_view g_kReasonTruncatedMetadata{ "truncated metadata block" };
constexpr std::uint64_t g_kMaxReserveBytes{ 64ULL * 1024ULL * 1024ULL };

[[nodiscard]] ContainerError makeError(ContainerErrc code, std::string_view reason, const std::filesystem::path& path)
{
    return ContainerError{ .code = code, .reason = std::string{ reason }, .path = path };
}

[[nodiscard]] ContainerError decryptionFailed(std::string_view reason, const std::filesystem::path& path)
{
    return makeError(ContainerErrc::DecryptionFailed, reason, path);
}

[[nodiscard]] ContainerError fromSystemError(const std::system_error& e, const std::filesystem::path& path)
{
    if (e.code() == std::errc::no_such_file_or_directory)
    {
        return makeError(ContainerErrc::FileNotFound, e.what(), path);
    }
    if (e.code() == std::errc::file_exists)
    {
        return makeError(ContainerErrc::FileAlreadyExists, e.what(), path);
    }
    return makeError(ContainerErrc::IoError, e.what(), path);
}

// Magic mismatch: not an error for callers probing formats.
struct NotAContainer final
{
};

using HeaderScan = std::variant<ContainerInfo, NotAContainer, ContainerError>;

[[nodiscard]] HeaderScan readHeader(detail::PosixFile& file, const std::filesystem::path& path)
{
    ContainerInfo info{};
    info.headerBytes.resize(g_kMagicBytes + 1U);

    const std::size_t magicRead{ file.readUpTo(std::span<std::byte>{ info.headerBytes }.first(g_kMagicBytes)) };
    if (magicRead != g_kMagicBytes ||
        !std::equal(g_kContainerMagic.begin(), g_kContainerMagic.end(), info.headerBytes.begin()))
    {
        return NotAContainer{};
    }

    if (file.readUpTo(std::span<std::byte>{ info.headerBytes }.last(1U)) != 1U)
    {
        return decryptionFailed(g_kReasonIncompleteHeader, path);
    }
    const std::uint8_t version{ std::to_integer<std::uint8_t>(info.headerBytes.back()) };
    if (!isSupportedVersion(version))
    {
        return makeError(ContainerErrc::InvalidFileFormat, "unsupported stream version " + std::to_string(version),
                         path);
    }

    const std::size_t fixedRead{ info.headerBytes.size() };
    info.headerBytes.resize(headerBytesFor(version));
    const auto rest{ std::span<std::byte>{ info.headerBytes }.subspan(fixedRead) };
    if (file.readUpTo(rest) != rest.size())
    {
        return decryptionFailed(g_kReasonIncompleteHeader, path);
    }

    const auto header{ decodeContainerHeader(std::span<const std::byte>{ info.headerBytes }) };
    if (!header)
    {
        return decryptionFailed(g_kReasonIncompleteHeader, path);
    }
    if (header->chunkSize == 0U || header->chunkSize > g_kMaxChunkSize)
    {
        return decryptionFailed("invalid chunk size", path);
    }
    if (header->metadataLength > g_kMaxMetadataBytes)
    {
        return decryptionFailed("invalid metadata length", path);
    }
    info.header = *header;
    return info;
}

// Opens `path` and parses its header; a magic mismatch is reported as InvalidFileFormat.
[[nodiscard]] std::variant<ContainerInfo, ContainerError> requireContainer(detail::PosixFile& file,
                                                                           const std::filesystem::path& path)
{
    auto scan{ readHeader(file, path) };
    if (std::holds_alternative<NotAContainer>(scan))
    {
        return makeError(ContainerErrc::InvalidFileFormat, g_kReasonNotContainer, path);
    }
    if (auto* error{ std::get_if<ContainerError>(&scan) }; error != nullptr)
    {
        return std::move(*error);
    }
    return std::move(std::get<ContainerInfo>(scan));
}

// Streams chunk records after the metadata block into `sink`, in file order, until the trailer.
template <class Sink>
[[nodiscard]] ContainerResult<std::monostate>
decryptChunks(photovault::crypto::ICryptoProvider& crypto, detail::PosixFile& file, const ContainerInfo& info,
              const photovault::crypto::ContainerKeys& keys, const std::filesystem::path& path, Sink&& sink,
              const ProgressCallback& progress, const std::stop_token& stop)
{
    const auto aad{ std::span<const std::byte>{ info.headerBytes } };
    std::array<std::byte, g_kChunkLengthBytes> lengthBytes{};
    photovault::crypto::AeadBox box{};
    std::uint64_t processed{ 0U };
    bool sawShortChunk{ false };

    for (;;)
    {
        if (stop.stop_requested())
        {
            return OperationCancelled{};
        }

        const std::size_t lengthRead{ file.readUpTo(std::span<std::byte>{ lengthBytes }) };
        if (lengthRead == 0U)
        {
            return decryptionFailed(g_kReasonMissingMarker, path);
        }
        if (lengthRead != lengthBytes.size())
        {
            return decryptionFailed(g_kReasonChunkLength, path);
        }

        const std::uint32_t chunkLength{ detail::readU32LE(
            std::span<const std::byte, detail::g_kU32Bytes>{ lengthBytes.data(), detail::g_kU32Bytes }) };
        if (chunkLength == 0U)
        {
            std::array<std::byte, g_kMagicBytes> marker{};
            if (file.readUpTo(std::span<std::byte>{ marker }) != marker.size() || marker != g_kCompletionMarker)
            {
                return decryptionFailed(g_kReasonInvalidMarker, path);
            }
            std::array<std::byte, 1> extra{};
            if (file.readUpTo(std::span<std::byte>{ extra }) != 0U)
            {
                return decryptionFailed(g_kReasonTrailingData, path);
            }
            return std::monostate{};
        }

        // Only the last data chunk may be short.
        if (chunkLength > info.header.chunkSize || sawShortChunk)
        {
            return decryptionFailed(g_kReasonChunkLength, path);
        }
        sawShortChunk = (chunkLength < info.header.chunkSize);

        box.cipherText.resize(chunkLength);
        const auto nonce{ std::as_writable_bytes(std::span{ box.nonce }) };
        const auto cipherText{ std::as_writable_bytes(std::span{ box.cipherText }) };
        const auto tag{ std::as_writable_bytes(std::span{ box.tag }) };
        if (file.readUpTo(nonce) != nonce.size() || file.readUpTo(cipherText) != cipherText.size() ||
            file.readUpTo(tag) != tag.size())
        {
            return decryptionFailed(g_kReasonTruncatedChunk, path);
        }

        auto plain{ crypto.aeadDecrypt(keys.encryptionKey(), box, aad) };
        if (!plain)
        {
            return decryptionFailed(g_kReasonChunkAuth, path);
        }
        sink(photovault::security::asSpan(*plain));

        processed += plain->size();
        if (progress)
        {
            progress(processed);
        }
    }
}

void appendChunkRecord(std::vector<std::byte>& record, const photovault::crypto::AeadBox& box)
{
    record.clear();
    detail::appendU32LE(record, static_cast<std::uint32_t>(box.cipherText.size()));
    const auto nonce{ std::as_bytes(std::span{ box.nonce }) };
    const auto cipherText{ std::as_bytes(std::span{ box.cipherText }) };
    const auto tag{ std::as_bytes(std::span{ box.tag }) };
    record.insert(record.end(), nonce.begin(), nonce.end());
    record.insert(record.end(), cipherText.begin(), cipherText.end());
    record.insert(record.end(), tag.begin(), tag.end());
}

[[nodiscard]] std::vector<std::byte> completionTrailer()
{
    std::vector<std::byte> trailer{};
    detail::appendU32LE(trailer, 0U);
    trailer.insert(trailer.end(), g_kCompletionMarker.begin(), g_kCompletionMarker.end());
    return trailer;
}

} // namespace

ContainerCodec::ContainerCodec(photovault::crypto::ICryptoProvider& crypto, ContainerOptions options)
    : m_crypto{ &crypto }, m_options{ std::move(options) }
{
    if (m_options.chunkSize == 0U || m_options.chunkSize > g_kMaxChunkSize)
    {
        throw std::invalid_argument("ContainerCodec: chunkSize out of range");
    }
}

ContainerResult<std::monostate> ContainerCodec::writeContainer(IPlaintextSource& source, MediaType mediaType,
                                                               const std::optional<MediaMetadata>& metadata,
                                                               const photovault::crypto::ContainerKeys& keys,
                                                               const std::filesystem::path& destination,
                                                               const ProgressCallback& progress, std::stop_token stop)
{
    if (stop.stop_requested())
    {
        return OperationCancelled{};
    }

    std::vector<std::uint8_t> metadataBlock{};
    std::vector<std::byte> headerBytes{};
    try
    {
        if (metadata)
        {
            metadataBlock = sealMetadata(*m_crypto, *metadata, keys);
        }
        if (metadataBlock.size() > g_kMaxMetadataBytes)
        {
            return makeError(ContainerErrc::CryptoError, "metadata block too large", destination);
        }
        const ContainerHeader header{ .version = g_kContainerVersionCurrent,
                                      .mediaType = mediaType,
                                      .originalSize = source.sizeHint(),
                                      .chunkSize = m_options.chunkSize,
                                      .metadataLength = static_cast<std::uint32_t>(metadataBlock.size()) };
        headerBytes = encodeContainerHeader(header);
    }
    catch (const std::exception& e)
    {
        return makeError(ContainerErrc::CryptoError, e.what(), destination);
    }

    try
    {
        auto file{ detail::PosixFile::createExclusive(destination) };
        detail::PartialFileGuard guard{ destination };

        file.writeAll(std::span<const std::byte>{ headerBytes });
        file.writeAll(std::as_bytes(std::span<const std::uint8_t>{ metadataBlock }));

        photovault::security::SecureBuffer plain(m_options.chunkSize);
        std::vector<std::byte> record{};
        record.reserve(m_options.chunkSize + g_kChunkOverheadBytes);
        std::uint64_t processed{ 0U };

        for (;;)
        {
            if (stop.stop_requested())
            {
                return OperationCancelled{};
            }

            const std::size_t n{ source.read(photovault::security::asWritableBytes(plain)) };
            if (n == 0U)
            {
                break;
            }

            const auto box{ m_crypto->aeadEncrypt(keys.encryptionKey(),
                                                  photovault::security::asBytes(plain).first(n),
                                                  std::span<const std::byte>{ headerBytes }) };
            appendChunkRecord(record, box);
            file.writeAll(std::span<const std::byte>{ record });

            processed += n;
            if (progress)
            {
                progress(processed);
            }
            if (n < plain.size())
            {
                break;
            }
        }

        // Chunks reach stable storage before the marker that vouches for them.
        file.sync();
        const auto trailer{ completionTrailer() };
        file.writeAll(std::span<const std::byte>{ trailer });
        file.sync();
        file.close();
        detail::syncDirectory(destination.parent_path());

        guard.release();
        return std::monostate{};
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, destination);
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ContainerErrc::IoError, "out of memory", destination);
    }
    catch (const std::exception& e)
    {
        return makeError(ContainerErrc::CryptoError, e.what(), destination);
    }
}

ContainerResult<std::monostate> ContainerCodec::writeContainer(std::span<const std::byte> plainText,
                                                               MediaType mediaType,
                                                               const std::optional<MediaMetadata>& metadata,
                                                               const photovault::crypto::ContainerKeys& keys,
                                                               const std::filesystem::path& destination,
                                                               const ProgressCallback& progress, std::stop_token stop)
{
    const auto source{ makeBufferSource(plainText) };
    return writeContainer(*source, mediaType, metadata, keys, destination, progress, std::move(stop));
}

ContainerResult<std::monostate>
ContainerCodec::writeContainerFromFile(const std::filesystem::path& sourcePath, MediaType mediaType,
                                       const std::optional<MediaMetadata>& metadata,
                                       const photovault::crypto::ContainerKeys& keys,
                                       const std::filesystem::path& destination, const ProgressCallback& progress,
                                       std::stop_token stop)
{
    std::unique_ptr<IPlaintextSource> source{};
    try
    {
        source = openFileSource(sourcePath);
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, sourcePath);
    }
    return writeContainer(*source, mediaType, metadata, keys, destination, progress, std::move(stop));
}

ContainerResult<photovault::security::SecureBuffer>
ContainerCodec::readContainer(const std::filesystem::path& path, const photovault::crypto::ContainerKeys& keys,
                              const ProgressCallback& progress, std::stop_token stop)
{
    try
    {
        auto file{ detail::PosixFile::openForRead(path) };
        auto parsed{ requireContainer(file, path) };
        if (auto* error{ std::get_if<ContainerError>(&parsed) }; error != nullptr)
        {
            return std::move(*error);
        }
        const auto& info{ std::get<ContainerInfo>(parsed) };
        file.skip(info.header.metadataLength);

        photovault::security::SecureBuffer out{};
        out.reserve(static_cast<std::size_t>(std::min(info.header.originalSize, g_kMaxReserveBytes)));
        auto result{ decryptChunks(
            *m_crypto, file, info, keys, path,
            [&out](std::span<const std::uint8_t> chunk) { out.insert(out.end(), chunk.begin(), chunk.end()); },
            progress, stop) };
        if (!std::holds_alternative<std::monostate>(result))
        {
            photovault::security::secureRelease(out);
            return propagateFailure<photovault::security::SecureBuffer>(std::move(result));
        }
        return out;
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, path);
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ContainerErrc::IoError, "out of memory", path);
    }
    catch (const std::exception& e)
    {
        return makeError(ContainerErrc::CryptoError, e.what(), path);
    }
}

ContainerResult<std::filesystem::path>
ContainerCodec::readContainerToTemporaryFile(const std::filesystem::path& path,
                                             const photovault::crypto::ContainerKeys& keys,
                                             const std::optional<std::string>& preferredExtension,
                                             const ProgressCallback& progress, std::stop_token stop)
{
    try
    {
        auto file{ detail::PosixFile::openForRead(path) };
        auto parsed{ requireContainer(file, path) };
        if (auto* error{ std::get_if<ContainerError>(&parsed) }; error != nullptr)
        {
            return std::move(*error);
        }
        const auto& info{ std::get<ContainerInfo>(parsed) };
        file.skip(info.header.metadataLength);

        auto temp{ detail::createTemporaryFile(m_options, preferredExtension) };
        detail::PartialFileGuard guard{ temp.path };

        auto result{ decryptChunks(
            *m_crypto, file, info, keys, path,
            [&temp](std::span<const std::uint8_t> chunk) { temp.file.writeAll(std::as_bytes(chunk)); }, progress,
            stop) };
        if (!std::holds_alternative<std::monostate>(result))
        {
            return propagateFailure<std::filesystem::path>(std::move(result));
        }

        temp.file.close();
        guard.release();
        return temp.path;
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, path);
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ContainerErrc::IoError, "out of memory", path);
    }
    catch (const std::exception& e)
    {
        return makeError(ContainerErrc::CryptoError, e.what(), path);
    }
}

ContainerResult<std::optional<MediaMetadata>> ContainerCodec::readMetadata(const std::filesystem::path& path,
                                                                           const photovault::crypto::ContainerKeys& keys)
{
    try
    {
        auto file{ detail::PosixFile::openForRead(path) };
        auto scan{ readHeader(file, path) };
        if (std::holds_alternative<NotAContainer>(scan))
        {
            return std::optional<MediaMetadata>{};
        }
        if (auto* error{ std::get_if<ContainerError>(&scan) }; error != nullptr)
        {
            return std::move(*error);
        }

        const auto& info{ std::get<ContainerInfo>(scan) };
        if (info.header.metadataLength == 0U)
        {
            return std::optional<MediaMetadata>{};
        }

        std::vector<std::uint8_t> block(info.header.metadataLength);
        if (file.readUpTo(std::as_writable_bytes(std::span{ block })) != block.size())
        {
            return decryptionFailed(g_kReasonTruncatedMetadata, path);
        }

        auto metadata{ openMetadata(*m_crypto, std::span<const std::uint8_t>{ block }, keys) };
        if (!metadata)
        {
            return decryptionFailed(g_kReasonMetadataAuth, path);
        }
        return std::optional<MediaMetadata>{ std::move(*metadata) };
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, path);
    }
    catch (const std::exception& e)
    {
        return makeError(ContainerErrc::CryptoError, e.what(), path);
    }
}

ContainerResult<bool> ContainerCodec::authenticatesWith(const std::filesystem::path& path,
                                                        const photovault::crypto::ContainerKeys& keys)
{
    try
    {
        auto file{ detail::PosixFile::openForRead(path) };
        auto parsed{ requireContainer(file, path) };
        if (auto* error{ std::get_if<ContainerError>(&parsed) }; error != nullptr)
        {
            return std::move(*error);
        }
        const auto& info{ std::get<ContainerInfo>(parsed) };

        if (info.header.metadataLength != 0U)
        {
            std::vector<std::uint8_t> block(info.header.metadataLength);
            if (file.readUpTo(std::as_writable_bytes(std::span{ block })) != block.size())
            {
                return false;
            }
            return openMetadata(*m_crypto, std::span<const std::uint8_t>{ block }, keys).has_value();
        }

        std::array<std::byte, g_kChunkLengthBytes> lengthBytes{};
        if (file.readUpTo(std::span<std::byte>{ lengthBytes }) != lengthBytes.size())
        {
            return false;
        }
        const std::uint32_t chunkLength{ detail::readU32LE(
            std::span<const std::byte, detail::g_kU32Bytes>{ lengthBytes.data(), detail::g_kU32Bytes }) };
        if (chunkLength == 0U)
        {
            // No metadata and no chunks: nothing in the file depends on the keys.
            return true;
        }
        if (chunkLength > info.header.chunkSize)
        {
            return false;
        }

        photovault::crypto::AeadBox box{};
        box.cipherText.resize(chunkLength);
        const auto nonce{ std::as_writable_bytes(std::span{ box.nonce }) };
        const auto cipherText{ std::as_writable_bytes(std::span{ box.cipherText }) };
        const auto tag{ std::as_writable_bytes(std::span{ box.tag }) };
        if (file.readUpTo(nonce) != nonce.size() || file.readUpTo(cipherText) != cipherText.size() ||
            file.readUpTo(tag) != tag.size())
        {
            return false;
        }
        auto plain{ m_crypto->aeadDecrypt(keys.encryptionKey(), box, std::span<const std::byte>{ info.headerBytes }) };
        if (!plain)
        {
            return false;
        }
        photovault::security::secureRelease(*plain);
        return true;
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, path);
    }
    catch (const std::bad_alloc&)
    {
        return makeError(ContainerErrc::IoError, "out of memory", path);
    }
    catch (const std::exception& e)
    {
        return makeError(ContainerErrc::CryptoError, e.what(), path);
    }
}

ContainerResult<ContainerInfo> ContainerCodec::readContainerInfo(const std::filesystem::path& path)
{
    try
    {
        auto file{ detail::PosixFile::openForRead(path) };
        auto parsed{ requireContainer(file, path) };
        if (auto* error{ std::get_if<ContainerError>(&parsed) }; error != nullptr)
        {
            return std::move(*error);
        }
        return std::move(std::get<ContainerInfo>(parsed));
    }
    catch (const std::system_error& e)
    {
        return fromSystemError(e, path);
    }
}

} // namespace photovault::container
