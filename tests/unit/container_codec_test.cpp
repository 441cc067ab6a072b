#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include "photovault/container/ContainerCodec.hpp"
#include "photovault/container/ContainerFormat.hpp"
#include "photovault/container/TemporaryFiles.hpp"
#include "photovault/crypto/providers/OpenSslProviderFactory.hpp"
#include "test_utils/CryptoFakes.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

using photovault::container::ContainerErrc;
using photovault::container::ContainerError;
using photovault::container::MediaMetadata;
using photovault::container::MediaType;
using photovault::container::OperationCancelled;
using photovault::test_utils::asByteVector;
using photovault::test_utils::makeTestKeys;
using photovault::test_utils::patternBytes;
using photovault::test_utils::readFile;
using photovault::test_utils::writeFile;

constexpr std::uint32_t g_kTestChunkSize{ 64U };

template <class T> ContainerErrc errcOf(const photovault::container::ContainerResult<T>& r)
{
    const auto* error{ std::get_if<ContainerError>(&r) };
    if (error == nullptr)
    {
        ADD_FAILURE() << "expected a ContainerError";
        return ContainerErrc::IoError;
    }
    return error->code;
}

std::size_t countEntries(const std::filesystem::path& dir)
{
    std::error_code ec{};
    if (!std::filesystem::exists(dir, ec))
    {
        return 0U;
    }
    std::size_t n{ 0U };
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator{ dir })
    {
        ++n;
    }
    return n;
}

// Serves pattern bytes, then fails with EIO on the read numbered `failingRead` (1-based).
class FailingSource final : public photovault::container::IPlaintextSource
{
public:
    explicit FailingSource(std::size_t failingRead) : m_failingRead{ failingRead } {}

    std::size_t read(std::span<std::byte> out) override
    {
        ++m_reads;
        if (m_reads >= m_failingRead)
        {
            throw std::system_error{ EIO, std::generic_category(), "read" };
        }
        std::fill(out.begin(), out.end(), std::byte{ 0x5A });
        return out.size();
    }

    std::uint64_t sizeHint() const noexcept override
    {
        return 0U;
    }

    [[nodiscard]] std::size_t reads() const noexcept
    {
        return m_reads;
    }

private:
    std::size_t m_failingRead;
    std::size_t m_reads{ 0U };
};

class ContainerCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_options.chunkSize = g_kTestChunkSize;
        m_options.temporaryDirectory = m_dir.path() / "tmp";
        m_codec = std::make_unique<photovault::container::ContainerCodec>(*m_crypto, m_options);
    }

    [[nodiscard]] std::filesystem::path path(const std::string& name) const
    {
        return m_dir.path() / name;
    }

    // Writes a photo container without metadata and returns its path.
    std::filesystem::path writeSample(const std::vector<std::byte>& plain, const std::string& name = "a.svf2")
    {
        const auto out{ path(name) };
        auto result{ m_codec->writeContainer(plain, MediaType::Photo, std::nullopt, m_keys, out) };
        EXPECT_TRUE(std::holds_alternative<std::monostate>(result));
        return out;
    }

    photovault::test_utils::TempDir m_dir{ "codec_" };
    std::unique_ptr<photovault::crypto::ICryptoProvider> m_crypto{
        photovault::crypto::providers::makeOpenSslCryptoProvider()
    };
    photovault::container::ContainerOptions m_options{};
    std::unique_ptr<photovault::container::ContainerCodec> m_codec;
    photovault::crypto::ContainerKeys m_keys{ makeTestKeys(0x01U) };
};

TEST(ContainerCodecConstruction, RejectsChunkSizeOutOfRange)
{
    auto crypto = photovault::crypto::providers::makeOpenSslCryptoProvider();
    photovault::container::ContainerOptions options{};

    options.chunkSize = 0U;
    EXPECT_THROW((void)photovault::container::ContainerCodec(*crypto, options), std::invalid_argument);

    options.chunkSize = photovault::container::g_kMaxChunkSize + 1U;
    EXPECT_THROW((void)photovault::container::ContainerCodec(*crypto, options), std::invalid_argument);
}

TEST_F(ContainerCodecTest, EmptyPlaintextRoundTrips)
{
    const auto file{ writeSample({}) };
    EXPECT_EQ(std::filesystem::file_size(file),
              photovault::container::g_kHeaderV2Bytes + photovault::container::g_kChunkLengthBytes +
                  photovault::container::g_kMagicBytes);

    auto result{ m_codec->readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_TRUE(std::get<photovault::security::SecureBuffer>(result).empty());
}

TEST_F(ContainerCodecTest, ExactChunkMultipleRoundTrips)
{
    const auto plain{ patternBytes(3U * g_kTestChunkSize) };
    const auto file{ writeSample(plain) };

    const std::uintmax_t records{ 3U * (g_kTestChunkSize + photovault::container::g_kChunkOverheadBytes) };
    EXPECT_EQ(std::filesystem::file_size(file), photovault::container::g_kHeaderV2Bytes + records +
                                                    photovault::container::g_kChunkLengthBytes +
                                                    photovault::container::g_kMagicBytes);

    auto result{ m_codec->readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_EQ(asByteVector(std::get<photovault::security::SecureBuffer>(result)), plain);
}

TEST_F(ContainerCodecTest, PartialLastChunkRoundTrips)
{
    const auto plain{ patternBytes(3U * g_kTestChunkSize + 7U, 0x11U) };
    const auto file{ writeSample(plain) };

    auto result{ m_codec->readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_EQ(asByteVector(std::get<photovault::security::SecureBuffer>(result)), plain);
}

TEST_F(ContainerCodecTest, LargeDefaultChunkRoundTrip)
{
    photovault::container::ContainerCodec codec{ *m_crypto };
    const auto plain{ patternBytes(photovault::container::g_kDefaultChunkSize + 1234U, 0x77U) };
    const auto file{ path("big.svf2") };

    ASSERT_TRUE(std::holds_alternative<std::monostate>(
        codec.writeContainer(plain, MediaType::Video, std::nullopt, m_keys, file)));
    auto result{ codec.readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_EQ(asByteVector(std::get<photovault::security::SecureBuffer>(result)), plain);
}

TEST_F(ContainerCodecTest, HeaderRecordsMediaTypeSizeAndChunkSize)
{
    const auto plain{ patternBytes(100U) };
    const auto file{ path("clip.svf2") };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(
        m_codec->writeContainer(plain, MediaType::Video, std::nullopt, m_keys, file)));

    auto info{ photovault::container::ContainerCodec::readContainerInfo(file) };
    ASSERT_TRUE(std::holds_alternative<photovault::container::ContainerInfo>(info));
    const auto& header{ std::get<photovault::container::ContainerInfo>(info).header };
    EXPECT_EQ(header.version, photovault::container::g_kContainerVersionCurrent);
    EXPECT_EQ(header.mediaType, MediaType::Video);
    EXPECT_EQ(header.originalSize, plain.size());
    EXPECT_EQ(header.chunkSize, g_kTestChunkSize);
    EXPECT_EQ(header.metadataLength, 0U);
}

TEST_F(ContainerCodecTest, MetadataTravelsWithContainer)
{
    MediaMetadata metadata{};
    metadata.filename = "IMG_1001.JPG";
    metadata.creationDate = MediaMetadata::TimePoint{ std::chrono::seconds{ 1650000000 } };
    metadata.isFavorite = true;

    const auto plain{ patternBytes(150U) };
    const auto file{ path("meta.svf2") };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(
        m_codec->writeContainer(plain, MediaType::Photo, metadata, m_keys, file)));

    auto readBack{ m_codec->readMetadata(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<std::optional<MediaMetadata>>(readBack));
    const auto& opened{ std::get<std::optional<MediaMetadata>>(readBack) };
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(*opened, metadata);

    // Content decryption skips the metadata block.
    auto content{ m_codec->readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(content));
    EXPECT_EQ(asByteVector(std::get<photovault::security::SecureBuffer>(content)), plain);

    auto wrongKeys{ m_codec->readMetadata(file, makeTestKeys(0x02U)) };
    EXPECT_EQ(errcOf(wrongKeys), ContainerErrc::DecryptionFailed);
}

TEST_F(ContainerCodecTest, ReadMetadataWithoutBlockOrMagicIsEmpty)
{
    const auto plainFile{ writeSample(patternBytes(10U)) };
    auto none{ m_codec->readMetadata(plainFile, m_keys) };
    ASSERT_TRUE(std::holds_alternative<std::optional<MediaMetadata>>(none));
    EXPECT_FALSE(std::get<std::optional<MediaMetadata>>(none).has_value());

    const auto jpeg{ path("raw.jpg") };
    writeFile(jpeg, patternBytes(64U));
    auto metadata{ m_codec->readMetadata(jpeg, m_keys) };
    ASSERT_TRUE(std::holds_alternative<std::optional<MediaMetadata>>(metadata));
    EXPECT_FALSE(std::get<std::optional<MediaMetadata>>(metadata).has_value());
}

TEST_F(ContainerCodecTest, NonContainerIsInvalidFormat)
{
    const auto jpeg{ path("raw.jpg") };
    writeFile(jpeg, patternBytes(64U));

    EXPECT_EQ(errcOf(m_codec->readContainer(jpeg, m_keys)), ContainerErrc::InvalidFileFormat);
    EXPECT_EQ(errcOf(photovault::container::ContainerCodec::readContainerInfo(jpeg)),
              ContainerErrc::InvalidFileFormat);
}

TEST_F(ContainerCodecTest, UnsupportedVersionIsInvalidFormat)
{
    const auto file{ writeSample(patternBytes(10U)) };
    auto bytes{ readFile(file) };
    bytes[photovault::container::g_kMagicBytes] = std::byte{ 3 };
    writeFile(file, bytes);

    EXPECT_EQ(errcOf(m_codec->readContainer(file, m_keys)), ContainerErrc::InvalidFileFormat);
}

TEST_F(ContainerCodecTest, MissingFileIsFileNotFound)
{
    EXPECT_EQ(errcOf(m_codec->readContainer(path("nope.svf2"), m_keys)), ContainerErrc::FileNotFound);
    EXPECT_EQ(errcOf(m_codec->writeContainerFromFile(path("nope.jpg"), MediaType::Photo, std::nullopt, m_keys,
                                                     path("out.svf2"))),
              ContainerErrc::FileNotFound);
    EXPECT_FALSE(std::filesystem::exists(path("out.svf2")));
}

TEST_F(ContainerCodecTest, WrongKeysFailAuthentication)
{
    const auto file{ writeSample(patternBytes(100U)) };
    EXPECT_EQ(errcOf(m_codec->readContainer(file, makeTestKeys(0x02U))), ContainerErrc::DecryptionFailed);
}

TEST_F(ContainerCodecTest, FlippedBitInChunkRecordIsDetected)
{
    const auto file{ writeSample(patternBytes(2U * g_kTestChunkSize)) };
    const auto pristine{ readFile(file) };

    const std::size_t recordStart{ photovault::container::g_kHeaderV2Bytes };
    const std::size_t nonceAt{ recordStart + photovault::container::g_kChunkLengthBytes };
    const std::size_t cipherAt{ nonceAt + photovault::crypto::g_aeadNonceBytes };
    const std::size_t tagAt{ cipherAt + g_kTestChunkSize };

    for (const std::size_t offset : { nonceAt, cipherAt, cipherAt + 31U, tagAt, tagAt + 15U })
    {
        auto tampered{ pristine };
        tampered[offset] ^= std::byte{ 0x01 };
        writeFile(file, tampered);
        EXPECT_EQ(errcOf(m_codec->readContainer(file, m_keys)), ContainerErrc::DecryptionFailed) << offset;
    }
}

TEST_F(ContainerCodecTest, FlippedHeaderBitIsDetected)
{
    const auto file{ writeSample(patternBytes(2U * g_kTestChunkSize + 5U)) };
    const auto pristine{ readFile(file) };

    // Magic and version only identify the format; every other header byte is authenticated.
    for (std::size_t offset{ photovault::container::g_kMagicBytes + 1U };
         offset < photovault::container::g_kHeaderV2Bytes; ++offset)
    {
        auto tampered{ pristine };
        tampered[offset] ^= std::byte{ 0x01 };
        writeFile(file, tampered);
        EXPECT_EQ(errcOf(m_codec->readContainer(file, m_keys)), ContainerErrc::DecryptionFailed) << offset;
    }
}

TEST_F(ContainerCodecTest, ChunkSplicedFromAnotherContainerIsRejected)
{
    const auto a{ writeSample(patternBytes(g_kTestChunkSize, 0x01U), "a.svf2") };
    const auto b{ writeSample(patternBytes(2U * g_kTestChunkSize, 0x02U), "b.svf2") };

    auto bytesA{ readFile(a) };
    const auto bytesB{ readFile(b) };
    const std::size_t record{ g_kTestChunkSize + photovault::container::g_kChunkOverheadBytes };
    const auto start{ static_cast<std::ptrdiff_t>(photovault::container::g_kHeaderV2Bytes) };
    std::copy(bytesB.begin() + start, bytesB.begin() + start + static_cast<std::ptrdiff_t>(record),
              bytesA.begin() + start);
    writeFile(a, bytesA);

    EXPECT_EQ(errcOf(m_codec->readContainer(a, m_keys)), ContainerErrc::DecryptionFailed);
}

TEST_F(ContainerCodecTest, TruncationIsDetected)
{
    const auto file{ writeSample(patternBytes(2U * g_kTestChunkSize)) };
    const auto pristine{ readFile(file) };

    const std::size_t trailer{ photovault::container::g_kChunkLengthBytes + photovault::container::g_kMagicBytes };
    for (const std::size_t cut : { std::size_t{ 1 }, trailer, trailer + 1U, trailer + 20U, pristine.size() - 30U })
    {
        const std::vector<std::byte> truncated(pristine.begin(),
                                               pristine.end() - static_cast<std::ptrdiff_t>(cut));
        writeFile(file, truncated);
        EXPECT_EQ(errcOf(m_codec->readContainer(file, m_keys)), ContainerErrc::DecryptionFailed) << cut;
    }
}

TEST_F(ContainerCodecTest, TrailingBytesAfterMarkerAreRejected)
{
    const auto file{ writeSample(patternBytes(10U)) };
    auto bytes{ readFile(file) };
    bytes.push_back(std::byte{ 0 });
    writeFile(file, bytes);

    auto result{ m_codec->readContainer(file, m_keys) };
    ASSERT_EQ(errcOf(result), ContainerErrc::DecryptionFailed);
    EXPECT_EQ(std::get<ContainerError>(result).path, file);
}

TEST_F(ContainerCodecTest, CorruptedMarkerIsRejected)
{
    const auto file{ writeSample(patternBytes(10U)) };
    auto bytes{ readFile(file) };
    bytes.back() ^= std::byte{ 0x20 };
    writeFile(file, bytes);

    EXPECT_EQ(errcOf(m_codec->readContainer(file, m_keys)), ContainerErrc::DecryptionFailed);
}

TEST_F(ContainerCodecTest, ReadsVersionOneContainers)
{
    const auto plain{ patternBytes(g_kTestChunkSize + 9U, 0x44U) };
    const photovault::container::ContainerHeader header{ .version = photovault::container::g_kContainerVersionV1,
                                                         .mediaType = MediaType::Photo,
                                                         .originalSize = plain.size(),
                                                         .chunkSize = g_kTestChunkSize,
                                                         .metadataLength = 0U };
    auto bytes{ photovault::container::encodeContainerHeader(header) };
    const auto aad{ bytes };

    auto appendU32 = [&bytes](std::uint32_t v) {
        for (int i{}; i < 4; ++i)
        {
            bytes.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFU));
        }
    };
    for (std::size_t off{}; off < plain.size(); off += g_kTestChunkSize)
    {
        const auto piece{ std::span<const std::byte>{ plain }.subspan(
            off, std::min<std::size_t>(g_kTestChunkSize, plain.size() - off)) };
        const auto box{ m_crypto->aeadEncrypt(m_keys.encryptionKey(), piece, aad) };
        appendU32(static_cast<std::uint32_t>(box.cipherText.size()));
        for (const auto b : box.nonce)
        {
            bytes.push_back(std::byte{ b });
        }
        for (const auto b : box.cipherText)
        {
            bytes.push_back(std::byte{ b });
        }
        for (const auto b : box.tag)
        {
            bytes.push_back(std::byte{ b });
        }
    }
    appendU32(0U);
    bytes.insert(bytes.end(), photovault::container::g_kCompletionMarker.begin(),
                 photovault::container::g_kCompletionMarker.end());

    const auto file{ path("legacy.svf2") };
    writeFile(file, bytes);

    auto result{ m_codec->readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_EQ(asByteVector(std::get<photovault::security::SecureBuffer>(result)), plain);

    auto metadata{ m_codec->readMetadata(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<std::optional<MediaMetadata>>(metadata));
    EXPECT_FALSE(std::get<std::optional<MediaMetadata>>(metadata).has_value());
}

TEST_F(ContainerCodecTest, RefusesToOverwriteDestination)
{
    const auto file{ path("taken.svf2") };
    const auto existing{ patternBytes(5U) };
    writeFile(file, existing);

    auto result{ m_codec->writeContainer(patternBytes(10U), MediaType::Photo, std::nullopt, m_keys, file) };
    EXPECT_EQ(errcOf(result), ContainerErrc::FileAlreadyExists);
    EXPECT_EQ(readFile(file), existing);
}

TEST_F(ContainerCodecTest, EncryptionFailureRemovesPartialFile)
{
    photovault::test_utils::FaultInjectingCryptoProvider faulty{ *m_crypto };
    faulty.failEncryptAfter(2U);
    photovault::container::ContainerCodec codec{ faulty, m_options };

    const auto file{ path("partial.svf2") };
    auto result{ codec.writeContainer(patternBytes(5U * g_kTestChunkSize), MediaType::Photo, std::nullopt, m_keys,
                                      file) };
    EXPECT_EQ(errcOf(result), ContainerErrc::CryptoError);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(ContainerCodecTest, SourceReadFailureRemovesPartialFile)
{
    const auto file{ path("interrupted.svf2") };
    FailingSource source{ 3U };

    auto result{ m_codec->writeContainer(source, MediaType::Video, std::nullopt, m_keys, file) };
    EXPECT_EQ(errcOf(result), ContainerErrc::IoError);
    EXPECT_EQ(source.reads(), 3U);
    EXPECT_FALSE(std::filesystem::exists(file));
    EXPECT_EQ(countEntries(m_dir.path() / "tmp"), 0U);
}

TEST_F(ContainerCodecTest, SourceFailureOnFirstReadRemovesHeaderOnlyFile)
{
    const auto file{ path("empty-handed.svf2") };
    FailingSource source{ 1U };

    auto result{ m_codec->writeContainer(source, MediaType::Photo, MediaMetadata{}, m_keys, file) };
    EXPECT_EQ(errcOf(result), ContainerErrc::IoError);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(ContainerCodecTest, AuthenticatesWithTellsWhichKeysSealedTheFile)
{
    const auto otherKeys{ makeTestKeys(0x02U) };
    const auto plainFile{ writeSample(patternBytes(3U * g_kTestChunkSize), "chunks.svf2") };

    const auto withMetadata{ path("described.svf2") };
    MediaMetadata metadata{};
    metadata.filename = "IMG_0007.HEIC";
    ASSERT_TRUE(std::holds_alternative<std::monostate>(
        m_codec->writeContainer(patternBytes(10U), MediaType::Photo, metadata, m_keys, withMetadata)));

    for (const auto& file : { plainFile, withMetadata })
    {
        const auto own{ m_codec->authenticatesWith(file, m_keys) };
        ASSERT_TRUE(std::holds_alternative<bool>(own)) << file;
        EXPECT_TRUE(std::get<bool>(own)) << file;

        const auto foreign{ m_codec->authenticatesWith(file, otherKeys) };
        ASSERT_TRUE(std::holds_alternative<bool>(foreign)) << file;
        EXPECT_FALSE(std::get<bool>(foreign)) << file;
    }
}

TEST_F(ContainerCodecTest, AuthenticatesWithOnEmptyContainerIsKeyIndependent)
{
    const auto file{ writeSample({}) };
    const auto result{ m_codec->authenticatesWith(file, makeTestKeys(0x02U)) };
    ASSERT_TRUE(std::holds_alternative<bool>(result));
    EXPECT_TRUE(std::get<bool>(result));
}

TEST_F(ContainerCodecTest, AuthenticatesWithRejectsPlainFiles)
{
    const auto file{ path("plain.jpg") };
    writeFile(file, patternBytes(200U));
    EXPECT_EQ(errcOf(m_codec->authenticatesWith(file, m_keys)), ContainerErrc::InvalidFileFormat);
    EXPECT_EQ(errcOf(m_codec->authenticatesWith(path("missing.svf2"), m_keys)), ContainerErrc::FileNotFound);
}

TEST_F(ContainerCodecTest, DecryptLibraryFailureIsCryptoError)
{
    const auto file{ writeSample(patternBytes(10U)) };
    photovault::test_utils::FaultInjectingCryptoProvider faulty{ *m_crypto };
    faulty.throwOnDecrypt(true);
    photovault::container::ContainerCodec codec{ faulty, m_options };

    EXPECT_EQ(errcOf(codec.readContainer(file, m_keys)), ContainerErrc::CryptoError);
}

TEST_F(ContainerCodecTest, CancelledBeforeStartWritesNothing)
{
    std::stop_source stop{};
    stop.request_stop();

    const auto file{ path("cancelled.svf2") };
    auto result{ m_codec->writeContainer(patternBytes(10U), MediaType::Photo, std::nullopt, m_keys, file, {},
                                         stop.get_token()) };
    EXPECT_TRUE(std::holds_alternative<OperationCancelled>(result));
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(ContainerCodecTest, CancelledMidWriteRemovesPartialFile)
{
    std::stop_source stop{};
    const auto file{ path("cancelled.svf2") };
    auto result{ m_codec->writeContainer(
        patternBytes(4U * g_kTestChunkSize), MediaType::Photo, std::nullopt, m_keys, file,
        [&stop](std::uint64_t) { stop.request_stop(); }, stop.get_token()) };

    EXPECT_TRUE(std::holds_alternative<OperationCancelled>(result));
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(ContainerCodecTest, CancelledMidReadLeavesNoTemporaryFile)
{
    const auto file{ writeSample(patternBytes(4U * g_kTestChunkSize)) };

    std::stop_source stop{};
    auto result{ m_codec->readContainerToTemporaryFile(
        file, m_keys, std::nullopt, [&stop](std::uint64_t) { stop.request_stop(); }, stop.get_token()) };

    EXPECT_TRUE(std::holds_alternative<OperationCancelled>(result));
    EXPECT_EQ(countEntries(m_options.temporaryDirectory), 0U);
}

TEST_F(ContainerCodecTest, ProgressReportsCumulativeBytes)
{
    const auto plain{ patternBytes(2U * g_kTestChunkSize + 10U) };
    std::vector<std::uint64_t> written{};
    const auto file{ path("progress.svf2") };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_codec->writeContainer(
        plain, MediaType::Photo, std::nullopt, m_keys, file,
        [&written](std::uint64_t n) { written.push_back(n); })));

    const std::vector<std::uint64_t> expected{ g_kTestChunkSize, 2U * g_kTestChunkSize, plain.size() };
    EXPECT_EQ(written, expected);

    std::vector<std::uint64_t> read{};
    auto result{ m_codec->readContainer(file, m_keys, [&read](std::uint64_t n) { read.push_back(n); }) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_EQ(read, expected);
}

TEST_F(ContainerCodecTest, WritesFromFileSource)
{
    const auto plain{ patternBytes(3U * g_kTestChunkSize + 1U) };
    const auto source{ path("source.jpg") };
    writeFile(source, plain);

    const auto file{ path("fromfile.svf2") };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(
        m_codec->writeContainerFromFile(source, MediaType::Photo, std::nullopt, m_keys, file)));

    auto info{ photovault::container::ContainerCodec::readContainerInfo(file) };
    ASSERT_TRUE(std::holds_alternative<photovault::container::ContainerInfo>(info));
    EXPECT_EQ(std::get<photovault::container::ContainerInfo>(info).header.originalSize, plain.size());

    auto result{ m_codec->readContainer(file, m_keys) };
    ASSERT_TRUE(std::holds_alternative<photovault::security::SecureBuffer>(result));
    EXPECT_EQ(asByteVector(std::get<photovault::security::SecureBuffer>(result)), plain);
}

TEST_F(ContainerCodecTest, DecryptsToPrivateTemporaryFile)
{
    const auto plain{ patternBytes(2U * g_kTestChunkSize + 3U) };
    const auto file{ writeSample(plain) };

    auto result{ m_codec->readContainerToTemporaryFile(file, m_keys, std::string{ ".jpg" }) };
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(result));
    const auto& temp{ std::get<std::filesystem::path>(result) };

    EXPECT_EQ(temp.parent_path(), m_options.temporaryDirectory);
    EXPECT_TRUE(temp.filename().string().starts_with(photovault::container::g_kDecryptedTempPrefix));
    EXPECT_EQ(temp.extension(), ".jpg");
    EXPECT_EQ(readFile(temp), plain);

    const auto perms{ std::filesystem::status(m_options.temporaryDirectory).permissions() };
    EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
              std::filesystem::perms::none);
}

TEST_F(ContainerCodecTest, FailedTemporaryDecryptRemovesFile)
{
    const auto file{ writeSample(patternBytes(2U * g_kTestChunkSize)) };

    auto result{ m_codec->readContainerToTemporaryFile(file, makeTestKeys(0x09U)) };
    EXPECT_EQ(errcOf(result), ContainerErrc::DecryptionFailed);
    EXPECT_EQ(countEntries(m_options.temporaryDirectory), 0U);
}

TEST_F(ContainerCodecTest, ExtensionCannotEscapeTemporaryDirectory)
{
    const auto file{ writeSample(patternBytes(8U)) };

    auto result{ m_codec->readContainerToTemporaryFile(file, m_keys, std::string{ "../../evil" }) };
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(result));
    const auto& temp{ std::get<std::filesystem::path>(result) };
    EXPECT_EQ(temp.parent_path(), m_options.temporaryDirectory);
    EXPECT_TRUE(temp.extension().empty());
}

} // namespace
