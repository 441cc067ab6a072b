#include "CommandRunner.hpp"
#include "photovault/container/ContainerCodec.hpp"
#include "photovault/crypto/providers/OpenSslProviderFactory.hpp"
#include "photovault/storage/sqlite/SqliteCredentialStoreFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <csignal>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <sys/resource.h>

namespace
{

using photovault::ui::cli::g_kExitAuth;
using photovault::ui::cli::g_kExitIntegrity;
using photovault::ui::cli::g_kExitIo;
using photovault::ui::cli::g_kExitOk;
using photovault::ui::cli::g_kExitUsage;

constexpr const char* g_kPassword{ "correct horse" };
constexpr const char* g_kNewPassword{ "battery staple" };

class CommandRunnerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_source = m_dir.path() / "IMG_0042.jpg";
        m_plain = photovault::test_utils::patternBytes(300U);
        photovault::test_utils::writeFile(m_source, m_plain);
    }

    // Each prompt consumes the next scripted answer; an exhausted script answers with an empty password.
    int run(std::vector<std::string> args, std::vector<std::string> passwords = {})
    {
        m_out.str({});
        m_err.str({});
        m_passwords.assign(passwords.begin(), passwords.end());

        photovault::core::PasswordServiceOptions options{};
        options.kdf = photovault::test_utils::fastKdfParams();
        options.container.chunkSize = 64U;
        options.container.temporaryDirectory = m_tempDir;

        photovault::ui::cli::CommandRunner runner{ *m_crypto, *m_store, m_out, m_err,
                                                   [this](const std::string& prompt) {
                                                       m_prompts.push_back(prompt);
                                                       if (m_passwords.empty())
                                                       {
                                                           return photovault::security::SecureString{};
                                                       }
                                                       auto next{ std::move(m_passwords.front()) };
                                                       m_passwords.pop_front();
                                                       return photovault::security::secureStringFrom(next);
                                                   },
                                                   options };
        args.insert(args.begin(), "pvault");
        return runner.run(args);
    }

    void initAlbum()
    {
        ASSERT_EQ(run({ "init", m_album.string() }, { g_kPassword, g_kPassword }), g_kExitOk) << m_err.str();
    }

    void encrypt(const std::filesystem::path& dest)
    {
        ASSERT_EQ(run({ "encrypt", m_album.string(), m_source.string(), dest.string() }, { g_kPassword }), g_kExitOk)
            << m_err.str();
    }

    photovault::test_utils::TempDir m_dir{ "cli_" };
    std::filesystem::path m_album{ m_dir.path() / "album" };
    std::filesystem::path m_tempDir{ m_dir.path() / "tmp" };
    std::filesystem::path m_source;
    std::vector<std::byte> m_plain;
    std::unique_ptr<photovault::crypto::ICryptoProvider> m_crypto{
        photovault::crypto::providers::makeOpenSslCryptoProvider()
    };
    std::unique_ptr<photovault::storage::ICredentialStore> m_store{
        photovault::storage::sqlite::makeSqliteCredentialStore()
    };
    std::ostringstream m_out;
    std::ostringstream m_err;
    std::deque<std::string> m_passwords;
    std::vector<std::string> m_prompts;
};

TEST_F(CommandRunnerTest, MissingSubcommandIsUsageError)
{
    EXPECT_EQ(run({}), g_kExitUsage);
    EXPECT_EQ(run({ "frobnicate" }), g_kExitUsage);
    EXPECT_EQ(run({ "info" }), g_kExitUsage);
}

TEST_F(CommandRunnerTest, HelpExitsCleanly)
{
    EXPECT_EQ(run({ "--help" }), g_kExitOk);
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("encrypt"));
}

TEST_F(CommandRunnerTest, InitPromptsTwiceAndRejectsMismatch)
{
    EXPECT_EQ(run({ "init", m_album.string() }, { g_kPassword, "something else" }), g_kExitUsage);
    EXPECT_EQ(m_prompts.size(), 2U);

    EXPECT_EQ(run({ "init", m_album.string() }, { "short", "short" }), g_kExitUsage);

    initAlbum();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("album initialized"));
    EXPECT_NE(run({ "init", m_album.string() }, { g_kPassword, g_kPassword }), g_kExitOk);
}

TEST_F(CommandRunnerTest, EncryptDecryptRoundTrip)
{
    initAlbum();
    const auto container{ m_dir.path() / "IMG_0042.svf2" };
    encrypt(container);

    const auto out{ m_dir.path() / "restored.jpg" };
    ASSERT_EQ(run({ "decrypt", m_album.string(), container.string(), "--out", out.string() }, { g_kPassword }),
              g_kExitOk)
        << m_err.str();
    EXPECT_EQ(photovault::test_utils::readFile(out), m_plain);

    // Never overwrites.
    EXPECT_EQ(run({ "decrypt", m_album.string(), container.string(), "--out", out.string() }, { g_kPassword }),
              g_kExitIo);
    EXPECT_EQ(run({ "encrypt", m_album.string(), m_source.string(), container.string() }, { g_kPassword }),
              g_kExitIo);
}

TEST_F(CommandRunnerTest, DecryptWithoutOutPrintsTemporaryFile)
{
    initAlbum();
    const auto container{ m_dir.path() / "IMG_0042.svf2" };
    encrypt(container);

    ASSERT_EQ(run({ "decrypt", m_album.string(), container.string() }, { g_kPassword }), g_kExitOk) << m_err.str();
    std::string printed{ m_out.str() };
    while (!printed.empty() && printed.back() == '\n')
    {
        printed.pop_back();
    }
    const std::filesystem::path tmp{ printed };
    EXPECT_EQ(tmp.parent_path(), m_tempDir);
    EXPECT_EQ(tmp.extension(), ".jpg");
    EXPECT_EQ(photovault::test_utils::readFile(tmp), m_plain);

    EXPECT_EQ(run({ "cleanup-temp", "--older-than-minutes", "0" }), g_kExitOk);
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("removed 1")) << m_out.str();
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(CommandRunnerTest, WrongPasswordIsAuthFailure)
{
    initAlbum();
    const auto container{ m_dir.path() / "IMG_0042.svf2" };
    encrypt(container);

    EXPECT_EQ(run({ "meta", m_album.string(), container.string() }, { "not the password" }), g_kExitAuth);
    EXPECT_EQ(run({ "decrypt", m_album.string(), container.string() }, { "not the password" }), g_kExitAuth);
}

TEST_F(CommandRunnerTest, InfoAndMetaDescribeContainer)
{
    initAlbum();
    const auto container{ m_dir.path() / "clip.svf2" };
    ASSERT_EQ(run({ "encrypt", m_album.string(), m_source.string(), container.string(), "--video", "--name",
                    "VID_1.MOV", "--duration", "2.5", "--lat", "48.85", "--lon", "2.35", "--favorite" },
                  { g_kPassword }),
              g_kExitOk)
        << m_err.str();

    ASSERT_EQ(run({ "info", container.string() }), g_kExitOk);
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("format version: 2")) << m_out.str();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("media type: video"));
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("original size: 300 bytes"));
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("chunk size: 64 bytes"));

    ASSERT_EQ(run({ "meta", m_album.string(), container.string() }, { g_kPassword }), g_kExitOk) << m_err.str();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("filename: VID_1.MOV")) << m_out.str();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("duration: 2.5 s"));
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("favorite: yes"));
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("location: "));
}

TEST_F(CommandRunnerTest, EncryptWithoutMetadata)
{
    initAlbum();
    const auto container{ m_dir.path() / "bare.svf2" };
    ASSERT_EQ(run({ "encrypt", m_album.string(), m_source.string(), container.string(), "--no-metadata" },
                  { g_kPassword }),
              g_kExitOk);
    ASSERT_EQ(run({ "meta", m_album.string(), container.string() }, { g_kPassword }), g_kExitOk);
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("(no metadata)"));
}

TEST_F(CommandRunnerTest, LatitudeRequiresLongitude)
{
    initAlbum();
    EXPECT_EQ(run({ "encrypt", m_album.string(), m_source.string(), (m_dir.path() / "x.svf2").string(), "--lat",
                    "10" },
                  { g_kPassword }),
              g_kExitUsage);
}

TEST_F(CommandRunnerTest, InfoOnPlainFileIsIntegrityError)
{
    EXPECT_EQ(run({ "info", m_source.string() }), g_kExitIntegrity);
    EXPECT_THAT(m_err.str(), ::testing::HasSubstr("error:"));
}

TEST_F(CommandRunnerTest, PasswdRotatesDirectoryOfContainers)
{
    initAlbum();
    const auto vault{ m_dir.path() / "vault" };
    std::filesystem::create_directories(vault);
    encrypt(vault / "a.svf2");
    encrypt(vault / "b.svf2");
    photovault::test_utils::writeFile(vault / "notes.txt", photovault::test_utils::patternBytes(10U));

    ASSERT_EQ(run({ "passwd", m_album.string(), vault.string() }, { g_kPassword, g_kNewPassword, g_kNewPassword }),
              g_kExitOk)
        << m_err.str();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("2 container(s) re-encrypted")) << m_out.str();

    EXPECT_EQ(run({ "meta", m_album.string(), (vault / "a.svf2").string() }, { g_kPassword }), g_kExitAuth);
    EXPECT_EQ(run({ "meta", m_album.string(), (vault / "b.svf2").string() }, { g_kNewPassword }), g_kExitOk);
    EXPECT_EQ(run({ "passwd", m_album.string(), vault.string(), "--resume" }, { g_kNewPassword }),
              photovault::ui::cli::exitCodeFor(photovault::core::PasswordError::NoPendingRotation));
}

TEST_F(CommandRunnerTest, PasswdWithBrokenContainerLeavesPasswordUnchanged)
{
    initAlbum();
    const auto good{ m_dir.path() / "good.svf2" };
    const auto bad{ m_dir.path() / "bad.svf2" };
    encrypt(good);
    encrypt(bad);
    auto bytes{ photovault::test_utils::readFile(bad) };
    // Inside the last chunk, just before the 12-byte trailer.
    bytes[bytes.size() - 20U] ^= std::byte{ 0x40 };
    photovault::test_utils::writeFile(bad, bytes);

    EXPECT_EQ(run({ "passwd", m_album.string(), good.string(), bad.string() },
                  { g_kPassword, g_kNewPassword, g_kNewPassword }),
              g_kExitIntegrity);
    EXPECT_THAT(m_err.str(), ::testing::HasSubstr("password unchanged"));

    ASSERT_EQ(run({ "passwd", m_album.string(), good.string(), "--resume" }, { g_kPassword }), g_kExitOk)
        << m_err.str();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("1 already done")) << m_out.str();
    EXPECT_EQ(run({ "meta", m_album.string(), good.string() }, { g_kNewPassword }), g_kExitOk);
}

TEST_F(CommandRunnerTest, ShredRemovesFile)
{
    const auto victim{ m_dir.path() / "victim.bin" };
    photovault::test_utils::writeFile(victim, photovault::test_utils::patternBytes(1000U));

    ASSERT_EQ(run({ "shred", victim.string() }), g_kExitOk) << m_err.str();
    EXPECT_THAT(m_out.str(), ::testing::HasSubstr("overwritten and removed"));
    EXPECT_FALSE(std::filesystem::exists(victim));

    EXPECT_EQ(run({ "shred", victim.string() }), g_kExitIo);
}

TEST(CopyWithoutReplacing, CopiesIntoNewFile)
{
    photovault::test_utils::TempDir dir{ "copy_" };
    const auto from{ dir.path() / "from.bin" };
    const auto to{ dir.path() / "to.bin" };
    photovault::test_utils::writeFile(from, photovault::test_utils::patternBytes(4096U));

    EXPECT_FALSE(photovault::ui::cli::copyWithoutReplacing(from, to).has_value());
    EXPECT_EQ(photovault::test_utils::readFile(to), photovault::test_utils::patternBytes(4096U));
}

TEST(CopyWithoutReplacing, LeavesExistingDestinationAlone)
{
    photovault::test_utils::TempDir dir{ "copy_" };
    const auto from{ dir.path() / "from.bin" };
    const auto to{ dir.path() / "to.bin" };
    photovault::test_utils::writeFile(from, photovault::test_utils::patternBytes(64U, 1U));
    photovault::test_utils::writeFile(to, photovault::test_utils::patternBytes(32U, 2U));

    EXPECT_TRUE(photovault::ui::cli::copyWithoutReplacing(from, to).has_value());
    EXPECT_EQ(photovault::test_utils::readFile(to), photovault::test_utils::patternBytes(32U, 2U));
}

// A file size limit makes the copy fail after the destination was created and partly written.
TEST(CopyWithoutReplacing, FailedCopyLeavesNoPartialPlaintext)
{
    photovault::test_utils::TempDir dir{ "copy_" };
    const auto from{ dir.path() / "from.bin" };
    const auto to{ dir.path() / "to.bin" };
    photovault::test_utils::writeFile(from, photovault::test_utils::patternBytes(64U * 1024U));

    rlimit saved{};
    ASSERT_EQ(::getrlimit(RLIMIT_FSIZE, &saved), 0);
    rlimit limited{ saved };
    limited.rlim_cur = 4096U;
    auto* const previousHandler{ std::signal(SIGXFSZ, SIG_IGN) };
    ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &limited), 0);

    const auto failure{ photovault::ui::cli::copyWithoutReplacing(from, to) };

    ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &saved), 0);
    (void)std::signal(SIGXFSZ, previousHandler);

    EXPECT_TRUE(failure.has_value());
    EXPECT_FALSE(std::filesystem::exists(to));
}

} // namespace
