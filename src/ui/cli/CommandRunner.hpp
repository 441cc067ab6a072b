#ifndef PHOTOVAULT_UI_CLI_COMMANDRUNNER_HPP
#define PHOTOVAULT_UI_CLI_COMMANDRUNNER_HPP

#include "photovault/container/ContainerError.hpp"
#include "photovault/core/PasswordService.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/security/SecureString.hpp"
#include "photovault/storage/ICredentialStore.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace photovault::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<photovault::security::SecureString(const std::string&)>;

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitFailure{ 1 };
constexpr int g_kExitUsage{ 2 };
constexpr int g_kExitIntegrity{ 3 };
constexpr int g_kExitIo{ 4 };
constexpr int g_kExitAuth{ 5 };
constexpr int g_kExitCancelled{ 130 };

[[nodiscard]] int exitCodeFor(const photovault::container::ContainerError& error) noexcept;
[[nodiscard]] int exitCodeFor(photovault::core::PasswordError error) noexcept;

// Copies `from` to a new file `to`, never replacing an existing one. On failure no partial copy is left at `to`.
// Returns the failure reason.
[[nodiscard]] std::optional<std::string> copyWithoutReplacing(const std::filesystem::path& from,
                                                              const std::filesystem::path& to);

// One-shot `pvault` command line: parses argv with CLI11 and runs the selected subcommand.
class CommandRunner final
{
public:
    CommandRunner(photovault::crypto::ICryptoProvider& crypto, photovault::storage::ICredentialStore& store,
                  std::ostream& out, std::ostream& err, PasswordReader pwdReader,
                  photovault::core::PasswordServiceOptions serviceOptions = photovault::core::defaultPasswordServiceOptions(),
                  std::stop_token stop = {});

    // args[0] is the program name.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    photovault::crypto::ICryptoProvider& m_crypto;
    photovault::storage::ICredentialStore& m_store;
    std::ostream& m_out;
    std::ostream& m_err;
    PasswordReader m_pwdReader;
    photovault::core::PasswordServiceOptions m_serviceOptions;
    std::stop_token m_stop;

    [[nodiscard]] photovault::core::PasswordService makeService(const std::filesystem::path& albumDir) const;
    [[nodiscard]] int report(photovault::core::PasswordError error);
    [[nodiscard]] photovault::core::PasswordResult<photovault::crypto::ContainerKeys>
    unlockAlbum(photovault::core::PasswordService& service);

    struct EncryptArgs final
    {
        std::filesystem::path albumDir;
        std::filesystem::path source;
        std::filesystem::path destination;
        bool video{ false };
        bool noMetadata{ false };
        std::string name;
        std::string assetId;
        bool hasDuration{ false };
        double durationSeconds{};
        bool hasLocation{ false };
        double latitude{};
        double longitude{};
        bool favorite{ false };
    };

    int doInit(const std::filesystem::path& albumDir);
    int doEncrypt(const EncryptArgs& a);
    int doDecrypt(const std::filesystem::path& albumDir, const std::filesystem::path& container,
                  const std::filesystem::path& outPath);
    int doInfo(const std::filesystem::path& container);
    int doMeta(const std::filesystem::path& albumDir, const std::filesystem::path& container);
    int doPasswd(const std::filesystem::path& albumDir, const std::vector<std::filesystem::path>& inputs,
                 bool resume);
    int doShred(const std::filesystem::path& file);
    int doCleanupTemp(unsigned olderThanMinutes);
};

} // namespace photovault::ui::cli

#endif // PHOTOVAULT_UI_CLI_COMMANDRUNNER_HPP
