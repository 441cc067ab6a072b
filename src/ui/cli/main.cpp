#include "CommandRunner.hpp"
#include "ConsoleUtils.hpp"

#include "photovault/crypto/providers/OpenSslProviderFactory.hpp"
#include "photovault/storage/sqlite/SqliteCredentialStoreFactory.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        photovault::ui::cli::lockProcessMemory();
        // Before any worker thread exists, so every thread inherits the blocked signal mask.
        const photovault::ui::cli::InterruptWatcher interrupts{};

        auto crypto{ photovault::crypto::providers::makeOpenSslCryptoProvider() };
        auto store{ photovault::storage::sqlite::makeSqliteCredentialStore() };

        photovault::ui::cli::CommandRunner runner{ *crypto,
                                                   *store,
                                                   std::cout,
                                                   std::cerr,
                                                   photovault::ui::cli::readPassword,
                                                   photovault::core::defaultPasswordServiceOptions(),
                                                   interrupts.token() };

        const std::vector<std::string> args(argv, argv + argc);
        return runner.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
