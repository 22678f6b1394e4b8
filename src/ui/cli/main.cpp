#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "cipherbook/core/KdfPolicy.hpp"
#include "cipherbook/core/KeyManager.hpp"
#include "cipherbook/core/Logger.hpp"
#include "cipherbook/core/RecordService.hpp"
#include "cipherbook/core/VaultTransfer.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"
#if defined(CPBK_HAVE_MONOCYPHER)
#include "cipherbook/crypto/providers/NativeProviderFactory.hpp"
#endif
#include "cipherbook/storage/file/FileParamStoreFactory.hpp"
#include "cipherbook/storage/sqlite/SqliteLocalStoreFactory.hpp"

#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace
{

[[nodiscard]] std::string defaultVaultDir()
{
    const char* home{ std::getenv("HOME") };
    if (home == nullptr || *home == '\0')
    {
        return ".cipherbook";
    }
    return (std::filesystem::path{ home } / ".cipherbook").string();
}

// Argon2id and the AEAD on Monocypher when it was built in; PBKDF2 always on libcrypto.
[[nodiscard]] std::unique_ptr<cipherbook::crypto::ICryptoProvider> makeCryptoProvider()
{
#if defined(CPBK_HAVE_MONOCYPHER)
    return cipherbook::crypto::providers::makeNativeCryptoProvider(
        cipherbook::crypto::providers::makeOpenSslCryptoProvider());
#else
    return cipherbook::crypto::providers::makeOpenSslCryptoProvider();
#endif
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "Cipherbook: an encrypted vault and notes store" };

    std::string vaultDir{ defaultVaultDir() };
    std::int64_t autoLockSeconds{ cipherbook::core::g_kDefaultAutoLockTimeout.count() };
    std::uint32_t iterations{ cipherbook::core::defaultKdfPolicy().iterations };
    cipherbook::crypto::KdfAlgorithm kdf{ cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256 };
    const std::map<std::string, cipherbook::crypto::KdfAlgorithm> kdfNames{
        { "pbkdf2", cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256 },
        { "argon2id", cipherbook::crypto::KdfAlgorithm::Argon2id },
    };
    bool verbose{ false };

    app.add_option("-d,--vault", vaultDir, "Vault directory")->envname("CPBK_VAULT_DIR")->capture_default_str();
    app.add_option("--auto-lock", autoLockSeconds, "Seconds of inactivity before the vault locks (0 disables)")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("--iterations", iterations, "PBKDF2 iterations for new key wrappings")
        ->check(CLI::Range(std::uint32_t{ 100000U }, std::uint32_t{ 10000000U }))
        ->capture_default_str();
    app.add_option("--kdf", kdf, "Password KDF for new key wrappings (pbkdf2, argon2id)")
        ->transform(CLI::CheckedTransformer(kdfNames, CLI::ignore_case))
        ->envname("CPBK_KDF");
    app.add_flag("-v,--verbose", verbose, "Debug logging");

    CLI11_PARSE(app, argc, argv);

    try
    {
        if (!cipherbook::ui::cli::lockProcessMemory())
        {
            std::cerr << "warning: could not lock process memory; secrets may be swapped to disk\n";
        }

        const auto level{ verbose ? cipherbook::core::LogLevel::Debug : cipherbook::core::LogLevel::Warn };
        const cipherbook::core::Logger root{ "cipherbook", cipherbook::core::makeConsoleLogSink(), level };

        const std::filesystem::path vault{ vaultDir };
        std::filesystem::create_directories(vault);

        auto crypto{ makeCryptoProvider() };
        if (!crypto->supportsKdf(kdf))
        {
            std::cerr << "error: the selected KDF is not available in this build\n";
            return 1;
        }
        root.debug(std::string{ "crypto provider: " } + std::string{ crypto->name() });
        auto params{ cipherbook::storage::file::makeFileParamStore(vault / "params") };
        auto store{ cipherbook::storage::sqlite::makeSqliteLocalStore(vault / "cipherbook.db") };

        auto policy{ kdf == cipherbook::crypto::KdfAlgorithm::Argon2id ? cipherbook::core::argon2idKdfPolicy()
                                                                        : cipherbook::core::defaultKdfPolicy() };
        if (kdf == cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256)
        {
            policy.iterations = iterations;
        }

        cipherbook::core::KeyManager keys{ *crypto, *params, policy, root.withComponent("KeyManager") };
        cipherbook::core::RecordService records{ *crypto, *store, cipherbook::core::systemNow,
                                                 root.withComponent("RecordService") };
        cipherbook::core::VaultTransfer transfer{ *crypto, *store, root.withComponent("VaultTransfer") };

        cipherbook::ui::cli::InteractiveShell shell{ cipherbook::ui::cli::ShellServices{ keys, records, transfer },
                                                     std::cin, std::cout, cipherbook::ui::cli::readPassword,
                                                     std::chrono::seconds{ autoLockSeconds } };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
