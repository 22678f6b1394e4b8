#ifndef CIPHERBOOK_UI_CLI_INTERACTIVESHELL_HPP
#define CIPHERBOOK_UI_CLI_INTERACTIVESHELL_HPP

#include "cipherbook/core/KeyManager.hpp"
#include "cipherbook/core/RecordService.hpp"
#include "cipherbook/core/VaultSession.hpp"
#include "cipherbook/core/VaultTransfer.hpp"
#include "cipherbook/security/SecureString.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace cipherbook::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<cipherbook::security::SecureString(const std::string&)>;

struct ShellServices final
{
    cipherbook::core::KeyManager& keys;
    cipherbook::core::RecordService& records;
    cipherbook::core::VaultTransfer& transfer;
};

class InteractiveShell final
{
public:
    InteractiveShell(ShellServices services, std::istream& in, std::ostream& out, PasswordReader pwdReader,
                     std::chrono::seconds autoLock = cipherbook::core::g_kDefaultAutoLockTimeout);

    int run();

private:
    ShellServices m_services;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    std::chrono::seconds m_autoLock;

    std::optional<cipherbook::core::VaultSession> m_session;
    bool m_running{ true };

    void processLine(const std::string& line);

    // Prints the reason and returns nullptr when there is no usable session.
    [[nodiscard]] cipherbook::core::VaultSession* requireSession();
    [[nodiscard]] std::optional<std::string> readOptionalSecret(const std::string& prompt);

    void doInit();
    void doUnlock();
    void doLock();
    void doPasswd();
    void doAdd(const std::string& title, const std::optional<std::string>& username,
               const std::optional<std::string>& url, const std::optional<std::string>& note);
    void doList(const std::string& keyword);
    void doShow(const std::string& id);
    void doRm(const std::string& id);
    void doNotes(const std::string& keyword);
    void doNoteAdd(const std::string& title, const std::string& content, const std::vector<std::string>& tags);
    void doNoteRm(const std::string& id);
    void doExport(const std::string& path);
    void doImport(const std::string& path);
};

} // namespace cipherbook::ui::cli

#endif // CIPHERBOOK_UI_CLI_INTERACTIVESHELL_HPP
