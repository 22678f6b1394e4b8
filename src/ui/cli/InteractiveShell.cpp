#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "cipherbook/security/ScopeWipe.hpp"
#include "cipherbook/security/SecureEquals.hpp"

#include <CLI/CLI.hpp>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace cipherbook::ui::cli
{
namespace
{

using cipherbook::core::AuthError;
using cipherbook::core::RecordError;

[[nodiscard]] const char* describe(RecordError e) noexcept
{
    switch (e)
    {
    case RecordError::NotFound:
        return "Record not found.";
    case RecordError::Locked:
        return "Vault is locked.";
    case RecordError::DecryptFailed:
        return "Record could not be decrypted.";
    case RecordError::InvalidRecord:
        return "Invalid record.";
    case RecordError::StorageError:
        return "Storage failure.";
    case RecordError::CryptoError:
        return "Crypto failure.";
    }
    return "Unknown error.";
}

// Wrong password, corrupt params and tampering read the same to the user.
[[nodiscard]] const char* describe(AuthError e) noexcept
{
    switch (e)
    {
    case AuthError::AlreadyInitialized:
        return "Vault is already initialized.";
    case AuthError::NotInitialized:
        return "Vault is not initialized. Run 'init' first.";
    case AuthError::StorageError:
        return "Storage failure.";
    case AuthError::InvalidPassword:
    case AuthError::Corrupt:
    case AuthError::UnsupportedKdf:
    case AuthError::RandomFailed:
    case AuthError::CryptoError:
        return "Authentication failed.";
    }
    return "Authentication failed.";
}

[[nodiscard]] std::string shortId(const std::string& id)
{
    constexpr std::size_t kShortIdChars{ 8U };
    return id.substr(0, kShortIdChars);
}

} // namespace

InteractiveShell::InteractiveShell(ShellServices services, std::istream& in, std::ostream& out,
                                   PasswordReader pwdReader, std::chrono::seconds autoLock)
    : m_services(services), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader)), m_autoLock(autoLock)
{
}

int InteractiveShell::run()
{
    m_out << "Cipherbook shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << (m_session.has_value() && m_session->isUnlocked() ? "cpbk(unlocked)> " : "cpbk> ");

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }
    m_session.reset();
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    auto tokens{ tokenizeCommandLine(line) };
    if (!tokens)
    {
        m_out << "Syntax Error: unbalanced quotes or trailing backslash\n";
        return;
    }
    std::vector<std::string> userArgs{ std::move(*tokens) };
    if (userArgs.empty())
    {
        return;
    }

    // 'help' shows the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("cpbk");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Cipherbook Shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    app.add_subcommand("init", "Create the vault key (prompts for a new password)")->callback([this]() { doInit(); });
    app.add_subcommand("unlock", "Unlock the vault")->callback([this]() { doUnlock(); });
    app.add_subcommand("lock", "Lock the vault and wipe the key from memory")->callback([this]() { doLock(); });
    app.add_subcommand("passwd", "Change the master password")->callback([this]() { doPasswd(); });

    std::string titleArg;
    std::optional<std::string> usernameArg;
    std::optional<std::string> urlArg;
    std::optional<std::string> noteArg;
    auto* subAdd = app.add_subcommand("add", "Add a vault item (prompts for the secret)");
    subAdd->add_option("title", titleArg, "Item title")->required();
    subAdd->add_option("-u,--username", usernameArg, "User name");
    subAdd->add_option("--url", urlArg, "URL");
    subAdd->add_option("-n,--note", noteArg, "Free-form note");
    subAdd->callback([&]() { doAdd(titleArg, usernameArg, urlArg, noteArg); });

    std::string keywordArg;
    auto* subLs = app.add_subcommand("ls", "List vault items, optionally filtered by title");
    subLs->add_option("keyword", keywordArg, "Case-insensitive title filter");
    subLs->callback([&]() { doList(keywordArg); });

    std::string idArg;
    auto* subShow = app.add_subcommand("show", "Show a vault item including its secret");
    subShow->add_option("id", idArg, "Item id")->required();
    subShow->callback([&]() { doShow(idArg); });

    auto* subRm = app.add_subcommand("rm", "Delete a vault item");
    subRm->add_option("id", idArg, "Item id")->required();
    subRm->callback([&]() { doRm(idArg); });

    auto* subNotes = app.add_subcommand("notes", "List notes, optionally filtered");
    subNotes->add_option("keyword", keywordArg, "Case-insensitive title/content filter");
    subNotes->callback([&]() { doNotes(keywordArg); });

    std::string contentArg;
    std::vector<std::string> tagArgs;
    auto* subNoteAdd = app.add_subcommand("note-add", "Add a note");
    subNoteAdd->add_option("title", titleArg, "Note title")->required();
    subNoteAdd->add_option("content", contentArg, "Note body");
    subNoteAdd->add_option("-t,--tag", tagArgs, "Tag (repeatable)");
    subNoteAdd->callback([&]() { doNoteAdd(titleArg, contentArg, tagArgs); });

    auto* subNoteRm = app.add_subcommand("note-rm", "Delete a note");
    subNoteRm->add_option("id", idArg, "Note id")->required();
    subNoteRm->callback([&]() { doNoteRm(idArg); });

    std::string pathArg;
    auto* subExport = app.add_subcommand("export", "Write an encrypted backup of all records");
    subExport->add_option("path", pathArg, "Output file")->required();
    subExport->callback([&]() { doExport(pathArg); });

    auto* subImport = app.add_subcommand("import", "Import records from an encrypted backup");
    subImport->add_option("path", pathArg, "Backup file")->required();
    subImport->callback([&]() { doImport(pathArg); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (auto& arg : args)
        {
            argv.push_back(arg.data());
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

cipherbook::core::VaultSession* InteractiveShell::requireSession()
{
    if (!m_session.has_value())
    {
        m_out << "Error: Vault is locked.\n";
        return nullptr;
    }
    if (!m_session->touchIfUnlocked())
    {
        m_session.reset();
        m_out << "Error: Vault locked after inactivity. Run 'unlock'.\n";
        return nullptr;
    }
    return &*m_session;
}

std::optional<std::string> InteractiveShell::readOptionalSecret(const std::string& prompt)
{
    auto value{ m_pwdReader(prompt) };
    auto wipeValue{ cipherbook::security::scopeWipe(value) };
    if (value.empty())
    {
        return std::nullopt;
    }
    return std::string{ cipherbook::security::asStringView(value) };
}

// --- Handlers ---

void InteractiveShell::doInit()
{
    auto p1{ m_pwdReader("New Password: ") };
    auto wipeP1{ cipherbook::security::scopeWipe(p1) };

    auto p2{ m_pwdReader("Confirm Password: ") };
    auto wipeP2{ cipherbook::security::scopeWipe(p2) };

    if (!cipherbook::security::secureEquals(p1, p2))
    {
        m_out << "Error: Passwords do not match.\n";
        return;
    }

    const auto result{ m_services.keys.initialize(p1) };
    if (const auto* err = std::get_if<AuthError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_out << "Vault initialized.\n";
}

void InteractiveShell::doUnlock()
{
    if (m_session.has_value() && m_session->isUnlocked())
    {
        m_out << "Vault already unlocked.\n";
        return;
    }

    auto pass{ m_pwdReader("Password: ") };
    auto wipePass{ cipherbook::security::scopeWipe(pass) };

    auto result{ m_services.keys.unlock(pass) };
    if (const auto* err = std::get_if<AuthError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_session.emplace(std::move(std::get<cipherbook::core::DataKey>(result)), m_autoLock);
    m_out << "Vault unlocked.\n";
}

void InteractiveShell::doLock()
{
    if (!m_session.has_value())
    {
        m_out << "Error: Vault is not unlocked.\n";
        return;
    }
    m_session.reset();
    m_out << "Vault locked.\n";
}

void InteractiveShell::doPasswd()
{
    auto oldPass{ m_pwdReader("Current Password: ") };
    auto wipeOld{ cipherbook::security::scopeWipe(oldPass) };
    auto p1{ m_pwdReader("New Password: ") };
    auto wipeP1{ cipherbook::security::scopeWipe(p1) };
    auto p2{ m_pwdReader("Confirm Password: ") };
    auto wipeP2{ cipherbook::security::scopeWipe(p2) };

    if (!cipherbook::security::secureEquals(p1, p2))
    {
        m_out << "Error: Passwords do not match.\n";
        return;
    }

    const auto result{ m_services.keys.changePassword(oldPass, p1) };
    if (const auto* err = std::get_if<AuthError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_out << "Password changed.\n";
}

void InteractiveShell::doAdd(const std::string& title, const std::optional<std::string>& username,
                             const std::optional<std::string>& url, const std::optional<std::string>& note)
{
    auto* session{ requireSession() };
    if (session == nullptr)
    {
        return;
    }

    cipherbook::core::VaultItemDraft draft{};
    draft.title = title;
    draft.username = username;
    draft.secret = readOptionalSecret("Secret (empty for none): ");
    draft.url = url;
    draft.note = note;

    const auto result{ m_services.records.createVaultItem(*session, draft) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_out << "Item stored: " << std::get<cipherbook::core::VaultRecord>(result).id << "\n";
}

void InteractiveShell::doList(const std::string& keyword)
{
    auto* session{ requireSession() };
    if (session == nullptr)
    {
        return;
    }

    const auto result{ m_services.records.searchVaultItems(*session, keyword) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }

    const auto& items{ std::get<std::vector<cipherbook::core::VaultRecord>>(result) };
    if (items.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& item : items)
    {
        m_out << " - " << shortId(item.id) << "  " << item.title;
        if (item.username)
        {
            m_out << " (" << *item.username << ")";
        }
        m_out << "\n";
    }
}

void InteractiveShell::doShow(const std::string& id)
{
    auto* session{ requireSession() };
    if (session == nullptr)
    {
        return;
    }

    // Accept the short id printed by 'ls'.
    std::string fullId{ id };
    const auto listed{ m_services.records.listVaultItems(*session) };
    if (const auto* items = std::get_if<std::vector<cipherbook::core::VaultRecord>>(&listed))
    {
        for (const auto& item : *items)
        {
            if (item.id.starts_with(id))
            {
                fullId = item.id;
                break;
            }
        }
    }

    const auto result{ m_services.records.getVaultItem(*session, fullId) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }

    const auto& item{ std::get<cipherbook::core::VaultRecord>(result) };
    m_out << "id:       " << item.id << "\n";
    m_out << "title:    " << item.title << "\n";
    m_out << "username: " << item.username.value_or("") << "\n";
    m_out << "secret:   " << item.secret.value_or("") << "\n";
    m_out << "url:      " << item.url.value_or("") << "\n";
    m_out << "note:     " << item.note.value_or("") << "\n";
}

void InteractiveShell::doRm(const std::string& id)
{
    auto* session{ requireSession() };
    if (session == nullptr)
    {
        return;
    }

    const auto result{ m_services.records.deleteVaultItem(*session, id) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_out << "Item deleted.\n";
}

void InteractiveShell::doNotes(const std::string& keyword)
{
    const auto result{ m_services.records.searchNotes(keyword) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }

    const auto& notes{ std::get<std::vector<cipherbook::core::NoteRecord>>(result) };
    if (notes.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& note : notes)
    {
        m_out << " - " << shortId(note.id) << "  " << note.title;
        for (const auto& tag : note.tags)
        {
            m_out << " #" << tag;
        }
        m_out << "\n";
    }
}

void InteractiveShell::doNoteAdd(const std::string& title, const std::string& content,
                                 const std::vector<std::string>& tags)
{
    cipherbook::core::NoteDraft draft{};
    draft.title = title;
    draft.content = content;
    draft.tags = tags;

    const auto result{ m_services.records.createNote(draft) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_out << "Note stored: " << std::get<cipherbook::core::NoteRecord>(result).id << "\n";
}

void InteractiveShell::doNoteRm(const std::string& id)
{
    const auto result{ m_services.records.deleteNote(id) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    m_out << "Note deleted.\n";
}

void InteractiveShell::doExport(const std::string& path)
{
    auto* session{ requireSession() };
    if (session == nullptr)
    {
        return;
    }

    const auto result{ m_services.transfer.exportAll(*session) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }

    std::ofstream out{ path, std::ios::binary | std::ios::trunc };
    out << std::get<std::string>(result);
    if (!out)
    {
        m_out << "Error: Failed to write " << path << "\n";
        return;
    }
    m_out << "Backup written to " << path << "\n";
}

void InteractiveShell::doImport(const std::string& path)
{
    auto* session{ requireSession() };
    if (session == nullptr)
    {
        return;
    }

    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        m_out << "Error: Cannot read " << path << "\n";
        return;
    }
    const std::string envelope{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };

    const auto result{ m_services.transfer.importAll(*session, envelope) };
    if (const auto* err = std::get_if<RecordError>(&result))
    {
        m_out << "Error: " << describe(*err) << "\n";
        return;
    }
    const auto& summary{ std::get<cipherbook::core::ImportSummary>(result) };
    m_out << "Imported " << summary.vaultItemsImported << " items and " << summary.notesImported << " notes ("
          << (summary.vaultItemsSkipped + summary.notesSkipped) << " skipped).\n";
}

} // namespace cipherbook::ui::cli
