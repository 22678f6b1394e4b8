#ifndef CIPHERBOOK_UI_CLI_CONSOLEUTILS_HPP
#define CIPHERBOOK_UI_CLI_CONSOLEUTILS_HPP

#include "cipherbook/security/SecureString.hpp"
#include <string>

namespace cipherbook::ui::cli
{

// mlockall() plus a zero core-dump limit. Returns false if memory could not be locked.
[[nodiscard]] bool lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo off. The intermediate std::string is wiped.
[[nodiscard]] cipherbook::security::SecureString readPassword(const std::string& prompt);

} // namespace cipherbook::ui::cli

#endif // CIPHERBOOK_UI_CLI_CONSOLEUTILS_HPP
