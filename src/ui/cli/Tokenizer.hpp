#ifndef CIPHERBOOK_UI_CLI_TOKENIZER_HPP
#define CIPHERBOOK_UI_CLI_TOKENIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cipherbook::ui::cli
{

// Shell-like word splitting: whitespace separates, '...' is literal, "..." honours \" and \\,
// a bare backslash escapes the next character. std::nullopt for an unterminated quote or a trailing backslash.
[[nodiscard]] std::optional<std::vector<std::string>> tokenizeCommandLine(std::string_view line);

} // namespace cipherbook::ui::cli

#endif // CIPHERBOOK_UI_CLI_TOKENIZER_HPP
