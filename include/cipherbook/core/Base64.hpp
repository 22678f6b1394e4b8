#ifndef INCLUDE_CIPHERBOOK_CORE_BASE64_HPP
#define INCLUDE_CIPHERBOOK_CORE_BASE64_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cipherbook::core
{

// Standard alphabet, padded, no line breaks.
[[nodiscard]] std::string base64Encode(std::span<const std::uint8_t> bytes);

// Strict: rejects whitespace, bad characters, wrong padding and lengths that are not a multiple of 4.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64Decode(std::string_view text);

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_BASE64_HPP
