#ifndef INCLUDE_CIPHERBOOK_SECURITY_SECURERANDOM_HPP
#define INCLUDE_CIPHERBOOK_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace cipherbook::security
{

// Fills from the OS CSPRNG. Safe to call from any thread.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Random (version 4) UUID in canonical lowercase form, or nullopt if the CSPRNG failed.
[[nodiscard]] std::optional<std::string> secureRandomUuid();

} // namespace cipherbook::security

#endif // INCLUDE_CIPHERBOOK_SECURITY_SECURERANDOM_HPP
