#ifndef INCLUDE_CIPHERBOOK_CORE_KEYPARAMS_HPP
#define INCLUDE_CIPHERBOOK_CORE_KEYPARAMS_HPP

#include "cipherbook/crypto/ICryptoProvider.hpp"
#include "cipherbook/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cipherbook::core
{

// Secure parameter store key holding the serialized VaultKeyParams.
constexpr std::string_view g_kVaultKeyParamsKey{ "vault_key_params" };

constexpr std::uint32_t g_kKeyParamsFormatVersion{ 1 };

// The data key wrapped under a password key, plus what is needed to re-derive that password key.
struct VaultKeyParams final
{
    cipherbook::crypto::KdfParams kdf{};
    std::array<std::uint8_t, cipherbook::crypto::g_aeadNonceBytes> wrapNonce{};
    // ciphertext || tag of the 32-byte data key.
    std::vector<std::uint8_t> wrappedDataKey;

    friend bool operator==(const VaultKeyParams&, const VaultKeyParams&) = default;
};

// "name=value" lines, byte fields in base64, led by "format=1".
[[nodiscard]] std::string serializeVaultKeyParams(const VaultKeyParams& params);

// std::nullopt for anything malformed: unknown or duplicate names, missing fields, bad sizes.
[[nodiscard]] std::optional<VaultKeyParams> parseVaultKeyParams(std::string_view text);

// Associated data for the key wrap. Binds the KDF parameters so they cannot be swapped under a valid blob.
[[nodiscard]] std::vector<std::byte> encodeKeyWrapAad(const cipherbook::crypto::KdfParams& kdf);

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_KEYPARAMS_HPP
