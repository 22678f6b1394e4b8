#ifndef INCLUDE_CIPHERBOOK_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_CIPHERBOOK_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "cipherbook/crypto/ICryptoProvider.hpp"
#include <memory>

namespace cipherbook::crypto::providers
{

// Monocypher-backed provider: Argon2id key derivation and IETF ChaCha20-Poly1305.
// PBKDF2 requests are forwarded to pbkdf2Fallback when one is given, so vaults
// created with the default policy keep unlocking.
[[nodiscard]] std::unique_ptr<cipherbook::crypto::ICryptoProvider>
makeNativeCryptoProvider(std::unique_ptr<cipherbook::crypto::ICryptoProvider> pbkdf2Fallback = nullptr);

} // namespace cipherbook::crypto::providers

#endif // INCLUDE_CIPHERBOOK_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
