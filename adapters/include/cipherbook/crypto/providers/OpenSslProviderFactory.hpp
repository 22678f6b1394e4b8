#ifndef INCLUDE_CIPHERBOOK_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_CIPHERBOOK_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "cipherbook/crypto/ICryptoProvider.hpp"
#include <memory>

namespace cipherbook::crypto::providers
{

// libcrypto-backed provider. PBKDF2-HMAC-SHA256 is always available; Argon2id
// only when the loaded OpenSSL ships the ARGON2ID KDF (3.2+), see supportsKdf().
[[nodiscard]] std::unique_ptr<cipherbook::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace cipherbook::crypto::providers

#endif // INCLUDE_CIPHERBOOK_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
