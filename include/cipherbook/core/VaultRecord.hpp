#ifndef INCLUDE_CIPHERBOOK_CORE_VAULTRECORD_HPP
#define INCLUDE_CIPHERBOOK_CORE_VAULTRECORD_HPP

#include "cipherbook/core/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cipherbook::core
{

// Decrypted vault item. Exists only in memory while the vault is unlocked.
struct VaultRecord final
{
    std::string id;
    std::string title;
    std::optional<std::string> username;
    std::optional<std::string> secret;
    std::optional<std::string> url;
    std::optional<std::string> note;
    Timestamp updatedAt{};
    std::optional<Timestamp> deletedAt;

    friend bool operator==(const VaultRecord&, const VaultRecord&) = default;
};

// Same shape as VaultRecord; every string field is a base64 AEAD envelope.
// id and the timestamps stay in clear so storage and sync can order and merge without the key.
struct EncryptedVaultRecord final
{
    std::string id;
    std::string titleEnc;
    std::optional<std::string> usernameEnc;
    std::optional<std::string> secretEnc;
    std::optional<std::string> urlEnc;
    std::optional<std::string> noteEnc;
    Timestamp updatedAt{};
    std::optional<Timestamp> deletedAt;

    friend bool operator==(const EncryptedVaultRecord&, const EncryptedVaultRecord&) = default;
};

struct NoteRecord final
{
    std::string id;
    std::string title;
    std::string content;
    std::vector<std::string> tags;
    Timestamp updatedAt{};
    std::optional<Timestamp> deletedAt;

    friend bool operator==(const NoteRecord&, const NoteRecord&) = default;
};

// Caller-supplied fields of a new vault item; id and timestamps are assigned on create.
struct VaultItemDraft final
{
    std::string title;
    std::optional<std::string> username;
    std::optional<std::string> secret;
    std::optional<std::string> url;
    std::optional<std::string> note;
};

struct NoteDraft final
{
    std::string title;
    std::string content;
    std::vector<std::string> tags;
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_VAULTRECORD_HPP
