#include "cipherbook/core/VaultTransfer.hpp"
#include "LittleEndian.hpp"
#include "cipherbook/security/SecureBuffer.hpp"
#include <array>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cipherbook::core
{
namespace
{

constexpr std::array<std::uint8_t, 8> g_kExportMagic{ 'C', 'P', 'B', 'K', 'E', 'X', 'P', 'T' };
constexpr std::uint32_t g_kExportVersion{ 1U };
constexpr std::string_view g_kExportAad{ "cipherbook.export.v1" };

struct ExportDocument final
{
    std::vector<NoteRecord> notes;
    std::vector<EncryptedVaultRecord> vaultItems;
};

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

void putTimestamp(detail::ByteWriter& w, Timestamp t)
{
    w.putU64(static_cast<std::uint64_t>(toUnixMillis(t)));
}

[[nodiscard]] bool getTimestamp(detail::ByteReader& r, Timestamp& out) noexcept
{
    std::uint64_t raw{};
    if (!r.getU64(raw))
    {
        return false;
    }
    out = fromUnixMillis(static_cast<std::int64_t>(raw));
    return true;
}

[[nodiscard]] std::vector<std::byte> encodeDocument(const ExportDocument& doc)
{
    detail::ByteWriter w{};
    w.putRaw(g_kExportMagic);
    w.putU32(g_kExportVersion);

    w.putU32(static_cast<std::uint32_t>(doc.notes.size()));
    for (const auto& n : doc.notes)
    {
        w.putString(n.id);
        w.putString(n.title);
        w.putString(n.content);
        w.putU32(static_cast<std::uint32_t>(n.tags.size()));
        for (const auto& t : n.tags)
        {
            w.putString(t);
        }
        putTimestamp(w, n.updatedAt);
    }

    w.putU32(static_cast<std::uint32_t>(doc.vaultItems.size()));
    for (const auto& v : doc.vaultItems)
    {
        w.putString(v.id);
        w.putString(v.titleEnc);
        w.putOptionalString(v.usernameEnc);
        w.putOptionalString(v.secretEnc);
        w.putOptionalString(v.urlEnc);
        w.putOptionalString(v.noteEnc);
        putTimestamp(w, v.updatedAt);
    }
    return w.take();
}

[[nodiscard]] std::optional<ExportDocument> decodeDocument(std::span<const std::byte> bytes)
{
    detail::ByteReader r{ bytes };

    std::array<std::uint8_t, g_kExportMagic.size()> magic{};
    std::uint32_t version{};
    if (!r.getRaw(magic) || magic != g_kExportMagic || !r.getU32(version) || version != g_kExportVersion)
    {
        return std::nullopt;
    }

    ExportDocument doc{};

    std::uint32_t noteCount{};
    if (!r.getU32(noteCount))
    {
        return std::nullopt;
    }
    for (std::uint32_t i{}; i < noteCount; ++i)
    {
        NoteRecord n{};
        std::uint32_t tagCount{};
        if (!r.getString(n.id) || !r.getString(n.title) || !r.getString(n.content) || !r.getU32(tagCount))
        {
            return std::nullopt;
        }
        for (std::uint32_t t{}; t < tagCount; ++t)
        {
            std::string tag{};
            if (!r.getString(tag))
            {
                return std::nullopt;
            }
            n.tags.push_back(std::move(tag));
        }
        if (!getTimestamp(r, n.updatedAt))
        {
            return std::nullopt;
        }
        doc.notes.push_back(std::move(n));
    }

    std::uint32_t itemCount{};
    if (!r.getU32(itemCount))
    {
        return std::nullopt;
    }
    for (std::uint32_t i{}; i < itemCount; ++i)
    {
        EncryptedVaultRecord v{};
        if (!r.getString(v.id) || !r.getString(v.titleEnc) || !r.getOptionalString(v.usernameEnc) ||
            !r.getOptionalString(v.secretEnc) || !r.getOptionalString(v.urlEnc) || !r.getOptionalString(v.noteEnc) ||
            !getTimestamp(r, v.updatedAt))
        {
            return std::nullopt;
        }
        doc.vaultItems.push_back(std::move(v));
    }

    if (!r.atEnd())
    {
        return std::nullopt;
    }
    return doc;
}

[[nodiscard]] RecordError toRecordError(CipherError e) noexcept
{
    return (e == CipherError::Locked) ? RecordError::Locked
           : (e == CipherError::DecryptFailed) ? RecordError::DecryptFailed
                                               : RecordError::CryptoError;
}

} // namespace

VaultTransfer::VaultTransfer(cipherbook::crypto::ICryptoProvider& crypto, cipherbook::storage::ILocalStore& store,
                             Logger logger)
    : m_aead(crypto), m_store(&store), m_log(std::move(logger))
{
}

RecordResult<std::string> VaultTransfer::exportAll(VaultSession& session) noexcept
{
    if (!session.touchIfUnlocked())
    {
        return RecordError::Locked;
    }

    ExportDocument doc{};
    try
    {
        doc.notes = m_store->listNotes(false);
        doc.vaultItems = m_store->listVaultItems(false);
    }
    catch (const std::exception&)
    {
        m_log.error("export: failed to read records");
        return RecordError::StorageError;
    }

    try
    {
        const auto plain{ encodeDocument(doc) };
        auto sealed{ m_aead.sealToString(session.dataKey().bytes(), plain, asBytes(g_kExportAad)) };
        if (auto* err = std::get_if<CipherError>(&sealed))
        {
            return toRecordError(*err);
        }
        m_log.info("exported " + std::to_string(doc.notes.size()) + " notes and " +
                   std::to_string(doc.vaultItems.size()) + " vault items");
        return std::move(std::get<std::string>(sealed));
    }
    catch (const std::exception&)
    {
        return RecordError::CryptoError;
    }
}

RecordResult<ImportSummary> VaultTransfer::importAll(VaultSession& session, std::string_view envelope) noexcept
{
    if (!session.touchIfUnlocked())
    {
        return RecordError::Locked;
    }

    auto opened{ m_aead.openFromString(session.dataKey().bytes(), envelope, asBytes(g_kExportAad)) };
    if (auto* err = std::get_if<CipherError>(&opened))
    {
        m_log.warn("import: envelope rejected");
        return toRecordError(*err);
    }
    auto& plain{ std::get<cipherbook::security::SecureBuffer>(opened) };

    std::optional<ExportDocument> doc{};
    try
    {
        doc = decodeDocument(cipherbook::security::asBytes(plain));
    }
    catch (const std::exception&)
    {
        doc.reset();
    }
    cipherbook::security::secureRelease(plain);
    if (!doc)
    {
        m_log.warn("import: malformed export document");
        return RecordError::InvalidRecord;
    }

    ImportSummary summary{};
    try
    {
        m_store->runInTransaction(
            [&]()
            {
                for (const auto& n : doc->notes)
                {
                    const auto local{ m_store->findNote(n.id) };
                    if (local && local->updatedAt >= n.updatedAt)
                    {
                        ++summary.notesSkipped;
                        continue;
                    }
                    m_store->put(n, cipherbook::storage::SyncMark::Dirty);
                    ++summary.notesImported;
                }
                for (const auto& v : doc->vaultItems)
                {
                    const auto local{ m_store->findVaultItem(v.id) };
                    if (local && local->updatedAt >= v.updatedAt)
                    {
                        ++summary.vaultItemsSkipped;
                        continue;
                    }
                    m_store->put(v, cipherbook::storage::SyncMark::Dirty);
                    ++summary.vaultItemsImported;
                }
            });
    }
    catch (const std::exception&)
    {
        m_log.error("import: storage failure, nothing imported");
        return RecordError::StorageError;
    }

    m_log.info("imported " + std::to_string(summary.notesImported + summary.vaultItemsImported) + " records");
    return summary;
}

} // namespace cipherbook::core
