#include "cipherbook/storage/sqlite/SqliteLocalStoreFactory.hpp"

#include "cipherbook/core/Timestamp.hpp"
#include "cipherbook/storage/ILocalStore.hpp"
#include "cipherbook/storage/StorageErrors.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sqlite3.h>

namespace cipherbook::storage::sqlite
{
namespace
{

using cipherbook::core::EncryptedVaultRecord;
using cipherbook::core::NoteRecord;
using cipherbook::core::Timestamp;

constexpr char g_kTagSeparator{ '\n' };

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw StorageError(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw StorageError(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    return db;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "PRAGMA journal_mode = WAL;");
    exec(db, "CREATE TABLE IF NOT EXISTS notes ("
             " id TEXT PRIMARY KEY NOT NULL,"
             " title TEXT NOT NULL,"
             " content TEXT NOT NULL,"
             " tags TEXT NOT NULL,"
             " updated_at INTEGER NOT NULL,"
             " deleted_at INTEGER,"
             " synced_updated_at INTEGER"
             ");");
    exec(db, "CREATE TABLE IF NOT EXISTS vault_items ("
             " id TEXT PRIMARY KEY NOT NULL,"
             " title_enc TEXT NOT NULL,"
             " username_enc TEXT,"
             " secret_enc TEXT,"
             " url_enc TEXT,"
             " note_enc TEXT,"
             " updated_at INTEGER NOT NULL,"
             " deleted_at INTEGER,"
             " synced_updated_at INTEGER"
             ");");
    exec(db, "CREATE TABLE IF NOT EXISTS sync_cursors ("
             " user_id TEXT NOT NULL,"
             " collection TEXT NOT NULL,"
             " cursor_ms INTEGER NOT NULL,"
             " PRIMARY KEY (user_id, collection)"
             ");");
    exec(db, "CREATE UNIQUE INDEX IF NOT EXISTS idx_notes_id ON notes(id);");
    exec(db, "CREATE INDEX IF NOT EXISTS idx_notes_updated_at ON notes(updated_at);");
    exec(db, "CREATE INDEX IF NOT EXISTS idx_notes_deleted_at ON notes(deleted_at);");
    exec(db, "CREATE UNIQUE INDEX IF NOT EXISTS idx_vault_items_id ON vault_items(id);");
    exec(db, "CREATE INDEX IF NOT EXISTS idx_vault_items_updated_at ON vault_items(updated_at);");
    exec(db, "CREATE INDEX IF NOT EXISTS idx_vault_items_deleted_at ON vault_items(deleted_at);");
}

// Prepared statement with 1-based binds and 0-based column reads.
class Statement final
{
public:
    Statement(sqlite3* db, const char* sql) : m_db(db)
    {
        sqlite3_stmt* rawStmt = nullptr;
        const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
        m_stmt.reset(rawStmt);
        if (prepRc != SQLITE_OK || !m_stmt)
        {
            throw StorageError(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
        }
    }

    void bindText(int index, std::string_view value)
    {
        if (sqlite3_bind_text(m_stmt.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
            SQLITE_OK)
        {
            throw StorageError(sqliteErr(m_db, "storage: bind text failed"));
        }
    }

    void bindOptionalText(int index, const std::optional<std::string>& value)
    {
        if (value)
        {
            bindText(index, *value);
            return;
        }
        bindNull(index);
    }

    void bindInt64(int index, std::int64_t value)
    {
        if (sqlite3_bind_int64(m_stmt.get(), index, value) != SQLITE_OK)
        {
            throw StorageError(sqliteErr(m_db, "storage: bind int64 failed"));
        }
    }

    void bindTimestamp(int index, Timestamp t)
    {
        bindInt64(index, cipherbook::core::toUnixMillis(t));
    }

    void bindOptionalTimestamp(int index, const std::optional<Timestamp>& t)
    {
        if (t)
        {
            bindTimestamp(index, *t);
            return;
        }
        bindNull(index);
    }

    void bindNull(int index)
    {
        if (sqlite3_bind_null(m_stmt.get(), index) != SQLITE_OK)
        {
            throw StorageError(sqliteErr(m_db, "storage: bind null failed"));
        }
    }

    // True while a row is available.
    [[nodiscard]] bool step()
    {
        const int rc = sqlite3_step(m_stmt.get());
        if (rc == SQLITE_ROW)
        {
            return true;
        }
        if (rc == SQLITE_DONE)
        {
            return false;
        }
        throw StorageError(sqliteErr(m_db, "storage: sqlite3_step failed"));
    }

    void run()
    {
        if (step())
        {
            throw StorageError("storage: unexpected result row");
        }
    }

    [[nodiscard]] int changes() const noexcept
    {
        return sqlite3_changes(m_db);
    }

    [[nodiscard]] bool isNull(int col) const noexcept
    {
        return sqlite3_column_type(m_stmt.get(), col) == SQLITE_NULL;
    }

    [[nodiscard]] std::string text(int col) const
    {
        const auto* ptr = sqlite3_column_text(m_stmt.get(), col);
        const int bytes = sqlite3_column_bytes(m_stmt.get(), col);
        if (ptr == nullptr || bytes <= 0)
        {
            return {};
        }
        return std::string{ reinterpret_cast<const char*>(ptr), static_cast<std::size_t>(bytes) };
    }

    [[nodiscard]] std::optional<std::string> optionalText(int col) const
    {
        if (isNull(col))
        {
            return std::nullopt;
        }
        return text(col);
    }

    [[nodiscard]] Timestamp timestamp(int col) const noexcept
    {
        return cipherbook::core::fromUnixMillis(sqlite3_column_int64(m_stmt.get(), col));
    }

    [[nodiscard]] std::optional<Timestamp> optionalTimestamp(int col) const noexcept
    {
        if (isNull(col))
        {
            return std::nullopt;
        }
        return timestamp(col);
    }

private:
    sqlite3* m_db{ nullptr };
    SqliteStmtPtr m_stmt;
};

[[nodiscard]] std::string joinTags(const std::vector<std::string>& tags)
{
    std::string out{};
    for (std::size_t i{}; i < tags.size(); ++i)
    {
        if (i != 0U)
        {
            out.push_back(g_kTagSeparator);
        }
        out.append(tags[i]);
    }
    return out;
}

[[nodiscard]] std::vector<std::string> splitTags(std::string_view joined)
{
    std::vector<std::string> out{};
    if (joined.empty())
    {
        return out;
    }
    std::size_t start{};
    while (true)
    {
        const std::size_t sep{ joined.find(g_kTagSeparator, start) };
        out.emplace_back(joined.substr(start, sep - start));
        if (sep == std::string_view::npos)
        {
            break;
        }
        start = sep + 1U;
    }
    return out;
}

constexpr const char* g_kNoteColumns{ "id, title, content, tags, updated_at, deleted_at" };
constexpr const char* g_kVaultColumns{
    "id, title_enc, username_enc, secret_enc, url_enc, note_enc, updated_at, deleted_at"
};

[[nodiscard]] NoteRecord readNote(const Statement& st)
{
    NoteRecord n{};
    n.id = st.text(0);
    n.title = st.text(1);
    n.content = st.text(2);
    n.tags = splitTags(st.text(3));
    n.updatedAt = st.timestamp(4);
    n.deletedAt = st.optionalTimestamp(5);
    return n;
}

[[nodiscard]] EncryptedVaultRecord readVaultItem(const Statement& st)
{
    EncryptedVaultRecord v{};
    v.id = st.text(0);
    v.titleEnc = st.text(1);
    v.usernameEnc = st.optionalText(2);
    v.secretEnc = st.optionalText(3);
    v.urlEnc = st.optionalText(4);
    v.noteEnc = st.optionalText(5);
    v.updatedAt = st.timestamp(6);
    v.deletedAt = st.optionalTimestamp(7);
    return v;
}

[[nodiscard]] std::string selectSql(const char* columns, std::string_view table, std::string_view tail)
{
    std::string sql{ "SELECT " };
    sql.append(columns);
    sql.append(" FROM ");
    sql.append(table);
    sql.append(" ");
    sql.append(tail);
    return sql;
}

// Dirty: never acknowledged, or acknowledged at a different updated_at. A row edited since its
// acknowledgement is returned even when the edit lands at or below the cursor.
constexpr std::string_view g_kDirtyTail{
    "WHERE (updated_at > ?1 OR synced_updated_at IS NULL OR synced_updated_at < updated_at)"
    " AND (synced_updated_at IS NULL OR synced_updated_at <> updated_at)"
    " ORDER BY updated_at ASC, id ASC;"
};

class SqliteLocalStore final : public cipherbook::storage::ILocalStore
{
public:
    explicit SqliteLocalStore(const std::filesystem::path& dbPath) : m_db(openDb(dbPath))
    {
        ensureSchema(m_db.get());
    }

    [[nodiscard]] std::optional<EncryptedVaultRecord> findVaultItem(std::string_view id) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const auto sql{ selectSql(g_kVaultColumns, "vault_items", "WHERE id = ?1;") };
        Statement st{ m_db.get(), sql.c_str() };
        st.bindText(1, id);
        if (!st.step())
        {
            return std::nullopt;
        }
        return readVaultItem(st);
    }

    [[nodiscard]] std::optional<NoteRecord> findNote(std::string_view id) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const auto sql{ selectSql(g_kNoteColumns, "notes", "WHERE id = ?1;") };
        Statement st{ m_db.get(), sql.c_str() };
        st.bindText(1, id);
        if (!st.step())
        {
            return std::nullopt;
        }
        return readNote(st);
    }

    [[nodiscard]] std::vector<EncryptedVaultRecord> listVaultItems(bool includeDeleted) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const auto sql{ selectSql(g_kVaultColumns, "vault_items",
                                  includeDeleted ? "ORDER BY updated_at DESC, id ASC;"
                                                 : "WHERE deleted_at IS NULL ORDER BY updated_at DESC, id ASC;") };
        Statement st{ m_db.get(), sql.c_str() };
        std::vector<EncryptedVaultRecord> out{};
        while (st.step())
        {
            out.push_back(readVaultItem(st));
        }
        return out;
    }

    [[nodiscard]] std::vector<NoteRecord> listNotes(bool includeDeleted) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const auto sql{ selectSql(g_kNoteColumns, "notes",
                                  includeDeleted ? "ORDER BY updated_at DESC, id ASC;"
                                                 : "WHERE deleted_at IS NULL ORDER BY updated_at DESC, id ASC;") };
        Statement st{ m_db.get(), sql.c_str() };
        std::vector<NoteRecord> out{};
        while (st.step())
        {
            out.push_back(readNote(st));
        }
        return out;
    }

    void put(const EncryptedVaultRecord& record, SyncMark mark) override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const char* sql =
            "INSERT INTO vault_items(id, title_enc, username_enc, secret_enc, url_enc, note_enc, updated_at,"
            " deleted_at, synced_updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)"
            " ON CONFLICT(id) DO UPDATE SET title_enc=excluded.title_enc, username_enc=excluded.username_enc,"
            " secret_enc=excluded.secret_enc, url_enc=excluded.url_enc, note_enc=excluded.note_enc,"
            " updated_at=excluded.updated_at, deleted_at=excluded.deleted_at,"
            " synced_updated_at=excluded.synced_updated_at;";
        Statement st{ m_db.get(), sql };
        st.bindText(1, record.id);
        st.bindText(2, record.titleEnc);
        st.bindOptionalText(3, record.usernameEnc);
        st.bindOptionalText(4, record.secretEnc);
        st.bindOptionalText(5, record.urlEnc);
        st.bindOptionalText(6, record.noteEnc);
        st.bindTimestamp(7, record.updatedAt);
        st.bindOptionalTimestamp(8, record.deletedAt);
        bindSyncMark(st, 9, mark, record.updatedAt);
        st.run();
    }

    void put(const NoteRecord& record, SyncMark mark) override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const char* sql = "INSERT INTO notes(id, title, content, tags, updated_at, deleted_at, synced_updated_at)"
                          " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)"
                          " ON CONFLICT(id) DO UPDATE SET title=excluded.title, content=excluded.content,"
                          " tags=excluded.tags, updated_at=excluded.updated_at, deleted_at=excluded.deleted_at,"
                          " synced_updated_at=excluded.synced_updated_at;";
        Statement st{ m_db.get(), sql };
        st.bindText(1, record.id);
        st.bindText(2, record.title);
        st.bindText(3, record.content);
        st.bindText(4, joinTags(record.tags));
        st.bindTimestamp(5, record.updatedAt);
        st.bindOptionalTimestamp(6, record.deletedAt);
        bindSyncMark(st, 7, mark, record.updatedAt);
        st.run();
    }

    [[nodiscard]] std::vector<EncryptedVaultRecord> dirtyVaultItems(Timestamp cursor) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const auto sql{ selectSql(g_kVaultColumns, "vault_items", g_kDirtyTail) };
        Statement st{ m_db.get(), sql.c_str() };
        st.bindTimestamp(1, cursor);
        std::vector<EncryptedVaultRecord> out{};
        while (st.step())
        {
            out.push_back(readVaultItem(st));
        }
        return out;
    }

    [[nodiscard]] std::vector<NoteRecord> dirtyNotes(Timestamp cursor) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const auto sql{ selectSql(g_kNoteColumns, "notes", g_kDirtyTail) };
        Statement st{ m_db.get(), sql.c_str() };
        st.bindTimestamp(1, cursor);
        std::vector<NoteRecord> out{};
        while (st.step())
        {
            out.push_back(readNote(st));
        }
        return out;
    }

    [[nodiscard]] bool markSynced(Collection collection, std::string_view id, Timestamp updatedAt) override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const std::string sql{ "UPDATE " + std::string{ collectionName(collection) } +
                               " SET synced_updated_at = updated_at WHERE id = ?1 AND updated_at = ?2;" };
        Statement st{ m_db.get(), sql.c_str() };
        st.bindText(1, id);
        st.bindTimestamp(2, updatedAt);
        st.run();
        return st.changes() > 0;
    }

    [[nodiscard]] std::optional<Timestamp> syncedWatermark(Collection collection) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const std::string table{ collectionName(collection) };
        const std::string sql{ "SELECT MAX(updated_at) FROM " + table +
                               " WHERE synced_updated_at = updated_at AND updated_at < COALESCE("
                               "(SELECT MIN(updated_at) FROM " +
                               table +
                               " WHERE synced_updated_at IS NULL OR synced_updated_at <> updated_at),"
                               " 9223372036854775807);" };
        Statement st{ m_db.get(), sql.c_str() };
        if (!st.step())
        {
            return std::nullopt;
        }
        return st.optionalTimestamp(0);
    }

    void markDirty(Collection collection, std::string_view id) override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        const std::string sql{ "UPDATE " + std::string{ collectionName(collection) } +
                               " SET synced_updated_at = NULL WHERE id = ?1;" };
        Statement st{ m_db.get(), sql.c_str() };
        st.bindText(1, id);
        st.run();
    }

    [[nodiscard]] std::optional<Timestamp> loadCursor(std::string_view userId, Collection collection) const override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        Statement st{ m_db.get(), "SELECT cursor_ms FROM sync_cursors WHERE user_id = ?1 AND collection = ?2;" };
        st.bindText(1, userId);
        st.bindText(2, collectionName(collection));
        if (!st.step())
        {
            return std::nullopt;
        }
        return st.timestamp(0);
    }

    void saveCursor(std::string_view userId, Collection collection, Timestamp cursor) override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        Statement st{ m_db.get(), "INSERT INTO sync_cursors(user_id, collection, cursor_ms) VALUES (?1, ?2, ?3)"
                                  " ON CONFLICT(user_id, collection) DO UPDATE SET cursor_ms=excluded.cursor_ms;" };
        st.bindText(1, userId);
        st.bindText(2, collectionName(collection));
        st.bindTimestamp(3, cursor);
        st.run();
    }

    void runInTransaction(const std::function<void()>& body) override
    {
        std::lock_guard<std::recursive_mutex> lock{ m_mutex };
        if (m_txDepth > 0U)
        {
            ++m_txDepth;
            TxDepthGuard guard{ m_txDepth };
            body();
            return;
        }

        exec(m_db.get(), "BEGIN IMMEDIATE;");
        ++m_txDepth;
        try
        {
            TxDepthGuard guard{ m_txDepth };
            body();
            exec(m_db.get(), "COMMIT;");
        }
        catch (...)
        {
            // Rollback failure must not mask the original error.
            (void)sqlite3_exec(m_db.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
            throw;
        }
    }

private:
    struct TxDepthGuard final
    {
        std::size_t& depth;
        ~TxDepthGuard()
        {
            --depth;
        }
    };

    static void bindSyncMark(Statement& st, int index, SyncMark mark, Timestamp updatedAt)
    {
        if (mark == SyncMark::Synced)
        {
            st.bindTimestamp(index, updatedAt);
            return;
        }
        st.bindNull(index);
    }

    mutable std::recursive_mutex m_mutex;
    SqliteDbPtr m_db;
    std::size_t m_txDepth{ 0U };
};

} // namespace

std::unique_ptr<cipherbook::storage::ILocalStore> makeSqliteLocalStore(const std::filesystem::path& dbPath)
{
    return std::make_unique<SqliteLocalStore>(dbPath);
}

} // namespace cipherbook::storage::sqlite
