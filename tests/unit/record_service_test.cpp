#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "test_utils/Fakes.hpp"
#include "test_utils/TestUtils.hpp"
#include "cipherbook/core/KeyManager.hpp"
#include "cipherbook/core/RecordService.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"
#include "cipherbook/storage/sqlite/SqliteLocalStoreFactory.hpp"

namespace
{

using cipherbook::core::DataKey;
using cipherbook::core::fromUnixMillis;
using cipherbook::core::NoteDraft;
using cipherbook::core::NoteRecord;
using cipherbook::core::RecordError;
using cipherbook::core::RecordService;
using cipherbook::core::VaultItemDraft;
using cipherbook::core::VaultRecord;
using cipherbook::core::VaultSession;
using cipherbook::security::secureStringFrom;

template <class T> [[nodiscard]] RecordError errorOf(const cipherbook::core::RecordResult<T>& res)
{
    EXPECT_TRUE(std::holds_alternative<RecordError>(res));
    return std::holds_alternative<RecordError>(res) ? std::get<RecordError>(res) : RecordError::CryptoError;
}

template <class T> [[nodiscard]] T valueOf(cipherbook::core::RecordResult<T> res)
{
    EXPECT_TRUE(std::holds_alternative<T>(res));
    if (!std::holds_alternative<T>(res))
    {
        return T{};
    }
    return std::move(std::get<T>(res));
}

[[nodiscard]] VaultItemDraft bankDraft()
{
    VaultItemDraft d{};
    d.title = "Bank";
    d.username = "alice";
    d.secret = "p@ss";
    d.url = "https://bank.example";
    return d;
}

class RecordServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = cipherbook::crypto::providers::makeOpenSslCryptoProvider();
        m_store = cipherbook::storage::sqlite::makeSqliteLocalStore(":memory:");
        m_keys = std::make_unique<cipherbook::core::KeyManager>(*m_crypto, m_params,
                                                                cipherbook::test_utils::fastKdfPolicy(),
                                                                cipherbook::test_utils::quietLogger("KeyManager"));
        ASSERT_TRUE(std::holds_alternative<std::monostate>(m_keys->initialize(secureStringFrom("Sup3rSecret!"))));
        m_session = std::make_unique<VaultSession>(unlock("Sup3rSecret!"));
        m_records = makeService(*m_store);
    }

    [[nodiscard]] std::unique_ptr<RecordService> makeService(cipherbook::storage::ILocalStore& store)
    {
        return std::make_unique<RecordService>(*m_crypto, store, [this]() { return fromUnixMillis(m_nowMs); },
                                               m_logs.logger("RecordService"));
    }

    [[nodiscard]] DataKey unlock(const std::string& password)
    {
        auto res{ m_keys->unlock(secureStringFrom(password)) };
        EXPECT_TRUE(std::holds_alternative<DataKey>(res));
        if (!std::holds_alternative<DataKey>(res))
        {
            return DataKey{};
        }
        return std::move(std::get<DataKey>(res));
    }

    std::int64_t m_nowMs{ 1'700'000'000'000 };                    // NOLINT
    std::unique_ptr<cipherbook::crypto::ICryptoProvider> m_crypto; // NOLINT
    std::unique_ptr<cipherbook::storage::ILocalStore> m_store;     // NOLINT
    cipherbook::test_utils::InMemoryParamStore m_params;           // NOLINT
    cipherbook::test_utils::LogCapture m_logs;                     // NOLINT
    std::unique_ptr<cipherbook::core::KeyManager> m_keys;          // NOLINT
    std::unique_ptr<VaultSession> m_session;                       // NOLINT
    std::unique_ptr<RecordService> m_records;                      // NOLINT
};

} // namespace

TEST_F(RecordServiceTest, CreateThenGetReturnsPlaintext)
{
    const auto created{ valueOf(m_records->createVaultItem(*m_session, bankDraft())) };
    EXPECT_FALSE(created.id.empty());
    EXPECT_EQ(created.updatedAt, fromUnixMillis(m_nowMs));
    EXPECT_FALSE(created.deletedAt.has_value());

    const auto fetched{ valueOf(m_records->getVaultItem(*m_session, created.id)) };
    EXPECT_EQ(fetched, created);
    EXPECT_EQ(fetched.secret, std::optional<std::string>{ "p@ss" });
    EXPECT_EQ(fetched.note, std::nullopt);
}

TEST_F(RecordServiceTest, StoredRowsHoldNoPlaintext)
{
    const auto created{ valueOf(m_records->createVaultItem(*m_session, bankDraft())) };
    const auto row{ m_store->findVaultItem(created.id) };
    ASSERT_TRUE(row.has_value());

    EXPECT_NE(row->titleEnc, "Bank");
    ASSERT_TRUE(row->secretEnc.has_value());
    EXPECT_EQ(row->secretEnc->find("p@ss"), std::string::npos);
    EXPECT_EQ(row->urlEnc.has_value(), true);
    EXPECT_FALSE(row->noteEnc.has_value());
    EXPECT_FALSE(m_logs.contains("p@ss"));
    EXPECT_FALSE(m_logs.contains("Bank"));
}

TEST_F(RecordServiceTest, WritesLeaveRowsDirty)
{
    const auto created{ valueOf(m_records->createVaultItem(*m_session, bankDraft())) };
    const auto dirty{ m_store->dirtyVaultItems(fromUnixMillis(0)) };
    ASSERT_EQ(dirty.size(), 1U);
    EXPECT_EQ(dirty[0].id, created.id);
}

TEST_F(RecordServiceTest, LockedSessionIsRejected)
{
    m_session->lock();
    EXPECT_EQ(errorOf(m_records->createVaultItem(*m_session, bankDraft())), RecordError::Locked);
    EXPECT_EQ(errorOf(m_records->listVaultItems(*m_session)), RecordError::Locked);
    EXPECT_EQ(errorOf(m_records->getVaultItem(*m_session, "x")), RecordError::Locked);
    EXPECT_EQ(errorOf(m_records->deleteVaultItem(*m_session, "x")), RecordError::Locked);
}

TEST_F(RecordServiceTest, ExpiredSessionLocksOnUse)
{
    auto now{ VaultSession::Clock::now() };
    VaultSession session{ unlock("Sup3rSecret!"), std::chrono::seconds{ 10 }, [&now]() { return now; } };
    (void)valueOf(m_records->createVaultItem(session, bankDraft()));

    now += std::chrono::seconds{ 11 };
    EXPECT_EQ(errorOf(m_records->listVaultItems(session)), RecordError::Locked);
    EXPECT_FALSE(session.isUnlocked());
}

TEST_F(RecordServiceTest, EmptyTitleIsInvalid)
{
    auto draft{ bankDraft() };
    draft.title.clear();
    EXPECT_EQ(errorOf(m_records->createVaultItem(*m_session, draft)), RecordError::InvalidRecord);
}

TEST_F(RecordServiceTest, UpdateBumpsTimestampMonotonically)
{
    auto created{ valueOf(m_records->createVaultItem(*m_session, bankDraft())) };

    // Clock going backwards still moves the record forward.
    m_nowMs -= 5000;
    created.secret = "n3w";
    const auto updated{ valueOf(m_records->updateVaultItem(*m_session, created)) };
    EXPECT_GT(updated.updatedAt, created.updatedAt);

    const auto fetched{ valueOf(m_records->getVaultItem(*m_session, created.id)) };
    EXPECT_EQ(fetched.secret, std::optional<std::string>{ "n3w" });
}

TEST_F(RecordServiceTest, UpdateOfUnknownIdIsNotFound)
{
    VaultRecord ghost{};
    ghost.id = "missing";
    ghost.title = "Ghost";
    EXPECT_EQ(errorOf(m_records->updateVaultItem(*m_session, ghost)), RecordError::NotFound);
}

TEST_F(RecordServiceTest, DeleteIsSoftAndHidesRecord)
{
    const auto created{ valueOf(m_records->createVaultItem(*m_session, bankDraft())) };
    m_nowMs += 10;
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_records->deleteVaultItem(*m_session, created.id)));

    EXPECT_EQ(errorOf(m_records->getVaultItem(*m_session, created.id)), RecordError::NotFound);
    EXPECT_TRUE(valueOf(m_records->listVaultItems(*m_session)).empty());
    EXPECT_EQ(errorOf(m_records->deleteVaultItem(*m_session, created.id)), RecordError::NotFound);

    const auto row{ m_store->findVaultItem(created.id) };
    ASSERT_TRUE(row.has_value());
    ASSERT_TRUE(row->deletedAt.has_value());
    EXPECT_EQ(*row->deletedAt, row->updatedAt);
    EXPECT_EQ(m_store->dirtyVaultItems(fromUnixMillis(0)).size(), 1U);
}

TEST_F(RecordServiceTest, ListIsNewestFirstAndSearchIsCaseInsensitive)
{
    auto draft{ bankDraft() };
    (void)valueOf(m_records->createVaultItem(*m_session, draft));
    m_nowMs += 1;
    draft.title = "Mail";
    (void)valueOf(m_records->createVaultItem(*m_session, draft));
    m_nowMs += 1;
    draft.title = "Online banking";
    (void)valueOf(m_records->createVaultItem(*m_session, draft));

    const auto all{ valueOf(m_records->listVaultItems(*m_session)) };
    ASSERT_EQ(all.size(), 3U);
    EXPECT_EQ(all[0].title, "Online banking");
    EXPECT_EQ(all[2].title, "Bank");

    const auto hits{ valueOf(m_records->searchVaultItems(*m_session, "BANK")) };
    ASSERT_EQ(hits.size(), 2U);
    EXPECT_EQ(hits[0].title, "Online banking");
    EXPECT_EQ(hits[1].title, "Bank");
}

TEST_F(RecordServiceTest, WrongKeyFailsToDecrypt)
{
    const auto created{ valueOf(m_records->createVaultItem(*m_session, bankDraft())) };

    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_keys->reset()));
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_keys->initialize(secureStringFrom("other"))));
    VaultSession other{ unlock("other") };

    EXPECT_EQ(errorOf(m_records->getVaultItem(other, created.id)), RecordError::DecryptFailed);
    EXPECT_EQ(errorOf(m_records->listVaultItems(other)), RecordError::DecryptFailed);
}

TEST_F(RecordServiceTest, NotesWorkWithoutSession)
{
    m_session->lock();
    const auto note{ valueOf(m_records->createNote(NoteDraft{ "Groceries", "Milk and eggs", { "home" } })) };
    m_nowMs += 1;
    (void)valueOf(m_records->createNote(NoteDraft{ "", "untitled body", {} }));

    const auto fetched{ valueOf(m_records->getNote(note.id)) };
    EXPECT_EQ(fetched, note);

    const auto all{ valueOf(m_records->listNotes()) };
    ASSERT_EQ(all.size(), 2U);
    EXPECT_EQ(all[0].content, "untitled body");

    const auto hits{ valueOf(m_records->searchNotes("eggs")) };
    ASSERT_EQ(hits.size(), 1U);
    EXPECT_EQ(hits[0].id, note.id);
}

TEST_F(RecordServiceTest, NoteUpdateAndDelete)
{
    auto note{ valueOf(m_records->createNote(NoteDraft{ "Todo", "one", {} })) };
    m_nowMs += 1;
    note.content = "two";
    note.tags = { "work" };
    const auto updated{ valueOf(m_records->updateNote(note)) };
    EXPECT_GT(updated.updatedAt, note.updatedAt);
    EXPECT_EQ(valueOf(m_records->getNote(note.id)).tags, (std::vector<std::string>{ "work" }));

    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_records->deleteNote(note.id)));
    EXPECT_EQ(errorOf(m_records->getNote(note.id)), RecordError::NotFound);
    EXPECT_EQ(errorOf(m_records->deleteNote(note.id)), RecordError::NotFound);
    EXPECT_EQ(errorOf(m_records->updateNote(note)), RecordError::NotFound);
    EXPECT_TRUE(valueOf(m_records->listNotes()).empty());
}

TEST_F(RecordServiceTest, InvalidTagsAreRejected)
{
    EXPECT_EQ(errorOf(m_records->createNote(NoteDraft{ "t", "c", { "" } })), RecordError::InvalidRecord);
    EXPECT_EQ(errorOf(m_records->createNote(NoteDraft{ "t", "c", { "a\nb" } })), RecordError::InvalidRecord);
}

TEST_F(RecordServiceTest, ItemsSurviveRestartWithFileDatabase)
{
    const auto dir{ cipherbook::test_utils::makeSecureTempDir("records_") };
    ASSERT_FALSE(dir.empty());
    const cipherbook::test_utils::TempDirCleanup cleanup{ dir };
    const auto dbPath{ dir / "cipherbook.db" };

    std::string id{};
    {
        auto store{ cipherbook::storage::sqlite::makeSqliteLocalStore(dbPath) };
        auto records{ makeService(*store) };
        id = valueOf(records->createVaultItem(*m_session, bankDraft())).id;
    }
    m_session->lock();

    auto store{ cipherbook::storage::sqlite::makeSqliteLocalStore(dbPath) };
    auto records{ makeService(*store) };
    VaultSession session{ unlock("Sup3rSecret!") };
    const auto fetched{ valueOf(records->getVaultItem(session, id)) };
    EXPECT_EQ(fetched.title, "Bank");
    EXPECT_EQ(fetched.secret, std::optional<std::string>{ "p@ss" });
}
