#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>

#include "test_utils/Fakes.hpp"
#include "test_utils/TestUtils.hpp"
#include "cipherbook/core/KeyManager.hpp"
#include "cipherbook/core/RecordService.hpp"
#include "cipherbook/core/VaultTransfer.hpp"
#include "cipherbook/crypto/providers/OpenSslProviderFactory.hpp"
#include "cipherbook/storage/sqlite/SqliteLocalStoreFactory.hpp"

namespace
{

using cipherbook::core::DataKey;
using cipherbook::core::fromUnixMillis;
using cipherbook::core::ImportSummary;
using cipherbook::core::NoteDraft;
using cipherbook::core::RecordError;
using cipherbook::core::VaultItemDraft;
using cipherbook::core::VaultRecord;
using cipherbook::core::VaultSession;
using cipherbook::security::secureStringFrom;

class VaultTransferTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = cipherbook::crypto::providers::makeOpenSslCryptoProvider();
        m_keys = std::make_unique<cipherbook::core::KeyManager>(*m_crypto, m_params,
                                                                cipherbook::test_utils::fastKdfPolicy(),
                                                                cipherbook::test_utils::quietLogger("KeyManager"));
        ASSERT_TRUE(std::holds_alternative<std::monostate>(m_keys->initialize(secureStringFrom("Sup3rSecret!"))));
        m_session = std::make_unique<VaultSession>(unlock());

        m_source = cipherbook::storage::sqlite::makeSqliteLocalStore(":memory:");
        m_target = cipherbook::storage::sqlite::makeSqliteLocalStore(":memory:");
        m_sourceRecords = std::make_unique<cipherbook::core::RecordService>(
            *m_crypto, *m_source, [this]() { return fromUnixMillis(m_nowMs); },
            cipherbook::test_utils::quietLogger("RecordService"));
        m_sourceTransfer = std::make_unique<cipherbook::core::VaultTransfer>(*m_crypto, *m_source,
                                                                             m_logs.logger("VaultTransfer"));
        m_targetTransfer = std::make_unique<cipherbook::core::VaultTransfer>(*m_crypto, *m_target,
                                                                             m_logs.logger("VaultTransfer"));
    }

    [[nodiscard]] DataKey unlock()
    {
        auto res{ m_keys->unlock(secureStringFrom("Sup3rSecret!")) };
        EXPECT_TRUE(std::holds_alternative<DataKey>(res));
        if (!std::holds_alternative<DataKey>(res))
        {
            return DataKey{};
        }
        return std::move(std::get<DataKey>(res));
    }

    [[nodiscard]] VaultRecord addItem(const std::string& title, const std::string& secret)
    {
        VaultItemDraft d{};
        d.title = title;
        d.secret = secret;
        auto res{ m_sourceRecords->createVaultItem(*m_session, d) };
        EXPECT_TRUE(std::holds_alternative<VaultRecord>(res));
        ++m_nowMs;
        return std::holds_alternative<VaultRecord>(res) ? std::get<VaultRecord>(res) : VaultRecord{};
    }

    [[nodiscard]] std::string exportOk()
    {
        auto res{ m_sourceTransfer->exportAll(*m_session) };
        EXPECT_TRUE(std::holds_alternative<std::string>(res));
        return std::holds_alternative<std::string>(res) ? std::get<std::string>(res) : std::string{};
    }

    std::int64_t m_nowMs{ 1'700'000'000'000 };                                    // NOLINT
    std::unique_ptr<cipherbook::crypto::ICryptoProvider> m_crypto;                 // NOLINT
    cipherbook::test_utils::InMemoryParamStore m_params;                           // NOLINT
    cipherbook::test_utils::LogCapture m_logs;                                     // NOLINT
    std::unique_ptr<cipherbook::core::KeyManager> m_keys;                          // NOLINT
    std::unique_ptr<VaultSession> m_session;                                       // NOLINT
    std::unique_ptr<cipherbook::storage::ILocalStore> m_source;                    // NOLINT
    std::unique_ptr<cipherbook::storage::ILocalStore> m_target;                    // NOLINT
    std::unique_ptr<cipherbook::core::RecordService> m_sourceRecords;              // NOLINT
    std::unique_ptr<cipherbook::core::VaultTransfer> m_sourceTransfer;             // NOLINT
    std::unique_ptr<cipherbook::core::VaultTransfer> m_targetTransfer;             // NOLINT
};

} // namespace

TEST_F(VaultTransferTest, ExportImportsIntoEmptyStore)
{
    const auto bank{ addItem("Bank", "p@ss") };
    const auto gone{ addItem("Old", "x") };
    ASSERT_TRUE(std::holds_alternative<std::monostate>(m_sourceRecords->deleteVaultItem(*m_session, gone.id)));
    ASSERT_TRUE(std::holds_alternative<cipherbook::core::NoteRecord>(
        m_sourceRecords->createNote(NoteDraft{ "Todo", "call bank", { "home" } })));

    const auto envelope{ exportOk() };
    EXPECT_EQ(envelope.find("p@ss"), std::string::npos);
    EXPECT_EQ(envelope.find("call bank"), std::string::npos);

    const auto res{ m_targetTransfer->importAll(*m_session, envelope) };
    ASSERT_TRUE(std::holds_alternative<ImportSummary>(res));
    const auto& summary{ std::get<ImportSummary>(res) };
    EXPECT_EQ(summary.vaultItemsImported, 1U);
    EXPECT_EQ(summary.notesImported, 1U);
    EXPECT_EQ(summary.vaultItemsSkipped + summary.notesSkipped, 0U);

    cipherbook::core::RecordService targetRecords{ *m_crypto, *m_target, cipherbook::core::systemNow,
                                                   cipherbook::test_utils::quietLogger("RecordService") };
    const auto fetched{ targetRecords.getVaultItem(*m_session, bank.id) };
    ASSERT_TRUE(std::holds_alternative<VaultRecord>(fetched));
    EXPECT_EQ(std::get<VaultRecord>(fetched), bank);
    EXPECT_EQ(m_target->findVaultItem(gone.id), std::nullopt);

    // Imported rows are queued for sync.
    EXPECT_EQ(m_target->dirtyVaultItems(fromUnixMillis(0)).size(), 1U);
}

TEST_F(VaultTransferTest, ImportKeepsNewerLocalCopies)
{
    auto bank{ addItem("Bank", "old") };
    const auto envelope{ exportOk() };

    bank.secret = "newer";
    ASSERT_TRUE(std::holds_alternative<VaultRecord>(m_sourceRecords->updateVaultItem(*m_session, bank)));

    const auto res{ m_sourceTransfer->importAll(*m_session, envelope) };
    ASSERT_TRUE(std::holds_alternative<ImportSummary>(res));
    EXPECT_EQ(std::get<ImportSummary>(res).vaultItemsImported, 0U);
    EXPECT_EQ(std::get<ImportSummary>(res).vaultItemsSkipped, 1U);

    const auto fetched{ m_sourceRecords->getVaultItem(*m_session, bank.id) };
    ASSERT_TRUE(std::holds_alternative<VaultRecord>(fetched));
    EXPECT_EQ(std::get<VaultRecord>(fetched).secret, std::optional<std::string>{ "newer" });
}

TEST_F(VaultTransferTest, LockedSessionIsRejected)
{
    const auto envelope{ exportOk() };
    m_session->lock();
    const auto exported{ m_sourceTransfer->exportAll(*m_session) };
    ASSERT_TRUE(std::holds_alternative<RecordError>(exported));
    EXPECT_EQ(std::get<RecordError>(exported), RecordError::Locked);

    const auto imported{ m_targetTransfer->importAll(*m_session, envelope) };
    ASSERT_TRUE(std::holds_alternative<RecordError>(imported));
    EXPECT_EQ(std::get<RecordError>(imported), RecordError::Locked);
}

TEST_F(VaultTransferTest, TamperedOrForeignEnvelopeIsRejected)
{
    (void)addItem("Bank", "p@ss");
    auto envelope{ exportOk() };
    ASSERT_GT(envelope.size(), 20U);
    envelope[envelope.size() / 2] = (envelope[envelope.size() / 2] == 'A') ? 'B' : 'A';

    const auto tampered{ m_targetTransfer->importAll(*m_session, envelope) };
    ASSERT_TRUE(std::holds_alternative<RecordError>(tampered));
    EXPECT_EQ(std::get<RecordError>(tampered), RecordError::DecryptFailed);

    const auto garbage{ m_targetTransfer->importAll(*m_session, "not an export") };
    ASSERT_TRUE(std::holds_alternative<RecordError>(garbage));
    EXPECT_EQ(std::get<RecordError>(garbage), RecordError::DecryptFailed);

    EXPECT_TRUE(m_target->listVaultItems(true).empty());
}
