#include "cipherbook/storage/file/FileParamStoreFactory.hpp"

#include "cipherbook/storage/StorageErrors.hpp"
#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include <sys/stat.h>

namespace
{

using cipherbook::storage::StorageError;

class FileParamStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = cipherbook::test_utils::makeSecureTempDir("params_");
        ASSERT_FALSE(m_root.empty());
        m_dir = m_root / "params";
    }

    void TearDown() override
    {
        std::error_code ec{};
        std::filesystem::remove_all(m_root, ec);
    }

    std::filesystem::path m_root; // NOLINT
    std::filesystem::path m_dir;  // NOLINT
};

[[nodiscard]] unsigned permissionBits(const std::filesystem::path& p)
{
    struct ::stat st{};
    if (::stat(p.c_str(), &st) != 0)
    {
        return 0U;
    }
    return static_cast<unsigned>(st.st_mode) & 0777U;
}

} // namespace

TEST_F(FileParamStoreTest, CreatesPrivateDirectory)
{
    const auto store{ cipherbook::storage::file::makeFileParamStore(m_dir) };
    ASSERT_TRUE(std::filesystem::is_directory(m_dir));
    EXPECT_EQ(permissionBits(m_dir), 0700U);
}

TEST_F(FileParamStoreTest, StoreLoadAndRemove)
{
    auto store{ cipherbook::storage::file::makeFileParamStore(m_dir) };
    EXPECT_EQ(store->load("key_params"), std::nullopt);

    store->store("key_params", "format=1\n");
    EXPECT_EQ(store->load("key_params"), std::string{ "format=1\n" });
    EXPECT_EQ(permissionBits(m_dir / "key_params"), 0600U);

    store->store("key_params", "format=1\nsalt=x\n");
    EXPECT_EQ(store->load("key_params"), std::string{ "format=1\nsalt=x\n" });
    EXPECT_FALSE(std::filesystem::exists(m_dir / "key_params.tmp"));

    store->remove("key_params");
    EXPECT_EQ(store->load("key_params"), std::nullopt);
    EXPECT_NO_THROW(store->remove("key_params"));
}

TEST_F(FileParamStoreTest, BinaryValuesSurviveReopen)
{
    const std::string value{ "a\0b\nc", 5 };
    {
        auto store{ cipherbook::storage::file::makeFileParamStore(m_dir) };
        store->store("blob", value);
    }
    const auto reopened{ cipherbook::storage::file::makeFileParamStore(m_dir) };
    EXPECT_EQ(reopened->load("blob"), value);
}

TEST_F(FileParamStoreTest, RejectsUnsafeKeys)
{
    auto store{ cipherbook::storage::file::makeFileParamStore(m_dir) };
    EXPECT_THROW(store->store("", "x"), StorageError);
    EXPECT_THROW(store->store("../escape", "x"), StorageError);
    EXPECT_THROW((void)store->load("Upper"), StorageError);
    EXPECT_THROW(store->remove("a/b"), StorageError);
}

TEST_F(FileParamStoreTest, PathThatIsAFileIsRejected)
{
    {
        auto store{ cipherbook::storage::file::makeFileParamStore(m_dir) };
        store->store("key", "v");
    }
    EXPECT_THROW((void)cipherbook::storage::file::makeFileParamStore(m_dir / "key"), StorageError);
}
