#include "cipherbook/storage/file/FileParamStoreFactory.hpp"

#include "cipherbook/storage/ISecureParamStore.hpp"
#include "cipherbook/storage/StorageErrors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cipherbook::storage::file
{
namespace
{

constexpr std::string_view g_kTmpSuffix{ ".tmp" };
constexpr ::mode_t g_kFileMode{ 0600 };

[[nodiscard]] std::string errnoMessage(const char* prefix, int err)
{
    std::string out{ prefix };
    out.append(": ");
    out.append(std::generic_category().message(err));
    return out;
}

// Keys become file names, so only [a-z0-9_] is accepted.
void requireValidKey(std::string_view key)
{
    if (key.empty())
    {
        throw StorageError("storage: empty parameter key");
    }
    for (const char c : key)
    {
        const bool ok{ (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' };
        if (!ok)
        {
            throw StorageError("storage: invalid parameter key");
        }
    }
}

class FileDescriptor final
{
public:
    explicit FileDescriptor(int fd) noexcept : m_fd(fd)
    {
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&&) = delete;
    FileDescriptor& operator=(FileDescriptor&&) = delete;
    ~FileDescriptor()
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

    // Close explicitly so that a failing close() is reported.
    [[nodiscard]] int close() noexcept
    {
        const int rc{ ::close(m_fd) };
        m_fd = -1;
        return rc;
    }

private:
    int m_fd{ -1 };
};

void writeAll(int fd, std::string_view data)
{
    std::size_t written{};
    while (written < data.size())
    {
        const ::ssize_t rc{ ::write(fd, data.data() + written, data.size() - written) };
        if (rc < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw StorageError(errnoMessage("storage: write failed", errno));
        }
        written += static_cast<std::size_t>(rc);
    }
}

void fsyncDir(const std::filesystem::path& dir)
{
    FileDescriptor fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
    if (fd.get() < 0)
    {
        throw StorageError(errnoMessage("storage: open directory failed", errno));
    }
    if (::fsync(fd.get()) != 0)
    {
        throw StorageError(errnoMessage("storage: fsync directory failed", errno));
    }
}

void ensurePrivateDir(const std::filesystem::path& dir)
{
    std::error_code ec{};
    if (std::filesystem::exists(dir, ec))
    {
        if (!std::filesystem::is_directory(dir, ec))
        {
            throw StorageError("storage: parameter path is not a directory");
        }
        return;
    }

    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        throw StorageError("storage: failed to create parameter directory");
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw StorageError("storage: failed to restrict parameter directory");
    }
}

class FileParamStore final : public cipherbook::storage::ISecureParamStore
{
public:
    explicit FileParamStore(std::filesystem::path dir) : m_dir(std::move(dir))
    {
        ensurePrivateDir(m_dir);
    }

    [[nodiscard]] std::optional<std::string> load(std::string_view key) const override
    {
        requireValidKey(key);
        const auto path{ pathFor(key) };

        std::error_code ec{};
        if (!std::filesystem::exists(path, ec))
        {
            if (ec)
            {
                throw StorageError("storage: failed to stat parameter file");
            }
            return std::nullopt;
        }

        std::ifstream in{ path, std::ios::binary };
        if (!in)
        {
            throw StorageError("storage: failed to open parameter file for reading");
        }
        std::string out{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
        if (in.bad())
        {
            throw StorageError("storage: failed to read parameter file");
        }
        return out;
    }

    void store(std::string_view key, std::string_view value) override
    {
        requireValidKey(key);
        const auto path{ pathFor(key) };
        auto tmpPath{ path };
        tmpPath += std::string{ g_kTmpSuffix };

        {
            FileDescriptor fd{ ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, g_kFileMode) };
            if (fd.get() < 0)
            {
                throw StorageError(errnoMessage("storage: open temp file failed", errno));
            }
            try
            {
                writeAll(fd.get(), value);
                if (::fsync(fd.get()) != 0)
                {
                    throw StorageError(errnoMessage("storage: fsync failed", errno));
                }
                if (fd.close() != 0)
                {
                    throw StorageError(errnoMessage("storage: close failed", errno));
                }
            }
            catch (const StorageError&)
            {
                std::error_code ignored{};
                std::filesystem::remove(tmpPath, ignored);
                throw;
            }
        }

        if (::rename(tmpPath.c_str(), path.c_str()) != 0)
        {
            const int err{ errno };
            std::error_code ignored{};
            std::filesystem::remove(tmpPath, ignored);
            throw StorageError(errnoMessage("storage: rename failed", err));
        }
        fsyncDir(m_dir);
    }

    void remove(std::string_view key) override
    {
        requireValidKey(key);
        std::error_code ec{};
        std::filesystem::remove(pathFor(key), ec);
        if (ec)
        {
            throw StorageError("storage: failed to remove parameter file");
        }
        fsyncDir(m_dir);
    }

private:
    [[nodiscard]] std::filesystem::path pathFor(std::string_view key) const
    {
        return m_dir / std::filesystem::path{ key };
    }

    std::filesystem::path m_dir;
};

} // namespace

std::unique_ptr<cipherbook::storage::ISecureParamStore> makeFileParamStore(const std::filesystem::path& dir)
{
    return std::make_unique<FileParamStore>(dir);
}

} // namespace cipherbook::storage::file
