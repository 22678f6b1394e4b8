#ifndef INCLUDE_CIPHERBOOK_STORAGE_SQLITE_SQLITELOCALSTOREFACTORY_HPP
#define INCLUDE_CIPHERBOOK_STORAGE_SQLITE_SQLITELOCALSTOREFACTORY_HPP

#include "cipherbook/storage/ILocalStore.hpp"
#include <filesystem>
#include <memory>

namespace cipherbook::storage::sqlite
{

// Opens (creating if needed) the record database at `dbPath`. Use ":memory:" for a private in-memory store.
[[nodiscard]] std::unique_ptr<cipherbook::storage::ILocalStore> makeSqliteLocalStore(const std::filesystem::path& dbPath);

} // namespace cipherbook::storage::sqlite

#endif // INCLUDE_CIPHERBOOK_STORAGE_SQLITE_SQLITELOCALSTOREFACTORY_HPP
