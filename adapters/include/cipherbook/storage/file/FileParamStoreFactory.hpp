#ifndef INCLUDE_CIPHERBOOK_STORAGE_FILE_FILEPARAMSTOREFACTORY_HPP
#define INCLUDE_CIPHERBOOK_STORAGE_FILE_FILEPARAMSTOREFACTORY_HPP

#include "cipherbook/storage/ISecureParamStore.hpp"
#include <filesystem>
#include <memory>

namespace cipherbook::storage::file
{

// One file per key inside `dir`, created with mode 0700; files are 0600.
[[nodiscard]] std::unique_ptr<cipherbook::storage::ISecureParamStore> makeFileParamStore(const std::filesystem::path& dir);

} // namespace cipherbook::storage::file

#endif // INCLUDE_CIPHERBOOK_STORAGE_FILE_FILEPARAMSTOREFACTORY_HPP
