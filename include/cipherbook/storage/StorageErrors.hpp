#ifndef INCLUDE_CIPHERBOOK_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_CIPHERBOOK_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace cipherbook::storage
{

// Any failure of a storage adapter: I/O, SQLite, permissions, malformed rows.
class StorageError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace cipherbook::storage

#endif // INCLUDE_CIPHERBOOK_STORAGE_STORAGEERRORS_HPP
