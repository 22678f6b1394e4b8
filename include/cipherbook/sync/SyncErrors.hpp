#ifndef INCLUDE_CIPHERBOOK_SYNC_SYNCERRORS_HPP
#define INCLUDE_CIPHERBOOK_SYNC_SYNCERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <variant>

namespace cipherbook::sync
{

// Thrown by remote store adapters when the transport fails. Always retryable.
class NetworkError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class SyncError : std::uint8_t
{
    NetworkError,
    StorageError,
    AlreadyRunning,
};

template <class T> using SyncResult = std::variant<T, SyncError>;

} // namespace cipherbook::sync

#endif // INCLUDE_CIPHERBOOK_SYNC_SYNCERRORS_HPP
