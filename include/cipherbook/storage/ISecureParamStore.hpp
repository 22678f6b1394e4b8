#ifndef INCLUDE_CIPHERBOOK_STORAGE_ISECUREPARAMSTORE_HPP
#define INCLUDE_CIPHERBOOK_STORAGE_ISECUREPARAMSTORE_HPP

#include <optional>
#include <string>
#include <string_view>

namespace cipherbook::storage
{

// Small key/value store for device-local secrets. Implementations throw StorageError.
class ISecureParamStore
{
public:
    ISecureParamStore() = default;
    ISecureParamStore(const ISecureParamStore&) = delete;
    ISecureParamStore& operator=(const ISecureParamStore&) = delete;
    ISecureParamStore(ISecureParamStore&&) = delete;
    ISecureParamStore& operator=(ISecureParamStore&&) = delete;
    virtual ~ISecureParamStore() = default;

    [[nodiscard]] virtual std::optional<std::string> load(std::string_view key) const = 0;

    // Atomic replace: readers observe either the previous value or the new one, never a torn write.
    virtual void store(std::string_view key, std::string_view value) = 0;

    // Removing a missing key is not an error.
    virtual void remove(std::string_view key) = 0;
};

} // namespace cipherbook::storage

#endif // INCLUDE_CIPHERBOOK_STORAGE_ISECUREPARAMSTORE_HPP
