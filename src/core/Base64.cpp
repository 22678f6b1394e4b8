#include "cipherbook/core/Base64.hpp"
#include <cstddef>
#include <limits>
#include <openssl/evp.h>
#include <stdexcept>

namespace cipherbook::core
{
namespace
{

constexpr std::size_t g_kBase64Quantum{ 4U };
constexpr std::size_t g_kBytesPerQuantum{ 3U };

[[nodiscard]] bool isBase64Char(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string base64Encode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    if (bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3))
    {
        throw std::invalid_argument("base64Encode: input too large");
    }

    const std::size_t encodedLen{ ((bytes.size() + g_kBytesPerQuantum - 1U) / g_kBytesPerQuantum) * g_kBase64Quantum };
    // EVP_EncodeBlock appends a NUL terminator.
    std::string out(encodedLen + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    if (written < 0 || static_cast<std::size_t>(written) != encodedLen)
    {
        throw std::runtime_error("base64Encode: EVP_EncodeBlock failed");
    }
    out.resize(encodedLen);
    return out;
}

std::optional<std::vector<std::uint8_t>> base64Decode(std::string_view text)
{
    if (text.empty())
    {
        return std::vector<std::uint8_t>{};
    }
    if ((text.size() % g_kBase64Quantum) != 0U ||
        text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }

    std::size_t padding{ 0U };
    if (text.back() == '=')
    {
        padding = (text[text.size() - 2U] == '=') ? 2U : 1U;
    }
    for (std::size_t i{}; i < text.size() - padding; ++i)
    {
        if (!isBase64Char(text[i]))
        {
            return std::nullopt;
        }
    }

    // EVP_DecodeBlock always emits whole quanta; padding bytes are trimmed afterwards.
    std::vector<std::uint8_t> out((text.size() / g_kBase64Quantum) * g_kBytesPerQuantum);
    const int written{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                       static_cast<int>(text.size())) };
    if (written < 0 || static_cast<std::size_t>(written) != out.size())
    {
        return std::nullopt;
    }
    out.resize(out.size() - padding);
    return out;
}

} // namespace cipherbook::core
