#include "cipherbook/core/KeyParams.hpp"
#include "LittleEndian.hpp"
#include "cipherbook/core/Base64.hpp"
#include <algorithm>
#include <charconv>
#include <map>
#include <system_error>

namespace cipherbook::core
{
namespace
{

constexpr std::string_view g_kWrapAadMagic{ "CPBKWRAP" };

constexpr std::string_view g_kFieldFormat{ "format" };
constexpr std::string_view g_kFieldPolicy{ "kdf.policy" };
constexpr std::string_view g_kFieldAlgorithm{ "kdf.algorithm" };
constexpr std::string_view g_kFieldIterations{ "kdf.iterations" };
constexpr std::string_view g_kFieldMemory{ "kdf.memoryKiB" };
constexpr std::string_view g_kFieldParallelism{ "kdf.parallelism" };
constexpr std::string_view g_kFieldSalt{ "salt" };
constexpr std::string_view g_kFieldWrapNonce{ "wrapNonce" };
constexpr std::string_view g_kFieldWrappedKey{ "wrappedDataKey" };

constexpr std::array<std::string_view, 9> g_kAllFields{
    g_kFieldFormat, g_kFieldPolicy,    g_kFieldAlgorithm, g_kFieldIterations, g_kFieldMemory,
    g_kFieldParallelism, g_kFieldSalt, g_kFieldWrapNonce, g_kFieldWrappedKey,
};

constexpr std::string_view g_kAlgPbkdf2{ "pbkdf2-hmac-sha256" };
constexpr std::string_view g_kAlgArgon2id{ "argon2id" };

// 32-byte data key + 16-byte tag.
constexpr std::size_t g_kWrappedKeyBytes{ 48U };

[[nodiscard]] std::string_view algorithmName(cipherbook::crypto::KdfAlgorithm alg) noexcept
{
    switch (alg)
    {
    case cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256:
        return g_kAlgPbkdf2;
    case cipherbook::crypto::KdfAlgorithm::Argon2id:
        return g_kAlgArgon2id;
    }
    return "unknown";
}

[[nodiscard]] std::optional<cipherbook::crypto::KdfAlgorithm> parseAlgorithm(std::string_view name) noexcept
{
    if (name == g_kAlgPbkdf2)
    {
        return cipherbook::crypto::KdfAlgorithm::Pbkdf2HmacSha256;
    }
    if (name == g_kAlgArgon2id)
    {
        return cipherbook::crypto::KdfAlgorithm::Argon2id;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<std::uint32_t> parseU32(std::string_view text) noexcept
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::uint32_t value{};
    const auto* first{ text.data() };
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

void appendField(std::string& out, std::string_view name, std::string_view value)
{
    out.append(name);
    out.push_back('=');
    out.append(value);
    out.push_back('\n');
}

} // namespace

std::string serializeVaultKeyParams(const VaultKeyParams& params)
{
    std::string out{};
    appendField(out, g_kFieldFormat, std::to_string(g_kKeyParamsFormatVersion));
    appendField(out, g_kFieldPolicy, std::to_string(params.kdf.policyVersion));
    appendField(out, g_kFieldAlgorithm, algorithmName(params.kdf.algorithm));
    appendField(out, g_kFieldIterations, std::to_string(params.kdf.iterations));
    appendField(out, g_kFieldMemory, std::to_string(params.kdf.memoryKiB));
    appendField(out, g_kFieldParallelism, std::to_string(params.kdf.parallelism));
    appendField(out, g_kFieldSalt, base64Encode(params.kdf.salt));
    appendField(out, g_kFieldWrapNonce, base64Encode(params.wrapNonce));
    appendField(out, g_kFieldWrappedKey, base64Encode(params.wrappedDataKey));
    return out;
}

std::optional<VaultKeyParams> parseVaultKeyParams(std::string_view text)
{
    std::map<std::string_view, std::string_view> fields{};

    while (!text.empty())
    {
        const std::size_t eol{ text.find('\n') };
        std::string_view line{ text.substr(0, eol) };
        text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1U);

        if (line.empty())
        {
            continue;
        }
        const std::size_t eq{ line.find('=') };
        if (eq == std::string_view::npos)
        {
            return std::nullopt;
        }
        const std::string_view name{ line.substr(0, eq) };
        const std::string_view value{ line.substr(eq + 1U) };
        if (std::find(g_kAllFields.begin(), g_kAllFields.end(), name) == g_kAllFields.end())
        {
            return std::nullopt;
        }
        if (!fields.emplace(name, value).second)
        {
            return std::nullopt;
        }
    }

    if (fields.size() != g_kAllFields.size())
    {
        return std::nullopt;
    }

    const auto format{ parseU32(fields[g_kFieldFormat]) };
    if (!format || *format != g_kKeyParamsFormatVersion)
    {
        return std::nullopt;
    }

    VaultKeyParams out{};

    const auto policy{ parseU32(fields[g_kFieldPolicy]) };
    const auto alg{ parseAlgorithm(fields[g_kFieldAlgorithm]) };
    const auto iterations{ parseU32(fields[g_kFieldIterations]) };
    const auto memory{ parseU32(fields[g_kFieldMemory]) };
    const auto parallelism{ parseU32(fields[g_kFieldParallelism]) };
    if (!policy || !alg || !iterations || !memory || !parallelism)
    {
        return std::nullopt;
    }
    out.kdf.policyVersion = *policy;
    out.kdf.algorithm = *alg;
    out.kdf.iterations = *iterations;
    out.kdf.memoryKiB = *memory;
    out.kdf.parallelism = *parallelism;

    auto salt{ base64Decode(fields[g_kFieldSalt]) };
    auto nonce{ base64Decode(fields[g_kFieldWrapNonce]) };
    auto wrapped{ base64Decode(fields[g_kFieldWrappedKey]) };
    if (!salt || !nonce || !wrapped)
    {
        return std::nullopt;
    }
    if (salt->size() < cipherbook::crypto::g_kMinSaltBytes || nonce->size() != out.wrapNonce.size() ||
        wrapped->size() != g_kWrappedKeyBytes)
    {
        return std::nullopt;
    }

    out.kdf.salt = std::move(*salt);
    std::copy(nonce->begin(), nonce->end(), out.wrapNonce.begin());
    out.wrappedDataKey = std::move(*wrapped);
    return out;
}

std::vector<std::byte> encodeKeyWrapAad(const cipherbook::crypto::KdfParams& kdf)
{
    detail::ByteWriter w{};
    w.putRaw(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(g_kWrapAadMagic.data()),
                                            g_kWrapAadMagic.size() });
    w.putU32(g_kKeyParamsFormatVersion);
    w.putU32(kdf.policyVersion);
    w.putU32(static_cast<std::uint32_t>(kdf.algorithm));
    w.putU32(kdf.iterations);
    w.putU32(kdf.memoryKiB);
    w.putU32(kdf.parallelism);
    w.putU32(static_cast<std::uint32_t>(kdf.salt.size()));
    w.putRaw(kdf.salt);
    return w.take();
}

} // namespace cipherbook::core
