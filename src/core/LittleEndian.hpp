#ifndef CIPHERBOOK_SRC_CORE_LITTLEENDIAN_HPP
#define CIPHERBOOK_SRC_CORE_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cipherbook::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

// Append-only encoder for the binary documents (key-wrap AAD, export payload).
class ByteWriter final
{
public:
    void putU32(std::uint32_t v)
    {
        putLE(v, g_kU32Bytes);
    }

    void putU64(std::uint64_t v)
    {
        putLE(v, g_kU64Bytes);
    }

    void putRaw(std::span<const std::uint8_t> bytes)
    {
        for (const std::uint8_t b : bytes)
        {
            m_out.push_back(static_cast<std::byte>(b));
        }
    }

    // u32 length prefix followed by the raw bytes.
    void putString(std::string_view s)
    {
        putU32(static_cast<std::uint32_t>(s.size()));
        for (const char c : s)
        {
            m_out.push_back(static_cast<std::byte>(c));
        }
    }

    void putOptionalString(const std::optional<std::string>& s)
    {
        putU32(s.has_value() ? 1U : 0U);
        if (s.has_value())
        {
            putString(*s);
        }
    }

    [[nodiscard]] const std::vector<std::byte>& bytes() const noexcept
    {
        return m_out;
    }

    [[nodiscard]] std::vector<std::byte> take() noexcept
    {
        return std::move(m_out);
    }

private:
    void putLE(std::uint64_t v, std::size_t width)
    {
        for (std::size_t i{}; i < width; ++i)
        {
            const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
            m_out.push_back(static_cast<std::byte>((v >> shiftBits) & g_kByteMaskU64));
        }
    }

    std::vector<std::byte> m_out;
};

// Bounds-checked decoder. Every getter returns false once the input is exhausted or malformed.
class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::byte> in) noexcept : m_in{ in }
    {
    }

    [[nodiscard]] bool getU32(std::uint32_t& out) noexcept
    {
        std::uint64_t wide{};
        if (!getLE(wide, g_kU32Bytes))
        {
            return false;
        }
        out = static_cast<std::uint32_t>(wide);
        return true;
    }

    [[nodiscard]] bool getU64(std::uint64_t& out) noexcept
    {
        return getLE(out, g_kU64Bytes);
    }

    [[nodiscard]] bool getRaw(std::span<std::uint8_t> out) noexcept
    {
        if (remaining() < out.size())
        {
            return false;
        }
        for (std::uint8_t& b : out)
        {
            b = std::to_integer<std::uint8_t>(m_in[m_pos++]);
        }
        return true;
    }

    [[nodiscard]] bool getString(std::string& out)
    {
        std::uint32_t len{};
        if (!getU32(len) || remaining() < len)
        {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(m_in.data() + m_pos), len);
        m_pos += len;
        return true;
    }

    [[nodiscard]] bool getOptionalString(std::optional<std::string>& out)
    {
        std::uint32_t present{};
        if (!getU32(present) || present > 1U)
        {
            return false;
        }
        if (present == 0U)
        {
            out.reset();
            return true;
        }
        std::string value{};
        if (!getString(value))
        {
            return false;
        }
        out = std::move(value);
        return true;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_pos;
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return m_pos == m_in.size();
    }

private:
    [[nodiscard]] bool getLE(std::uint64_t& out, std::size_t width) noexcept
    {
        if (remaining() < width)
        {
            return false;
        }
        std::uint64_t v{ 0U };
        for (std::size_t i{}; i < width; ++i)
        {
            const std::uint64_t shiftBits{ static_cast<std::uint64_t>(i) * g_kBitsPerByte };
            v |= (static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(m_in[m_pos++])) << shiftBits);
        }
        out = v;
        return true;
    }

    std::span<const std::byte> m_in;
    std::size_t m_pos{ 0U };
};

} // namespace cipherbook::core::detail

#endif // CIPHERBOOK_SRC_CORE_LITTLEENDIAN_HPP
