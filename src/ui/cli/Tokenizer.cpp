#include "Tokenizer.hpp"

#include <cctype>
#include <cstdint>
#include <utility>

namespace cipherbook::ui::cli
{
namespace
{

enum class Quote : std::uint8_t
{
    None,
    Single,
    Double,
};

class WordBuilder final
{
public:
    void append(char c)
    {
        m_word.push_back(c);
        m_started = true;
    }

    // Marks an empty quoted word ("") as present.
    void start() noexcept
    {
        m_started = true;
    }

    void flushInto(std::vector<std::string>& out)
    {
        if (m_started)
        {
            out.push_back(std::move(m_word));
        }
        m_word.clear();
        m_started = false;
    }

private:
    std::string m_word;
    bool m_started{ false };
};

} // namespace

std::optional<std::vector<std::string>> tokenizeCommandLine(std::string_view line)
{
    std::vector<std::string> words{};
    WordBuilder word{};
    Quote quote{ Quote::None };

    for (std::size_t i{}; i < line.size(); ++i)
    {
        const char c{ line[i] };
        switch (quote)
        {
        case Quote::Single:
            if (c == '\'')
            {
                quote = Quote::None;
            }
            else
            {
                word.append(c);
            }
            break;

        case Quote::Double:
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && i + 1U < line.size() && (line[i + 1U] == '"' || line[i + 1U] == '\\'))
            {
                word.append(line[++i]);
            }
            else
            {
                word.append(c);
            }
            break;

        case Quote::None:
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                word.flushInto(words);
            }
            else if (c == '\'')
            {
                quote = Quote::Single;
                word.start();
            }
            else if (c == '"')
            {
                quote = Quote::Double;
                word.start();
            }
            else if (c == '\\')
            {
                if (i + 1U >= line.size())
                {
                    return std::nullopt;
                }
                word.append(line[++i]);
            }
            else
            {
                word.append(c);
            }
            break;
        }
    }

    if (quote != Quote::None)
    {
        return std::nullopt;
    }
    word.flushInto(words);
    return words;
}

} // namespace cipherbook::ui::cli
