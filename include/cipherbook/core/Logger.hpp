#ifndef INCLUDE_CIPHERBOOK_CORE_LOGGER_HPP
#define INCLUDE_CIPHERBOOK_CORE_LOGGER_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cipherbook::core
{

enum class LogLevel : std::uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
};

using LogSink = std::function<void(LogLevel level, std::string_view component, std::string_view message)>;

[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

// Timestamped lines on std::clog, serialized across threads.
[[nodiscard]] LogSink makeConsoleLogSink();

// Component-tagged logger. Callers must never pass key material, passwords or field values.
class Logger final
{
public:
    explicit Logger(std::string component, LogSink sink = makeConsoleLogSink(), LogLevel minLevel = LogLevel::Info);

    void log(LogLevel level, std::string_view message) const noexcept;

    void debug(std::string_view message) const noexcept
    {
        log(LogLevel::Debug, message);
    }
    void info(std::string_view message) const noexcept
    {
        log(LogLevel::Info, message);
    }
    void warn(std::string_view message) const noexcept
    {
        log(LogLevel::Warn, message);
    }
    void error(std::string_view message) const noexcept
    {
        log(LogLevel::Error, message);
    }

    void setMinLevel(LogLevel level) noexcept
    {
        m_minLevel = level;
    }
    [[nodiscard]] LogLevel minLevel() const noexcept
    {
        return m_minLevel;
    }
    [[nodiscard]] const std::string& component() const noexcept
    {
        return m_component;
    }

    // Same sink and threshold under another component name.
    [[nodiscard]] Logger withComponent(std::string component) const;

private:
    std::string m_component;
    LogSink m_sink;
    LogLevel m_minLevel{ LogLevel::Info };
};

} // namespace cipherbook::core

#endif // INCLUDE_CIPHERBOOK_CORE_LOGGER_HPP
