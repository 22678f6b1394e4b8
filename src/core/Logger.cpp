#include "cipherbook/core/Logger.hpp"
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace cipherbook::core
{
namespace
{

std::mutex g_consoleMutex{};

[[nodiscard]] std::string formatNow()
{
    using Clock = std::chrono::system_clock;
    const auto now{ Clock::now() };
    const std::time_t seconds{ Clock::to_time_t(now) };
    const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000 };

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out{};
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis.count();
    return out.str();
}

} // namespace

std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

LogSink makeConsoleLogSink()
{
    return [](LogLevel level, std::string_view component, std::string_view message)
    {
        const std::string stamp{ formatNow() };
        const std::scoped_lock lock{ g_consoleMutex };
        std::clog << stamp << " [" << toString(level) << "] " << component << ": " << message << '\n';
    };
}

Logger::Logger(std::string component, LogSink sink, LogLevel minLevel)
    : m_component(std::move(component)), m_sink(std::move(sink)), m_minLevel(minLevel)
{
}

void Logger::log(LogLevel level, std::string_view message) const noexcept
{
    if (level < m_minLevel || !m_sink)
    {
        return;
    }
    try
    {
        m_sink(level, m_component, message);
    }
    catch (const std::exception&)
    {
        // A failing sink drops the line; logging never fails the caller.
    }
}

Logger Logger::withComponent(std::string component) const
{
    return Logger{ std::move(component), m_sink, m_minLevel };
}

} // namespace cipherbook::core
