#pragma once

#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Base.hpp"

namespace Cosmos
{
    /**
     * Severity of a log message. Messages below the logger's minimum level are dropped
     * before formatting.
     */
    enum class LogLevel : std::uint8_t
    {
        Debug = 0,
        Info,
        Warning,
        Error,
        Fatal,
        Off
    };

    COSMOS_NODISCARD constexpr std::string_view LogLevelString(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Debug: return "Debug";
            case LogLevel::Info: return "Info";
            case LogLevel::Warning: return "Warning";
            case LogLevel::Error: return "Error";
            case LogLevel::Fatal: return "Fatal";
            case LogLevel::Off: return "Off";
        }
        return "Unknown";
    }

    using LogWriteFunc = std::function<void(LogLevel, std::string_view)>;

    /**
     * Process-wide logger with a replaceable sink.
     * The default sink writes "[Level] cosmos: message" lines to stderr.
     */
    class Log
    {
    public:
        static Log& Get()
        {
            static Log instance;
            return instance;
        }

        /**
         * Replace the output function. Passing an empty function restores stderr output.
         */
        void SetOutput(LogWriteFunc func)
        {
            std::lock_guard lock(m_mutex);
            m_output = func ? std::move(func) : LogWriteFunc(&WriteStderr);
        }

        void SetMinLevel(LogLevel level) noexcept
        {
            std::lock_guard lock(m_mutex);
            m_minLevel = level;
        }

        COSMOS_NODISCARD LogLevel GetMinLevel() const noexcept
        {
            std::lock_guard lock(m_mutex);
            return m_minLevel;
        }

        COSMOS_NODISCARD bool IsEnabled(LogLevel level) const noexcept
        {
            return level >= GetMinLevel() && level != LogLevel::Off;
        }

        void Write(LogLevel level, std::string_view message)
        {
            LogWriteFunc output;
            {
                std::lock_guard lock(m_mutex);
                if (level < m_minLevel || level == LogLevel::Off)
                    return;
                output = m_output;
            }
            // Sinks run unlocked so they may log or reconfigure the logger
            output(level, message);
        }

        template<typename... Args>
        void WriteFormat(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
        {
            if (!IsEnabled(level))
                return;
            Write(level, fmt::format(format, std::forward<Args>(args)...));
        }

    private:
        Log() : m_output(&WriteStderr) {}

        static void WriteStderr(LogLevel level, std::string_view message)
        {
            fmt::print(stderr, "[{}] cosmos: {}\n", LogLevelString(level), message);
        }

        mutable std::mutex m_mutex;
        LogWriteFunc m_output;
        LogLevel m_minLevel = LogLevel::Info;
    };
}

#define COSMOS_LOG_DEBUG(...) ::Cosmos::Log::Get().WriteFormat(::Cosmos::LogLevel::Debug, __VA_ARGS__)
#define COSMOS_LOG_INFO(...) ::Cosmos::Log::Get().WriteFormat(::Cosmos::LogLevel::Info, __VA_ARGS__)
#define COSMOS_LOG_WARN(...) ::Cosmos::Log::Get().WriteFormat(::Cosmos::LogLevel::Warning, __VA_ARGS__)
#define COSMOS_LOG_ERROR(...) ::Cosmos::Log::Get().WriteFormat(::Cosmos::LogLevel::Error, __VA_ARGS__)
