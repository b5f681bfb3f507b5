#include "utils/Logger.hpp"

#include <iostream>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace PromptGuard
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view text)
        {
            const std::string s = toLower(trim(text));
            if (s == "warning")
                return LogLevel::WARN;
            for (int i = static_cast<int>(LogLevel::TRACE); i <= static_cast<int>(LogLevel::CRITICAL); ++i)
            {
                const auto candidate = static_cast<LogLevel>(i);
                if (iequals(s, Logger::levelName(candidate)))
                    return candidate;
            }
            return std::nullopt;
        }

        Logger::Logger()
            : m_threshold(LogLevel::INFO),
              m_console(&std::cerr)
        {
        }

        Logger::~Logger()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open())
                m_file.close();
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_threshold = level;
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return level >= m_threshold;
        }

        bool Logger::setLogFile(std::string_view filePath)
        {
            std::ofstream next;
            if (!filePath.empty())
            {
                next.open(std::string(filePath), std::ios::out | std::ios::app);
                if (!next.is_open())
                    return false;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_file = std::move(next);
            return true;
        }

        void Logger::setConsole(std::ostream *console) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_console = console;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
                return;

            std::string line = "[" + formatTimestamp(now(), "%Y-%m-%d %H:%M:%S") + "] [" + levelName(level) + "] ";
            line.append(message);
            line.push_back('\n');

            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_console)
                m_console->write(line.data(), static_cast<std::streamsize>(line.size())).flush();
            if (m_file.is_open())
                m_file.write(line.data(), static_cast<std::streamsize>(line.size())).flush();
        }

        const char *Logger::levelName(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            }
            return "UNKNOWN";
        }

        Logger &getLogger()
        {
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace PromptGuard
