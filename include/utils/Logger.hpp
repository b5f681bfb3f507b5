#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace PromptGuard
{
    namespace Utils
    {
        /**
         * Severities, lowest first.
         *
         *  - TRACE: per-tree detail, never on in production
         *  - DEBUG: fuser stage transitions, judge raw replies
         *  - INFO: final decisions, model lifecycle events
         *  - WARN: degraded operation (judge unavailable, bad config values)
         *  - ERROR: recoverable failures (corrupt model artifact, I/O errors)
         *  - CRITICAL: unrecoverable failures
         */
        enum class LogLevel
        {
            TRACE = 0,
            DEBUG,
            INFO,
            WARN,
            ERROR,
            CRITICAL,
        };

        /// Case-insensitive; accepts "warning" for WARN. std::nullopt if unknown.
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Line logger shared by every gateway component.
         *
         * Output format is "[YYYY-mm-dd HH:MM:SS] [LEVEL] message". Lines go
         * to a console stream (stderr unless redirected) and, once
         * setLogFile() succeeds, are appended to that file too. All members
         * may be called concurrently.
         */
        class Logger
        {
        public:
            Logger();
            ~Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            void setLevel(LogLevel level) noexcept;
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Append to filePath from now on; an empty path closes the file
             * sink. Returns false when the file cannot be opened, in which
             * case only the console receives lines.
             */
            bool setLogFile(std::string_view filePath);

            /// nullptr silences the console sink (tests capture into a stringstream).
            void setConsole(std::ostream *console) noexcept;

            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)    { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)    { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)     { log(LogLevel::INFO, message); }
            void warn(std::string_view message)     { log(LogLevel::WARN, message); }
            void error(std::string_view message)    { log(LogLevel::ERROR, message); }
            void critical(std::string_view message) { log(LogLevel::CRITICAL, message); }

            /// "TRACE" ... "CRITICAL", as printed in the line prefix.
            static const char *levelName(LogLevel level) noexcept;

        private:
            mutable std::mutex m_mutex;
            LogLevel           m_threshold;
            std::ostream      *m_console;
            std::ofstream      m_file;
        };

        /// Process-wide logger: INFO and above to stderr until reconfigured.
        Logger &getLogger();

    } // namespace Utils
} // namespace PromptGuard
