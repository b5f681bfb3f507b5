#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace PromptGuard
{
    namespace Utils
    {
        /**
         * Text helpers shared by config parsing, prompt matching and the
         * JSON reporters. Stateless, safe to call from any thread.
         */

        /// View of sv without leading or trailing whitespace.
        std::string_view trim(std::string_view sv) noexcept;

        /// ASCII lowercase copy; bytes >= 0x80 pass through untouched.
        std::string toLower(std::string_view sv);

        /// ASCII case-insensitive equality.
        bool iequals(std::string_view a, std::string_view b) noexcept;

        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.substr(0, prefix.size()) == prefix;
        }

        inline bool endsWith(std::string_view sv, std::string_view suffix) noexcept
        {
            return sv.size() >= suffix.size() && sv.substr(sv.size() - suffix.size()) == suffix;
        }

        inline bool contains(std::string_view sv, std::string_view needle) noexcept
        {
            return sv.find(needle) != std::string_view::npos;
        }

        /**
         * Comma lists from the config file: "a, b ,, c" -> {"a", "b", "c"}.
         * Items are trimmed and empty items dropped.
         */
        std::vector<std::string> splitAndTrim(std::string_view sv, char delimiter);

        /// Replace every non-overlapping occurrence of from; no-op for an empty from.
        void replaceAllInPlace(std::string &str, std::string_view from, std::string_view to);

        /**
         * Shorten a prompt for log lines: newlines become spaces and the
         * result is cut to maxChars with a trailing "...".
         */
        std::string previewForLog(std::string_view text, std::size_t maxChars = 50);

        /// RFC 8259 string escaping (without the surrounding quotes).
        std::string escapeJson(std::string_view s);

    } // namespace Utils
} // namespace PromptGuard
