#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PromptGuard
{
    namespace Utils
    {
        /**
         * Flat "key = value" configuration store.
         *
         *   # comment            ; also a comment
         *   contamination      = 0.005
         *   judge_timeout_ms   = 8000
         *   banned_phrases     = drop table, system override
         *
         * Keys and values are trimmed, lines without '=' are skipped and a
         * repeated key keeps its last value. Typed getters return
         * std::nullopt for a missing key or a value that does not parse,
         * so callers decide on the fallback.
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            /// false if the file cannot be opened; the current values then stay.
            bool loadFromFile(const std::string &filePath);

            /// Replaces every current value with what the stream holds.
            void loadFromStream(std::istream &in);

            void set(std::string key, std::string value);
            void clear();

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::string getStringOr(std::string_view key, std::string_view defaultValue) const;

            /// Whole value must be a base-10 integer.
            std::optional<std::int64_t> getInt(std::string_view key) const;
            std::int64_t getIntOr(std::string_view key, std::int64_t defaultValue) const;

            std::optional<double> getDouble(std::string_view key) const;

            /// 1/true/yes/on and 0/false/no/off, any case.
            std::optional<bool> getBool(std::string_view key) const;

            /// Comma-separated; items trimmed, empty items dropped.
            std::optional<std::vector<std::string>> getList(std::string_view key) const;

        private:
            using Values = std::map<std::string, std::string, std::less<>>;

            Values             m_values;
            mutable std::mutex m_mutex;
        };

        /// Process-wide configuration, loaded once by the CLI.
        ConfigLoader &getGlobalConfig();

    } // namespace Utils
} // namespace PromptGuard
