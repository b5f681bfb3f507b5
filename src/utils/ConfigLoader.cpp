#include "utils/ConfigLoader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>

#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Utils
    {
        namespace
        {
            // strtoll/strtod wrapper: the whole string must be consumed and in range.
            template <typename T, typename Conv>
            std::optional<T> parseWhole(const std::string &text, Conv conv)
            {
                if (text.empty())
                    return std::nullopt;

                const char *begin = text.c_str();
                char *end = nullptr;
                errno = 0;
                const T value = conv(begin, &end);
                if (errno == ERANGE || end != begin + text.size())
                    return std::nullopt;
                return value;
            }
        } // namespace

        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in)
                return false;

            loadFromStream(in);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            Values parsed;
            for (std::string raw; std::getline(in, raw);)
            {
                const auto line = trim(raw);
                if (line.empty() || line.front() == '#' || line.front() == ';')
                    continue;

                const auto eq = line.find('=');
                if (eq == std::string_view::npos)
                    continue;

                const auto key = trim(line.substr(0, eq));
                if (!key.empty())
                    parsed[std::string(key)] = std::string(trim(line.substr(eq + 1)));
            }

            // Readers see either the old file or the new one, never a mix.
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values.swap(parsed);
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        void ConfigLoader::clear()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values.clear();
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(key) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            const auto it = m_values.find(key);
            if (it == m_values.end())
                return std::nullopt;
            return it->second;
        }

        std::string ConfigLoader::getStringOr(std::string_view key, std::string_view defaultValue) const
        {
            return getString(key).value_or(std::string(defaultValue));
        }

        std::optional<std::int64_t> ConfigLoader::getInt(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v)
                return std::nullopt;
            return parseWhole<std::int64_t>(*v, [](const char *s, char **end) {
                return static_cast<std::int64_t>(std::strtoll(s, end, 10));
            });
        }

        std::int64_t ConfigLoader::getIntOr(std::string_view key, std::int64_t defaultValue) const
        {
            return getInt(key).value_or(defaultValue);
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v)
                return std::nullopt;
            return parseWhole<double>(*v, [](const char *s, char **end) { return std::strtod(s, end); });
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v)
                return std::nullopt;

            static constexpr std::string_view kTrue[]  = {"1", "true", "yes", "on"};
            static constexpr std::string_view kFalse[] = {"0", "false", "no", "off"};
            for (const auto word : kTrue)
            {
                if (iequals(*v, word))
                    return true;
            }
            for (const auto word : kFalse)
            {
                if (iequals(*v, word))
                    return false;
            }
            return std::nullopt;
        }

        std::optional<std::vector<std::string>> ConfigLoader::getList(std::string_view key) const
        {
            const auto v = getString(key);
            if (!v)
                return std::nullopt;
            return splitAndTrim(*v, ',');
        }

        ConfigLoader &getGlobalConfig()
        {
            static ConfigLoader instance;
            return instance;
        }

    } // namespace Utils
} // namespace PromptGuard
