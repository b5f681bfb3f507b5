#include "input/CorpusReader.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Input
    {
        using nlohmann::json;

        CorpusReader::CorpusReader(const std::string &filePath)
        {
            open(filePath);
        }

        bool CorpusReader::open(const std::string &filePath)
        {
            if (m_stream.is_open())
                m_stream.close();

            m_filePath.clear();
            m_lineNumber = 0;

            m_stream.open(filePath, std::ios::in);
            if (!m_stream.is_open())
                return false;

            m_filePath = filePath;
            m_format = detectFormat();
            return true;
        }

        CorpusFormat CorpusReader::detectFormat()
        {
            const std::string lower = Utils::toLower(m_filePath);
            if (Utils::endsWith(lower, ".jsonl") || Utils::endsWith(lower, ".ndjson"))
                return CorpusFormat::JSON_LINES;

            // Peek at the first non-blank line, then rewind.
            CorpusFormat detected = CorpusFormat::TEXT;
            std::string line;
            while (std::getline(m_stream, line))
            {
                const std::string_view t = Utils::trim(line);
                if (t.empty())
                    continue;
                if (t.front() == '{')
                    detected = CorpusFormat::JSON_LINES;
                break;
            }

            m_stream.clear();
            m_stream.seekg(0, std::ios::beg);
            return detected;
        }

        std::optional<CorpusEntry> CorpusReader::nextEntry()
        {
            if (!m_stream.is_open())
                return std::nullopt;

            std::string line;
            while (std::getline(m_stream, line))
            {
                ++m_lineNumber;

                if (!line.empty() && line.back() == '\r')
                    line.pop_back();

                const std::string_view t = Utils::trim(line);
                if (t.empty())
                    continue;

                if (m_format == CorpusFormat::TEXT)
                {
                    if (t.front() == '#')
                        continue;
                    return CorpusEntry{std::string(t), std::nullopt};
                }

                try
                {
                    return parseJsonLine(std::string(t));
                }
                catch (const std::runtime_error &e)
                {
                    throw std::runtime_error(m_filePath + ":" + std::to_string(m_lineNumber) +
                                             ": " + e.what());
                }
            }
            return std::nullopt;
        }

        CorpusEntry CorpusReader::parseJsonLine(const std::string &line)
        {
            json record;
            try
            {
                record = json::parse(line);
            }
            catch (const json::parse_error &e)
            {
                throw std::runtime_error(std::string("invalid JSON: ") + e.what());
            }

            if (!record.is_object())
                throw std::runtime_error("record is not a JSON object");

            const auto promptIt = record.find("prompt");
            if (promptIt == record.end() || !promptIt->is_string())
                throw std::runtime_error("record has no string \"prompt\"");

            CorpusEntry entry;
            entry.prompt = promptIt->get<std::string>();

            const auto embIt = record.find("embedding");
            if (embIt != record.end() && !embIt->is_null())
            {
                if (!embIt->is_array() || embIt->empty())
                    throw std::runtime_error("\"embedding\" must be a non-empty array");

                core::Embedding vec;
                vec.reserve(embIt->size());
                for (const auto &v : *embIt)
                {
                    if (!v.is_number())
                        throw std::runtime_error("\"embedding\" contains a non-numeric value");
                    vec.push_back(v.get<double>());
                }
                entry.embedding = std::move(vec);
            }
            return entry;
        }

        std::vector<CorpusEntry> CorpusReader::readAll(const std::string &filePath)
        {
            CorpusReader reader(filePath);
            if (!reader.isOpen())
                throw std::runtime_error("cannot open " + filePath);

            std::vector<CorpusEntry> entries;
            while (auto entry = reader.nextEntry())
                entries.push_back(std::move(*entry));
            return entries;
        }

        std::vector<core::Embedding> embeddingsOf(const std::vector<CorpusEntry> &entries)
        {
            std::vector<core::Embedding> out;
            out.reserve(entries.size());
            for (const auto &e : entries)
            {
                if (e.embedding)
                    out.push_back(*e.embedding);
            }
            return out;
        }

    } // namespace Input
} // namespace PromptGuard
