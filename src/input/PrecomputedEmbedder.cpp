#include "input/PrecomputedEmbedder.hpp"

#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Input
    {
        PrecomputedEmbedder::PrecomputedEmbedder(const std::vector<CorpusEntry> &entries)
        {
            for (const auto &entry : entries)
            {
                if (!entry.embedding)
                    continue;

                if (m_dimension == 0)
                    m_dimension = entry.embedding->size();
                else if (entry.embedding->size() != m_dimension)
                    throw std::invalid_argument("precomputed embeddings differ in length");

                m_table[entry.prompt] = *entry.embedding;
            }

            if (m_table.empty())
                throw std::invalid_argument("no precomputed embeddings supplied");
        }

        core::Embedding PrecomputedEmbedder::embed(std::string_view text) const
        {
            auto it = m_table.find(std::string(text));
            if (it == m_table.end())
                it = m_table.find(std::string(Utils::trim(text)));

            if (it == m_table.end())
                throw core::EmbeddingServiceError("no precomputed embedding for prompt \"" +
                                                  Utils::previewForLog(text) + "\"");
            return it->second;
        }

    } // namespace Input
} // namespace PromptGuard
