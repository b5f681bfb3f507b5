#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "input/CorpusReader.hpp"
#include "input/Embedder.hpp"

namespace PromptGuard
{
    namespace Input
    {
        /**
         * PrecomputedEmbedder
         *
         * Serves vectors produced offline by an external embedding model
         * (JSON-lines corpus). Lookup is by exact prompt text, then by the
         * whitespace-trimmed text. Unknown prompts raise
         * core::EmbeddingServiceError.
         */
        class PrecomputedEmbedder : public IEmbedder
        {
        public:
            /**
             * Entries without an embedding are ignored; later duplicates win.
             * Throws std::invalid_argument if no entry has an embedding or the
             * embeddings differ in length.
             */
            explicit PrecomputedEmbedder(const std::vector<CorpusEntry> &entries);

            core::Embedding embed(std::string_view text) const override;

            std::size_t dimension() const noexcept override { return m_dimension; }

            std::size_t size() const noexcept { return m_table.size(); }

        private:
            std::unordered_map<std::string, core::Embedding> m_table;
            std::size_t                                      m_dimension = 0;
        };

    } // namespace Input
} // namespace PromptGuard
