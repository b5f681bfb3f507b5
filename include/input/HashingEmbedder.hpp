#pragma once

#include <cstddef>
#include <string_view>

#include "input/Embedder.hpp"

namespace PromptGuard
{
    namespace Input
    {
        /**
         * HashingEmbedder
         *
         * Deterministic local embedder so the gateway runs without a remote
         * embedding service.
         *
         *  - Text is lowercased and whitespace runs collapse to one space.
         *  - Every character n-gram (minN..maxN, padded with spaces) is hashed
         *    with FNV-1a into one of dimension() buckets; a second hash bit
         *    picks the sign so collisions tend to cancel.
         *  - The vector is L2-normalised. Empty text yields the zero vector.
         */
        class HashingEmbedder : public IEmbedder
        {
        public:
            static constexpr std::size_t kDefaultDimension = 384;

            explicit HashingEmbedder(std::size_t dimension = kDefaultDimension,
                                     std::size_t minN = 3,
                                     std::size_t maxN = 5);

            core::Embedding embed(std::string_view text) const override;

            std::size_t dimension() const noexcept override { return m_dimension; }

        private:
            std::size_t m_dimension;
            std::size_t m_minN;
            std::size_t m_maxN;
        };

    } // namespace Input
} // namespace PromptGuard
