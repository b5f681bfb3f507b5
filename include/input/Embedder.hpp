#pragma once

#include <cstddef>
#include <string_view>

#include "core/Embedding.hpp"

namespace PromptGuard
{
    namespace Input
    {
        /**
         * IEmbedder
         *
         * Boundary to the embedding collaborator. Implementations map prompt
         * text to a fixed-length vector and raise core::EmbeddingServiceError
         * when they cannot. Retrying is the implementation's business; the
         * decision pipeline calls embed() exactly once per request.
         */
        class IEmbedder
        {
        public:
            virtual ~IEmbedder() = default;

            virtual core::Embedding embed(std::string_view text) const = 0;

            /// Length of every vector this embedder returns.
            virtual std::size_t dimension() const noexcept = 0;
        };

    } // namespace Input
} // namespace PromptGuard
