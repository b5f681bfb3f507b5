#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "anomaly/AnomalyModel.hpp"
#include "core/Embedding.hpp"
#include "core/Verdict.hpp"

namespace PromptGuard
{
    namespace Anomaly
    {
        /**
         * Read-only view of "the currently published model".
         *
         * Implemented by Lifecycle::ModelLifecycle. current() returns a
         * complete snapshot or nullptr; it never exposes a model under
         * construction.
         */
        class ModelSnapshotSource
        {
        public:
            virtual ~ModelSnapshotSource() = default;

            virtual std::shared_ptr<const AnomalyModel> current() const = 0;
        };

        /// One entry of a batch: a verdict, or the reason its embedding was rejected.
        struct ScoreOutcome
        {
            std::optional<core::AnomalyVerdict> verdict;
            std::string                         error;
        };

        /**
         * AnomalyScorer
         *
         * Statistical stage of the gateway. Holds a read-only reference to
         * the snapshot source and takes one local handle per call, so a
         * concurrent model swap can never mix two models within a verdict.
         *
         * Stateless apart from that reference; safe to share across threads.
         */
        class AnomalyScorer
        {
        public:
            explicit AnomalyScorer(const ModelSnapshotSource &source) noexcept
                : m_source(source)
            {
            }

            /**
             * Score against the currently published model.
             *
             * Throws core::ModelNotReady if no model is published and
             * core::DimensionMismatch if the embedding length is wrong.
             * Never retries.
             */
            core::AnomalyVerdict score(const core::Embedding &embedding) const;

            /**
             * Score a batch against one snapshot. An embedding of the wrong
             * length or with a non-finite component gets an outcome carrying
             * the error; the rest of the batch is still scored. Throws
             * core::ModelNotReady if no model is published.
             */
            std::vector<ScoreOutcome> scoreEach(const std::vector<core::Embedding> &embeddings) const;

            /**
             * The snapshot a request should use for its whole lifetime.
             * Throws core::ModelNotReady if none is published.
             */
            std::shared_ptr<const AnomalyModel> snapshot() const;

            /// Score against an explicit snapshot (the fuser pins one per request).
            static core::AnomalyVerdict scoreWith(const AnomalyModel &model,
                                                  const core::Embedding &embedding);

        private:
            const ModelSnapshotSource &m_source;
        };

    } // namespace Anomaly
} // namespace PromptGuard
