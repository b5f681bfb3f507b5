#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "anomaly/AnomalyModel.hpp"
#include "anomaly/AnomalyScorer.hpp"
#include "core/Embedding.hpp"
#include "lifecycle/ModelStore.hpp"

namespace PromptGuard
{
    namespace Lifecycle
    {
        enum class LifecycleState
        {
            Unfitted,   ///< No model published; scoring fails with ModelNotReady.
            Ready       ///< A complete model is published.
        };

        const char *toString(LifecycleState state) noexcept;

        /**
         * ModelLifecycle
         *
         * Sole owner of the published AnomalyModel.
         *
         *   UNFITTED --fit/load--> READY --invalidate/reset--> UNFITTED
         *
         * Design notes:
         *  - New models are built completely off to the side, then published
         *    by swapping one shared_ptr under m_mutex. Readers copy that
         *    pointer and keep scoring against it even if a swap follows.
         *  - Writers (fit, load, invalidate, reset) are serialized by
         *    m_writeMutex so persistence and publication stay in order.
         *  - Fitting is administrative; it is never triggered by a request.
         */
        class ModelLifecycle : public Anomaly::ModelSnapshotSource
        {
        public:
            /// Without a store the lifecycle is memory-only (tests, ad hoc runs).
            explicit ModelLifecycle(std::optional<ModelStore> store = std::nullopt);

            ModelLifecycle(const ModelLifecycle &)            = delete;
            ModelLifecycle &operator=(const ModelLifecycle &) = delete;

            /**
             * Fit, persist (if a store is configured), then publish.
             *
             * Idempotent: when the published model was already fitted on the
             * same corpus with the same parameters it is returned unchanged.
             * On any failure the previously published model stays in place.
             */
            std::shared_ptr<const Anomaly::AnomalyModel> fit(const std::vector<core::Embedding> &corpus,
                                                             const Anomaly::FitParams &params);

            /// fit() with default tree count, sample size and seed.
            std::shared_ptr<const Anomaly::AnomalyModel> fit(const std::vector<core::Embedding> &corpus,
                                                             double contamination);

            /**
             * Reconstruct the last persisted model and publish it.
             *
             * Returns std::nullopt when no artifact exists (or no store is
             * configured). Throws core::ModelCorrupt when the artifact cannot
             * be reconstructed; the current publication is left untouched.
             */
            std::optional<std::shared_ptr<const Anomaly::AnomalyModel>> load();

            /// Publish an already-built model (snapshot swap).
            void publish(std::shared_ptr<const Anomaly::AnomalyModel> model);

            /// Drop the published model. The persisted artifact is kept.
            void invalidate();

            /**
             * Administrative reset: invalidate() and delete the persisted
             * artifact, with no automatic refit. Returns true if an artifact
             * was deleted.
             */
            bool reset();

            LifecycleState state() const;

            /// Published snapshot or nullptr.
            std::shared_ptr<const Anomaly::AnomalyModel> current() const override;

            /**
             * True if the published model cannot serve embeddings of this
             * dimension, was fitted with another contamination, or on another
             * reference corpus. Also true when nothing is published.
             */
            bool needsRefit(std::size_t dimension,
                            double contamination,
                            std::uint64_t corpusFingerprint) const;

            /// Number of publications so far; bumps on every fit/load/publish.
            std::uint64_t generation() const;

            const std::optional<ModelStore> &store() const noexcept { return m_store; }

        private:
            void swapIn(std::shared_ptr<const Anomaly::AnomalyModel> model);

        private:
            std::optional<ModelStore>                     m_store;
            std::shared_ptr<const Anomaly::AnomalyModel>  m_current;
            std::uint64_t                                 m_generation = 0;

            mutable std::mutex                            m_mutex;        // guards m_current, m_generation
            std::mutex                                    m_writeMutex;   // serializes writers
        };

    } // namespace Lifecycle
} // namespace PromptGuard
