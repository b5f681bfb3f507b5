#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <vector>

#include "anomaly/IsolationForest.hpp"
#include "core/Embedding.hpp"
#include "core/Verdict.hpp"
#include "utils/TimeUtils.hpp"

namespace PromptGuard
{
    namespace Anomaly
    {
        /**
         * Parameters of a fit. Two fits with equal FitParams over the same
         * corpus produce identical forests, thresholds and fingerprints.
         */
        struct FitParams
        {
            double        contamination = 0.005;   ///< Expected outlier fraction, in (0, 1).
            std::size_t   treeCount     = 200;
            std::size_t   maxSamples    = 256;
            std::uint64_t seed          = 42;
        };

        /**
         * AnomalyModel
         *
         * Immutable fitted state of the statistical stage ("the brain"):
         * an isolation forest plus the decision threshold derived from the
         * contamination parameter at fit time.
         *
         * Design notes:
         *  - Only ever handed out as std::shared_ptr<const AnomalyModel>;
         *    concurrent scorers share one instance without locking.
         *  - The threshold is the contamination-quantile (linear interpolation)
         *    of the scores of the fitting corpus. It is never recalibrated.
         *  - fingerprint() hashes the canonical serialization minus the fit
         *    timestamp, so it identifies the model's scoring behaviour.
         */
        class AnomalyModel
        {
        public:
            static constexpr int kFormatVersion = 1;

            struct Metadata
            {
                FitParams        params;
                std::size_t      dimension         = 0;
                std::size_t      corpusSize        = 0;
                std::uint64_t    corpusFingerprint = 0;
                double           threshold         = 0.0;
                Utils::TimePoint fittedAt{};
            };

            AnomalyModel(IsolationForest forest, Metadata metadata);

            /**
             * Fit over a reference corpus of known-benign embeddings.
             *
             * Throws std::invalid_argument if contamination is outside (0, 1),
             * the corpus has fewer than 2 embeddings, or embeddings are
             * ragged or non-finite.
             */
            static std::shared_ptr<const AnomalyModel> fit(const std::vector<core::Embedding>& corpus,
                                                           const FitParams& params);

            /**
             * Score one embedding. Deterministic and side-effect free.
             * Throws core::DimensionMismatch if the length differs from dimension().
             */
            core::AnomalyVerdict score(const core::Embedding& embedding) const;

            /// Raw score without building a verdict; same precondition as score().
            double rawScore(const core::Embedding& embedding) const;

            std::size_t dimension() const noexcept { return m_meta.dimension; }
            std::size_t corpusSize() const noexcept { return m_meta.corpusSize; }
            std::uint64_t corpusFingerprint() const noexcept { return m_meta.corpusFingerprint; }
            double contamination() const noexcept { return m_meta.params.contamination; }
            double threshold() const noexcept { return m_meta.threshold; }
            const FitParams& params() const noexcept { return m_meta.params; }
            Utils::TimePoint fittedAt() const noexcept { return m_meta.fittedAt; }
            std::uint64_t fingerprint() const noexcept { return m_fingerprint; }
            const IsolationForest& forest() const noexcept { return m_forest; }

            /**
             * True if this model was fitted with exactly these inputs, i.e. a
             * refit would reproduce it and can be skipped.
             */
            bool fittedWith(std::size_t dimension,
                            std::uint64_t corpusFingerprint,
                            const FitParams& params) const noexcept;

            /**
             * Versioned text artifact ("PROMPTGUARD-MODEL 1"), closed by an
             * FNV-1a checksum line over everything before it.
             */
            void serialize(std::ostream& out) const;

            /**
             * Inverse of serialize(). Throws core::ModelCorrupt for anything
             * unreadable: bad magic/version, truncation, checksum mismatch,
             * inconsistent header or tree structure.
             */
            static std::shared_ptr<const AnomalyModel> deserialize(std::istream& in);

        private:
            void writeBody(std::ostream& out, bool includeTimestamp) const;

        private:
            IsolationForest m_forest;
            Metadata        m_meta;
            std::uint64_t   m_fingerprint = 0;
        };

        /**
         * Linear-interpolation quantile (numpy's default) of unsorted values.
         * q in [0, 1]; values must be non-empty.
         */
        double quantile(std::vector<double> values, double q);

    } // namespace Anomaly
} // namespace PromptGuard
