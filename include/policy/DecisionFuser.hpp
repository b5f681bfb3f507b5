#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "anomaly/AnomalyScorer.hpp"
#include "core/Decision.hpp"
#include "core/Embedding.hpp"
#include "input/Embedder.hpp"
#include "judge/Judge.hpp"
#include "policy/CancellationToken.hpp"
#include "policy/JudgeFailurePolicy.hpp"
#include "policy/PromptRuleGuard.hpp"

namespace PromptGuard
{
    namespace Policy
    {
        struct FuserConfig
        {
            std::chrono::milliseconds judgeTimeout{8000};
            JudgeFailurePolicy        judgeFailurePolicy = JudgeFailurePolicy::FailClosed;

            /// Judge workers allowed to run at once, including ones still
            /// running after their request timed out. Past the cap a request
            /// gets the judge-failure policy without starting a worker.
            std::size_t               maxJudgeCallsInFlight = 8;
        };

        /// Per-request states, logged at DEBUG as the request advances.
        enum class FuserStage
        {
            Init,
            AnomalyChecked,
            ShortCircuitAllow,
            Judged,
            Final
        };

        const char *toString(FuserStage stage) noexcept;

        /**
         * DecisionFuser
         *
         * Combines the statistical verdict with the semantic judge into one
         * Decision per prompt:
         *
         *   INIT -> ANOMALY_CHECKED -> SHORT_CIRCUIT_ALLOW -> FINAL   (not anomalous: CLEAN)
         *                           -> JUDGED              -> FINAL   (anomalous)
         *
         * Guarantees:
         *  - The judge is consulted only for anomalous prompts.
         *  - Only a judge verdict can turn a statistical block into an allow.
         *  - Every failure maps to a blocking reason code, except a judge
         *    failure under FailOpen, which allows without an override.
         *  - Each request pins one model snapshot; a concurrent refit cannot
         *    mix models within a decision.
         *  - Cancellation while awaiting the judge throws core::RequestCancelled
         *    and produces no Decision.
         *
         * Stateless between requests; evaluate() may run on many threads.
         * Each judge call runs on its own worker so the request can give up
         * at the timeout. Workers are counted and capped by
         * maxJudgeCallsInFlight, and the destructor blocks until every
         * worker has returned, so a judge must eventually return.
         */
        class DecisionFuser
        {
        public:
            /**
             * `judge` is required. `embedder` may be null when callers only use
             * evaluateEmbedding(). `ruleGuard` may be null to disable the
             * banned-phrase pre-filter.
             */
            DecisionFuser(const Anomaly::ModelSnapshotSource &models,
                          std::shared_ptr<const Input::IEmbedder> embedder,
                          std::shared_ptr<Judge::IJudge> judge,
                          FuserConfig config = FuserConfig{},
                          std::shared_ptr<const PromptRuleGuard> ruleGuard = nullptr);

            ~DecisionFuser();

            DecisionFuser(const DecisionFuser &)            = delete;
            DecisionFuser &operator=(const DecisionFuser &) = delete;

            /// Full pipeline: rule guard, embedding, scoring, judge.
            core::Decision evaluate(const std::string &prompt,
                                    const CancellationToken *token = nullptr) const;

            /// Pipeline for a caller-supplied embedding: rule guard, scoring, judge.
            core::Decision evaluateEmbedding(const std::string &prompt,
                                             core::Embedding embedding,
                                             const CancellationToken *token = nullptr) const;

            const FuserConfig &config() const noexcept { return m_config; }

            /// Judge workers that have started and not yet returned.
            std::size_t judgeCallsInFlight() const;

        private:
            /// BLOCKED_RULE_VIOLATION decision if the prompt carries a banned phrase.
            std::optional<core::Decision> checkRules(const std::string &prompt) const;

            core::Decision evaluateScored(const std::string &prompt,
                                          core::Embedding embedding,
                                          const CancellationToken *token) const;

            core::Decision decide(const std::string &prompt,
                                  std::shared_ptr<const core::Embedding> embedding,
                                  const CancellationToken *token) const;

            core::Decision judgeAnomalous(const std::string &prompt,
                                          const core::AnomalyVerdict &verdict,
                                          std::shared_ptr<const core::Embedding> embedding,
                                          const CancellationToken *token) const;

            /// Judge call bounded by m_config.judgeTimeout; polls `token`.
            core::JudgeVerdict callJudge(const std::string &prompt,
                                         double anomalyScore,
                                         const CancellationToken *token) const;

            core::Decision finish(core::Decision decision, const std::string &prompt) const;

        private:
            struct JudgeCalls;

            const Anomaly::ModelSnapshotSource       &m_models;
            std::shared_ptr<const Input::IEmbedder>   m_embedder;
            std::shared_ptr<Judge::IJudge>            m_judge;
            FuserConfig                               m_config;
            std::shared_ptr<const PromptRuleGuard>    m_ruleGuard;
            std::shared_ptr<JudgeCalls>               m_calls;   // shared with running workers
        };

    } // namespace Policy
} // namespace PromptGuard
