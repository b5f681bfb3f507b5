#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include "core/Decision.hpp"

namespace PromptGuard
{
    namespace Report
    {
        /// Session counters, in the spirit of an operator dashboard.
        struct SessionSummary
        {
            std::size_t totalRequests    = 0;
            std::size_t allowed          = 0;
            std::size_t blocked          = 0;
            std::size_t overridden       = 0;
            std::size_t judgeInvocations = 0;
            std::map<core::ReasonCode, std::size_t> byReason;
        };

        /**
         * DecisionReporter
         *
         * Responsibilities:
         *  - Render decisions and visualization records as JSON lines for
         *    machine consumers (plotting, dashboards).
         *  - Keep session counters (no long-term audit trail).
         *
         * Design notes:
         *  - JSON is written by hand with RFC 8259 escaping; one object per line.
         *  - record() is thread-safe; rendering functions are pure.
         */
        class DecisionReporter
        {
        public:
            DecisionReporter() = default;

            DecisionReporter(const DecisionReporter &)            = delete;
            DecisionReporter &operator=(const DecisionReporter &) = delete;

            /// Add one decision to the session counters.
            void record(const core::Decision &decision);

            SessionSummary summary() const;

            void reset();

            /// {"prompt":..,"final_allowed":..,"reason_code":..,...}
            static std::string decisionToJson(const core::Decision &decision, std::string_view prompt);

            /// {"embedding":[..],"score":..,"threshold":..,"final_allowed":..,"overridden":..}
            static std::string visualizationToJson(const core::VisualizationRecord &record);

            /// Statistical stage only: {"prompt":..,"score":..,"threshold":..,"is_anomalous":..}
            static std::string verdictToJson(std::string_view prompt, const core::AnomalyVerdict &verdict);

            /// {"prompt":..,"error":..} for an input line that could not be scored.
            static std::string rejectionToJson(std::string_view prompt, std::string_view error);

            static std::string summaryToJson(const SessionSummary &summary);

            /// Human-readable block for the console.
            static void writeSummaryText(std::ostream &out, const SessionSummary &summary);

        private:
            SessionSummary     m_summary;
            mutable std::mutex m_mutex;
        };

    } // namespace Report
} // namespace PromptGuard
