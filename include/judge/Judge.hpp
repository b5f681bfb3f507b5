#pragma once

#include <string>

#include "core/Verdict.hpp"

namespace PromptGuard
{
    namespace Judge
    {
        /**
         * IJudge
         *
         * Boundary to the semantic judge: a context-aware model that decides
         * whether a statistically unusual prompt is benign.
         *
         *  - Called only for prompts the anomaly stage flagged.
         *  - Must either return a verdict or raise core::JudgeUnavailable.
         *  - May be called from several worker threads at once.
         *
         * The caller enforces the timeout; an implementation that can bound
         * its own I/O (CommandJudge) should do so as well.
         */
        class IJudge
        {
        public:
            virtual ~IJudge() = default;

            virtual core::JudgeVerdict judge(const std::string &promptText, double anomalyScore) = 0;
        };

    } // namespace Judge
} // namespace PromptGuard
