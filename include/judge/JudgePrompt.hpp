#pragma once

#include <string>
#include <string_view>

#include "core/Verdict.hpp"

namespace PromptGuard
{
    namespace Judge
    {
        /**
         * JudgePrompt
         *
         * Wire protocol with a generative judge model.
         *
         * Request: a firewall instruction that asks the model to tell
         * malicious actions (hacking, social engineering, destroying data)
         * apart from safe context (research, storytelling, education), with
         * the anomaly score as context, followed by the user prompt.
         *
         * Reply: one JSON object
         *   {"is_safe": bool, "threat_type": str, "reason": str}
         * optionally wrapped in markdown code fences or surrounded by prose.
         */
        class JudgePrompt
        {
        public:
            /// Full text sent to the judge model.
            static std::string build(std::string_view promptText, double anomalyScore);

            /// Drop ``` / ```json fences and surrounding whitespace.
            static std::string stripCodeFences(std::string_view reply);

            /**
             * Parse a raw model reply into a verdict.
             *
             * "is_safe" must be a JSON boolean. A missing "reason" becomes a
             * placeholder rationale; "threat_type" is optional. Anything else
             * (empty reply, invalid JSON, wrong types) throws
             * core::JudgeUnavailable.
             */
            static core::JudgeVerdict parseReply(std::string_view reply);
        };

    } // namespace Judge
} // namespace PromptGuard
