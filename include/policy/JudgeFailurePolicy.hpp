#pragma once

#include <optional>
#include <string_view>

namespace PromptGuard
{
    namespace Policy
    {
        /// What to do with an anomalous prompt when the judge cannot answer.
        enum class JudgeFailurePolicy
        {
            FailClosed,   // block: BLOCKED_JUDGE_UNAVAILABLE
            FailOpen      // allow: ALLOWED_JUDGE_UNAVAILABLE, never counted as an override
        };

        const char *toString(JudgeFailurePolicy policy) noexcept;

        /// "fail_closed"/"closed" and "fail_open"/"open"; case-insensitive, '-' accepted for '_'.
        std::optional<JudgeFailurePolicy> parseJudgeFailurePolicy(std::string_view text);

    } // namespace Policy
} // namespace PromptGuard
