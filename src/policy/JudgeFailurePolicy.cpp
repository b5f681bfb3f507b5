#include "policy/JudgeFailurePolicy.hpp"

#include <algorithm>
#include <string>

#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Policy
    {
        const char *toString(JudgeFailurePolicy policy) noexcept
        {
            switch (policy)
            {
            case JudgeFailurePolicy::FailClosed: return "fail_closed";
            case JudgeFailurePolicy::FailOpen:   return "fail_open";
            default:                             return "unknown";
            }
        }

        std::optional<JudgeFailurePolicy> parseJudgeFailurePolicy(std::string_view text)
        {
            std::string norm = Utils::toLower(Utils::trim(text));
            std::replace(norm.begin(), norm.end(), '-', '_');

            if (norm == "fail_closed" || norm == "closed")
                return JudgeFailurePolicy::FailClosed;
            if (norm == "fail_open" || norm == "open")
                return JudgeFailurePolicy::FailOpen;
            return std::nullopt;
        }

    } // namespace Policy
} // namespace PromptGuard
