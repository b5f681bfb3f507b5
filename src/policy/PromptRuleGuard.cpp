#include "policy/PromptRuleGuard.hpp"

#include <mutex>

#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Policy
    {
        std::vector<std::string> PromptRuleGuard::defaultPhrases()
        {
            return {
                "ignore previous instructions",
                "disregard the above",
                "system override",
                "drop table",
                "sudo rm -rf /",
            };
        }

        PromptRuleGuard::PromptRuleGuard()
            : PromptRuleGuard(defaultPhrases())
        {
        }

        PromptRuleGuard::PromptRuleGuard(const std::vector<std::string> &phrases)
        {
            setPhrases(phrases);
        }

        void PromptRuleGuard::setPhrases(const std::vector<std::string> &phrases)
        {
            std::vector<std::string> normalized;
            normalized.reserve(phrases.size());
            for (const auto &p : phrases)
            {
                const std::string_view t = Utils::trim(p);
                if (!t.empty())
                    normalized.push_back(Utils::toLower(t));
            }

            std::unique_lock<std::shared_mutex> lock(m_mutex);
            m_phrases = std::move(normalized);
        }

        std::vector<std::string> PromptRuleGuard::phrases() const
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            return m_phrases;
        }

        std::optional<PromptRuleGuard::RuleMatch> PromptRuleGuard::check(std::string_view prompt) const
        {
            const std::string lowered = Utils::toLower(prompt);

            std::shared_lock<std::shared_mutex> lock(m_mutex);
            for (const auto &phrase : m_phrases)
            {
                if (Utils::contains(lowered, phrase))
                    return RuleMatch{phrase};
            }
            return std::nullopt;
        }

    } // namespace Policy
} // namespace PromptGuard
