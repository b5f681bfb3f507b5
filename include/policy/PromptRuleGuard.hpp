#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace PromptGuard
{
    namespace Policy
    {
        /**
         * PromptRuleGuard
         *
         * Cheap deterministic pre-filter that runs before embedding.
         *
         * Responsibilities:
         *  - Match prompts case-insensitively against a list of banned phrases.
         *  - Report which phrase matched so the block is explainable.
         *
         * Design notes:
         *  - Phrases are stored lowercased; matching lowercases the prompt once.
         *  - Shared mutex: many concurrent check() calls, rare setPhrases().
         *  - An empty phrase list never matches.
         */
        class PromptRuleGuard
        {
        public:
            struct RuleMatch
            {
                std::string phrase;   ///< The banned phrase as configured (lowercased).
            };

            /// "ignore previous instructions", "drop table", ...
            static std::vector<std::string> defaultPhrases();

            PromptRuleGuard();

            explicit PromptRuleGuard(const std::vector<std::string> &phrases);

            PromptRuleGuard(const PromptRuleGuard &)            = delete;
            PromptRuleGuard &operator=(const PromptRuleGuard &) = delete;

            /// Replace the phrase list (hot reload). Blank entries are dropped.
            void setPhrases(const std::vector<std::string> &phrases);

            std::vector<std::string> phrases() const;

            /// First banned phrase contained in the prompt, if any.
            std::optional<RuleMatch> check(std::string_view prompt) const;

        private:
            std::vector<std::string>  m_phrases;
            mutable std::shared_mutex m_mutex;
        };

    } // namespace Policy
} // namespace PromptGuard
