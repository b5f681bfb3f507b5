#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "policy/JudgeFailurePolicy.hpp"
#include "utils/ConfigLoader.hpp"

namespace PromptGuard
{
    namespace Utils
    {
        /**
         * GuardSettings
         *
         * Typed view of the gateway configuration. Every field has a usable
         * default; fromConfig() overrides what the file provides and keeps the
         * default (with a WARN line) for values that do not parse or are out
         * of range.
         *
         *   model_path           = models/promptguard.model
         *   contamination        = 0.005
         *   tree_count           = 200
         *   max_samples          = 256
         *   seed                 = 42
         *   embedding_dimension  = 384
         *   judge_command        = ./scripts/judge.sh
         *   judge_timeout_ms     = 8000
         *   judge_failure_policy = fail_closed
         *   judge_max_in_flight  = 8
         *   rule_guard_enabled   = true
         *   banned_phrases       = drop table, system override
         *   log_level            = info
         *   log_file             =
         */
        struct GuardSettings
        {
            std::string               modelPath          = "models/promptguard.model";
            double                    contamination      = 0.005;
            std::size_t               treeCount          = 200;
            std::size_t               maxSamples         = 256;
            std::uint64_t             seed               = 42;
            std::size_t               embeddingDimension = 384;
            std::string               judgeCommand;
            std::chrono::milliseconds judgeTimeout{8000};
            Policy::JudgeFailurePolicy judgeFailurePolicy = Policy::JudgeFailurePolicy::FailClosed;
            std::size_t               judgeMaxInFlight   = 8;
            bool                      ruleGuardEnabled   = true;

            /// std::nullopt means "use the built-in phrase list".
            std::optional<std::vector<std::string>> bannedPhrases;

            std::string               logLevel = "info";
            std::string               logFile;

            static GuardSettings fromConfig(const ConfigLoader &config);

            /**
             * Deadline for the judge command itself. Shorter than judgeTimeout
             * so the child is killed and reaped before the request gives up
             * on the judge worker.
             */
            std::chrono::milliseconds commandJudgeTimeout() const noexcept;
        };

    } // namespace Utils
} // namespace PromptGuard
