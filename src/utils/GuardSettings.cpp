#include "utils/GuardSettings.hpp"

#include <algorithm>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Utils
    {
        namespace
        {
            void warnInvalid(std::string_view key, const std::string &raw, const std::string &fallback)
            {
                getLogger().warn("Invalid value '" + raw + "' for " + std::string(key) +
                                 "; using default " + fallback);
            }

            /// Positive integer setting; keeps `target` when absent or invalid.
            void readCount(const ConfigLoader &config, std::string_view key, std::int64_t minimum,
                           std::size_t &target)
            {
                const auto raw = config.getString(key);
                if (!raw)
                    return;

                const auto value = config.getInt(key);
                if (!value || *value < minimum)
                {
                    warnInvalid(key, *raw, std::to_string(target));
                    return;
                }
                target = static_cast<std::size_t>(*value);
            }
        } // anonymous namespace

        GuardSettings GuardSettings::fromConfig(const ConfigLoader &config)
        {
            GuardSettings s;

            if (auto v = config.getString("model_path"); v && !v->empty())
                s.modelPath = *v;

            if (auto raw = config.getString("contamination"))
            {
                const auto value = config.getDouble("contamination");
                if (value && *value > 0.0 && *value < 1.0)
                    s.contamination = *value;
                else
                    warnInvalid("contamination", *raw, std::to_string(s.contamination));
            }

            readCount(config, "tree_count", 1, s.treeCount);
            readCount(config, "max_samples", 2, s.maxSamples);
            readCount(config, "embedding_dimension", 1, s.embeddingDimension);

            if (auto raw = config.getString("seed"))
            {
                const auto value = config.getInt("seed");
                if (value && *value >= 0)
                    s.seed = static_cast<std::uint64_t>(*value);
                else
                    warnInvalid("seed", *raw, std::to_string(s.seed));
            }

            s.judgeCommand = config.getStringOr("judge_command", "");

            if (auto raw = config.getString("judge_timeout_ms"))
            {
                const auto value = config.getInt("judge_timeout_ms");
                if (value && *value > 0)
                    s.judgeTimeout = std::chrono::milliseconds(*value);
                else
                    warnInvalid("judge_timeout_ms", *raw, std::to_string(s.judgeTimeout.count()));
            }

            if (auto raw = config.getString("judge_failure_policy"))
            {
                if (auto policy = Policy::parseJudgeFailurePolicy(*raw))
                    s.judgeFailurePolicy = *policy;
                else
                    warnInvalid("judge_failure_policy", *raw, Policy::toString(s.judgeFailurePolicy));
            }

            readCount(config, "judge_max_in_flight", 1, s.judgeMaxInFlight);

            if (auto raw = config.getString("rule_guard_enabled"))
            {
                if (auto value = config.getBool("rule_guard_enabled"))
                    s.ruleGuardEnabled = *value;
                else
                    warnInvalid("rule_guard_enabled", *raw, "true");
            }

            s.bannedPhrases = config.getList("banned_phrases");

            if (auto raw = config.getString("log_level"))
            {
                if (parseLogLevel(*raw))
                    s.logLevel = toLower(*raw);
                else
                    warnInvalid("log_level", *raw, s.logLevel);
            }

            s.logFile = config.getStringOr("log_file", "");
            return s;
        }

        std::chrono::milliseconds GuardSettings::commandJudgeTimeout() const noexcept
        {
            using std::chrono::milliseconds;
            // A fifth of the budget, at most 250 ms, is left for fork, reaping and the hand-off.
            const milliseconds margin = std::max(milliseconds(1), std::min(milliseconds(250), judgeTimeout / 5));
            return std::max(milliseconds(1), judgeTimeout - margin);
        }

    } // namespace Utils
} // namespace PromptGuard
