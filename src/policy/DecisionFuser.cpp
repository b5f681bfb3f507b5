#include "policy/DecisionFuser.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <exception>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace PromptGuard
{
    namespace Policy
    {
        using core::Decision;
        using core::ReasonCode;

        namespace
        {
            constexpr std::chrono::milliseconds kCancelPollInterval{10};

            std::string fmt(double value)
            {
                std::ostringstream oss;
                oss << std::fixed << std::setprecision(4) << value;
                return oss.str();
            }

            void logStage(FuserStage from, FuserStage to, const std::string &detail = {})
            {
                auto &logger = Utils::getLogger();
                if (!logger.isEnabled(Utils::LogLevel::DEBUG))
                    return;

                std::string line = std::string("Fuser ") + toString(from) + " -> " + toString(to);
                if (!detail.empty())
                    line += " (" + detail + ")";
                logger.debug(line);
            }
        } // namespace

        const char *toString(FuserStage stage) noexcept
        {
            switch (stage)
            {
            case FuserStage::Init:              return "INIT";
            case FuserStage::AnomalyChecked:    return "ANOMALY_CHECKED";
            case FuserStage::ShortCircuitAllow: return "SHORT_CIRCUIT_ALLOW";
            case FuserStage::Judged:            return "JUDGED";
            case FuserStage::Final:             return "FINAL";
            default:                            return "UNKNOWN";
            }
        }

        struct DecisionFuser::JudgeCalls
        {
            std::mutex              mutex;
            std::condition_variable idle;
            std::size_t             inFlight = 0;
        };

        DecisionFuser::DecisionFuser(const Anomaly::ModelSnapshotSource &models,
                                     std::shared_ptr<const Input::IEmbedder> embedder,
                                     std::shared_ptr<Judge::IJudge> judge,
                                     FuserConfig config,
                                     std::shared_ptr<const PromptRuleGuard> ruleGuard)
            : m_models(models),
              m_embedder(std::move(embedder)),
              m_judge(std::move(judge)),
              m_config(config),
              m_ruleGuard(std::move(ruleGuard)),
              m_calls(std::make_shared<JudgeCalls>())
        {
            if (!m_judge)
                throw std::invalid_argument("decision fuser requires a judge");
            if (m_config.judgeTimeout.count() <= 0)
                throw std::invalid_argument("judge timeout must be positive");
            if (m_config.maxJudgeCallsInFlight == 0)
                throw std::invalid_argument("at least one judge call must be allowed in flight");
        }

        DecisionFuser::~DecisionFuser()
        {
            std::unique_lock<std::mutex> lock(m_calls->mutex);
            if (m_calls->inFlight > 0)
            {
                Utils::getLogger().debug("Waiting for " + std::to_string(m_calls->inFlight) +
                                         " judge call(s) to return");
            }
            m_calls->idle.wait(lock, [this] { return m_calls->inFlight == 0; });
        }

        std::size_t DecisionFuser::judgeCallsInFlight() const
        {
            std::lock_guard<std::mutex> lock(m_calls->mutex);
            return m_calls->inFlight;
        }

        std::optional<Decision> DecisionFuser::checkRules(const std::string &prompt) const
        {
            if (!m_ruleGuard)
                return std::nullopt;

            const auto match = m_ruleGuard->check(prompt);
            if (!match)
                return std::nullopt;

            return finish(Decision(ReasonCode::BlockedRuleViolation, std::nullopt, std::nullopt,
                                   "Request blocked by rule-based filter. Found banned phrase \"" +
                                       match->phrase + "\"."),
                          prompt);
        }

        Decision DecisionFuser::evaluate(const std::string &prompt, const CancellationToken *token) const
        {
            if (auto blocked = checkRules(prompt))
                return std::move(*blocked);

            if (!m_embedder)
            {
                return finish(Decision(ReasonCode::BlockedEmbeddingFailed, std::nullopt, std::nullopt,
                                       "No embedder is configured; the prompt cannot be scored."),
                              prompt);
            }

            core::Embedding embedding;
            try
            {
                embedding = m_embedder->embed(prompt);
            }
            catch (const std::exception &e)
            {
                Utils::getLogger().warn(std::string("Embedding failed: ") + e.what());
                return finish(Decision(ReasonCode::BlockedEmbeddingFailed, std::nullopt, std::nullopt,
                                       std::string("Embedding failed: ") + e.what()),
                              prompt);
            }

            return evaluateScored(prompt, std::move(embedding), token);
        }

        Decision DecisionFuser::evaluateEmbedding(const std::string &prompt,
                                                  core::Embedding embedding,
                                                  const CancellationToken *token) const
        {
            if (auto blocked = checkRules(prompt))
                return std::move(*blocked);

            return evaluateScored(prompt, std::move(embedding), token);
        }

        Decision DecisionFuser::evaluateScored(const std::string &prompt,
                                               core::Embedding embedding,
                                               const CancellationToken *token) const
        {
            auto shared = std::make_shared<const core::Embedding>(std::move(embedding));

            try
            {
                return finish(decide(prompt, std::move(shared), token), prompt);
            }
            catch (const core::RequestCancelled &)
            {
                Utils::getLogger().info("Request cancelled while awaiting judge: \"" +
                                        Utils::previewForLog(prompt) + "\"");
                throw;
            }
            catch (const std::exception &e)
            {
                Utils::getLogger().error(std::string("Internal fault in decision pipeline: ") + e.what());
                return finish(Decision(ReasonCode::BlockedInternalFault, std::nullopt, std::nullopt,
                                       std::string("Internal fault: ") + e.what()),
                              prompt);
            }
        }

        Decision DecisionFuser::decide(const std::string &prompt,
                                       std::shared_ptr<const core::Embedding> embedding,
                                       const CancellationToken *token) const
        {
            // One snapshot for the whole request.
            const auto model = m_models.current();
            if (!model)
            {
                return Decision(ReasonCode::BlockedModelNotReady, std::nullopt, std::nullopt,
                                "Anomaly model is not fitted; run a fit before serving requests.",
                                std::move(embedding));
            }

            std::optional<core::AnomalyVerdict> verdict;
            try
            {
                verdict = Anomaly::AnomalyScorer::scoreWith(*model, *embedding);
            }
            catch (const core::DimensionMismatch &e)
            {
                Utils::getLogger().error(e.what());
                return Decision(ReasonCode::BlockedDimensionMismatch, std::nullopt, std::nullopt,
                                std::string("Embedding rejected: ") + e.what(), std::move(embedding));
            }

            logStage(FuserStage::Init, FuserStage::AnomalyChecked,
                     "score=" + fmt(verdict->score()) + ", threshold=" + fmt(verdict->threshold()));

            if (!verdict->isAnomalous())
            {
                logStage(FuserStage::AnomalyChecked, FuserStage::ShortCircuitAllow);
                return Decision(ReasonCode::Clean, verdict, std::nullopt,
                                "No anomaly detected (score " + fmt(verdict->score()) +
                                    " >= threshold " + fmt(verdict->threshold()) + ").",
                                std::move(embedding));
            }

            return judgeAnomalous(prompt, *verdict, std::move(embedding), token);
        }

        Decision DecisionFuser::judgeAnomalous(const std::string &prompt,
                                               const core::AnomalyVerdict &verdict,
                                               std::shared_ptr<const core::Embedding> embedding,
                                               const CancellationToken *token) const
        {
            auto &logger = Utils::getLogger();
            logger.debug("Anomaly detected (score " + fmt(verdict.score()) + "); asking judge for a second opinion");

            std::optional<core::JudgeVerdict> judged;
            std::string failure;
            try
            {
                judged = callJudge(prompt, verdict.score(), token);
            }
            catch (const core::RequestCancelled &)
            {
                throw;
            }
            catch (const core::JudgeUnavailable &e)
            {
                failure = e.what();
            }
            catch (const std::exception &e)
            {
                failure = std::string("judge failed: ") + e.what();
            }

            if (!judged)
            {
                logger.warn("Judge unavailable, applying " + std::string(toString(m_config.judgeFailurePolicy)) +
                            " policy: " + failure);

                if (m_config.judgeFailurePolicy == JudgeFailurePolicy::FailOpen)
                {
                    return Decision(ReasonCode::AllowedJudgeUnavailable, verdict, std::nullopt,
                                    "Anomaly was detected but the judge was unavailable (" + failure +
                                        "); allowed by fail-open policy.",
                                    std::move(embedding));
                }
                return Decision(ReasonCode::BlockedJudgeUnavailable, verdict, std::nullopt,
                                "Anomaly was detected and the judge was unavailable (" + failure +
                                    "); blocked by fail-closed policy.",
                                std::move(embedding));
            }

            logStage(FuserStage::AnomalyChecked, FuserStage::Judged,
                     std::string("allowed=") + (judged->allowed() ? "true" : "false"));

            const std::string threat = judged->threatType() ? " Threat type: " + *judged->threatType() + "." : "";

            if (judged->allowed())
            {
                logger.debug("Override triggered: judge deemed the anomalous prompt safe");
                return Decision(ReasonCode::OverriddenSafe, verdict, judged,
                                "Anomaly was detected but overridden by context analysis. Judge reason: " +
                                    judged->rationale(),
                                std::move(embedding));
            }

            logger.debug("Override rejected: judge confirmed the prompt is unsafe");
            return Decision(ReasonCode::BlockedConfirmed, verdict, judged,
                            "Anomaly was detected and confirmed by context analysis. Judge reason: " +
                                judged->rationale() + threat,
                            std::move(embedding));
        }

        core::JudgeVerdict DecisionFuser::callJudge(const std::string &prompt,
                                                    double anomalyScore,
                                                    const CancellationToken *token) const
        {
            Utils::Stopwatch sw;

            {
                std::lock_guard<std::mutex> lock(m_calls->mutex);
                if (m_calls->inFlight >= m_config.maxJudgeCallsInFlight)
                {
                    throw core::JudgeUnavailable("judge saturated: " + std::to_string(m_calls->inFlight) +
                                                 " calls still in flight");
                }
                ++m_calls->inFlight;
            }

            // The worker owns copies of everything it touches, so it can outlive
            // this request after a timeout or cancellation. It drops them before
            // giving its slot back; the destructor waits for every slot.
            auto promise = std::make_shared<std::promise<core::JudgeVerdict>>();
            std::future<core::JudgeVerdict> future = promise->get_future();

            try
            {
                std::thread([judge = m_judge, promise, prompt, anomalyScore, calls = m_calls]() mutable {
                    try
                    {
                        promise->set_value(judge->judge(prompt, anomalyScore));
                    }
                    catch (...)
                    {
                        promise->set_exception(std::current_exception());
                    }
                    judge.reset();
                    promise.reset();

                    std::lock_guard<std::mutex> lock(calls->mutex);
                    --calls->inFlight;
                    calls->idle.notify_all();
                }).detach();
            }
            catch (const std::system_error &e)
            {
                {
                    std::lock_guard<std::mutex> lock(m_calls->mutex);
                    --m_calls->inFlight;
                }
                m_calls->idle.notify_all();
                throw core::JudgeUnavailable(std::string("cannot start judge worker: ") + e.what());
            }

            const auto deadline = Utils::SteadyClock::now() + m_config.judgeTimeout;
            for (;;)
            {
                if (token && token->isCancelled())
                    throw core::RequestCancelled();

                const auto now = Utils::SteadyClock::now();
                if (now >= deadline)
                {
                    throw core::JudgeUnavailable("no reply within " +
                                                 std::to_string(m_config.judgeTimeout.count()) + " ms");
                }

                auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                if (token)
                    slice = std::min(slice, kCancelPollInterval);
                if (slice.count() <= 0)
                    slice = std::chrono::milliseconds(1);

                if (future.wait_for(slice) == std::future_status::ready)
                    break;
            }

            core::JudgeVerdict verdict = future.get();
            if (!verdict.latencyMs())
                verdict = verdict.withLatency(sw.elapsedMillis());
            return verdict;
        }

        Decision DecisionFuser::finish(Decision decision, const std::string &prompt) const
        {
            auto &logger = Utils::getLogger();

            std::ostringstream line;
            line << "Decision " << core::toString(decision.reasonCode())
                 << " allowed=" << (decision.finalAllowed() ? "true" : "false")
                 << " overridden=" << (decision.overridden() ? "true" : "false");
            if (decision.anomalyVerdict())
            {
                line << " score=" << fmt(decision.anomalyVerdict()->score())
                     << " threshold=" << fmt(decision.anomalyVerdict()->threshold());
            }
            if (decision.judgeVerdict() && decision.judgeVerdict()->latencyMs())
                line << " judge_ms=" << fmt(*decision.judgeVerdict()->latencyMs());
            line << " prompt=\"" << Utils::previewForLog(prompt) << "\"";

            logStage(decision.judgeVerdict() ? FuserStage::Judged
                     : decision.anomalyVerdict() && !decision.anomalyVerdict()->isAnomalous()
                         ? FuserStage::ShortCircuitAllow
                         : FuserStage::AnomalyChecked,
                     FuserStage::Final);
            logger.info(line.str());
            return decision;
        }

    } // namespace Policy
} // namespace PromptGuard
