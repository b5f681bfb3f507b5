// Immutable verdict records produced by the two decision stages:
// the statistical anomaly scorer and the semantic judge.

#ifndef CORE_VERDICT_HPP
#define CORE_VERDICT_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace core
{

/**
 * @brief Output of the statistical stage for one embedding.
 *
 * Convention: lower score = more anomalous. The score is the negated
 * isolation-forest anomaly measure, so it lies in [-1, 0). The threshold
 * is fixed when the model is fitted and travels with the verdict so a
 * decision can be explained without the model at hand.
 */
class AnomalyVerdict
{
public:
    AnomalyVerdict(double score,
                   double threshold,
                   std::uint64_t modelFingerprint) noexcept
        : m_score(score),
          m_threshold(threshold),
          m_isAnomalous(score < threshold),
          m_modelFingerprint(modelFingerprint)
    {
    }

    double score() const noexcept { return m_score; }

    /// Threshold used for this decision (contamination quantile at fit time).
    double threshold() const noexcept { return m_threshold; }

    /// True iff score() < threshold().
    bool isAnomalous() const noexcept { return m_isAnomalous; }

    /**
     * @brief Signed distance to the threshold; negative means anomalous.
     *
     * This is the value operators usually quote ("decision function").
     */
    double margin() const noexcept { return m_score - m_threshold; }

    /// Identifies the model snapshot that produced this verdict.
    std::uint64_t modelFingerprint() const noexcept { return m_modelFingerprint; }

private:
    double        m_score;
    double        m_threshold;
    bool          m_isAnomalous;
    std::uint64_t m_modelFingerprint;
};

/**
 * @brief Output of the semantic judge for one prompt.
 */
class JudgeVerdict
{
public:
    JudgeVerdict(bool allowed,
                 std::string rationale,
                 std::optional<double> latencyMs = std::nullopt,
                 std::optional<std::string> threatType = std::nullopt)
        : m_allowed(allowed),
          m_rationale(std::move(rationale)),
          m_latencyMs(latencyMs),
          m_threatType(std::move(threatType))
    {
    }

    bool allowed() const noexcept { return m_allowed; }

    const std::string& rationale() const noexcept { return m_rationale; }

    /// Wall time of the judge round trip, when the binding measured it.
    const std::optional<double>& latencyMs() const noexcept { return m_latencyMs; }

    /// Threat label reported by the judge model ("social_engineering", ...).
    const std::optional<std::string>& threatType() const noexcept { return m_threatType; }

    /// Copy with the latency filled in; the binding that timed the call uses this.
    JudgeVerdict withLatency(double latencyMs) const
    {
        return JudgeVerdict(m_allowed, m_rationale, latencyMs, m_threatType);
    }

private:
    bool                       m_allowed;
    std::string                m_rationale;
    std::optional<double>      m_latencyMs;
    std::optional<std::string> m_threatType;
};

} // namespace core

#endif // CORE_VERDICT_HPP
