// Core data model for the final gateway verdict on one prompt.
// A Decision is created once per request by the decision fuser and is
// never mutated afterwards; reporting and visualization consumers only
// read it.

#ifndef CORE_DECISION_HPP
#define CORE_DECISION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "core/Embedding.hpp"
#include "core/Verdict.hpp"

namespace core
{

/**
 * @brief Closed set of explanations for a final verdict.
 *
 * Exactly three codes allow a prompt (Clean, OverriddenSafe and the
 * opt-in AllowedJudgeUnavailable); everything else blocks.
 */
enum class ReasonCode : std::uint8_t
{
    Clean = 0,                ///< Not anomalous; judge never consulted.
    OverriddenSafe,           ///< Anomalous, judge deemed it benign.
    BlockedConfirmed,         ///< Anomalous, judge confirmed the threat.
    BlockedJudgeUnavailable,  ///< Anomalous, judge failed; fail-closed policy.
    AllowedJudgeUnavailable,  ///< Anomalous, judge failed; fail-open policy.
    BlockedRuleViolation,     ///< Banned phrase matched before scoring.
    BlockedModelNotReady,     ///< No fitted model published (or corrupt artifact).
    BlockedDimensionMismatch, ///< Embedding length does not match the model.
    BlockedEmbeddingFailed,   ///< Embedder could not produce a vector.
    BlockedInternalFault      ///< Any other failure inside the pipeline.
};

/// "CLEAN", "OVERRIDDEN_SAFE", ...
const char* toString(ReasonCode code) noexcept;

/// Inverse of toString(); std::nullopt for unknown text.
std::optional<ReasonCode> parseReasonCode(std::string_view text) noexcept;

/// True for the codes that let a prompt through.
bool isAllowing(ReasonCode code) noexcept;

/**
 * @brief Read-only projection handed to the external plotting collaborator.
 *
 * The core never projects or renders; it only exposes what a plot needs.
 */
struct VisualizationRecord
{
    Embedding      embedding;
    AnomalyVerdict anomalyVerdict;
    bool           finalAllowed;
    bool           overridden;
};

/**
 * @brief Final verdict for one prompt.
 *
 * Invariants (enforced by the constructor):
 *  - overridden() is derived, never supplied: it is true iff the anomaly
 *    verdict flagged the prompt, a judge verdict is present and allowed
 *    it, and the decision allows the prompt.
 *  - finalAllowed() agrees with isAllowing(reasonCode()).
 *  - Clean requires a non-anomalous verdict and no judge verdict;
 *    OverriddenSafe / BlockedConfirmed require an anomalous verdict and
 *    a judge verdict that agrees with them.
 *
 * Violations throw std::invalid_argument; they indicate a bug in the fuser.
 */
class Decision
{
public:
    Decision(ReasonCode reasonCode,
             std::optional<AnomalyVerdict> anomalyVerdict,
             std::optional<JudgeVerdict> judgeVerdict,
             std::string explanation,
             std::shared_ptr<const Embedding> embedding = nullptr);

    Decision(const Decision&)            = default;
    Decision(Decision&&) noexcept        = default;
    Decision& operator=(const Decision&) = default;
    Decision& operator=(Decision&&) noexcept = default;

    bool finalAllowed() const noexcept { return m_finalAllowed; }

    bool overridden() const noexcept { return m_overridden; }

    ReasonCode reasonCode() const noexcept { return m_reasonCode; }

    /**
     * @brief Statistical verdict.
     *
     * Absent only when the pipeline stopped before scoring
     * (rule violation, embedding failure, model or dimension fault).
     */
    const std::optional<AnomalyVerdict>& anomalyVerdict() const noexcept { return m_anomalyVerdict; }

    /// Present only if the judge was invoked and answered.
    const std::optional<JudgeVerdict>& judgeVerdict() const noexcept { return m_judgeVerdict; }

    /// Human-readable sentence suitable for an operator console.
    const std::string& explanation() const noexcept { return m_explanation; }

    /// Embedding the verdict was computed on; null when none was produced.
    const std::shared_ptr<const Embedding>& embedding() const noexcept { return m_embedding; }

    /**
     * @brief Plotting projection; std::nullopt if the prompt was never scored.
     */
    std::optional<VisualizationRecord> visualizationRecord() const;

private:
    bool                             m_finalAllowed{false};
    bool                             m_overridden{false};
    ReasonCode                       m_reasonCode{ReasonCode::BlockedInternalFault};
    std::optional<AnomalyVerdict>    m_anomalyVerdict;
    std::optional<JudgeVerdict>      m_judgeVerdict;
    std::string                      m_explanation;
    std::shared_ptr<const Embedding> m_embedding;
};

} // namespace core

#endif // CORE_DECISION_HPP
