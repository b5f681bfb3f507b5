#include "core/Decision.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace core
{

namespace
{
    struct ReasonName
    {
        ReasonCode  code;
        const char* name;
    };

    constexpr std::array<ReasonName, 10> kReasonNames{{
        {ReasonCode::Clean,                    "CLEAN"},
        {ReasonCode::OverriddenSafe,           "OVERRIDDEN_SAFE"},
        {ReasonCode::BlockedConfirmed,         "BLOCKED_CONFIRMED"},
        {ReasonCode::BlockedJudgeUnavailable,  "BLOCKED_JUDGE_UNAVAILABLE"},
        {ReasonCode::AllowedJudgeUnavailable,  "ALLOWED_JUDGE_UNAVAILABLE"},
        {ReasonCode::BlockedRuleViolation,     "BLOCKED_RULE_VIOLATION"},
        {ReasonCode::BlockedModelNotReady,     "BLOCKED_MODEL_NOT_READY"},
        {ReasonCode::BlockedDimensionMismatch, "BLOCKED_DIMENSION_MISMATCH"},
        {ReasonCode::BlockedEmbeddingFailed,   "BLOCKED_EMBEDDING_FAILED"},
        {ReasonCode::BlockedInternalFault,     "BLOCKED_INTERNAL_FAULT"},
    }};

    void require(bool condition, const char* what)
    {
        if (!condition)
            throw std::invalid_argument(std::string("inconsistent decision: ") + what);
    }
} // anonymous namespace

const char* toString(ReasonCode code) noexcept
{
    for (const auto& entry : kReasonNames)
    {
        if (entry.code == code)
            return entry.name;
    }
    return "UNKNOWN";
}

std::optional<ReasonCode> parseReasonCode(std::string_view text) noexcept
{
    for (const auto& entry : kReasonNames)
    {
        if (text == entry.name)
            return entry.code;
    }
    return std::nullopt;
}

bool isAllowing(ReasonCode code) noexcept
{
    return code == ReasonCode::Clean ||
           code == ReasonCode::OverriddenSafe ||
           code == ReasonCode::AllowedJudgeUnavailable;
}

Decision::Decision(ReasonCode reasonCode,
                   std::optional<AnomalyVerdict> anomalyVerdict,
                   std::optional<JudgeVerdict> judgeVerdict,
                   std::string explanation,
                   std::shared_ptr<const Embedding> embedding)
    : m_finalAllowed(isAllowing(reasonCode)),
      m_reasonCode(reasonCode),
      m_anomalyVerdict(std::move(anomalyVerdict)),
      m_judgeVerdict(std::move(judgeVerdict)),
      m_explanation(std::move(explanation)),
      m_embedding(std::move(embedding))
{
    const bool flagged = m_anomalyVerdict && m_anomalyVerdict->isAnomalous();

    switch (m_reasonCode)
    {
    case ReasonCode::Clean:
        require(m_anomalyVerdict.has_value() && !flagged, "CLEAN needs a non-anomalous verdict");
        require(!m_judgeVerdict, "CLEAN never consults the judge");
        break;
    case ReasonCode::OverriddenSafe:
        require(flagged, "OVERRIDDEN_SAFE needs an anomalous verdict");
        require(m_judgeVerdict && m_judgeVerdict->allowed(), "OVERRIDDEN_SAFE needs an allowing judge verdict");
        break;
    case ReasonCode::BlockedConfirmed:
        require(flagged, "BLOCKED_CONFIRMED needs an anomalous verdict");
        require(m_judgeVerdict && !m_judgeVerdict->allowed(), "BLOCKED_CONFIRMED needs a blocking judge verdict");
        break;
    case ReasonCode::BlockedJudgeUnavailable:
    case ReasonCode::AllowedJudgeUnavailable:
        require(flagged, "judge fallback only applies to anomalous prompts");
        require(!m_judgeVerdict, "judge fallback has no judge verdict");
        break;
    default:
        require(!m_judgeVerdict, "fault codes never carry a judge verdict");
        break;
    }

    m_overridden = flagged && m_finalAllowed && m_judgeVerdict && m_judgeVerdict->allowed();
}

std::optional<VisualizationRecord> Decision::visualizationRecord() const
{
    if (!m_anomalyVerdict)
        return std::nullopt;

    return VisualizationRecord{
        m_embedding ? *m_embedding : Embedding{},
        *m_anomalyVerdict,
        m_finalAllowed,
        m_overridden};
}

} // namespace core
