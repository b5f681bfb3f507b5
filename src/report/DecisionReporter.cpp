#include "report/DecisionReporter.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

#include "utils/Hash.hpp"
#include "utils/StringUtils.hpp"

namespace PromptGuard
{
namespace Report
{
    namespace
    {
        bool judgeWasCalled(const core::Decision &d)
        {
            return d.judgeVerdict().has_value() ||
                   d.reasonCode() == core::ReasonCode::BlockedJudgeUnavailable ||
                   d.reasonCode() == core::ReasonCode::AllowedJudgeUnavailable;
        }

        const char *boolText(bool b) { return b ? "true" : "false"; }
    } // anonymous namespace

    void DecisionReporter::record(const core::Decision &decision)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        ++m_summary.totalRequests;
        if (decision.finalAllowed())
            ++m_summary.allowed;
        else
            ++m_summary.blocked;
        if (decision.overridden())
            ++m_summary.overridden;
        if (judgeWasCalled(decision))
            ++m_summary.judgeInvocations;
        ++m_summary.byReason[decision.reasonCode()];
    }

    SessionSummary DecisionReporter::summary() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_summary;
    }

    void DecisionReporter::reset()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_summary = SessionSummary{};
    }

    std::string DecisionReporter::decisionToJson(const core::Decision &d, std::string_view prompt)
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"prompt\":\"" << Utils::escapeJson(prompt) << "\",";
        oss << "\"final_allowed\":" << boolText(d.finalAllowed()) << ",";
        oss << "\"overridden\":" << boolText(d.overridden()) << ",";
        oss << "\"reason_code\":\"" << core::toString(d.reasonCode()) << "\",";

        if (const auto &av = d.anomalyVerdict())
        {
            oss << "\"anomaly\":{";
            oss << "\"score\":" << std::fixed << std::setprecision(6) << av->score() << ",";
            oss << "\"threshold\":" << av->threshold() << ",";
            oss << "\"is_anomalous\":" << boolText(av->isAnomalous()) << ",";
            oss << "\"model\":\"" << Utils::toHex64(av->modelFingerprint()) << "\"";
            oss << "},";
        }
        else
        {
            oss << "\"anomaly\":null,";
        }

        if (const auto &jv = d.judgeVerdict())
        {
            oss << "\"judge\":{";
            oss << "\"allowed\":" << boolText(jv->allowed()) << ",";
            oss << "\"rationale\":\"" << Utils::escapeJson(jv->rationale()) << "\"";
            if (jv->threatType())
                oss << ",\"threat_type\":\"" << Utils::escapeJson(*jv->threatType()) << "\"";
            if (jv->latencyMs())
                oss << ",\"latency_ms\":" << std::fixed << std::setprecision(3) << *jv->latencyMs();
            oss << "},";
        }
        else
        {
            oss << "\"judge\":null,";
        }

        oss << "\"explanation\":\"" << Utils::escapeJson(d.explanation()) << "\"";
        oss << "}";
        return oss.str();
    }

    std::string DecisionReporter::visualizationToJson(const core::VisualizationRecord &r)
    {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<double>::max_digits10);
        oss << "{\"embedding\":[";
        for (std::size_t i = 0; i < r.embedding.size(); ++i)
        {
            if (i > 0)
                oss << ",";
            oss << r.embedding[i];
        }
        oss << "],";
        oss << "\"score\":" << r.anomalyVerdict.score() << ",";
        oss << "\"threshold\":" << r.anomalyVerdict.threshold() << ",";
        oss << "\"is_anomalous\":" << boolText(r.anomalyVerdict.isAnomalous()) << ",";
        oss << "\"final_allowed\":" << boolText(r.finalAllowed) << ",";
        oss << "\"overridden\":" << boolText(r.overridden);
        oss << "}";
        return oss.str();
    }

    std::string DecisionReporter::verdictToJson(std::string_view prompt, const core::AnomalyVerdict &v)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(6);
        oss << "{\"prompt\":\"" << Utils::escapeJson(prompt) << "\",";
        oss << "\"score\":" << v.score() << ",";
        oss << "\"threshold\":" << v.threshold() << ",";
        oss << "\"is_anomalous\":" << boolText(v.isAnomalous()) << "}";
        return oss.str();
    }

    std::string DecisionReporter::rejectionToJson(std::string_view prompt, std::string_view error)
    {
        return "{\"prompt\":\"" + Utils::escapeJson(prompt) + "\",\"error\":\"" + Utils::escapeJson(error) + "\"}";
    }

    std::string DecisionReporter::summaryToJson(const SessionSummary &s)
    {
        std::ostringstream oss;
        oss << "{\"summary\":{";
        oss << "\"total_requests\":" << s.totalRequests << ",";
        oss << "\"allowed\":" << s.allowed << ",";
        oss << "\"blocked\":" << s.blocked << ",";
        oss << "\"overridden\":" << s.overridden << ",";
        oss << "\"judge_invocations\":" << s.judgeInvocations << ",";
        oss << "\"by_reason\":{";
        bool first = true;
        for (const auto &[code, count] : s.byReason)
        {
            if (!first)
                oss << ",";
            first = false;
            oss << "\"" << core::toString(code) << "\":" << count;
        }
        oss << "}}}";
        return oss.str();
    }

    void DecisionReporter::writeSummaryText(std::ostream &out, const SessionSummary &s)
    {
        out << "=== Session summary ===\n";
        out << "  Total requests    : " << s.totalRequests << "\n";
        out << "  Allowed           : " << s.allowed << "\n";
        out << "  Blocked           : " << s.blocked << "\n";
        out << "  Overridden        : " << s.overridden << "\n";
        out << "  Judge invocations : " << s.judgeInvocations << "\n";
        for (const auto &[code, count] : s.byReason)
            out << "    " << std::left << std::setw(28) << core::toString(code) << count << "\n";
    }

} // namespace Report
} // namespace PromptGuard
