#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"

#include "core/Decision.hpp"
#include "report/DecisionReporter.hpp"

namespace {

using core::Decision;
using core::ReasonCode;
using nlohmann::json;
using PromptGuard::Report::DecisionReporter;

const core::AnomalyVerdict kFlagged(-0.72, -0.61, 0xfeedULL);
const core::AnomalyVerdict kNormal(-0.45, -0.61, 0xfeedULL);

static Decision clean()
{
    return Decision(ReasonCode::Clean, kNormal, std::nullopt, "No anomaly detected.",
                    std::make_shared<const core::Embedding>(core::Embedding{0.25, -1.5}));
}

static Decision overridden()
{
    return Decision(ReasonCode::OverriddenSafe, kFlagged, core::JudgeVerdict(true, "storytelling", 12.5),
                    "Anomaly was detected but overridden by context analysis.");
}

static Decision confirmed()
{
    return Decision(ReasonCode::BlockedConfirmed, kFlagged,
                    core::JudgeVerdict(false, "asks for \"exploit\" code", std::nullopt, std::string("hacking")),
                    "Blocked.");
}

static Decision judgeDown()
{
    return Decision(ReasonCode::BlockedJudgeUnavailable, kFlagged, std::nullopt, "Judge unavailable.");
}

static Decision ruleHit()
{
    return Decision(ReasonCode::BlockedRuleViolation, std::nullopt, std::nullopt, "Banned phrase.");
}

static void runSummaryCounts()
{
    DecisionReporter reporter;
    reporter.record(clean());
    reporter.record(clean());
    reporter.record(overridden());
    reporter.record(confirmed());
    reporter.record(judgeDown());
    reporter.record(ruleHit());

    const auto s = reporter.summary();
    REQUIRE(s.totalRequests == 6, "total");
    REQUIRE(s.allowed == 3 && s.blocked == 3, "allowed/blocked split");
    REQUIRE(s.overridden == 1, "only OVERRIDDEN_SAFE counts as an override");
    REQUIRE(s.judgeInvocations == 3, "judge counted for answers and failures only");
    REQUIRE(s.byReason.at(ReasonCode::Clean) == 2, "per-reason count");
    REQUIRE(s.byReason.count(ReasonCode::BlockedModelNotReady) == 0, "absent codes not listed");

    std::ostringstream text;
    DecisionReporter::writeSummaryText(text, s);
    REQUIRE(text.str().find("Total requests    : 6") != std::string::npos, "text summary: " << text.str());
    REQUIRE(text.str().find("BLOCKED_RULE_VIOLATION") != std::string::npos, "text summary lists reasons");

    const auto parsed = json::parse(DecisionReporter::summaryToJson(s));
    REQUIRE(parsed["summary"]["judge_invocations"] == 3, "JSON summary");
    REQUIRE(parsed["summary"]["by_reason"]["OVERRIDDEN_SAFE"] == 1, "JSON summary by reason");

    reporter.reset();
    REQUIRE(reporter.summary().totalRequests == 0, "reset clears counters");
}

static void runDecisionJson()
{
    const auto line = DecisionReporter::decisionToJson(confirmed(), "say \"hi\"\nthen leave");
    REQUIRE(line.find('\n') == std::string::npos, "one object per line");

    const auto j = json::parse(line);
    REQUIRE(j["prompt"] == "say \"hi\"\nthen leave", "prompt escaped and restored");
    REQUIRE(j["final_allowed"] == false && j["overridden"] == false, "flags");
    REQUIRE(j["reason_code"] == "BLOCKED_CONFIRMED", "reason code");
    REQUIRE(j["anomaly"]["is_anomalous"] == true, "anomaly block");
    REQUIRE(j["anomaly"]["model"] == "000000000000feed", "model fingerprint in hex");
    REQUIRE(j["judge"]["allowed"] == false, "judge block");
    REQUIRE(j["judge"]["threat_type"] == "hacking", "threat type");
    REQUIRE(j["judge"]["rationale"] == "asks for \"exploit\" code", "rationale escaped");
    REQUIRE(!j["judge"].contains("latency_ms"), "latency omitted when unknown");

    const auto over = json::parse(DecisionReporter::decisionToJson(overridden(), "x"));
    REQUIRE(over["overridden"] == true && over["final_allowed"] == true, "override flags");
    REQUIRE(over["judge"]["latency_ms"] == 12.5, "latency included when known");

    const auto rule = json::parse(DecisionReporter::decisionToJson(ruleHit(), "x"));
    REQUIRE(rule["anomaly"].is_null() && rule["judge"].is_null(), "unscored decision has null blocks");
}

static void runScoreLines()
{
    const auto line = json::parse(DecisionReporter::verdictToJson("tab\there", kFlagged));
    REQUIRE(line["prompt"] == "tab\there", "prompt restored");
    REQUIRE(line["is_anomalous"] == true, "flag");
    REQUIRE(line["score"].get<double>() == -0.72 && line["threshold"].get<double>() == -0.61, "score and threshold");
    REQUIRE(!line.contains("error"), "scored line has no error");

    const auto rejected =
        json::parse(DecisionReporter::rejectionToJson("short", "embedding dimension mismatch: model expects 4, got 3"));
    REQUIRE(rejected["prompt"] == "short", "rejected prompt kept");
    REQUIRE(rejected["error"] == "embedding dimension mismatch: model expects 4, got 3", "error message kept");
    REQUIRE(!rejected.contains("score"), "rejected line has no score");
}

static void runVisualizationJson()
{
    const auto record = clean().visualizationRecord();
    REQUIRE(record.has_value(), "scored decision has a record");

    const auto j = json::parse(DecisionReporter::visualizationToJson(*record));
    REQUIRE(j["embedding"].size() == 2, "embedding array");
    REQUIRE(j["embedding"][1].get<double>() == -1.5, "embedding values exact");
    REQUIRE(j["score"].get<double>() == -0.45, "score round-trips at full precision");
    REQUIRE(j["threshold"].get<double>() == -0.61, "threshold round-trips at full precision");
    REQUIRE(j["is_anomalous"] == false && j["final_allowed"] == true && j["overridden"] == false, "flags");

    REQUIRE(!ruleHit().visualizationRecord().has_value(), "unscored decision has no record");
}

} // namespace

int main()
{
    testsupport::quietLogs();

    runSummaryCounts();
    runDecisionJson();
    runScoreLines();
    runVisualizationJson();

    std::cout << "[PASS] TestReporter\n";
    return 0;
}
