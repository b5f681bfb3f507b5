#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "TestSupport.hpp"

#include "anomaly/AnomalyModel.hpp"
#include "anomaly/AnomalyScorer.hpp"
#include "core/Errors.hpp"
#include "lifecycle/ModelLifecycle.hpp"
#include "policy/DecisionFuser.hpp"
#include "report/DecisionReporter.hpp"

namespace {

using PromptGuard::Anomaly::AnomalyModel;
using PromptGuard::Anomaly::AnomalyScorer;
using PromptGuard::Anomaly::FitParams;
using PromptGuard::Lifecycle::ModelLifecycle;
using PromptGuard::Policy::DecisionFuser;
using PromptGuard::Report::DecisionReporter;

constexpr std::size_t kDim = 8;

static FitParams params(double contamination)
{
    FitParams p;
    p.contamination = contamination;
    p.treeCount = 50;
    return p;
}

static void runHundredReadersOneModel()
{
    ModelLifecycle lifecycle;
    const auto model = lifecycle.fit(testsupport::gaussianCorpus(400, kDim, 7), params(0.01));
    const AnomalyScorer scorer(lifecycle);

    const auto probe = testsupport::gaussianCorpus(1, kDim, 8).front();
    const double expected = model->rawScore(probe);

    std::atomic<int> ready{0};
    std::atomic<int> inconsistent{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 100; ++t)
    {
        readers.emplace_back([&] {
            // Start together so the calls genuinely overlap.
            ++ready;
            while (ready.load() < 100)
                std::this_thread::yield();

            const auto v = scorer.score(probe);
            if (v.score() != expected || v.threshold() != model->threshold() ||
                v.modelFingerprint() != model->fingerprint())
                ++inconsistent;
        });
    }
    for (auto& r : readers)
        r.join();

    REQUIRE(inconsistent.load() == 0, "simultaneous scores disagree with the published model");
}

// Readers racing a writer that swaps two models must always see one whole
// model: the (score, threshold) pair of every verdict comes from A or from B.
static void runSwapNeverMixesModels()
{
    const auto modelA = AnomalyModel::fit(testsupport::gaussianCorpus(400, kDim, 1), params(0.01));
    const auto modelB = AnomalyModel::fit(testsupport::gaussianCorpus(400, kDim, 2, 0.5, 2.0), params(0.10));
    REQUIRE(modelA->threshold() != modelB->threshold(), "models must be distinguishable");

    const auto probes = testsupport::gaussianCorpus(20, kDim, 3, 0.0, 1.5);
    std::vector<double> scoresA, scoresB;
    for (const auto& p : probes)
    {
        scoresA.push_back(modelA->rawScore(p));
        scoresB.push_back(modelB->rawScore(p));
    }

    ModelLifecycle lifecycle;
    lifecycle.publish(modelA);
    const AnomalyScorer scorer(lifecycle);

    std::atomic<bool> stop{false};
    std::atomic<int>  mixed{0};
    std::atomic<int>  notReady{0};
    std::atomic<long> verdicts{0};

    std::thread writer([&] {
        for (int i = 0; i < 400; ++i)
        {
            if (i % 50 == 49)
                lifecycle.invalidate();
            else
                lifecycle.publish(i % 2 == 0 ? modelB : modelA);
            std::this_thread::yield();
        }
        stop = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 100; ++t)
    {
        readers.emplace_back([&, t] {
            std::size_t i = static_cast<std::size_t>(t) % probes.size();
            do
            {
                try
                {
                    const auto v = scorer.score(probes[i]);
                    const bool fromA = v.score() == scoresA[i] && v.threshold() == modelA->threshold() &&
                                       v.modelFingerprint() == modelA->fingerprint();
                    const bool fromB = v.score() == scoresB[i] && v.threshold() == modelB->threshold() &&
                                       v.modelFingerprint() == modelB->fingerprint();
                    if (!fromA && !fromB)
                        ++mixed;
                    ++verdicts;
                }
                catch (const core::ModelNotReady&)
                {
                    ++notReady;
                }
                i = (i + 1) % probes.size();
            } while (!stop.load());
        });
    }

    writer.join();
    for (auto& r : readers)
        r.join();

    REQUIRE(mixed.load() == 0, "verdicts mixing two models: " << mixed.load());
    REQUIRE(verdicts.load() > 0, "readers produced verdicts");
    REQUIRE(lifecycle.generation() >= 392, "every publication counted: " << lifecycle.generation());
}

static void runConcurrentFitsPublishOneWholeModel()
{
    const auto corpusA = testsupport::gaussianCorpus(300, kDim, 11);
    const auto corpusB = testsupport::gaussianCorpus(300, kDim, 12);

    ModelLifecycle lifecycle;
    std::shared_ptr<const AnomalyModel> fromA, fromB;
    std::thread a([&] { fromA = lifecycle.fit(corpusA, params(0.02)); });
    std::thread b([&] { fromB = lifecycle.fit(corpusB, params(0.02)); });
    a.join();
    b.join();

    const auto current = lifecycle.current();
    REQUIRE(current == fromA || current == fromB, "published model is one of the fitted ones");
    REQUIRE(lifecycle.generation() == 2, "both fits published in turn");
    REQUIRE(!lifecycle.needsRefit(kDim, 0.02, current->corpusFingerprint()), "published model is complete");
}

static void runParallelEvaluations()
{
    ModelLifecycle lifecycle;
    lifecycle.fit(testsupport::gaussianCorpus(500, kDim, 21), params(0.01));

    constexpr int kThreads = 16;
    constexpr int kPerThread = 40;

    // A worker gives its slot back just after answering, so a thread can
    // briefly hold two; the cap must not turn that into a judge failure.
    PromptGuard::Policy::FuserConfig config;
    config.maxJudgeCallsInFlight = 4 * kThreads;

    auto judge = std::make_shared<testsupport::ScriptedJudge>(true, "context is benign");
    const DecisionFuser fuser(lifecycle, nullptr, judge, config);
    DecisionReporter reporter;

    const auto benign  = testsupport::constantEmbedding(kDim, 0.0);
    const auto crafted = testsupport::constantEmbedding(kDim, 8.0);
    std::atomic<int> wrong{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i)
            {
                const bool anomalous = (i % 4) == 0;
                const auto d = fuser.evaluateEmbedding("prompt", anomalous ? crafted : benign);
                const auto expected = anomalous ? core::ReasonCode::OverriddenSafe : core::ReasonCode::Clean;
                if (d.reasonCode() != expected || !d.finalAllowed())
                    ++wrong;
                reporter.record(d);
            }
        });
    }
    for (auto& w : workers)
        w.join();

    const int anomalousTotal = kThreads * kPerThread / 4;
    REQUIRE(wrong.load() == 0, "parallel decisions disagree with serial ones");
    REQUIRE(judge->calls() == anomalousTotal, "judge called once per anomalous request");

    const auto s = reporter.summary();
    REQUIRE(s.totalRequests == static_cast<std::size_t>(kThreads * kPerThread), "every decision recorded");
    REQUIRE(s.overridden == static_cast<std::size_t>(anomalousTotal), "override count");
    REQUIRE(s.judgeInvocations == static_cast<std::size_t>(anomalousTotal), "judge invocation count");
}

} // namespace

int main()
{
    testsupport::quietLogs();

    runHundredReadersOneModel();
    runSwapNeverMixesModels();
    runConcurrentFitsPublishOneWholeModel();
    runParallelEvaluations();

    std::cout << "[PASS] TestConcurrency\n";
    return 0;
}
