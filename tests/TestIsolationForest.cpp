#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "TestSupport.hpp"

#include "anomaly/AnomalyModel.hpp"
#include "anomaly/IsolationForest.hpp"
#include "core/Errors.hpp"

namespace {

using PromptGuard::Anomaly::AnomalyModel;
using PromptGuard::Anomaly::FitParams;
using PromptGuard::Anomaly::IsolationForest;
using PromptGuard::Anomaly::quantile;

static void runAveragePathLength()
{
    REQUIRE(IsolationForest::averagePathLength(0) == 0.0, "c(0) must be 0");
    REQUIRE(IsolationForest::averagePathLength(1) == 0.0, "c(1) must be 0");
    REQUIRE(IsolationForest::averagePathLength(2) == 1.0, "c(2) must be 1");

    // 2 (ln 255 + gamma) - 2 * 255 / 256
    const double c256 = IsolationForest::averagePathLength(256);
    REQUIRE(std::abs(c256 - 10.244770920) < 1e-6, "c(256) mismatch: " << c256);

    double prev = 0.0;
    for (std::size_t n = 2; n < 600; n += 7)
    {
        const double c = IsolationForest::averagePathLength(n);
        REQUIRE(c > prev, "c(n) must increase with n");
        prev = c;
    }
}

static void runQuantileInterpolation()
{
    REQUIRE(quantile({4.0, 1.0, 3.0, 2.0}, 0.5) == 2.5, "median of 1..4 is 2.5");
    REQUIRE(quantile({0.0, 10.0}, 0.25) == 2.5, "linear interpolation between two points");
    REQUIRE(quantile({7.0}, 0.3) == 7.0, "single value is every quantile");
    REQUIRE(quantile({3.0, 1.0, 2.0}, 0.0) == 1.0, "q=0 is the minimum");
    REQUIRE(quantile({3.0, 1.0, 2.0}, 1.0) == 3.0, "q=1 is the maximum");
    REQUIRE_THROWS(quantile({}, 0.5), std::invalid_argument, "empty quantile must throw");
}

static void runScoresAreInRange()
{
    const auto corpus = testsupport::gaussianCorpus(300, 8, 7);
    IsolationForest::Params params;
    params.treeCount = 50;
    const auto forest = IsolationForest::fit(corpus, params);

    REQUIRE(forest.treeCount() == 50, "tree count");
    REQUIRE(forest.dimension() == 8, "dimension");
    REQUIRE(forest.samplesPerTree() == 256, "psi = min(max_samples, n)");

    for (const auto& e : corpus)
    {
        const double s = forest.scoreSample(e);
        REQUIRE(s >= -1.0 && s < 0.0, "score out of [-1, 0): " << s);
    }
}

static void runSmallCorpusUsesAllSamples()
{
    const auto corpus = testsupport::gaussianCorpus(40, 4, 3);
    const auto forest = IsolationForest::fit(corpus, IsolationForest::Params{});
    REQUIRE(forest.samplesPerTree() == 40, "psi capped by corpus size");
}

static void runOutliersScoreLower()
{
    const auto corpus = testsupport::gaussianCorpus(500, 16, 11);
    FitParams params;
    params.contamination = 0.01;
    const auto model = AnomalyModel::fit(corpus, params);

    const double centre  = model->rawScore(testsupport::constantEmbedding(16, 0.0));
    const double outlier = model->rawScore(testsupport::constantEmbedding(16, 8.0));

    REQUIRE(outlier < centre, "outlier must score lower than the centre");
    REQUIRE(model->score(testsupport::constantEmbedding(16, 8.0)).isAnomalous(), "far outlier must be anomalous");
    REQUIRE(!model->score(testsupport::constantEmbedding(16, 0.0)).isAnomalous(), "centre must not be anomalous");
}

static void runThresholdMatchesContamination()
{
    const auto corpus = testsupport::gaussianCorpus(1000, 16, 5);
    FitParams params;
    params.contamination = 0.05;
    const auto model = AnomalyModel::fit(corpus, params);

    std::size_t flagged = 0;
    for (const auto& e : corpus)
    {
        if (model->score(e).isAnomalous())
            ++flagged;
    }

    // The threshold is the 5% quantile of the fit scores, so about 50 fit points fall below it.
    REQUIRE(flagged >= 40 && flagged <= 60, "flagged fraction far from contamination: " << flagged);
}

static void runFitIsDeterministic()
{
    const auto corpus  = testsupport::gaussianCorpus(400, 12, 21);
    const auto heldOut = testsupport::gaussianCorpus(50, 12, 99);

    FitParams params;
    params.contamination = 0.01;
    const auto a = AnomalyModel::fit(corpus, params);
    const auto b = AnomalyModel::fit(corpus, params);

    REQUIRE(a->threshold() == b->threshold(), "same inputs must give the same threshold");
    REQUIRE(a->fingerprint() == b->fingerprint(), "same inputs must give the same fingerprint");
    for (const auto& e : heldOut)
        REQUIRE(a->rawScore(e) == b->rawScore(e), "same inputs must give identical scores");

    FitParams otherSeed = params;
    otherSeed.seed = 43;
    const auto c = AnomalyModel::fit(corpus, otherSeed);
    REQUIRE(c->fingerprint() != a->fingerprint(), "a different seed must give a different forest");
}

static void runFitValidation()
{
    const auto corpus = testsupport::gaussianCorpus(20, 4, 1);

    FitParams bad;
    bad.contamination = 0.0;
    REQUIRE_THROWS(AnomalyModel::fit(corpus, bad), std::invalid_argument, "contamination 0 rejected");
    bad.contamination = 1.0;
    REQUIRE_THROWS(AnomalyModel::fit(corpus, bad), std::invalid_argument, "contamination 1 rejected");

    REQUIRE_THROWS(AnomalyModel::fit({}, FitParams{}), std::invalid_argument, "empty corpus rejected");
    REQUIRE_THROWS(AnomalyModel::fit({core::Embedding{1.0, 2.0}}, FitParams{}), std::invalid_argument,
                   "single-sample corpus rejected");

    auto ragged = corpus;
    ragged[3].push_back(1.0);
    REQUIRE_THROWS(AnomalyModel::fit(ragged, FitParams{}), std::invalid_argument, "ragged corpus rejected");

    auto nonFinite = corpus;
    nonFinite[2][1] = std::nan("");
    REQUIRE_THROWS(AnomalyModel::fit(nonFinite, FitParams{}), std::invalid_argument, "NaN corpus rejected");
}

static void runDimensionMismatch()
{
    const auto model = AnomalyModel::fit(testsupport::gaussianCorpus(50, 6, 2), FitParams{});

    bool thrown = false;
    try
    {
        (void)model->score(core::Embedding(5, 0.0));
    }
    catch (const core::DimensionMismatch& e)
    {
        thrown = true;
        REQUIRE(e.expected() == 6 && e.actual() == 5, "mismatch carries both lengths");
    }
    REQUIRE(thrown, "wrong length must raise DimensionMismatch");
}

static void runTreeSerializationRejectsGarbage()
{
    const auto forest = IsolationForest::fit(testsupport::gaussianCorpus(64, 3, 4), IsolationForest::Params{5, 32, 1});

    std::ostringstream out;
    forest.writeTrees(out);

    std::istringstream in(out.str());
    const auto back = IsolationForest::readTrees(in, 5, 3, 32);
    const core::Embedding probe{0.25, -1.0, 2.0};
    REQUIRE(back.scoreSample(probe) == forest.scoreSample(probe), "tree text must round-trip scores");

    std::istringstream truncated(out.str().substr(0, out.str().size() / 2));
    REQUIRE_THROWS(IsolationForest::readTrees(truncated, 5, 3, 32), std::invalid_argument,
                   "truncated tree block must be rejected");
}

} // namespace

int main()
{
    testsupport::quietLogs();

    runAveragePathLength();
    runQuantileInterpolation();
    runScoresAreInRange();
    runSmallCorpusUsesAllSamples();
    runOutliersScoreLower();
    runThresholdMatchesContamination();
    runFitIsDeterministic();
    runFitValidation();
    runDimensionMismatch();
    runTreeSerializationRejectsGarbage();

    std::cout << "[PASS] TestIsolationForest\n";
    return 0;
}
