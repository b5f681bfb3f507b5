#include <iostream>
#include <fstream>
#include <string>
#include <optional>
#include <memory>
#include <vector>
#include <iomanip>
#include <sstream>

// Core models
#include "core/Decision.hpp"
#include "core/Errors.hpp"

// Anomaly stage and lifecycle
#include "anomaly/AnomalyScorer.hpp"
#include "lifecycle/ModelLifecycle.hpp"

// Input
#include "input/CorpusReader.hpp"
#include "input/HashingEmbedder.hpp"
#include "input/PrecomputedEmbedder.hpp"

// Judge and policy
#include "judge/CommandJudge.hpp"
#include "policy/DecisionFuser.hpp"
#include "policy/PromptRuleGuard.hpp"

// Reporting
#include "report/DecisionReporter.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/GuardSettings.hpp"
#include "utils/Hash.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace pg = PromptGuard;

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string command;
    std::string configFile = "config/promptguard.conf";
    bool        configExplicit = false;
    std::string modelPath;
    std::string corpusFile;
    std::string inputFile;
    std::string exportFile;
    bool verbose = false;
    bool help = false;
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
        {
            if (++i < argc)
            {
                opts.configFile = argv[i];
                opts.configExplicit = true;
            }
        }
        else if (arg == "--model" || arg == "-m")
        {
            if (++i < argc)
                opts.modelPath = argv[i];
        }
        else if (arg == "--corpus")
        {
            if (++i < argc)
                opts.corpusFile = argv[i];
        }
        else if (arg == "--input" || arg == "-i")
        {
            if (++i < argc)
                opts.inputFile = argv[i];
        }
        else if (arg == "--export")
        {
            if (++i < argc)
                opts.exportFile = argv[i];
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else if (!arg.empty() && arg[0] != '-' && opts.command.empty())
        {
            opts.command = arg;
        }
    }

    return opts;
}

static void printUsage(const char *progName)
{
    std::cout
        << "Usage: " << progName << " COMMAND [OPTIONS]\n\n"
        << "COMMANDS:\n"
        << "  fit --corpus FILE            Fit the anomaly model on a benign corpus and persist it\n"
        << "  status                       Show the persisted model and its metadata\n"
        << "  score --input FILE           Print anomaly verdicts only (judge is not consulted)\n"
        << "  evaluate --input FILE        Run the full decision pipeline, one JSON decision per line\n"
        << "           [--export FILE]     Also write visualization records (JSON lines)\n"
        << "  reset                        Discard the learned model and delete its artifact\n\n"
        << "OPTIONS:\n"
        << "  -c, --config FILE            Config file (default: config/promptguard.conf)\n"
        << "  -m, --model FILE             Model artifact path (overrides model_path)\n"
        << "  -v, --verbose                Verbose logging\n"
        << "  -h, --help                   Show this help\n\n"
        << "Corpus and input files hold one prompt per line, or JSON lines of the form\n"
        << "  {\"prompt\": \"...\", \"embedding\": [..]}\n";
}

namespace
{
    std::string fmt(double v, int precision = 6)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << v;
        return oss.str();
    }

    pg::Utils::GuardSettings loadSettings(const CliOptions &opts)
    {
        auto &logger = pg::Utils::getLogger();
        auto &config = pg::Utils::getGlobalConfig();

        if (!config.loadFromFile(opts.configFile))
        {
            if (opts.configExplicit)
                throw std::runtime_error("cannot open config file " + opts.configFile);
            logger.debug("No config file at " + opts.configFile + "; using defaults");
        }

        auto settings = pg::Utils::GuardSettings::fromConfig(config);
        if (!opts.modelPath.empty())
            settings.modelPath = opts.modelPath;
        return settings;
    }

    void configureLogging(const pg::Utils::GuardSettings &settings, bool verbose)
    {
        auto &logger = pg::Utils::getLogger();
        if (auto level = pg::Utils::parseLogLevel(settings.logLevel))
            logger.setLevel(*level);
        if (verbose)
            logger.setLevel(pg::Utils::LogLevel::DEBUG);
        if (!settings.logFile.empty() && !logger.setLogFile(settings.logFile))
            logger.warn("Cannot open log file " + settings.logFile + "; logging to stderr only");
    }

    /// Embeddings for every entry: precomputed where present, hashed otherwise.
    std::vector<core::Embedding> embedEntries(const std::vector<pg::Input::CorpusEntry> &entries,
                                              const pg::Input::IEmbedder &embedder)
    {
        std::vector<core::Embedding> out;
        out.reserve(entries.size());
        for (const auto &e : entries)
            out.push_back(e.embedding ? *e.embedding : embedder.embed(e.prompt));
        return out;
    }

    bool allPrecomputed(const std::vector<pg::Input::CorpusEntry> &entries)
    {
        for (const auto &e : entries)
        {
            if (!e.embedding)
                return false;
        }
        return !entries.empty();
    }

    void printModel(const pg::Anomaly::AnomalyModel &model, std::ostream &out)
    {
        const auto &p = model.params();
        out << "  fingerprint        : " << pg::Utils::toHex64(model.fingerprint()) << "\n"
            << "  fitted at          : " << pg::Utils::formatTimestamp(model.fittedAt()) << "\n"
            << "  dimension          : " << model.dimension() << "\n"
            << "  corpus size        : " << model.corpusSize() << "\n"
            << "  corpus fingerprint : " << pg::Utils::toHex64(model.corpusFingerprint()) << "\n"
            << "  contamination      : " << model.contamination() << "\n"
            << "  trees / samples    : " << p.treeCount << " / " << p.maxSamples << "\n"
            << "  seed               : " << p.seed << "\n"
            << "  threshold          : " << fmt(model.threshold()) << "\n";
    }

    /// Load the persisted model, treating a corrupt artifact like "not fitted".
    bool loadModel(pg::Lifecycle::ModelLifecycle &lifecycle)
    {
        try
        {
            return lifecycle.load().has_value();
        }
        catch (const core::ModelCorrupt &e)
        {
            pg::Utils::getLogger().error(std::string(e.what()) + "; refit required");
            return false;
        }
    }

    // -------------------------
    // Commands
    // -------------------------
    int runFit(const CliOptions &opts, const pg::Utils::GuardSettings &settings)
    {
        auto &logger = pg::Utils::getLogger();
        if (opts.corpusFile.empty())
        {
            std::cerr << "Error: fit requires --corpus FILE.\n";
            return 1;
        }

        const auto entries = pg::Input::CorpusReader::readAll(opts.corpusFile);
        logger.info("Read " + std::to_string(entries.size()) + " corpus prompts from " + opts.corpusFile);

        pg::Input::HashingEmbedder embedder(settings.embeddingDimension);
        const auto corpus = embedEntries(entries, embedder);
        if (allPrecomputed(entries))
            logger.info("Corpus carries precomputed embeddings");

        pg::Anomaly::FitParams params;
        params.contamination = settings.contamination;
        params.treeCount     = settings.treeCount;
        params.maxSamples    = settings.maxSamples;
        params.seed          = settings.seed;

        pg::Lifecycle::ModelLifecycle lifecycle{pg::Lifecycle::ModelStore(settings.modelPath)};
        loadModel(lifecycle);

        pg::Utils::Stopwatch sw;
        const auto model = lifecycle.fit(corpus, params);
        logger.info("Fit finished in " + fmt(sw.elapsedMillis(), 1) + " ms");

        std::cout << "Model ready (" << settings.modelPath << ")\n";
        printModel(*model, std::cout);
        return 0;
    }

    int runStatus(const pg::Utils::GuardSettings &settings)
    {
        pg::Lifecycle::ModelLifecycle lifecycle{pg::Lifecycle::ModelStore(settings.modelPath)};
        loadModel(lifecycle);

        std::cout << "State: " << pg::Lifecycle::toString(lifecycle.state()) << "\n"
                  << "Artifact: " << settings.modelPath << "\n";
        if (const auto model = lifecycle.current())
            printModel(*model, std::cout);
        return 0;
    }

    int runScore(const CliOptions &opts, const pg::Utils::GuardSettings &settings)
    {
        if (opts.inputFile.empty())
        {
            std::cerr << "Error: score requires --input FILE.\n";
            return 1;
        }

        pg::Lifecycle::ModelLifecycle lifecycle{pg::Lifecycle::ModelStore(settings.modelPath)};
        if (!loadModel(lifecycle))
        {
            std::cerr << "Error: " << core::ModelNotReady().what() << " (" << settings.modelPath << ")\n";
            return 2;
        }

        const pg::Anomaly::AnomalyScorer scorer(lifecycle);
        const pg::Input::HashingEmbedder embedder(settings.embeddingDimension);

        const auto entries = pg::Input::CorpusReader::readAll(opts.inputFile);
        const auto outcomes = scorer.scoreEach(embedEntries(entries, embedder));

        std::size_t rejected = 0;
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            if (outcomes[i].verdict)
            {
                std::cout << pg::Report::DecisionReporter::verdictToJson(entries[i].prompt, *outcomes[i].verdict) << "\n";
            }
            else
            {
                ++rejected;
                std::cout << pg::Report::DecisionReporter::rejectionToJson(entries[i].prompt, outcomes[i].error) << "\n";
            }
        }

        if (rejected > 0)
        {
            pg::Utils::getLogger().warn(std::to_string(rejected) + " of " + std::to_string(entries.size()) +
                                        " entries could not be scored");
        }
        return 0;
    }

    int runEvaluate(const CliOptions &opts, const pg::Utils::GuardSettings &settings)
    {
        auto &logger = pg::Utils::getLogger();
        if (opts.inputFile.empty())
        {
            std::cerr << "Error: evaluate requires --input FILE.\n";
            return 1;
        }
        if (settings.judgeCommand.empty())
        {
            std::cerr << "Error: judge_command is not configured.\n";
            return 1;
        }

        pg::Lifecycle::ModelLifecycle lifecycle{pg::Lifecycle::ModelStore(settings.modelPath)};
        if (!loadModel(lifecycle))
            logger.warn("No usable model; every prompt will be blocked until a fit is run");

        const auto entries = pg::Input::CorpusReader::readAll(opts.inputFile);

        // A fully precomputed input is served by lookup; otherwise prompts are
        // hashed and the vectors a line does carry are passed straight through.
        const bool precomputed = allPrecomputed(entries);
        std::shared_ptr<const pg::Input::IEmbedder> embedder;
        if (precomputed)
            embedder = std::make_shared<pg::Input::PrecomputedEmbedder>(entries);
        else
            embedder = std::make_shared<pg::Input::HashingEmbedder>(settings.embeddingDimension);

        std::shared_ptr<const pg::Policy::PromptRuleGuard> ruleGuard;
        if (settings.ruleGuardEnabled)
        {
            ruleGuard = std::make_shared<pg::Policy::PromptRuleGuard>(
                settings.bannedPhrases.value_or(pg::Policy::PromptRuleGuard::defaultPhrases()));
        }

        pg::Policy::FuserConfig fuserConfig;
        fuserConfig.judgeTimeout          = settings.judgeTimeout;
        fuserConfig.judgeFailurePolicy    = settings.judgeFailurePolicy;
        fuserConfig.maxJudgeCallsInFlight = settings.judgeMaxInFlight;

        // The command's own deadline expires first, so its child is reaped
        // before the fuser stops waiting for it.
        auto judge = std::make_shared<pg::Judge::CommandJudge>(settings.judgeCommand, settings.commandJudgeTimeout());

        const pg::Policy::DecisionFuser fuser(lifecycle, embedder, judge, fuserConfig, ruleGuard);

        std::ofstream exportStream;
        if (!opts.exportFile.empty())
        {
            exportStream.open(opts.exportFile, std::ios::out | std::ios::trunc);
            if (!exportStream.is_open())
            {
                std::cerr << "Error: cannot open export file " << opts.exportFile << "\n";
                return 1;
            }
        }

        pg::Report::DecisionReporter reporter;
        for (const auto &entry : entries)
        {
            const core::Decision decision =
                (entry.embedding && !precomputed) ? fuser.evaluateEmbedding(entry.prompt, *entry.embedding)
                                                  : fuser.evaluate(entry.prompt);

            reporter.record(decision);
            std::cout << pg::Report::DecisionReporter::decisionToJson(decision, entry.prompt) << "\n";

            if (exportStream.is_open())
            {
                if (const auto record = decision.visualizationRecord())
                    exportStream << pg::Report::DecisionReporter::visualizationToJson(*record) << "\n";
            }
        }

        const auto summary = reporter.summary();
        pg::Report::DecisionReporter::writeSummaryText(std::cerr, summary);
        if (exportStream.is_open())
            logger.info("Visualization records written to " + opts.exportFile);
        return 0;
    }

    int runReset(const pg::Utils::GuardSettings &settings)
    {
        pg::Lifecycle::ModelLifecycle lifecycle{pg::Lifecycle::ModelStore(settings.modelPath)};
        const bool removed = lifecycle.reset();
        std::cout << (removed ? "Model artifact deleted: " : "No model artifact at ")
                  << settings.modelPath << "\n"
                  << "State: " << pg::Lifecycle::toString(lifecycle.state())
                  << " (run 'fit' before serving requests)\n";
        return 0;
    }
} // anonymous namespace

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (opts.command.empty())
    {
        std::cerr << "Error: command required.\n\n";
        printUsage(argv[0]);
        return 1;
    }

    auto &logger = pg::Utils::getLogger();
    if (opts.verbose)
        logger.setLevel(pg::Utils::LogLevel::DEBUG);

    try
    {
        const auto settings = loadSettings(opts);
        configureLogging(settings, opts.verbose);
        logger.debug("Command: " + opts.command + ", model: " + settings.modelPath);

        if (opts.command == "fit")
            return runFit(opts, settings);
        if (opts.command == "status")
            return runStatus(settings);
        if (opts.command == "score")
            return runScore(opts, settings);
        if (opts.command == "evaluate")
            return runEvaluate(opts, settings);
        if (opts.command == "reset")
            return runReset(settings);

        std::cerr << "Error: unknown command '" << opts.command << "'.\n\n";
        printUsage(argv[0]);
        return 1;
    }
    catch (const core::PromptGuardError &e)
    {
        logger.error(e.what());
        return 2;
    }
    catch (const std::exception &e)
    {
        logger.error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
