#include "anomaly/AnomalyModel.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/Errors.hpp"
#include "utils/Hash.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace PromptGuard
{
    namespace Anomaly
    {
        namespace
        {
            constexpr const char *kMagic = "PROMPTGUARD-MODEL";

            template <typename T>
            T readField(std::istream &in, const char *key)
            {
                std::string name;
                T value{};
                if (!(in >> name) || name != key)
                    throw std::invalid_argument(std::string("expected field '") + key + "'");
                if (!(in >> value))
                    throw std::invalid_argument(std::string("unreadable value for '") + key + "'");
                return value;
            }

            std::uint64_t readHexField(std::istream &in, const char *key)
            {
                const std::string text = readField<std::string>(in, key);
                std::size_t idx = 0;
                const unsigned long long value = std::stoull(text, &idx, 16);
                if (idx != text.size())
                    throw std::invalid_argument(std::string("bad hex value for '") + key + "'");
                return static_cast<std::uint64_t>(value);
            }
        } // anonymous namespace

        double quantile(std::vector<double> values, double q)
        {
            if (values.empty())
                throw std::invalid_argument("quantile of empty set");

            std::sort(values.begin(), values.end());
            const double pos = std::clamp(q, 0.0, 1.0) * static_cast<double>(values.size() - 1);
            const auto lower = static_cast<std::size_t>(std::floor(pos));
            const std::size_t upper = std::min(lower + 1, values.size() - 1);
            const double frac = pos - static_cast<double>(lower);
            return values[lower] + (values[upper] - values[lower]) * frac;
        }

        AnomalyModel::AnomalyModel(IsolationForest forest, Metadata metadata)
            : m_forest(std::move(forest)),
              m_meta(std::move(metadata))
        {
            std::ostringstream canonical;
            writeBody(canonical, false);
            m_fingerprint = Utils::fnv1a64(canonical.str());
        }

        std::shared_ptr<const AnomalyModel>
        AnomalyModel::fit(const std::vector<core::Embedding> &corpus, const FitParams &params)
        {
            if (!(params.contamination > 0.0 && params.contamination < 1.0))
                throw std::invalid_argument("contamination must lie in (0, 1), got " +
                                            std::to_string(params.contamination));

            auto &logger = Utils::getLogger();
            logger.info("Fitting anomaly model on " + std::to_string(corpus.size()) +
                        " embeddings (trees=" + std::to_string(params.treeCount) +
                        ", contamination=" + std::to_string(params.contamination) +
                        ", seed=" + std::to_string(params.seed) + ")");

            IsolationForest forest = IsolationForest::fit(
                corpus, IsolationForest::Params{params.treeCount, params.maxSamples, params.seed});

            std::vector<double> scores;
            scores.reserve(corpus.size());
            for (const auto &e : corpus)
                scores.push_back(forest.scoreSample(e));

            Metadata meta;
            meta.params            = params;
            meta.dimension         = forest.dimension();
            meta.corpusSize        = corpus.size();
            meta.corpusFingerprint = core::corpusFingerprint(corpus);
            meta.threshold         = quantile(std::move(scores), params.contamination);
            meta.fittedAt          = Utils::now();

            auto model = std::make_shared<const AnomalyModel>(std::move(forest), std::move(meta));

            std::ostringstream oss;
            oss << std::setprecision(6) << "Anomaly model fitted: dimension=" << model->dimension()
                << " threshold=" << model->threshold()
                << " fingerprint=" << Utils::toHex64(model->fingerprint());
            logger.info(oss.str());

            return model;
        }

        double AnomalyModel::rawScore(const core::Embedding &embedding) const
        {
            if (embedding.size() != m_meta.dimension)
                throw core::DimensionMismatch(m_meta.dimension, embedding.size());
            if (!core::isFinite(embedding))
                throw std::invalid_argument("embedding contains a non-finite value");

            return m_forest.scoreSample(embedding);
        }

        core::AnomalyVerdict AnomalyModel::score(const core::Embedding &embedding) const
        {
            return core::AnomalyVerdict(rawScore(embedding), m_meta.threshold, m_fingerprint);
        }

        bool AnomalyModel::fittedWith(std::size_t dimension,
                                      std::uint64_t corpusFingerprint,
                                      const FitParams &params) const noexcept
        {
            const FitParams &mine = m_meta.params;
            return m_meta.dimension == dimension &&
                   m_meta.corpusFingerprint == corpusFingerprint &&
                   mine.contamination == params.contamination &&
                   mine.treeCount == params.treeCount &&
                   mine.maxSamples == params.maxSamples &&
                   mine.seed == params.seed;
        }

        void AnomalyModel::writeBody(std::ostream &out, bool includeTimestamp) const
        {
            const auto oldPrecision = out.precision(17);

            out << kMagic << ' ' << kFormatVersion << '\n'
                << "dimension " << m_meta.dimension << '\n'
                << "corpus_size " << m_meta.corpusSize << '\n'
                << "corpus_fingerprint " << Utils::toHex64(m_meta.corpusFingerprint) << '\n'
                << "contamination " << m_meta.params.contamination << '\n'
                << "tree_count " << m_meta.params.treeCount << '\n'
                << "max_samples " << m_meta.params.maxSamples << '\n'
                << "samples_per_tree " << m_forest.samplesPerTree() << '\n'
                << "seed " << m_meta.params.seed << '\n'
                << "threshold " << m_meta.threshold << '\n';
            if (includeTimestamp)
                out << "fitted_at_ms " << Utils::toMillisSinceEpoch(m_meta.fittedAt) << '\n';

            out.precision(oldPrecision);
            m_forest.writeTrees(out);
        }

        void AnomalyModel::serialize(std::ostream &out) const
        {
            std::ostringstream body;
            writeBody(body, true);
            const std::string text = body.str();

            out << text << "checksum " << Utils::toHex64(Utils::fnv1a64(text)) << '\n';
        }

        std::shared_ptr<const AnomalyModel> AnomalyModel::deserialize(std::istream &in)
        {
            const std::string text((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
            if (text.empty())
                throw core::ModelCorrupt("artifact is empty");

            const auto pos = text.rfind("checksum ");
            if (pos == std::string::npos || (pos != 0 && text[pos - 1] != '\n'))
                throw core::ModelCorrupt("checksum line missing (truncated artifact?)");

            const std::string body = text.substr(0, pos);
            const std::string stored(Utils::trim(std::string_view(text).substr(pos + 9)));
            if (stored != Utils::toHex64(Utils::fnv1a64(body)))
                throw core::ModelCorrupt("checksum mismatch");

            try
            {
                std::istringstream bin(body);

                std::string magic;
                int version = 0;
                if (!(bin >> magic >> version) || magic != kMagic)
                    throw std::invalid_argument("not a PromptGuard model artifact");
                if (version != kFormatVersion)
                    throw std::invalid_argument("unsupported format version " + std::to_string(version));

                Metadata meta;
                meta.dimension                = readField<std::size_t>(bin, "dimension");
                meta.corpusSize               = readField<std::size_t>(bin, "corpus_size");
                meta.corpusFingerprint        = readHexField(bin, "corpus_fingerprint");
                meta.params.contamination     = readField<double>(bin, "contamination");
                meta.params.treeCount         = readField<std::size_t>(bin, "tree_count");
                meta.params.maxSamples        = readField<std::size_t>(bin, "max_samples");
                const auto samplesPerTree     = readField<std::size_t>(bin, "samples_per_tree");
                meta.params.seed              = readField<std::uint64_t>(bin, "seed");
                meta.threshold                = readField<double>(bin, "threshold");
                meta.fittedAt = Utils::fromMillisSinceEpoch(readField<std::int64_t>(bin, "fitted_at_ms"));

                if (!(meta.params.contamination > 0.0 && meta.params.contamination < 1.0))
                    throw std::invalid_argument("contamination out of range");
                if (!std::isfinite(meta.threshold))
                    throw std::invalid_argument("threshold is not finite");
                if (samplesPerTree != std::min(meta.params.maxSamples, meta.corpusSize))
                    throw std::invalid_argument("samples_per_tree inconsistent with header");

                IsolationForest forest = IsolationForest::readTrees(
                    bin, meta.params.treeCount, meta.dimension, samplesPerTree);

                std::string trailing;
                if (bin >> trailing)
                    throw std::invalid_argument("unexpected trailing data '" + trailing + "'");

                return std::make_shared<const AnomalyModel>(std::move(forest), std::move(meta));
            }
            catch (const std::logic_error &e)
            {
                // invalid_argument / out_of_range from the field parsers
                throw core::ModelCorrupt(e.what());
            }
        }

    } // namespace Anomaly
} // namespace PromptGuard
