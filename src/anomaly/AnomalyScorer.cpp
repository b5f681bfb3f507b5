#include "anomaly/AnomalyScorer.hpp"

#include <stdexcept>

#include "core/Errors.hpp"

namespace PromptGuard
{
    namespace Anomaly
    {
        std::shared_ptr<const AnomalyModel> AnomalyScorer::snapshot() const
        {
            auto model = m_source.current();
            if (!model)
                throw core::ModelNotReady();
            return model;
        }

        core::AnomalyVerdict AnomalyScorer::score(const core::Embedding &embedding) const
        {
            const auto model = snapshot();
            return scoreWith(*model, embedding);
        }

        std::vector<ScoreOutcome> AnomalyScorer::scoreEach(const std::vector<core::Embedding> &embeddings) const
        {
            const auto model = snapshot();

            std::vector<ScoreOutcome> outcomes(embeddings.size());
            for (std::size_t i = 0; i < embeddings.size(); ++i)
            {
                try
                {
                    outcomes[i].verdict = scoreWith(*model, embeddings[i]);
                }
                catch (const core::DimensionMismatch &e)
                {
                    outcomes[i].error = e.what();
                }
                catch (const std::invalid_argument &e)
                {
                    outcomes[i].error = e.what();
                }
            }
            return outcomes;
        }

        core::AnomalyVerdict AnomalyScorer::scoreWith(const AnomalyModel &model,
                                                      const core::Embedding &embedding)
        {
            return model.score(embedding);
        }

    } // namespace Anomaly
} // namespace PromptGuard
