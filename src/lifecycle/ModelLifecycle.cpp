#include "lifecycle/ModelLifecycle.hpp"

#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Hash.hpp"
#include "utils/Logger.hpp"

namespace PromptGuard
{
    namespace Lifecycle
    {
        using Anomaly::AnomalyModel;

        const char *toString(LifecycleState state) noexcept
        {
            switch (state)
            {
            case LifecycleState::Unfitted: return "UNFITTED";
            case LifecycleState::Ready:    return "READY";
            default:                       return "UNKNOWN";
            }
        }

        ModelLifecycle::ModelLifecycle(std::optional<ModelStore> store)
            : m_store(std::move(store))
        {
        }

        std::shared_ptr<const AnomalyModel>
        ModelLifecycle::fit(const std::vector<core::Embedding> &corpus, const Anomaly::FitParams &params)
        {
            std::lock_guard<std::mutex> writeLock(m_writeMutex);

            const auto existing = current();
            if (existing && !corpus.empty() &&
                existing->fittedWith(corpus.front().size(), core::corpusFingerprint(corpus), params))
            {
                Utils::getLogger().info("Anomaly model already fitted on this corpus; keeping " +
                                        Utils::toHex64(existing->fingerprint()));
                return existing;
            }

            // Built entirely outside m_mutex: readers keep using the old snapshot meanwhile.
            auto model = AnomalyModel::fit(corpus, params);

            if (m_store)
                m_store->write(*model);

            swapIn(model);
            return model;
        }

        std::shared_ptr<const AnomalyModel>
        ModelLifecycle::fit(const std::vector<core::Embedding> &corpus, double contamination)
        {
            Anomaly::FitParams params;
            params.contamination = contamination;
            return fit(corpus, params);
        }

        std::optional<std::shared_ptr<const AnomalyModel>> ModelLifecycle::load()
        {
            std::lock_guard<std::mutex> writeLock(m_writeMutex);

            if (!m_store)
                return std::nullopt;

            auto &logger = Utils::getLogger();

            std::optional<std::shared_ptr<const AnomalyModel>> loaded;
            try
            {
                loaded = m_store->read();
            }
            catch (const core::ModelCorrupt &e)
            {
                logger.error(std::string(e.what()) + " (" + m_store->path() + ")");
                throw;
            }

            if (!loaded)
            {
                logger.info("No model artifact at " + m_store->path());
                return std::nullopt;
            }

            swapIn(*loaded);
            logger.info("Anomaly model loaded from " + m_store->path() + " (fingerprint " +
                        Utils::toHex64((*loaded)->fingerprint()) + ")");
            return loaded;
        }

        void ModelLifecycle::publish(std::shared_ptr<const AnomalyModel> model)
        {
            if (!model)
                throw std::invalid_argument("cannot publish a null model; use invalidate()");

            std::lock_guard<std::mutex> writeLock(m_writeMutex);
            swapIn(std::move(model));
        }

        void ModelLifecycle::invalidate()
        {
            std::lock_guard<std::mutex> writeLock(m_writeMutex);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_current.reset();
            }
            Utils::getLogger().info("Anomaly model invalidated; scoring disabled until refit");
        }

        bool ModelLifecycle::reset()
        {
            std::lock_guard<std::mutex> writeLock(m_writeMutex);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_current.reset();
            }

            const bool removed = m_store ? m_store->remove() : false;

            auto &logger = Utils::getLogger();
            if (removed)
                logger.info("Detector reset: model artifact " + m_store->path() + " deleted");
            else
                logger.info("Detector reset: no persisted artifact to delete");
            return removed;
        }

        LifecycleState ModelLifecycle::state() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_current ? LifecycleState::Ready : LifecycleState::Unfitted;
        }

        std::shared_ptr<const AnomalyModel> ModelLifecycle::current() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_current;
        }

        bool ModelLifecycle::needsRefit(std::size_t dimension,
                                        double contamination,
                                        std::uint64_t corpusFingerprint) const
        {
            const auto model = current();
            return !model ||
                   model->dimension() != dimension ||
                   model->contamination() != contamination ||
                   model->corpusFingerprint() != corpusFingerprint;
        }

        std::uint64_t ModelLifecycle::generation() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_generation;
        }

        void ModelLifecycle::swapIn(std::shared_ptr<const AnomalyModel> model)
        {
            std::shared_ptr<const AnomalyModel> previous;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                previous = std::move(m_current);
                m_current = std::move(model);
                ++m_generation;
            }
            // `previous` is released here, outside the lock; in-flight readers may still hold it.
        }

    } // namespace Lifecycle
} // namespace PromptGuard
