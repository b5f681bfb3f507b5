#include "lifecycle/ModelStore.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"

namespace PromptGuard
{
    namespace Lifecycle
    {
        namespace fs = std::filesystem;

        ModelStore::ModelStore(std::string path)
            : m_path(std::move(path))
        {
            if (m_path.empty())
                throw std::invalid_argument("model store path must not be empty");
        }

        bool ModelStore::exists() const
        {
            std::error_code ec;
            return fs::is_regular_file(m_path, ec);
        }

        void ModelStore::write(const Anomaly::AnomalyModel &model) const
        {
            const std::string tmpPath = m_path + ".tmp";

            const fs::path parent = fs::path(m_path).parent_path();
            if (!parent.empty())
            {
                std::error_code ec;
                fs::create_directories(parent, ec);
                if (ec)
                    throw std::runtime_error("cannot create directory " + parent.string() + ": " + ec.message());
            }

            {
                std::ofstream out(tmpPath, std::ios::out | std::ios::trunc | std::ios::binary);
                if (!out.is_open())
                    throw std::runtime_error("cannot open " + tmpPath + " for writing");

                model.serialize(out);
                out.flush();
                if (!out)
                    throw std::runtime_error("failed writing model artifact " + tmpPath);
            }

            std::error_code ec;
            fs::rename(tmpPath, m_path, ec);
            if (ec)
            {
                fs::remove(tmpPath, ec);
                throw std::runtime_error("cannot move model artifact into place at " + m_path);
            }

            Utils::getLogger().info("Model artifact saved to " + m_path);
        }

        std::optional<std::shared_ptr<const Anomaly::AnomalyModel>> ModelStore::read() const
        {
            if (!exists())
                return std::nullopt;

            std::ifstream in(m_path, std::ios::in | std::ios::binary);
            if (!in.is_open())
                throw core::ModelCorrupt("cannot open " + m_path);

            return Anomaly::AnomalyModel::deserialize(in);
        }

        bool ModelStore::remove() const
        {
            std::error_code ec;
            const bool removed = fs::remove(m_path, ec);
            if (ec)
                throw std::runtime_error("cannot delete model artifact " + m_path + ": " + ec.message());
            return removed;
        }

    } // namespace Lifecycle
} // namespace PromptGuard
