#pragma once

#include <memory>
#include <optional>
#include <string>

#include "anomaly/AnomalyModel.hpp"

namespace PromptGuard
{
    namespace Lifecycle
    {
        /**
         * ModelStore
         *
         * Persists one AnomalyModel artifact at a fixed path.
         *
         *  - write() goes to "<path>.tmp" and renames over <path>, so a
         *    reader never sees a half-written artifact.
         *  - read() distinguishes "no artifact" (std::nullopt) from
         *    "artifact present but unusable" (core::ModelCorrupt).
         */
        class ModelStore
        {
        public:
            explicit ModelStore(std::string path);

            const std::string &path() const noexcept { return m_path; }

            bool exists() const;

            /// Throws std::runtime_error if the artifact cannot be written.
            void write(const Anomaly::AnomalyModel &model) const;

            std::optional<std::shared_ptr<const Anomaly::AnomalyModel>> read() const;

            /// Delete the artifact. Returns true if a file was removed.
            bool remove() const;

        private:
            std::string m_path;
        };

    } // namespace Lifecycle
} // namespace PromptGuard
