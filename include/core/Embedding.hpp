#ifndef CORE_EMBEDDING_HPP
#define CORE_EMBEDDING_HPP

#include <cmath>
#include <cstdint>
#include <vector>

#include "utils/Hash.hpp"

namespace core
{

/**
 * @brief Fixed-length semantic vector for one prompt.
 *
 * The length D is fixed for the lifetime of a fitted anomaly model;
 * vectors produced by different embedder versions are not comparable.
 */
using Embedding = std::vector<double>;

/// True if every component is a finite number.
inline bool isFinite(const Embedding& e) noexcept
{
    for (double v : e)
    {
        if (!std::isfinite(v))
            return false;
    }
    return true;
}

/**
 * @brief Order-sensitive fingerprint of a corpus of embeddings.
 *
 * Used to decide whether a persisted model was fitted on the same
 * reference corpus (bit-exact) as the one being offered now.
 */
inline std::uint64_t corpusFingerprint(const std::vector<Embedding>& corpus) noexcept
{
    PromptGuard::Utils::Fnv1a64 h;
    h.update(static_cast<std::uint64_t>(corpus.size()));
    for (const auto& e : corpus)
    {
        h.update(static_cast<std::uint64_t>(e.size()));
        for (double v : e)
            h.update(v);
    }
    return h.digest();
}

} // namespace core

#endif // CORE_EMBEDDING_HPP
