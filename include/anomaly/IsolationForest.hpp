#pragma once

#include <cstdint>
#include <istream>
#include <limits>
#include <ostream>
#include <random>
#include <vector>

#include "core/Embedding.hpp"

namespace PromptGuard
{
    namespace Anomaly
    {
        /**
         * DeterministicRng
         *
         * mt19937_64 engine with hand-rolled range conversions. The standard
         * distributions are implementation-defined, so they would break
         * bit-reproducible fits across standard libraries.
         */
        class DeterministicRng
        {
        public:
            explicit DeterministicRng(std::uint64_t seed) : m_engine(seed) {}

            /// Uniform in [0, 1) with 53 bits of precision.
            double uniform01() noexcept
            {
                return static_cast<double>(m_engine() >> 11) * 0x1.0p-53;
            }

            /// Uniform integer in [0, n). n must be > 0.
            std::size_t uniformIndex(std::size_t n) noexcept
            {
                const std::uint64_t bound = static_cast<std::uint64_t>(n);
                const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() -
                                            std::numeric_limits<std::uint64_t>::max() % bound;
                std::uint64_t x = m_engine();
                while (x >= limit)
                    x = m_engine();
                return static_cast<std::size_t>(x % bound);
            }

        private:
            std::mt19937_64 m_engine;
        };

        /// splitmix64 finalizer; derives independent per-tree seeds from one fit seed.
        std::uint64_t mixSeed(std::uint64_t seed, std::uint64_t stream) noexcept;

        /**
         * One node of an isolation tree. Leaves have left == right == -1 and
         * record how many fit samples reached them.
         */
        struct IsolationNode
        {
            std::int32_t  feature   = -1;
            double        threshold = 0.0;
            std::int32_t  left      = -1;
            std::int32_t  right     = -1;
            std::uint32_t size      = 0;

            bool isLeaf() const noexcept { return left < 0 && right < 0; }
        };

        /**
         * IsolationTree
         *
         * Random binary partitioning of a subsample: each internal node splits
         * on a random non-constant feature at a uniform threshold between the
         * feature's min and max. Points with x[f] <= threshold go left.
         */
        class IsolationTree
        {
        public:
            IsolationTree() = default;

            /**
             * Build over data[sample[i]] up to heightLimit levels.
             */
            static IsolationTree build(const std::vector<core::Embedding>& data,
                                       std::vector<std::size_t> sample,
                                       std::size_t heightLimit,
                                       DeterministicRng& rng);

            /**
             * Adopt a node array read back from an artifact.
             * Throws std::invalid_argument if the structure is not a valid tree
             * over `dimension` features.
             */
            static IsolationTree fromNodes(std::vector<IsolationNode> nodes, std::size_t dimension);

            /// Depth at which x is isolated, plus the expected remainder for the leaf size.
            double pathLength(const core::Embedding& x) const noexcept;

            const std::vector<IsolationNode>& nodes() const noexcept { return m_nodes; }

        private:
            std::int32_t grow(const std::vector<core::Embedding>& data,
                              std::vector<std::size_t>& sample,
                              std::size_t begin,
                              std::size_t end,
                              std::size_t depth,
                              std::size_t heightLimit,
                              DeterministicRng& rng);

        private:
            std::vector<IsolationNode> m_nodes;   // m_nodes[0] is the root
        };

        /**
         * IsolationForest
         *
         * Ensemble of isolation trees (Liu, Ting & Zhou 2008).
         *
         *   s(x) = -2^(-E[h(x)] / c(psi))
         *
         * where h is the path length, psi the subsample size and c(n) the
         * average unsuccessful-search path length of a BST with n keys.
         * s lies in [-1, 0); lower means more anomalous.
         *
         * Building is deterministic given (data, params); scoring is a pure read.
         */
        class IsolationForest
        {
        public:
            struct Params
            {
                std::size_t   treeCount  = 200;
                std::size_t   maxSamples = 256;
                std::uint64_t seed       = 42;
            };

            IsolationForest() = default;

            /// Throws std::invalid_argument on an empty/ragged corpus or zero trees.
            static IsolationForest fit(const std::vector<core::Embedding>& data, const Params& params);

            /// Negated anomaly measure; caller guarantees x.size() == dimension().
            double scoreSample(const core::Embedding& x) const noexcept;

            std::size_t dimension() const noexcept { return m_dimension; }
            std::size_t samplesPerTree() const noexcept { return m_samplesPerTree; }
            std::size_t treeCount() const noexcept { return m_trees.size(); }
            const std::vector<IsolationTree>& trees() const noexcept { return m_trees; }

            /// Writes "tree <i> <nodeCount>" blocks followed by one node per line.
            void writeTrees(std::ostream& out) const;

            /// Inverse of writeTrees(); throws std::invalid_argument on malformed input.
            static IsolationForest readTrees(std::istream& in,
                                             std::size_t treeCount,
                                             std::size_t dimension,
                                             std::size_t samplesPerTree);

            /// c(n): 0 for n <= 1, 1 for n == 2, 2H(n-1) - 2(n-1)/n otherwise.
            static double averagePathLength(std::size_t n) noexcept;

        private:
            std::vector<IsolationTree> m_trees;
            std::size_t                m_dimension      = 0;
            std::size_t                m_samplesPerTree = 0;
            double                     m_normalizer     = 1.0;   // c(samplesPerTree)
        };

    } // namespace Anomaly
} // namespace PromptGuard
