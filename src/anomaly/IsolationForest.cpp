#include "anomaly/IsolationForest.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <stdexcept>
#include <string>

namespace PromptGuard
{
    namespace Anomaly
    {
        namespace
        {
            constexpr double kEulerGamma = 0.57721566490153286;

            std::size_t heightLimitFor(std::size_t samples)
            {
                return static_cast<std::size_t>(
                    std::ceil(std::log2(static_cast<double>(std::max<std::size_t>(samples, 2)))));
            }
        } // anonymous namespace

        std::uint64_t mixSeed(std::uint64_t seed, std::uint64_t stream) noexcept
        {
            std::uint64_t z = seed + (stream + 1) * 0x9E3779B97F4A7C15ULL;
            z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
            z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
            return z ^ (z >> 31);
        }

        // ---------------- IsolationTree ----------------

        IsolationTree IsolationTree::build(const std::vector<core::Embedding>& data,
                                           std::vector<std::size_t> sample,
                                           std::size_t heightLimit,
                                           DeterministicRng& rng)
        {
            IsolationTree tree;
            tree.m_nodes.reserve(2 * sample.size());
            tree.grow(data, sample, 0, sample.size(), 0, heightLimit, rng);
            return tree;
        }

        std::int32_t IsolationTree::grow(const std::vector<core::Embedding>& data,
                                         std::vector<std::size_t>& sample,
                                         std::size_t begin,
                                         std::size_t end,
                                         std::size_t depth,
                                         std::size_t heightLimit,
                                         DeterministicRng& rng)
        {
            const auto index = static_cast<std::int32_t>(m_nodes.size());
            m_nodes.emplace_back();

            const std::size_t count = end - begin;
            m_nodes[static_cast<std::size_t>(index)].size = static_cast<std::uint32_t>(count);

            if (depth >= heightLimit || count <= 1)
                return index;

            // Scan features cyclically from a random start until one varies.
            const std::size_t dim = data[sample[begin]].size();
            const std::size_t start = rng.uniformIndex(dim);

            std::size_t feature = dim;
            double lo = 0.0;
            double hi = 0.0;
            for (std::size_t k = 0; k < dim; ++k)
            {
                const std::size_t f = (start + k) % dim;
                lo = hi = data[sample[begin]][f];
                for (std::size_t i = begin + 1; i < end; ++i)
                {
                    const double v = data[sample[i]][f];
                    lo = std::min(lo, v);
                    hi = std::max(hi, v);
                }
                if (hi > lo)
                {
                    feature = f;
                    break;
                }
            }

            // All remaining points are identical: nothing left to isolate.
            if (feature == dim)
                return index;

            double threshold = lo + rng.uniform01() * (hi - lo);
            if (threshold >= hi)
                threshold = lo;

            const auto first = sample.begin() + static_cast<std::ptrdiff_t>(begin);
            const auto last  = sample.begin() + static_cast<std::ptrdiff_t>(end);
            const auto mid   = std::partition(first, last, [&](std::size_t i) {
                return data[i][feature] <= threshold;
            });
            const std::size_t split = static_cast<std::size_t>(mid - sample.begin());

            const std::int32_t left  = grow(data, sample, begin, split, depth + 1, heightLimit, rng);
            const std::int32_t right = grow(data, sample, split, end, depth + 1, heightLimit, rng);

            // m_nodes may have reallocated while growing children.
            IsolationNode& node = m_nodes[static_cast<std::size_t>(index)];
            node.feature   = static_cast<std::int32_t>(feature);
            node.threshold = threshold;
            node.left      = left;
            node.right     = right;
            return index;
        }

        IsolationTree IsolationTree::fromNodes(std::vector<IsolationNode> nodes, std::size_t dimension)
        {
            if (nodes.empty())
                throw std::invalid_argument("tree has no nodes");

            const auto count = static_cast<std::int32_t>(nodes.size());
            for (std::int32_t i = 0; i < count; ++i)
            {
                const IsolationNode& n = nodes[static_cast<std::size_t>(i)];
                if (n.isLeaf())
                    continue;

                // Children must come after their parent (pre-order), which rules out cycles.
                if (n.left <= i || n.right <= i || n.left >= count || n.right >= count)
                    throw std::invalid_argument("node " + std::to_string(i) + " has invalid children");
                if (n.feature < 0 || static_cast<std::size_t>(n.feature) >= dimension)
                    throw std::invalid_argument("node " + std::to_string(i) + " splits on unknown feature");
                if (!std::isfinite(n.threshold))
                    throw std::invalid_argument("node " + std::to_string(i) + " has non-finite threshold");
            }

            IsolationTree tree;
            tree.m_nodes = std::move(nodes);
            return tree;
        }

        double IsolationTree::pathLength(const core::Embedding& x) const noexcept
        {
            std::size_t i = 0;
            std::size_t depth = 0;
            while (!m_nodes[i].isLeaf())
            {
                const IsolationNode& n = m_nodes[i];
                i = static_cast<std::size_t>(
                    x[static_cast<std::size_t>(n.feature)] <= n.threshold ? n.left : n.right);
                ++depth;
            }
            return static_cast<double>(depth) + IsolationForest::averagePathLength(m_nodes[i].size);
        }

        // ---------------- IsolationForest ----------------

        double IsolationForest::averagePathLength(std::size_t n) noexcept
        {
            if (n <= 1)
                return 0.0;
            if (n == 2)
                return 1.0;
            const double nd = static_cast<double>(n);
            return 2.0 * (std::log(nd - 1.0) + kEulerGamma) - 2.0 * (nd - 1.0) / nd;
        }

        IsolationForest IsolationForest::fit(const std::vector<core::Embedding>& data, const Params& params)
        {
            if (data.size() < 2)
                throw std::invalid_argument("isolation forest needs at least 2 samples");
            if (params.treeCount == 0)
                throw std::invalid_argument("isolation forest needs at least 1 tree");
            if (params.maxSamples < 2)
                throw std::invalid_argument("max_samples must be at least 2");

            const std::size_t dim = data.front().size();
            if (dim == 0)
                throw std::invalid_argument("embeddings must not be empty");
            for (const auto& e : data)
            {
                if (e.size() != dim)
                    throw std::invalid_argument("corpus embeddings have differing dimensions");
                if (!core::isFinite(e))
                    throw std::invalid_argument("corpus embedding contains a non-finite value");
            }

            IsolationForest forest;
            forest.m_dimension      = dim;
            forest.m_samplesPerTree = std::min(params.maxSamples, data.size());
            forest.m_normalizer     = averagePathLength(forest.m_samplesPerTree);
            forest.m_trees.reserve(params.treeCount);

            const std::size_t heightLimit = heightLimitFor(forest.m_samplesPerTree);

            std::vector<std::size_t> indices(data.size());
            for (std::size_t t = 0; t < params.treeCount; ++t)
            {
                DeterministicRng rng(mixSeed(params.seed, t));

                // Partial Fisher-Yates: the first samplesPerTree slots become the subsample.
                std::iota(indices.begin(), indices.end(), std::size_t{0});
                for (std::size_t i = 0; i < forest.m_samplesPerTree; ++i)
                {
                    const std::size_t j = i + rng.uniformIndex(indices.size() - i);
                    std::swap(indices[i], indices[j]);
                }
                std::vector<std::size_t> sample(
                    indices.begin(),
                    indices.begin() + static_cast<std::ptrdiff_t>(forest.m_samplesPerTree));

                forest.m_trees.push_back(IsolationTree::build(data, std::move(sample), heightLimit, rng));
            }

            return forest;
        }

        double IsolationForest::scoreSample(const core::Embedding& x) const noexcept
        {
            double total = 0.0;
            for (const auto& tree : m_trees)
                total += tree.pathLength(x);

            const double meanPath = total / static_cast<double>(m_trees.size());
            return -std::pow(2.0, -meanPath / m_normalizer);
        }

        void IsolationForest::writeTrees(std::ostream& out) const
        {
            const auto oldPrecision = out.precision(17);
            for (std::size_t t = 0; t < m_trees.size(); ++t)
            {
                const auto& nodes = m_trees[t].nodes();
                out << "tree " << t << ' ' << nodes.size() << '\n';
                for (const auto& n : nodes)
                {
                    out << n.feature << ' ' << n.threshold << ' '
                        << n.left << ' ' << n.right << ' ' << n.size << '\n';
                }
            }
            out.precision(oldPrecision);
        }

        IsolationForest IsolationForest::readTrees(std::istream& in,
                                                   std::size_t treeCount,
                                                   std::size_t dimension,
                                                   std::size_t samplesPerTree)
        {
            if (treeCount == 0 || dimension == 0 || samplesPerTree < 2)
                throw std::invalid_argument("invalid forest header");

            IsolationForest forest;
            forest.m_dimension      = dimension;
            forest.m_samplesPerTree = samplesPerTree;
            forest.m_normalizer     = averagePathLength(samplesPerTree);
            forest.m_trees.reserve(treeCount);

            // A tree over psi samples never has more than 2*psi - 1 nodes.
            const std::size_t maxNodes = 2 * samplesPerTree - 1;

            for (std::size_t t = 0; t < treeCount; ++t)
            {
                std::string tag;
                std::size_t index = 0;
                std::size_t nodeCount = 0;
                if (!(in >> tag >> index >> nodeCount) || tag != "tree" || index != t)
                    throw std::invalid_argument("missing header for tree " + std::to_string(t));
                if (nodeCount == 0 || nodeCount > maxNodes)
                    throw std::invalid_argument("tree " + std::to_string(t) + " has implausible node count");

                std::vector<IsolationNode> nodes(nodeCount);
                for (auto& n : nodes)
                {
                    if (!(in >> n.feature >> n.threshold >> n.left >> n.right >> n.size))
                        throw std::invalid_argument("truncated node in tree " + std::to_string(t));
                }
                forest.m_trees.push_back(IsolationTree::fromNodes(std::move(nodes), dimension));
            }

            return forest;
        }

    } // namespace Anomaly
} // namespace PromptGuard
