module;

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <deque>
#include <limits>
#include <numeric>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

module GraphScale:Partitioning.Impl;

import Core.Error;
import Core.Logging;
import :Partitioning;
import :Types;

namespace GraphScale
{
    namespace
    {
        constexpr std::uint32_t kUnassigned = std::numeric_limits<std::uint32_t>::max();
        constexpr std::uint32_t kUnreached = std::numeric_limits<std::uint32_t>::max();

        // Nodes re-indexed 0..n-1 in input order. Edges keep self loops for the metrics;
        // adjacency does not.
        struct LocalGraph
        {
            std::vector<std::pair<std::uint32_t, std::uint32_t>> Edges;
            std::vector<std::vector<std::uint32_t>> Adjacency;
        };

        [[nodiscard]] LocalGraph BuildLocalGraph(std::span<const Edge> edges,
            const std::unordered_map<NodeId, std::uint32_t>& indexOf, std::size_t nodeCount)
        {
            LocalGraph graph;
            graph.Adjacency.resize(nodeCount);
            graph.Edges.reserve(edges.size());

            for (const Edge& edge : edges)
            {
                const auto source = indexOf.find(edge.Source);
                const auto target = indexOf.find(edge.Target);
                if (source == indexOf.end() || target == indexOf.end()) continue;

                const std::uint32_t a = source->second;
                const std::uint32_t b = target->second;
                graph.Edges.emplace_back(a, b);
                if (a == b) continue;
                graph.Adjacency[a].push_back(b);
                graph.Adjacency[b].push_back(a);
            }
            return graph;
        }

        // --- Breadth-first growth ---

        // Lowers hop[] to the BFS distance from `source` wherever that is shorter.
        void RelaxHopDistances(const LocalGraph& graph, std::uint32_t source, std::vector<std::uint32_t>& hop)
        {
            std::deque<std::uint32_t> queue;
            hop[source] = 0;
            queue.push_back(source);
            while (!queue.empty())
            {
                const std::uint32_t u = queue.front();
                queue.pop_front();
                for (const std::uint32_t v : graph.Adjacency[u])
                {
                    if (hop[u] + 1 >= hop[v]) continue;
                    hop[v] = hop[u] + 1;
                    queue.push_back(v);
                }
            }
        }

        // Farthest-first seeds: the first input node, then repeatedly the node with the largest
        // hop distance to every seed so far (unreachable first, ties by input order).
        [[nodiscard]] std::vector<std::uint32_t> SelectSeeds(const LocalGraph& graph, std::size_t nodeCount,
            std::size_t seedCount)
        {
            std::vector<std::uint32_t> seeds;
            seeds.reserve(seedCount);
            std::vector<std::uint32_t> hop(nodeCount, kUnreached);
            std::vector<bool> isSeed(nodeCount, false);

            std::uint32_t next = 0;
            while (seeds.size() < seedCount)
            {
                seeds.push_back(next);
                isSeed[next] = true;
                RelaxHopDistances(graph, next, hop);
                if (seeds.size() == seedCount) break;

                bool found = false;
                std::uint32_t bestHop = 0;
                for (std::uint32_t i = 0; i < nodeCount; ++i)
                {
                    if (isSeed[i]) continue;
                    if (!found || hop[i] > bestHop)
                    {
                        found = true;
                        bestHop = hop[i];
                        next = i;
                    }
                }
            }
            return seeds;
        }

        [[nodiscard]] std::vector<std::uint32_t> GrowBreadthFirst(const LocalGraph& graph, std::size_t nodeCount,
            std::size_t partitionCount, std::size_t maxSize)
        {
            std::vector<std::uint32_t> assignment(nodeCount, kUnassigned);
            std::vector<std::deque<std::uint32_t>> frontier(partitionCount);
            std::vector<std::size_t> sizes(partitionCount, 0);
            std::size_t assigned = 0;

            auto assign = [&](std::uint32_t node, std::size_t partition)
            {
                assignment[node] = static_cast<std::uint32_t>(partition);
                ++sizes[partition];
                ++assigned;
                for (const std::uint32_t neighbor : graph.Adjacency[node])
                {
                    if (assignment[neighbor] == kUnassigned) frontier[partition].push_back(neighbor);
                }
            };

            const std::vector<std::uint32_t> seeds = SelectSeeds(graph, nodeCount, partitionCount);
            for (std::size_t p = 0; p < partitionCount; ++p) assign(seeds[p], p);

            std::uint32_t cursor = 0;
            while (assigned < nodeCount)
            {
                bool progressed = false;
                for (std::size_t p = 0; p < partitionCount; ++p)
                {
                    if (sizes[p] >= maxSize) continue;

                    auto& queue = frontier[p];
                    while (!queue.empty())
                    {
                        const std::uint32_t candidate = queue.front();
                        queue.pop_front();
                        if (assignment[candidate] != kUnassigned) continue;
                        assign(candidate, p);
                        progressed = true;
                        break;
                    }
                }
                if (progressed) continue;

                // Stalled: every frontier is exhausted or full. Hand the first leftover node to
                // the smallest partition, which resumes growing from there. The partition count
                // covers nodeCount / maxSize, so the smallest partition always has room.
                while (assignment[cursor] != kUnassigned) ++cursor;
                const auto smallest = static_cast<std::size_t>(
                    std::distance(sizes.begin(), std::min_element(sizes.begin(), sizes.end())));
                assign(cursor, smallest);
            }
            return assignment;
        }

        // --- Spectral bisection ---

        void RemoveMean(std::vector<float>& values)
        {
            if (values.empty()) return;

            float mean = 0.0f;
            for (const float value : values) mean += value;
            mean /= static_cast<float>(values.size());
            for (float& value : values) value -= mean;
        }

        [[nodiscard]] float Dot(const std::vector<float>& a, const std::vector<float>& b)
        {
            float sum = 0.0f;
            for (std::size_t i = 0; i < a.size(); ++i) sum += a[i] * b[i];
            return sum;
        }

        [[nodiscard]] float Normalize(std::vector<float>& values, float minNorm)
        {
            const float norm2 = Dot(values, values);
            if (!std::isfinite(norm2) || norm2 <= minNorm * minNorm) return 0.0f;
            const float invNorm = 1.0f / std::sqrt(norm2);
            for (float& value : values) value *= invNorm;
            return std::sqrt(norm2);
        }

        void MultiplyCombinatorialLaplacian(std::span<const std::pair<std::uint32_t, std::uint32_t>> edges,
            std::span<const float> x, std::span<float> y)
        {
            std::fill(y.begin(), y.end(), 0.0f);
            for (const auto& [i, j] : edges)
            {
                const float d = x[i] - x[j];
                y[i] += d;
                y[j] -= d;
            }
        }

        // Approximate Fiedler vector of the subgraph induced by `members`, by power iteration on
        // (I - alpha * L) restricted to mean-free vectors. Empty when the iteration degenerates.
        [[nodiscard]] std::vector<float> ApproximateFiedlerVector(const LocalGraph& graph,
            std::span<const std::uint32_t> members, std::vector<std::uint32_t>& scratchLocal,
            const PartitionConfig& config)
        {
            const std::size_t n = members.size();
            for (std::size_t i = 0; i < n; ++i) scratchLocal[members[i]] = static_cast<std::uint32_t>(i);

            std::vector<std::pair<std::uint32_t, std::uint32_t>> localEdges;
            std::vector<std::uint32_t> degree(n, 0);
            for (std::size_t i = 0; i < n; ++i)
            {
                for (const std::uint32_t neighbor : graph.Adjacency[members[i]])
                {
                    const std::uint32_t j = scratchLocal[neighbor];
                    // Each undirected edge appears in both adjacency lists; keep one copy.
                    if (j == kUnassigned || j <= i) continue;
                    localEdges.emplace_back(static_cast<std::uint32_t>(i), j);
                    ++degree[i];
                    ++degree[j];
                }
            }
            for (const std::uint32_t member : members) scratchLocal[member] = kUnassigned;

            const std::uint32_t maxDegree = *std::max_element(degree.begin(), degree.end());
            // Eigenvalues of L lie in [0, 2 * maxDegree]; this keeps I - alpha * L positive semi-definite.
            const float alpha = 0.5f / std::max(1.0f, static_cast<float>(maxDegree));
            constexpr float minNorm = 1.0e-12f;

            std::vector<float> q(n, 0.0f);
            for (std::size_t i = 0; i < n; ++i)
            {
                const float t = static_cast<float>(i + 1U);
                q[i] = std::sin(0.73f * t) + 0.17f * std::cos(1.11f * t);
            }
            RemoveMean(q);
            if (Normalize(q, minNorm) == 0.0f) return {};

            std::vector<float> y(n, 0.0f);
            std::vector<float> laplace(n, 0.0f);
            for (std::uint32_t iteration = 0; iteration < config.SpectralIterations; ++iteration)
            {
                MultiplyCombinatorialLaplacian(localEdges, q, laplace);
                for (std::size_t i = 0; i < n; ++i) y[i] = q[i] - alpha * laplace[i];
                RemoveMean(y);
                if (Normalize(y, minNorm) == 0.0f) return {};

                float delta = 0.0f;
                for (std::size_t i = 0; i < n; ++i)
                {
                    delta = std::max(delta, std::abs(y[i] - q[i]));
                    q[i] = y[i];
                }
                if (delta <= config.SpectralTolerance) break;
            }
            return q;
        }

        [[nodiscard]] std::vector<std::uint32_t> BisectSpectrally(const LocalGraph& graph, std::size_t nodeCount,
            std::size_t partitionCount, const PartitionConfig& config)
        {
            std::vector<std::vector<std::uint32_t>> parts(1);
            parts[0].resize(nodeCount);
            std::iota(parts[0].begin(), parts[0].end(), 0U);

            std::vector<std::uint32_t> scratchLocal(nodeCount, kUnassigned);

            while (true)
            {
                std::size_t largest = 0;
                for (std::size_t p = 1; p < parts.size(); ++p)
                {
                    if (parts[p].size() > parts[largest].size()) largest = p;
                }

                const std::size_t largestSize = parts[largest].size();
                if (largestSize < 2) break;
                if (parts.size() >= partitionCount && largestSize <= config.MaxSize) break;

                std::vector<std::uint32_t> members = std::move(parts[largest]);
                const std::vector<float> fiedler = ApproximateFiedlerVector(graph, members, scratchLocal, config);

                std::vector<std::size_t> order(members.size());
                std::iota(order.begin(), order.end(), std::size_t{0});
                if (!fiedler.empty())
                {
                    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b)
                    {
                        return fiedler[a] < fiedler[b];
                    });
                }

                const std::size_t half = members.size() / 2;
                std::vector<std::uint32_t> lower;
                std::vector<std::uint32_t> upper;
                lower.reserve(half);
                upper.reserve(members.size() - half);
                for (std::size_t i = 0; i < order.size(); ++i)
                {
                    (i < half ? lower : upper).push_back(members[order[i]]);
                }
                std::sort(lower.begin(), lower.end());
                std::sort(upper.begin(), upper.end());

                parts[largest] = std::move(lower);
                parts.push_back(std::move(upper));
            }

            std::vector<std::uint32_t> assignment(nodeCount, kUnassigned);
            for (std::size_t p = 0; p < parts.size(); ++p)
            {
                for (const std::uint32_t node : parts[p]) assignment[node] = static_cast<std::uint32_t>(p);
            }
            return assignment;
        }

        // --- Result assembly ---

        [[nodiscard]] PartitionResult AssembleResult(std::span<const NodeId> nodes, const LocalGraph& graph,
            const std::vector<std::uint32_t>& assignment)
        {
            std::size_t partitionCount = 0;
            for (const std::uint32_t p : assignment) partitionCount = std::max<std::size_t>(partitionCount, p + 1U);

            PartitionResult result;
            result.Partitions.resize(partitionCount);
            result.NodeToPartition.reserve(nodes.size());
            for (std::size_t p = 0; p < partitionCount; ++p) result.Partitions[p].Id = p;

            for (std::size_t i = 0; i < nodes.size(); ++i)
            {
                result.Partitions[assignment[i]].Nodes.push_back(nodes[i]);
                result.NodeToPartition.emplace(nodes[i], assignment[i]);
            }

            std::vector<double> degreeSum(partitionCount, 0.0);
            std::size_t edgeCut = 0;
            for (const auto& [a, b] : graph.Edges)
            {
                const std::uint32_t pa = assignment[a];
                const std::uint32_t pb = assignment[b];
                degreeSum[pa] += 1.0;
                degreeSum[pb] += 1.0;
                if (pa == pb)
                {
                    ++result.Partitions[pa].InternalEdges;
                    continue;
                }
                ++edgeCut;
                ++result.Partitions[pa].CutEdges;
                ++result.Partitions[pb].CutEdges;
                result.Partitions[pa].Neighbors.push_back(pb);
                result.Partitions[pb].Neighbors.push_back(pa);
            }

            for (GraphPartition& partition : result.Partitions)
            {
                std::sort(partition.Neighbors.begin(), partition.Neighbors.end());
                partition.Neighbors.erase(std::unique(partition.Neighbors.begin(), partition.Neighbors.end()),
                    partition.Neighbors.end());
            }

            PartitionMetrics& metrics = result.Metrics;
            metrics.PartitionCount = partitionCount;
            metrics.EdgeCut = edgeCut;
            if (partitionCount == 0) return result;

            const double mean = static_cast<double>(nodes.size()) / static_cast<double>(partitionCount);
            double variance = 0.0;
            std::size_t maxSize = 0;
            for (const GraphPartition& partition : result.Partitions)
            {
                const double d = static_cast<double>(partition.Size()) - mean;
                variance += d * d;
                maxSize = std::max(maxSize, partition.Size());
            }
            variance /= static_cast<double>(partitionCount);

            metrics.AverageSize = static_cast<float>(mean);
            metrics.SizeStdDev = static_cast<float>(std::sqrt(variance));
            metrics.BalanceFactor = static_cast<float>(static_cast<double>(maxSize) / mean);

            const double m = static_cast<double>(graph.Edges.size());
            if (m > 0.0)
            {
                double modularity = 0.0;
                for (std::size_t p = 0; p < partitionCount; ++p)
                {
                    const double share = degreeSum[p] / (2.0 * m);
                    modularity += static_cast<double>(result.Partitions[p].InternalEdges) / m - share * share;
                }
                metrics.Modularity = static_cast<float>(modularity);
            }
            return result;
        }
    }

    bool IsValid(const PartitionConfig& config)
    {
        return config.MaxSize > 0 &&
               config.MinSize <= config.MaxSize &&
               config.SpectralIterations > 0 &&
               std::isfinite(config.SpectralTolerance) && config.SpectralTolerance >= 0.0f;
    }

    Core::Expected<GraphPartitioner> GraphPartitioner::Create(const PartitionConfig& config)
    {
        if (!IsValid(config))
        {
            Core::Log::Warn("GraphPartitioner: rejected config (min={}, max={}, iterations={})",
                config.MinSize, config.MaxSize, config.SpectralIterations);
            return Core::Err<GraphPartitioner>(Core::ErrorCode::InvalidConfiguration);
        }
        return GraphPartitioner(config);
    }

    std::size_t GraphPartitioner::ResolvePartitionCount(std::size_t nodeCount) const
    {
        if (nodeCount == 0) return 0;

        // Never fewer partitions than MaxSize allows, never more than there are nodes.
        const std::size_t minimum = (nodeCount + m_Config.MaxSize - 1) / m_Config.MaxSize;
        const std::size_t requested = m_Config.TargetPartitions > 0 ? m_Config.TargetPartitions : minimum;

        // MinSize caps the count so the average partition holds at least MinSize nodes.
        // When both bounds cannot hold, MaxSize wins.
        const std::size_t maximum =
            m_Config.MinSize > 0 ? std::max<std::size_t>(1, nodeCount / m_Config.MinSize) : nodeCount;
        return std::min(std::max(std::min(requested, maximum), minimum), nodeCount);
    }

    Core::Expected<PartitionResult> GraphPartitioner::Partition(std::span<const NodeId> nodes,
        std::span<const Edge> edges) const
    {
        if (nodes.empty()) return PartitionResult{};

        std::unordered_map<NodeId, std::uint32_t> indexOf;
        indexOf.reserve(nodes.size());
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            if (!indexOf.emplace(nodes[i], static_cast<std::uint32_t>(i)).second)
            {
                Core::Log::Warn("GraphPartitioner: duplicate node id {} in input", nodes[i].Value);
                return Core::Err<PartitionResult>(Core::ErrorCode::InvalidArgument);
            }
        }

        const LocalGraph graph = BuildLocalGraph(edges, indexOf, nodes.size());
        const std::size_t partitionCount = ResolvePartitionCount(nodes.size());

        const std::vector<std::uint32_t> assignment =
            m_Config.Algorithm == PartitionAlgorithm::Spectral
                ? BisectSpectrally(graph, nodes.size(), partitionCount, m_Config)
                : GrowBreadthFirst(graph, nodes.size(), partitionCount, m_Config.MaxSize);

        PartitionResult result = AssembleResult(nodes, graph, assignment);

        Core::Log::Debug("GraphPartitioner: {} nodes -> {} partitions (cut={}, modularity={:.3f}, balance={:.2f})",
            nodes.size(), result.Metrics.PartitionCount, result.Metrics.EdgeCut, result.Metrics.Modularity,
            result.Metrics.BalanceFactor);
        return result;
    }
}
