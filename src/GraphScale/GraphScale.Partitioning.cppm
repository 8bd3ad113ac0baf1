module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

export module GraphScale:Partitioning;

import Core.Error;
import Core;
import :Types;

export namespace GraphScale
{
    enum class PartitionAlgorithm : std::uint8_t
    {
        BreadthFirst = 0,
        Spectral
    };

    struct PartitionConfig
    {
        // 0 selects ceil(nodeCount / MaxSize) partitions.
        std::size_t TargetPartitions = 0;
        // Lowers the target to nodeCount / MinSize when it would leave smaller partitions.
        std::size_t MinSize = 10;
        std::size_t MaxSize = 1000;
        PartitionAlgorithm Algorithm = PartitionAlgorithm::BreadthFirst;

        // Power-iteration budget per spectral bisection.
        std::uint32_t SpectralIterations = 300;
        float SpectralTolerance = 1.0e-5f;
    };

    struct GraphPartition
    {
        std::size_t Id{0};
        std::vector<NodeId> Nodes{}; // input order
        std::size_t InternalEdges{0};
        std::size_t CutEdges{0};
        std::vector<std::size_t> Neighbors{}; // ascending partition ids

        [[nodiscard]] std::size_t Size() const noexcept { return Nodes.size(); }

        // Fraction of incident edges that stay inside the partition.
        [[nodiscard]] float Cohesion() const noexcept
        {
            const std::size_t total = InternalEdges + CutEdges;
            return total > 0 ? static_cast<float>(InternalEdges) / static_cast<float>(total) : 0.0f;
        }
    };

    struct PartitionMetrics
    {
        std::size_t PartitionCount{0};
        float AverageSize{0.0f};
        float SizeStdDev{0.0f};
        std::size_t EdgeCut{0};
        float Modularity{0.0f};
        // Largest partition size over the mean size; 1 is perfect balance.
        float BalanceFactor{0.0f};
    };

    struct PartitionResult
    {
        std::vector<GraphPartition> Partitions{};
        std::unordered_map<NodeId, std::size_t> NodeToPartition{};
        PartitionMetrics Metrics{};

        [[nodiscard]] std::optional<std::size_t> PartitionOf(NodeId id) const
        {
            const auto it = NodeToPartition.find(id);
            if (it == NodeToPartition.end()) return std::nullopt;
            return it->second;
        }
    };

    // Splits a node set into connected-ish, size-bounded groups. Output is deterministic for a
    // given input order and configuration.
    class GraphPartitioner
    {
    public:
        [[nodiscard]] static Core::Expected<GraphPartitioner> Create(const PartitionConfig& config = {});

        // Edges naming unknown ids are ignored. Duplicate node ids are InvalidArgument.
        [[nodiscard]] Core::Expected<PartitionResult> Partition(std::span<const NodeId> nodes,
            std::span<const Edge> edges) const;

        // Number of partitions Partition() aims for on a graph of nodeCount nodes.
        [[nodiscard]] std::size_t ResolvePartitionCount(std::size_t nodeCount) const;

        [[nodiscard]] const PartitionConfig& Config() const noexcept { return m_Config; }

    private:
        explicit GraphPartitioner(const PartitionConfig& config) : m_Config(config) {}

        PartitionConfig m_Config{};
    };

    [[nodiscard]] bool IsValid(const PartitionConfig& config);
}
