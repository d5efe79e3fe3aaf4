#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fraudscope {

// ─── WeightedPath ──────────────────────────────────────────────
// A directed walk through the graph and the sum of its edge weights,
// accumulated in walk order.

struct WeightedPath {
    std::vector<std::string> nodes;
    double total_weight = 0.0;
};

// ─── ShortestPathTree ──────────────────────────────────────────
// Result of one single-source Dijkstra run. distance[i] is infinity and
// parent_edge[i] is kNoEdge for nodes the source cannot reach.

struct ShortestPathTree {
    static constexpr size_t kNoEdge = std::numeric_limits<size_t>::max();

    size_t source = 0;
    std::vector<double> distance;
    std::vector<size_t> parent_edge;    // index into the graph's edge list

    bool reachable(size_t node) const {
        return node < distance.size() &&
               distance[node] != std::numeric_limits<double>::infinity();
    }
};

// ─── RelationshipGraph ─────────────────────────────────────────
// Directed weighted graph of entities (cards, merchants, policies, claim
// types). Node and edge order is first-insertion order, so every
// traversal is deterministic. Parallel transactions between the same
// pair collapse into one edge (see Edge).

class RelationshipGraph {
public:
    RelationshipGraph() = default;

    // ── Node operations ──
    /// Insert the node if missing; returns its index either way.
    size_t addNode(const std::string& id, EntityRole role = EntityRole::Source);
    bool hasNode(const std::string& id) const { return index_.count(id) > 0; }
    std::optional<size_t> nodeIndex(const std::string& id) const;
    const Node& node(size_t index) const { return nodes_.at(index); }
    std::vector<std::string> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    /// Add one transaction from source to target. Creates missing nodes.
    /// If the edge exists, the weight is added and the timestamp is kept
    /// at the later of the two.
    const Edge& addEdge(const std::string& source, const std::string& target,
                        double weight, double timestamp);
    bool hasEdge(const std::string& source, const std::string& target) const;
    const Edge* getEdge(const std::string& source, const std::string& target) const;
    const Edge& edge(size_t index) const { return edges_.at(index); }
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    std::vector<std::string> getSuccessors(const std::string& id) const;
    std::vector<std::string> getPredecessors(const std::string& id) const;

    bool hasNegativeWeights() const;

    // ── Shortest paths ──
    /// Single-source Dijkstra over edge weights. Ties are broken by node
    /// index. Throws ConfigurationError if any edge weight is negative.
    ShortestPathTree shortestPathsFrom(size_t source) const;

    /// Extract the path to `target` from a tree, or nullopt if unreachable.
    /// The total is re-summed along the path in walk order.
    std::optional<WeightedPath> pathTo(const ShortestPathTree& tree, size_t target) const;

    /// Minimum-weight path between two named nodes. nullopt when either
    /// node is unknown, the nodes coincide, or no directed path exists.
    std::optional<WeightedPath> findPath(const std::string& source,
                                         const std::string& target) const;

    /// Sum of edge weights along `path`, or nullopt if a hop has no edge.
    std::optional<double> pathWeight(const std::vector<std::string>& path) const;

    // ── Iteration ──
    void forEachNode(std::function<void(const Node&)> fn) const;
    void forEachEdge(std::function<void(const Edge&)> fn) const;

private:
    uint64_t next_edge_id_ = 1;

    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Edge> edges_;
    std::map<std::pair<size_t, size_t>, size_t> edge_lookup_;

    // Adjacency lists: node index → edge indices, in insertion order
    std::vector<std::vector<size_t>> outgoing_;
    std::vector<std::vector<size_t>> incoming_;
};

} // namespace fraudscope
