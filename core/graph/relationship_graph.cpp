#include "graph/relationship_graph.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <stdexcept>
#include <string>

namespace fraudscope {

// ─── Node operations ───────────────────────────────────────────

size_t RelationshipGraph::addNode(const std::string& id, EntityRole role) {
    auto it = index_.find(id);
    if (it != index_.end()) return it->second;

    size_t index = nodes_.size();
    nodes_.emplace_back(index, id, role);
    index_.emplace(id, index);
    outgoing_.emplace_back();
    incoming_.emplace_back();
    return index;
}

std::optional<size_t> RelationshipGraph::nodeIndex(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> RelationshipGraph::getNodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const Node& n : nodes_) {
        ids.push_back(n.id);
    }
    return ids;
}

// ─── Edge operations ───────────────────────────────────────────

const Edge& RelationshipGraph::addEdge(const std::string& source, const std::string& target,
                                       double weight, double timestamp) {
    size_t s = addNode(source, EntityRole::Source);
    size_t t = addNode(target, EntityRole::Target);

    auto it = edge_lookup_.find({s, t});
    if (it != edge_lookup_.end()) {
        Edge& existing = edges_[it->second];
        existing.weight += weight;
        existing.timestamp = std::max(existing.timestamp, timestamp);
        existing.transaction_count++;
        return existing;
    }

    size_t index = edges_.size();
    edges_.emplace_back(next_edge_id_++, s, t, weight, timestamp);
    edge_lookup_.emplace(std::make_pair(s, t), index);
    outgoing_[s].push_back(index);
    incoming_[t].push_back(index);
    return edges_.back();
}

bool RelationshipGraph::hasEdge(const std::string& source, const std::string& target) const {
    return getEdge(source, target) != nullptr;
}

const Edge* RelationshipGraph::getEdge(const std::string& source, const std::string& target) const {
    auto s = nodeIndex(source);
    auto t = nodeIndex(target);
    if (!s || !t) return nullptr;
    auto it = edge_lookup_.find({*s, *t});
    return it != edge_lookup_.end() ? &edges_[it->second] : nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<std::string> RelationshipGraph::getSuccessors(const std::string& id) const {
    auto n = nodeIndex(id);
    if (!n) return {};
    std::vector<std::string> result;
    for (size_t eid : outgoing_[*n]) {
        result.push_back(nodes_[edges_[eid].target].id);
    }
    return result;
}

std::vector<std::string> RelationshipGraph::getPredecessors(const std::string& id) const {
    auto n = nodeIndex(id);
    if (!n) return {};
    std::vector<std::string> result;
    for (size_t eid : incoming_[*n]) {
        result.push_back(nodes_[edges_[eid].source].id);
    }
    return result;
}

bool RelationshipGraph::hasNegativeWeights() const {
    return std::any_of(edges_.begin(), edges_.end(),
                       [](const Edge& e) { return e.weight < 0.0; });
}

// ─── Shortest paths ────────────────────────────────────────────

ShortestPathTree RelationshipGraph::shortestPathsFrom(size_t source) const {
    if (source >= nodes_.size()) {
        throw std::out_of_range("Source node index out of range: " + std::to_string(source));
    }
    if (hasNegativeWeights()) {
        throw ConfigurationError("Shortest-path search requires non-negative edge weights");
    }

    ShortestPathTree tree;
    tree.source = source;
    tree.distance.assign(nodes_.size(), std::numeric_limits<double>::infinity());
    tree.parent_edge.assign(nodes_.size(), ShortestPathTree::kNoEdge);
    tree.distance[source] = 0.0;

    using Entry = std::pair<double, size_t>;  // (distance, node)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    frontier.push({0.0, source});
    std::vector<bool> settled(nodes_.size(), false);

    while (!frontier.empty()) {
        auto [dist, u] = frontier.top();
        frontier.pop();
        if (settled[u]) continue;
        settled[u] = true;

        for (size_t eid : outgoing_[u]) {
            const Edge& e = edges_[eid];
            double candidate = dist + e.weight;
            if (candidate < tree.distance[e.target]) {
                tree.distance[e.target] = candidate;
                tree.parent_edge[e.target] = eid;
                frontier.push({candidate, e.target});
            }
        }
    }
    return tree;
}

std::optional<WeightedPath> RelationshipGraph::pathTo(const ShortestPathTree& tree,
                                                      size_t target) const {
    if (target == tree.source || !tree.reachable(target)) return std::nullopt;

    std::vector<size_t> hops;
    for (size_t at = target; at != tree.source;) {
        size_t eid = tree.parent_edge[at];
        hops.push_back(eid);
        at = edges_[eid].source;
    }
    std::reverse(hops.begin(), hops.end());

    WeightedPath path;
    path.nodes.reserve(hops.size() + 1);
    path.nodes.push_back(nodes_[tree.source].id);
    for (size_t eid : hops) {
        path.total_weight += edges_[eid].weight;
        path.nodes.push_back(nodes_[edges_[eid].target].id);
    }
    return path;
}

std::optional<WeightedPath> RelationshipGraph::findPath(const std::string& source,
                                                        const std::string& target) const {
    auto s = nodeIndex(source);
    auto t = nodeIndex(target);
    if (!s || !t || *s == *t) return std::nullopt;
    return pathTo(shortestPathsFrom(*s), *t);
}

std::optional<double> RelationshipGraph::pathWeight(const std::vector<std::string>& path) const {
    double total = 0.0;
    for (size_t i = 0; i + 1 < path.size(); i++) {
        const Edge* e = getEdge(path[i], path[i + 1]);
        if (!e) return std::nullopt;
        total += e->weight;
    }
    return total;
}

// ─── Iteration ─────────────────────────────────────────────────

void RelationshipGraph::forEachNode(std::function<void(const Node&)> fn) const {
    for (const Node& n : nodes_) {
        fn(n);
    }
}

void RelationshipGraph::forEachEdge(std::function<void(const Edge&)> fn) const {
    for (const Edge& e : edges_) {
        fn(e);
    }
}

} // namespace fraudscope
