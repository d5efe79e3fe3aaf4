#pragma once

#include "detection/fraud_detector.hpp"
#include "graph/relationship_graph.hpp"
#include "search/search_budget.hpp"

namespace fraudscope {

/// Pairwise shortest-path search over the relationship graph.
///
/// For every ordered pair of distinct nodes (u, v) with a directed path,
/// the minimum-weight path is found with Dijkstra and reported when its
/// summed amount exceeds `min_path_amount`. One single-source run per u
/// covers every v; sources can be spread over worker threads without
/// changing the output order.
class GraphFraudDetector : public FraudDetector {
public:
    /// Throws ConfigurationError if worker_threads is zero.
    explicit GraphFraudDetector(double min_path_amount = 5000.0,
                                unsigned worker_threads = 1,
                                double max_seconds = 0.0);

    /// Throws ConfigurationError if the graph has negative edge weights,
    /// AnalysisCancelled if the token fires or the time budget runs out.
    AnomalyResult detect(const std::optional<std::vector<double>>& processed_signal,
                         const TransactionDataset& dataset) const override;

    InputRequirement requirement() const override { return InputRequirement::DatasetOnly; }
    std::string name() const override;

    /// Detection over an already built graph.
    GraphResult search(const RelationshipGraph& graph) const;

    void setCancellationToken(CancellationTokenPtr token) { token_ = std::move(token); }

    double minPathAmount() const { return min_path_amount_; }
    unsigned workerThreads() const { return worker_threads_; }
    double maxSeconds() const { return max_seconds_; }

private:
    /// Suspicious paths starting at `source`, in target index order.
    std::vector<SuspiciousPath> searchFrom(const RelationshipGraph& graph, size_t source) const;

    double min_path_amount_;
    unsigned worker_threads_;
    double max_seconds_;
    CancellationTokenPtr token_;
};

} // namespace fraudscope
