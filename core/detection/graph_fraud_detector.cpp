#include "detection/graph_fraud_detector.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace fraudscope {

GraphFraudDetector::GraphFraudDetector(double min_path_amount, unsigned worker_threads,
                                       double max_seconds)
    : min_path_amount_(min_path_amount),
      worker_threads_(worker_threads),
      max_seconds_(max_seconds) {
    if (worker_threads == 0) {
        throw ConfigurationError("Graph detector needs at least one worker thread");
    }
}

std::string GraphFraudDetector::name() const {
    return fmt::format("Graph Dijkstra Detector (min_path_amount={})", min_path_amount_);
}

AnomalyResult GraphFraudDetector::detect(const std::optional<std::vector<double>>& /*processed_signal*/,
                                         const TransactionDataset& dataset) const {
    return search(dataset.buildTransactionGraph());
}

std::vector<SuspiciousPath> GraphFraudDetector::searchFrom(const RelationshipGraph& graph,
                                                           size_t source) const {
    std::vector<SuspiciousPath> found;
    ShortestPathTree tree = graph.shortestPathsFrom(source);
    for (size_t target = 0; target < graph.nodeCount(); target++) {
        auto path = graph.pathTo(tree, target);
        if (!path) continue;  // unreachable or same node
        if (path->total_weight > min_path_amount_) {
            found.push_back({std::move(path->nodes), path->total_weight});
        }
    }
    return found;
}

GraphResult GraphFraudDetector::search(const RelationshipGraph& graph) const {
    if (graph.hasNegativeWeights()) {
        throw ConfigurationError("Graph detection requires non-negative transaction amounts");
    }

    const size_t node_count = graph.nodeCount();
    const size_t workers = std::max<size_t>(1, std::min<size_t>(worker_threads_, node_count));
    logger()->info("Searching {} node pairs over {} edges with {} worker(s)",
                   node_count * (node_count > 0 ? node_count - 1 : 0), graph.edgeCount(), workers);

    SearchBudget budget(max_seconds_, token_);
    budget.start();

    // One slot per source keeps the output in node order regardless of
    // which worker handled it.
    std::vector<std::vector<SuspiciousPath>> per_source(node_count);
    std::atomic<bool> stopped{false};

    auto run = [&](size_t first) {
        for (size_t source = first; source < node_count; source += workers) {
            if (stopped.load() || !budget.canContinue()) {
                stopped.store(true);
                return;
            }
            per_source[source] = searchFrom(graph, source);
            budget.recordExpansion();
        }
    };

    if (workers == 1) {
        run(0);
    } else {
        std::vector<std::thread> pool;
        std::vector<std::exception_ptr> errors(workers);
        pool.reserve(workers);
        for (size_t w = 0; w < workers; w++) {
            pool.emplace_back([&, w] {
                try {
                    run(w);
                } catch (...) {
                    errors[w] = std::current_exception();
                    stopped.store(true);
                }
            });
        }
        for (auto& t : pool) {
            t.join();
        }
        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    }

    if (stopped.load()) {
        std::string reason = budget.isCancelled() ? "cancelled" : "exceeded its time budget";
        logger()->warn("Graph detection {} after {} of {} sources",
                       reason, budget.expansions(), node_count);
        throw AnalysisCancelled(fmt::format("Graph detection {} after {:.3f}s",
                                            reason, budget.elapsedSeconds()));
    }

    GraphResult result;
    for (auto& paths : per_source) {
        for (auto& p : paths) {
            result.suspicious_paths.push_back(std::move(p));
        }
    }
    logger()->info("Found {} suspicious paths in {:.3f}s",
                   result.suspicious_paths.size(), budget.elapsedSeconds());
    return result;
}

} // namespace fraudscope
