#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace fraudscope {

/// Outcome of z-score detection over the raw amount series.
struct ThresholdResult {
    std::vector<size_t> indices;    // ascending
    std::vector<double> scores;     // |z| / threshold, aligned with indices
    std::vector<double> z_scores;   // |z| for every transaction
};

/// A relationship chain whose summed amount crossed the threshold.
struct SuspiciousPath {
    std::vector<std::string> path;
    double total_amount = 0.0;
};

/// Outcome of graph detection, in node-pair enumeration order.
struct GraphResult {
    std::vector<SuspiciousPath> suspicious_paths;
};

using AnomalyResult = std::variant<ThresholdResult, GraphResult>;

/// Flagged transactions or suspicious paths, whichever the variant holds.
inline size_t anomalyCount(const AnomalyResult& result) {
    if (const auto* t = std::get_if<ThresholdResult>(&result)) return t->indices.size();
    return std::get<GraphResult>(result).suspicious_paths.size();
}

inline bool isGraphResult(const AnomalyResult& result) {
    return std::holds_alternative<GraphResult>(result);
}

} // namespace fraudscope
