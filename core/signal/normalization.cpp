#include "signal/normalization.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace fraudscope {

SeriesStats computeStats(const std::vector<double>& values) {
    SeriesStats stats;
    if (values.empty()) return stats;

    // Constant series: report exact zero spread, not rounding noise
    auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    if (*lo == *hi) {
        stats.mean = *lo;
        return stats;
    }

    double n = static_cast<double>(values.size());
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

    double sq = 0.0;
    for (double v : values) {
        sq += (v - stats.mean) * (v - stats.mean);
    }
    stats.stddev = std::sqrt(sq / n);
    return stats;
}

std::vector<double> zScoreNormalize(const std::vector<double>& values) {
    SeriesStats stats = computeStats(values);
    std::vector<double> out(values.size(), 0.0);
    if (stats.degenerate()) {
        if (!values.empty()) {
            logger()->debug("Zero variance over {} values, using a zero signal", values.size());
        }
        return out;
    }
    for (size_t i = 0; i < values.size(); i++) {
        out[i] = (values[i] - stats.mean) / stats.stddev;
    }
    return out;
}

} // namespace fraudscope
