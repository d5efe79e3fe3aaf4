#pragma once

#include <vector>

namespace fraudscope {

/// Population mean and standard deviation of a series.
struct SeriesStats {
    double mean = 0.0;
    double stddev = 0.0;

    /// All values equal (or the series is empty): z-scores are undefined.
    bool degenerate() const { return stddev == 0.0; }
};

SeriesStats computeStats(const std::vector<double>& values);

/// (x - mean) / stddev for every element. A zero-variance series maps to
/// all zeros instead of dividing by zero.
std::vector<double> zScoreNormalize(const std::vector<double>& values);

} // namespace fraudscope
