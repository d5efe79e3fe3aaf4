#include "detection/threshold_detector.hpp"
#include "signal/normalization.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <fmt/format.h>

#include <cmath>

namespace fraudscope {

ThresholdDetector::ThresholdDetector(double threshold) : threshold_(threshold) {
    if (!(threshold > 0.0)) {
        throw ConfigurationError(fmt::format("Detection threshold must be positive, got {}", threshold));
    }
}

std::string ThresholdDetector::name() const {
    return fmt::format("Threshold Detector (threshold={})", threshold_);
}

AnomalyResult ThresholdDetector::detect(const std::optional<std::vector<double>>& /*processed_signal*/,
                                        const TransactionDataset& dataset) const {
    return score(dataset.getAmounts());
}

ThresholdResult ThresholdDetector::score(const std::vector<double>& amounts) const {
    ThresholdResult result;
    result.z_scores = zScoreNormalize(amounts);
    for (size_t i = 0; i < result.z_scores.size(); i++) {
        double z = std::abs(result.z_scores[i]);
        result.z_scores[i] = z;
        if (z > threshold_) {
            result.indices.push_back(i);
            result.scores.push_back(z / threshold_);
        }
    }
    logger()->debug("{} flagged {} of {} transactions",
                    name(), result.indices.size(), amounts.size());
    return result;
}

} // namespace fraudscope
