#pragma once

#include "detection/fraud_detector.hpp"

namespace fraudscope {

/// Flags transactions whose raw amount lies more than `threshold`
/// population standard deviations from the mean.
class ThresholdDetector : public FraudDetector {
public:
    /// Throws ConfigurationError if threshold is not positive.
    explicit ThresholdDetector(double threshold = 2.0);

    AnomalyResult detect(const std::optional<std::vector<double>>& processed_signal,
                         const TransactionDataset& dataset) const override;

    /// Statistical path: the pipeline runs the processor so the signal
    /// reaches observers, but scoring reads the raw amounts.
    InputRequirement requirement() const override { return InputRequirement::SignalAndDataset; }
    std::string name() const override;

    double threshold() const { return threshold_; }

    /// Detection over a bare amount series.
    ThresholdResult score(const std::vector<double>& amounts) const;

private:
    double threshold_;
};

} // namespace fraudscope
