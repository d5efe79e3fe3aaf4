#pragma once

#include "data/transaction_dataset.hpp"
#include "detection/anomaly_result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fraudscope {

/// Which inputs a detector actually reads. The pipeline skips the
/// signal transform for detectors that do not need it.
enum class InputRequirement {
    SignalOnly,
    DatasetOnly,
    SignalAndDataset,
};

/// Base class for anomaly detection strategies.
class FraudDetector {
public:
    virtual ~FraudDetector() = default;

    /// `processed_signal` is nullopt when requirement() says no signal is
    /// needed. The dataset is always available.
    virtual AnomalyResult detect(const std::optional<std::vector<double>>& processed_signal,
                                 const TransactionDataset& dataset) const = 0;

    virtual InputRequirement requirement() const = 0;

    /// Human-readable name, used in reports.
    virtual std::string name() const = 0;

    bool needsSignal() const { return requirement() != InputRequirement::DatasetOnly; }
};

using FraudDetectorPtr = std::unique_ptr<FraudDetector>;

} // namespace fraudscope
