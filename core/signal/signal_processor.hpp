#pragma once

#include "data/transaction_dataset.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fraudscope {

/// Base class for amount-series transforms on the statistical path.
/// Implementations normalize the dataset's amounts and return a processed
/// signal; they never modify the dataset.
class SignalProcessor {
public:
    virtual ~SignalProcessor() = default;

    virtual std::vector<double> process(const TransactionDataset& dataset) const = 0;

    /// Human-readable name, used in reports.
    virtual std::string name() const = 0;
};

using SignalProcessorPtr = std::unique_ptr<SignalProcessor>;

} // namespace fraudscope
