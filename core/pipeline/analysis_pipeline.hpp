#pragma once

#include "data/dataset_loader.hpp"
#include "signal/signal_processor.hpp"
#include "detection/fraud_detector.hpp"

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fraudscope {

/// Everything a reporting or visualization collaborator gets after a run.
struct AnalysisSummary {
    size_t transaction_count = 0;
    DatasetType dataset_type = DatasetType::CreditCard;
    std::string processor_name;     // empty when no processor ran
    std::string detector_name;
    std::vector<double> amounts;
    std::optional<std::vector<double>> processed_signal;   // nullopt on the graph path
    AnomalyResult result;
};

/// Receives the summary of every completed analysis run.
class AnalysisObserver {
public:
    virtual ~AnalysisObserver() = default;
    virtual void onAnalysisComplete(const AnalysisSummary& summary) = 0;
};

// ─── AnalysisPipeline ──────────────────────────────────────────
// load → [process] → detect → notify. Whether the signal transform runs
// is decided by the detector's declared input requirement.

class AnalysisPipeline {
public:
    /// `processor` may be null only if the detector never needs a signal.
    /// Throws ConfigurationError otherwise, or if `detector` is null.
    AnalysisPipeline(DatasetLoader loader, SignalProcessorPtr processor, FraudDetectorPtr detector);

    /// Register a collaborator. Observers are notified in insertion order.
    void addObserver(std::shared_ptr<AnalysisObserver> observer);

    /// Analyze a transaction file. Throws DataSourceError / ParseError on
    /// bad input, and whatever the strategies throw.
    AnomalyResult analyze(const std::string& file_path);
    AnomalyResult analyze(std::istream& input);
    AnomalyResult analyzeLines(const std::vector<std::string>& raw_lines);
    AnomalyResult analyzeDataset(const TransactionDataset& dataset);

    const SignalProcessor* processor() const { return processor_.get(); }
    const FraudDetector& detector() const { return *detector_; }
    const DatasetLoader& loader() const { return loader_; }

private:
    DatasetLoader loader_;
    SignalProcessorPtr processor_;
    FraudDetectorPtr detector_;
    std::vector<std::shared_ptr<AnalysisObserver>> observers_;
};

} // namespace fraudscope
