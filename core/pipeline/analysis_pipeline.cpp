#include "pipeline/analysis_pipeline.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <utility>

namespace fraudscope {

AnalysisPipeline::AnalysisPipeline(DatasetLoader loader, SignalProcessorPtr processor,
                                   FraudDetectorPtr detector)
    : loader_(std::move(loader)),
      processor_(std::move(processor)),
      detector_(std::move(detector)) {
    if (!detector_) {
        throw ConfigurationError("Analysis pipeline requires a fraud detector");
    }
    if (!processor_ && detector_->needsSignal()) {
        throw ConfigurationError(detector_->name() + " needs a signal processor");
    }
}

void AnalysisPipeline::addObserver(std::shared_ptr<AnalysisObserver> observer) {
    if (observer) {
        observers_.push_back(std::move(observer));
    }
}

AnomalyResult AnalysisPipeline::analyze(const std::string& file_path) {
    return analyzeDataset(loader_.load(file_path));
}

AnomalyResult AnalysisPipeline::analyze(std::istream& input) {
    return analyzeDataset(loader_.load(input));
}

AnomalyResult AnalysisPipeline::analyzeLines(const std::vector<std::string>& raw_lines) {
    return analyzeDataset(TransactionDataset::build(raw_lines, loader_.dataType()));
}

AnomalyResult AnalysisPipeline::analyzeDataset(const TransactionDataset& dataset) {
    auto log = logger();
    log->info("Loaded {} transactions of type {}",
              dataset.transactionCount(), toString(dataset.dataType()));

    AnalysisSummary summary;
    summary.transaction_count = dataset.transactionCount();
    summary.dataset_type = dataset.dataType();
    summary.detector_name = detector_->name();
    summary.amounts = dataset.getAmounts();

    if (detector_->needsSignal()) {
        summary.processor_name = processor_->name();
        summary.processed_signal = processor_->process(dataset);
        log->info("Processed signal using {}", summary.processor_name);
    } else {
        log->info("Using {} without a signal transform", summary.detector_name);
    }

    summary.result = detector_->detect(summary.processed_signal, dataset);
    log->info("{} reported {} anomalies", summary.detector_name, anomalyCount(summary.result));

    for (const auto& observer : observers_) {
        observer->onAnalysisComplete(summary);
    }
    return summary.result;
}

} // namespace fraudscope
