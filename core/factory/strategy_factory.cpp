#include "factory/strategy_factory.hpp"
#include "signal/fft_processor.hpp"
#include "signal/wavelet_processor.hpp"
#include "detection/threshold_detector.hpp"
#include "detection/graph_fraud_detector.hpp"
#include "common/errors.hpp"

#include <functional>
#include <map>
#include <memory>

namespace fraudscope {

namespace {

using ProcessorCreator = std::function<SignalProcessorPtr(const ProcessorParams&)>;
using DetectorCreator = std::function<FraudDetectorPtr(const DetectorParams&)>;

const std::map<std::string, ProcessorCreator>& processorCreators() {
    static const std::map<std::string, ProcessorCreator> creators = {
        {"fft", [](const ProcessorParams& p) -> SignalProcessorPtr {
            return std::make_unique<FFTProcessor>(p.sample_rate);
        }},
        {"wavelet", [](const ProcessorParams& p) -> SignalProcessorPtr {
            return std::make_unique<WaveletProcessor>(p.wavelet_type, p.level);
        }},
    };
    return creators;
}

const std::map<std::string, DetectorCreator>& detectorCreators() {
    static const std::map<std::string, DetectorCreator> creators = {
        {"threshold", [](const DetectorParams& p) -> FraudDetectorPtr {
            return std::make_unique<ThresholdDetector>(p.threshold);
        }},
        {"graph", [](const DetectorParams& p) -> FraudDetectorPtr {
            return std::make_unique<GraphFraudDetector>(p.min_path_amount, p.worker_threads,
                                                        p.max_seconds);
        }},
    };
    return creators;
}

template <typename Creators>
std::vector<std::string> tagsOf(const Creators& creators) {
    std::vector<std::string> tags;
    for (const auto& [tag, _] : creators) {
        tags.push_back(tag);
    }
    return tags;
}

} // namespace

SignalProcessorPtr StrategyFactory::createProcessor(const std::string& tag,
                                                    const ProcessorParams& params) {
    const auto& creators = processorCreators();
    auto it = creators.find(tag);
    if (it == creators.end()) {
        throw ConfigurationError("Unsupported processor type: " + tag);
    }
    return it->second(params);
}

FraudDetectorPtr StrategyFactory::createDetector(const std::string& tag,
                                                 const DetectorParams& params) {
    const auto& creators = detectorCreators();
    auto it = creators.find(tag);
    if (it == creators.end()) {
        throw ConfigurationError("Unsupported detector type: " + tag);
    }
    return it->second(params);
}

std::vector<std::string> StrategyFactory::processorTags() {
    return tagsOf(processorCreators());
}

std::vector<std::string> StrategyFactory::detectorTags() {
    return tagsOf(detectorCreators());
}

} // namespace fraudscope
