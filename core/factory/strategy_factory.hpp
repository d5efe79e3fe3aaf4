#pragma once

#include "signal/signal_processor.hpp"
#include "detection/fraud_detector.hpp"

#include <string>
#include <vector>

namespace fraudscope {

/// Parameters for createProcessor(). Each strategy reads only its own.
struct ProcessorParams {
    double sample_rate = 1000.0;        // fft
    std::string wavelet_type = "db4";   // wavelet
    int level = 5;                      // wavelet
};

/// Parameters for createDetector(). Each strategy reads only its own.
struct DetectorParams {
    double threshold = 2.0;             // threshold
    double min_path_amount = 5000.0;    // graph
    unsigned worker_threads = 1;        // graph
    double max_seconds = 0.0;           // graph, 0 = unlimited
};

/// Builds signal processors and fraud detectors from a type tag.
/// The tag sets are closed: "fft" | "wavelet" and "threshold" | "graph".
class StrategyFactory {
public:
    /// Throws ConfigurationError naming the tag if it is not supported,
    /// or if the strategy rejects its parameters.
    static SignalProcessorPtr createProcessor(const std::string& tag,
                                              const ProcessorParams& params = {});

    /// Throws ConfigurationError naming the tag if it is not supported,
    /// or if the strategy rejects its parameters.
    static FraudDetectorPtr createDetector(const std::string& tag,
                                           const DetectorParams& params = {});

    static std::vector<std::string> processorTags();
    static std::vector<std::string> detectorTags();
};

} // namespace fraudscope
