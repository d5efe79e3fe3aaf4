#pragma once

#include "data/transaction_record.hpp"
#include "factory/strategy_factory.hpp"
#include "pipeline/analysis_pipeline.hpp"

#include <string>

namespace YAML {
class Node;
}

namespace fraudscope {

/// Everything needed to assemble one analysis pipeline.
struct PipelineConfig {
    DatasetType dataset_type = DatasetType::CreditCard;
    std::string processor_type = "fft";
    ProcessorParams processor;
    std::string detector_type = "threshold";
    DetectorParams detector;
    std::string report_path;        // empty = stdout
    std::string log_level = "info";
};

/// Read a config document. Missing keys keep their defaults; malformed
/// values and unknown dataset types throw ConfigurationError. Strategy
/// tags are checked when the pipeline is built.
PipelineConfig parsePipelineConfig(const YAML::Node& root);
PipelineConfig loadPipelineConfig(const std::string& path);
PipelineConfig pipelineConfigFromString(const std::string& yaml);

/// Build the pipeline through StrategyFactory.
AnalysisPipeline buildPipeline(const PipelineConfig& config);

} // namespace fraudscope
