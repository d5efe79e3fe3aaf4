#include "config/pipeline_config.hpp"
#include "common/errors.hpp"

#include <yaml-cpp/yaml.h>

namespace fraudscope {

namespace {

/// Overwrite `target` with node[key] if the key is present.
template <typename T>
void readOptional(const YAML::Node& node, const char* key, T& target) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return;
    try {
        target = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void readProcessor(const YAML::Node& node, PipelineConfig& config) {
    if (!node) return;
    if (!node.IsMap()) throw ConfigurationError("'processor' must be a mapping");
    readOptional(node, "type", config.processor_type);
    readOptional(node, "sample_rate", config.processor.sample_rate);
    readOptional(node, "wavelet", config.processor.wavelet_type);
    readOptional(node, "level", config.processor.level);
}

void readDetector(const YAML::Node& node, PipelineConfig& config) {
    if (!node) return;
    if (!node.IsMap()) throw ConfigurationError("'detector' must be a mapping");
    readOptional(node, "type", config.detector_type);
    readOptional(node, "threshold", config.detector.threshold);
    readOptional(node, "min_path_amount", config.detector.min_path_amount);
    readOptional(node, "worker_threads", config.detector.worker_threads);
    readOptional(node, "max_seconds", config.detector.max_seconds);
}

} // namespace

PipelineConfig parsePipelineConfig(const YAML::Node& root) {
    PipelineConfig config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw ConfigurationError("Pipeline config must be a mapping");

    std::string dataset_type = toString(config.dataset_type);
    readOptional(root, "dataset_type", dataset_type);
    config.dataset_type = parseDatasetType(dataset_type);

    readProcessor(root["processor"], config);
    readDetector(root["detector"], config);
    readOptional(root, "report_path", config.report_path);
    readOptional(root, "log_level", config.log_level);
    return config;
}

PipelineConfig loadPipelineConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw DataSourceError("Cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Malformed config " + path + ": " + e.what());
    }
    return parsePipelineConfig(root);
}

PipelineConfig pipelineConfigFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed config: ") + e.what());
    }
    return parsePipelineConfig(root);
}

AnalysisPipeline buildPipeline(const PipelineConfig& config) {
    auto processor = StrategyFactory::createProcessor(config.processor_type, config.processor);
    auto detector = StrategyFactory::createDetector(config.detector_type, config.detector);
    return AnalysisPipeline(DatasetLoader(config.dataset_type), std::move(processor),
                            std::move(detector));
}

} // namespace fraudscope
