// PyBind11 bindings for the fraudscope C++ core.
// Exposes datasets, the relationship graph, strategies, results and the
// analysis pipeline to Python (plotting and interactive front ends).

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DFRAUDSCOPE_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "data/transaction_record.hpp"
#include "data/transaction_dataset.hpp"
#include "graph/relationship_graph.hpp"
#include "signal/signal_processor.hpp"
#include "signal/fft_processor.hpp"
#include "signal/wavelet_processor.hpp"
#include "detection/anomaly_result.hpp"
#include "detection/fraud_detector.hpp"
#include "detection/threshold_detector.hpp"
#include "detection/graph_fraud_detector.hpp"
#include "factory/strategy_factory.hpp"
#include "config/pipeline_config.hpp"
#include "pipeline/analysis_pipeline.hpp"
#include "report/summary_reporter.hpp"

namespace py = pybind11;

namespace {

/// Lets Python classes act as pipeline observers (e.g. a plotting front end).
class PyAnalysisObserver : public fraudscope::AnalysisObserver {
public:
    using fraudscope::AnalysisObserver::AnalysisObserver;

    void onAnalysisComplete(const fraudscope::AnalysisSummary& summary) override {
        PYBIND11_OVERRIDE_PURE_NAME(void, fraudscope::AnalysisObserver,
                                    "on_analysis_complete", onAnalysisComplete, summary);
    }
};

} // namespace

PYBIND11_MODULE(fraudscope_bindings, m) {
    m.doc() = "fraudscope C++ core bindings";

    // ── Errors ──
    auto base_error = py::register_exception<fraudscope::FraudscopeError>(m, "FraudscopeError");
    py::register_exception<fraudscope::ParseError>(m, "ParseError", base_error);
    py::register_exception<fraudscope::DataSourceError>(m, "DataSourceError", base_error);
    py::register_exception<fraudscope::ConfigurationError>(m, "ConfigurationError", base_error);
    py::register_exception<fraudscope::AnalysisCancelled>(m, "AnalysisCancelled", base_error);

    m.def("set_log_level", &fraudscope::setLogLevel, py::arg("level"));

    // ── Records ──
    py::enum_<fraudscope::DatasetType>(m, "DatasetType")
        .value("CREDIT_CARD", fraudscope::DatasetType::CreditCard)
        .value("INSURANCE_CLAIM", fraudscope::DatasetType::InsuranceClaim);
    m.def("parse_dataset_type", &fraudscope::parseDatasetType);

    py::class_<fraudscope::CreditCardRecord>(m, "CreditCardRecord")
        .def(py::init<>())
        .def_readwrite("timestamp", &fraudscope::CreditCardRecord::timestamp)
        .def_readwrite("amount", &fraudscope::CreditCardRecord::amount)
        .def_readwrite("merchant", &fraudscope::CreditCardRecord::merchant)
        .def_readwrite("card_id", &fraudscope::CreditCardRecord::card_id);

    py::class_<fraudscope::InsuranceClaimRecord>(m, "InsuranceClaimRecord")
        .def(py::init<>())
        .def_readwrite("claim_date", &fraudscope::InsuranceClaimRecord::claim_date)
        .def_readwrite("claim_amount", &fraudscope::InsuranceClaimRecord::claim_amount)
        .def_readwrite("policy_id", &fraudscope::InsuranceClaimRecord::policy_id)
        .def_readwrite("claim_type", &fraudscope::InsuranceClaimRecord::claim_type);

    // ── Graph ──
    py::class_<fraudscope::Edge>(m, "Edge")
        .def_readonly("source", &fraudscope::Edge::source)
        .def_readonly("target", &fraudscope::Edge::target)
        .def_readonly("weight", &fraudscope::Edge::weight)
        .def_readonly("timestamp", &fraudscope::Edge::timestamp)
        .def_readonly("transaction_count", &fraudscope::Edge::transaction_count);

    py::class_<fraudscope::WeightedPath>(m, "WeightedPath")
        .def_readonly("nodes", &fraudscope::WeightedPath::nodes)
        .def_readonly("total_weight", &fraudscope::WeightedPath::total_weight);

    py::class_<fraudscope::RelationshipGraph>(m, "RelationshipGraph")
        .def(py::init<>())
        .def("add_edge", &fraudscope::RelationshipGraph::addEdge,
             py::arg("source"), py::arg("target"), py::arg("weight"), py::arg("timestamp") = 0.0,
             py::return_value_policy::copy)
        .def("get_node_ids", &fraudscope::RelationshipGraph::getNodeIds)
        .def("node_count", &fraudscope::RelationshipGraph::nodeCount)
        .def("edge_count", &fraudscope::RelationshipGraph::edgeCount)
        .def("has_edge", &fraudscope::RelationshipGraph::hasEdge)
        .def("get_edge", &fraudscope::RelationshipGraph::getEdge,
             py::return_value_policy::copy)
        .def("get_successors", &fraudscope::RelationshipGraph::getSuccessors)
        .def("get_predecessors", &fraudscope::RelationshipGraph::getPredecessors)
        .def("find_path", &fraudscope::RelationshipGraph::findPath)
        .def("path_weight", &fraudscope::RelationshipGraph::pathWeight)
        .def("edges", [](const fraudscope::RelationshipGraph& g) {
            std::vector<std::tuple<std::string, std::string, double>> out;
            g.forEachEdge([&](const fraudscope::Edge& e) {
                out.emplace_back(g.node(e.source).id, g.node(e.target).id, e.weight);
            });
            return out;
        });

    // ── Dataset ──
    py::class_<fraudscope::TransactionDataset>(m, "TransactionDataset")
        .def_static("build", &fraudscope::TransactionDataset::build,
                    py::arg("raw_lines"), py::arg("declared_type"))
        .def("get_time_series", &fraudscope::TransactionDataset::getTimeSeries)
        .def("get_amounts", &fraudscope::TransactionDataset::getAmounts)
        .def("get_transactions", &fraudscope::TransactionDataset::getTransactions)
        .def("transaction_count", &fraudscope::TransactionDataset::transactionCount)
        .def("data_type", &fraudscope::TransactionDataset::dataType)
        .def("build_transaction_graph", &fraudscope::TransactionDataset::buildTransactionGraph);

    // ── Results ──
    py::class_<fraudscope::ThresholdResult>(m, "ThresholdResult")
        .def_readonly("indices", &fraudscope::ThresholdResult::indices)
        .def_readonly("scores", &fraudscope::ThresholdResult::scores)
        .def_readonly("z_scores", &fraudscope::ThresholdResult::z_scores);

    py::class_<fraudscope::SuspiciousPath>(m, "SuspiciousPath")
        .def_readonly("path", &fraudscope::SuspiciousPath::path)
        .def_readonly("total_amount", &fraudscope::SuspiciousPath::total_amount);

    py::class_<fraudscope::GraphResult>(m, "GraphResult")
        .def_readonly("suspicious_paths", &fraudscope::GraphResult::suspicious_paths);

    m.def("anomaly_count", &fraudscope::anomalyCount);

    // ── Strategies ──
    py::class_<fraudscope::SignalProcessor>(m, "SignalProcessor")
        .def("process", &fraudscope::SignalProcessor::process)
        .def("name", &fraudscope::SignalProcessor::name);

    py::class_<fraudscope::FFTProcessor, fraudscope::SignalProcessor>(m, "FFTProcessor")
        .def(py::init<double>(), py::arg("sample_rate") = 1000.0)
        .def("sample_rate", &fraudscope::FFTProcessor::sampleRate);

    py::class_<fraudscope::WaveletProcessor, fraudscope::SignalProcessor>(m, "WaveletProcessor")
        .def(py::init<const std::string&, int>(),
             py::arg("wavelet_type") = "db4", py::arg("level") = 5)
        .def("level", &fraudscope::WaveletProcessor::level);

    py::enum_<fraudscope::InputRequirement>(m, "InputRequirement")
        .value("SIGNAL_ONLY", fraudscope::InputRequirement::SignalOnly)
        .value("DATASET_ONLY", fraudscope::InputRequirement::DatasetOnly)
        .value("SIGNAL_AND_DATASET", fraudscope::InputRequirement::SignalAndDataset);

    py::class_<fraudscope::FraudDetector>(m, "FraudDetector")
        .def("detect", &fraudscope::FraudDetector::detect,
             py::arg("processed_signal"), py::arg("dataset"))
        .def("requirement", &fraudscope::FraudDetector::requirement)
        .def("needs_signal", &fraudscope::FraudDetector::needsSignal)
        .def("name", &fraudscope::FraudDetector::name);

    py::class_<fraudscope::ThresholdDetector, fraudscope::FraudDetector>(m, "ThresholdDetector")
        .def(py::init<double>(), py::arg("threshold") = 2.0);

    py::class_<fraudscope::CancellationToken, std::shared_ptr<fraudscope::CancellationToken>>(
        m, "CancellationToken")
        .def(py::init<>())
        .def("cancel", &fraudscope::CancellationToken::cancel)
        .def("is_cancelled", &fraudscope::CancellationToken::isCancelled);

    py::class_<fraudscope::GraphFraudDetector, fraudscope::FraudDetector>(m, "GraphFraudDetector")
        .def(py::init<double, unsigned, double>(),
             py::arg("min_path_amount") = 5000.0, py::arg("worker_threads") = 1,
             py::arg("max_seconds") = 0.0)
        .def("search", &fraudscope::GraphFraudDetector::search,
             py::call_guard<py::gil_scoped_release>())
        .def("set_cancellation_token", &fraudscope::GraphFraudDetector::setCancellationToken);

    py::class_<fraudscope::ProcessorParams>(m, "ProcessorParams")
        .def(py::init<>())
        .def_readwrite("sample_rate", &fraudscope::ProcessorParams::sample_rate)
        .def_readwrite("wavelet_type", &fraudscope::ProcessorParams::wavelet_type)
        .def_readwrite("level", &fraudscope::ProcessorParams::level);

    py::class_<fraudscope::DetectorParams>(m, "DetectorParams")
        .def(py::init<>())
        .def_readwrite("threshold", &fraudscope::DetectorParams::threshold)
        .def_readwrite("min_path_amount", &fraudscope::DetectorParams::min_path_amount)
        .def_readwrite("worker_threads", &fraudscope::DetectorParams::worker_threads)
        .def_readwrite("max_seconds", &fraudscope::DetectorParams::max_seconds);

    m.def("create_processor", &fraudscope::StrategyFactory::createProcessor,
          py::arg("tag"), py::arg("params") = fraudscope::ProcessorParams{});
    m.def("create_detector", &fraudscope::StrategyFactory::createDetector,
          py::arg("tag"), py::arg("params") = fraudscope::DetectorParams{});

    // ── Pipeline ──
    py::class_<fraudscope::AnalysisSummary>(m, "AnalysisSummary")
        .def_readonly("transaction_count", &fraudscope::AnalysisSummary::transaction_count)
        .def_readonly("dataset_type", &fraudscope::AnalysisSummary::dataset_type)
        .def_readonly("processor_name", &fraudscope::AnalysisSummary::processor_name)
        .def_readonly("detector_name", &fraudscope::AnalysisSummary::detector_name)
        .def_readonly("amounts", &fraudscope::AnalysisSummary::amounts)
        .def_readonly("processed_signal", &fraudscope::AnalysisSummary::processed_signal)
        .def_readonly("result", &fraudscope::AnalysisSummary::result)
        .def("render", &fraudscope::SummaryReporter::render);

    py::class_<fraudscope::AnalysisObserver, PyAnalysisObserver,
               std::shared_ptr<fraudscope::AnalysisObserver>>(m, "AnalysisObserver")
        .def(py::init<>())
        .def("on_analysis_complete", &fraudscope::AnalysisObserver::onAnalysisComplete);

    py::class_<fraudscope::PipelineConfig>(m, "PipelineConfig")
        .def(py::init<>())
        .def_readwrite("dataset_type", &fraudscope::PipelineConfig::dataset_type)
        .def_readwrite("processor_type", &fraudscope::PipelineConfig::processor_type)
        .def_readwrite("processor", &fraudscope::PipelineConfig::processor)
        .def_readwrite("detector_type", &fraudscope::PipelineConfig::detector_type)
        .def_readwrite("detector", &fraudscope::PipelineConfig::detector)
        .def_readwrite("report_path", &fraudscope::PipelineConfig::report_path)
        .def_readwrite("log_level", &fraudscope::PipelineConfig::log_level);

    m.def("load_pipeline_config", &fraudscope::loadPipelineConfig, py::arg("path"));
    m.def("pipeline_config_from_string", &fraudscope::pipelineConfigFromString, py::arg("yaml"));

    py::class_<fraudscope::AnalysisPipeline>(m, "AnalysisPipeline")
        .def(py::init(&fraudscope::buildPipeline), py::arg("config"))
        .def("add_observer", &fraudscope::AnalysisPipeline::addObserver,
             py::keep_alive<1, 2>())
        .def("analyze", py::overload_cast<const std::string&>(&fraudscope::AnalysisPipeline::analyze),
             py::arg("file_path"))
        .def("analyze_lines", &fraudscope::AnalysisPipeline::analyzeLines, py::arg("raw_lines"))
        .def("analyze_dataset", &fraudscope::AnalysisPipeline::analyzeDataset, py::arg("dataset"))
        .def("detector_name", [](const fraudscope::AnalysisPipeline& p) {
            return p.detector().name();
        });
}
