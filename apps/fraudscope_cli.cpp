// Batch driver: fraudscope_cli <config.yaml> <transactions.txt>
// Assembles the pipeline from a YAML config, runs one analysis and writes
// the plain-text summary to the configured report path (stdout if empty).

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "config/pipeline_config.hpp"
#include "report/summary_reporter.hpp"

#include <fstream>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> <transactions.txt>\n";
        return 2;
    }

    try {
        fraudscope::PipelineConfig config = fraudscope::loadPipelineConfig(argv[1]);
        fraudscope::setLogLevel(config.log_level);

        std::ofstream report_file;
        std::ostream* report = &std::cout;
        if (!config.report_path.empty()) {
            report_file.open(config.report_path);
            if (!report_file) {
                throw fraudscope::DataSourceError("Cannot open report file: " + config.report_path);
            }
            report = &report_file;
        }

        fraudscope::AnalysisPipeline pipeline = fraudscope::buildPipeline(config);
        pipeline.addObserver(std::make_shared<fraudscope::SummaryReporter>(*report));
        pipeline.analyze(std::string(argv[2]));
    } catch (const fraudscope::FraudscopeError& e) {
        fraudscope::logger()->error("{}", e.what());
        return 1;
    }
    return 0;
}
