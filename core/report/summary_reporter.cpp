#include "report/summary_reporter.hpp"
#include "common/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iterator>

namespace fraudscope {

std::string SummaryReporter::render(const AnalysisSummary& summary) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    fmt::format_to(out, "Loaded {} transactions of type {}\n",
                   summary.transaction_count, toString(summary.dataset_type));

    if (const auto* graph = std::get_if<GraphResult>(&summary.result)) {
        fmt::format_to(out, "Using graph-based detection with {}\n", summary.detector_name);
        fmt::format_to(out, "Detected {} suspicious transaction paths\n",
                       graph->suspicious_paths.size());
        size_t i = 1;
        for (const auto& p : graph->suspicious_paths) {
            fmt::format_to(out, "{}. Path: {} (total amount: {:.2f})\n",
                           i++, fmt::join(p.path, " -> "), p.total_amount);
        }
    } else {
        const auto& threshold = std::get<ThresholdResult>(summary.result);
        if (summary.processed_signal) {
            fmt::format_to(out, "Processed signal using {}\n", summary.processor_name);
        }
        fmt::format_to(out, "Detected {} potential fraud cases using {}\n",
                       threshold.indices.size(), summary.detector_name);
        for (size_t k = 0; k < threshold.indices.size(); k++) {
            size_t idx = threshold.indices[k];
            fmt::format_to(out, "  #{}: amount {:.2f}, confidence {:.2f}\n",
                           idx, summary.amounts.at(idx), threshold.scores[k]);
        }
    }
    return fmt::to_string(buf);
}

void SummaryReporter::onAnalysisComplete(const AnalysisSummary& summary) {
    out_ << render(summary);
    out_.flush();
    if (!out_) {
        throw DataSourceError("Failed to write analysis summary");
    }
}

} // namespace fraudscope
