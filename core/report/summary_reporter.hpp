#pragma once

#include "pipeline/analysis_pipeline.hpp"

#include <ostream>
#include <string>

namespace fraudscope {

/// Plain-text run summary written to a caller-owned stream. The stream
/// must outlive the reporter.
class SummaryReporter : public AnalysisObserver {
public:
    explicit SummaryReporter(std::ostream& out) : out_(out) {}

    void onAnalysisComplete(const AnalysisSummary& summary) override;

    /// The text onAnalysisComplete() writes.
    static std::string render(const AnalysisSummary& summary);

private:
    std::ostream& out_;
};

} // namespace fraudscope
