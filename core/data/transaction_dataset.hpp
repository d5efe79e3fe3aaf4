#pragma once

#include "data/transaction_record.hpp"
#include "graph/relationship_graph.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fraudscope {

/// `YYYY-MM-DD` → seconds since epoch at UTC midnight. nullopt if the
/// string is not in that layout or names a day that does not exist.
std::optional<double> claimDateToTimestamp(const std::string& date);

// ─── TransactionDataset ────────────────────────────────────────
// Immutable, homogeneous sequence of parsed records plus the parallel
// timestamp and amount series. Built once per analysis run; every
// accessor hands out a copy.

class TransactionDataset {
public:
    /// Parse raw lines (blank lines skipped). Each line must split on ','
    /// into exactly four fields. Throws ParseError on the first bad line;
    /// nothing is returned in that case.
    static TransactionDataset build(const std::vector<std::string>& raw_lines,
                                    DatasetType declared_type);

    /// (timestamps, amounts), index-aligned with getTransactions().
    std::pair<std::vector<double>, std::vector<double>> getTimeSeries() const;
    std::vector<double> getAmounts() const { return amounts_; }
    std::vector<TransactionRecord> getTransactions() const { return records_; }

    size_t transactionCount() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    DatasetType dataType() const { return data_type_; }

    /// Rebuild the relationship graph from scratch. Not cached.
    RelationshipGraph buildTransactionGraph() const;

private:
    explicit TransactionDataset(DatasetType type) : data_type_(type) {}

    void parseLine(const std::string& line, size_t line_number);

    DatasetType data_type_;
    std::vector<TransactionRecord> records_;
    std::vector<double> timestamps_;
    std::vector<double> amounts_;
};

} // namespace fraudscope
