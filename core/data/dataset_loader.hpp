#pragma once

#include "data/transaction_dataset.hpp"

#include <istream>
#include <string>
#include <vector>

namespace fraudscope {

/// Reads line-oriented transaction text and hands it to
/// TransactionDataset::build() with a fixed declared type.
class DatasetLoader {
public:
    explicit DatasetLoader(DatasetType type) : type_(type) {}

    /// Throws DataSourceError if the file cannot be opened or read,
    /// ParseError if any line is malformed.
    TransactionDataset load(const std::string& file_path) const;
    TransactionDataset load(std::istream& input) const;

    DatasetType dataType() const { return type_; }

private:
    DatasetType type_;
};

/// Every line of `input`, including blank ones.
std::vector<std::string> readLines(std::istream& input);

} // namespace fraudscope
