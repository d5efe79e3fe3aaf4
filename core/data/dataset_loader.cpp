#include "data/dataset_loader.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <fstream>

namespace fraudscope {

std::vector<std::string> readLines(std::istream& input) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    if (input.bad()) {
        throw DataSourceError("I/O error while reading transaction input");
    }
    return lines;
}

TransactionDataset DatasetLoader::load(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file) {
        throw DataSourceError("Cannot open transaction file: " + file_path);
    }
    logger()->info("Loading {} data from {}", toString(type_), file_path);
    return load(file);
}

TransactionDataset DatasetLoader::load(std::istream& input) const {
    return TransactionDataset::build(readLines(input), type_);
}

} // namespace fraudscope
