#include "data/transaction_dataset.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace fraudscope {

namespace {

constexpr char kDelimiter = ',';
constexpr size_t kFieldCount = 4;

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(s);
    while (std::getline(ss, field, delimiter)) {
        fields.push_back(field);
    }
    // getline drops an empty trailing field
    if (!s.empty() && s.back() == delimiter) {
        fields.emplace_back();
    }
    return fields;
}

/// Whole-field conversion: rejects empty input, trailing garbage,
/// overflow and non-finite values.
std::optional<double> parseNumber(const std::string& field) {
    std::string text = trim(field);
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return kDays[month - 1];
}

/// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(int year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const long long yoe = year - era * 400;
    const long long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace

std::optional<double> claimDateToTimestamp(const std::string& date) {
    std::string text = trim(date);
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }

    int year = std::stoi(text.substr(0, 4));
    int month = std::stoi(text.substr(5, 2));
    int day = std::stoi(text.substr(8, 2));
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    return static_cast<double>(daysFromCivil(year, month, day)) * 86400.0;
}

// ─── Parsing ───────────────────────────────────────────────────

TransactionDataset TransactionDataset::build(const std::vector<std::string>& raw_lines,
                                             DatasetType declared_type) {
    TransactionDataset dataset(declared_type);
    for (size_t i = 0; i < raw_lines.size(); i++) {
        std::string line = trim(raw_lines[i]);
        if (line.empty()) continue;
        dataset.parseLine(line, i + 1);
    }
    logger()->debug("Parsed {} {} records from {} lines",
                    dataset.records_.size(), toString(declared_type), raw_lines.size());
    return dataset;
}

void TransactionDataset::parseLine(const std::string& line, size_t line_number) {
    std::vector<std::string> fields = split(line, kDelimiter);
    if (fields.size() != kFieldCount) {
        throw ParseError(line_number, line,
                         "expected " + std::to_string(kFieldCount) + " fields, got " +
                         std::to_string(fields.size()));
    }

    auto amount = parseNumber(fields[1]);
    if (!amount) {
        throw ParseError(line_number, line, "invalid amount '" + fields[1] + "'");
    }
    if (fields[2].empty() || fields[3].empty()) {
        throw ParseError(line_number, line, "empty entity identifier");
    }

    switch (data_type_) {
        case DatasetType::CreditCard: {
            auto timestamp = parseNumber(fields[0]);
            if (!timestamp) {
                throw ParseError(line_number, line, "invalid timestamp '" + fields[0] + "'");
            }
            records_.emplace_back(CreditCardRecord{*timestamp, *amount, fields[2], fields[3]});
            timestamps_.push_back(*timestamp);
            break;
        }
        case DatasetType::InsuranceClaim: {
            auto timestamp = claimDateToTimestamp(fields[0]);
            if (!timestamp) {
                throw ParseError(line_number, line, "invalid claim date '" + fields[0] + "'");
            }
            records_.emplace_back(InsuranceClaimRecord{fields[0], *amount, fields[2], fields[3]});
            timestamps_.push_back(*timestamp);
            break;
        }
    }
    amounts_.push_back(*amount);
}

// ─── Accessors ─────────────────────────────────────────────────

std::pair<std::vector<double>, std::vector<double>> TransactionDataset::getTimeSeries() const {
    return {timestamps_, amounts_};
}

RelationshipGraph TransactionDataset::buildTransactionGraph() const {
    RelationshipGraph graph;
    for (size_t i = 0; i < records_.size(); i++) {
        graph.addEdge(recordSource(records_[i]), recordTarget(records_[i]),
                      amounts_[i], timestamps_[i]);
    }
    return graph;
}

} // namespace fraudscope
