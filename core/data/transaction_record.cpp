#include "data/transaction_record.hpp"
#include "common/errors.hpp"

namespace fraudscope {

std::string toString(DatasetType type) {
    switch (type) {
        case DatasetType::CreditCard: return "credit_card";
        case DatasetType::InsuranceClaim: return "insurance";
    }
    return "unknown";
}

DatasetType parseDatasetType(const std::string& tag) {
    if (tag == "credit_card") return DatasetType::CreditCard;
    if (tag == "insurance") return DatasetType::InsuranceClaim;
    throw ConfigurationError("Unsupported dataset type: " + tag);
}

namespace {

struct AmountOf {
    double operator()(const CreditCardRecord& r) const { return r.amount; }
    double operator()(const InsuranceClaimRecord& r) const { return r.claim_amount; }
};

struct SourceOf {
    const std::string& operator()(const CreditCardRecord& r) const { return r.card_id; }
    const std::string& operator()(const InsuranceClaimRecord& r) const { return r.policy_id; }
};

struct TargetOf {
    const std::string& operator()(const CreditCardRecord& r) const { return r.merchant; }
    const std::string& operator()(const InsuranceClaimRecord& r) const { return r.claim_type; }
};

} // namespace

double recordAmount(const TransactionRecord& record) {
    return std::visit(AmountOf{}, record);
}

const std::string& recordSource(const TransactionRecord& record) {
    return std::visit(SourceOf{}, record);
}

const std::string& recordTarget(const TransactionRecord& record) {
    return std::visit(TargetOf{}, record);
}

} // namespace fraudscope
