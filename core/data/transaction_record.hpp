#pragma once

#include <string>
#include <variant>

namespace fraudscope {

/// Declared layout of an input source. A dataset holds exactly one kind.
enum class DatasetType {
    CreditCard,
    InsuranceClaim,
};

/// "credit_card" / "insurance".
std::string toString(DatasetType type);

/// Inverse of toString(). Throws ConfigurationError on unknown tags.
DatasetType parseDatasetType(const std::string& tag);

/// One card charge: `timestamp,amount,merchant,card_id`.
struct CreditCardRecord {
    double timestamp = 0.0;     // seconds
    double amount = 0.0;
    std::string merchant;
    std::string card_id;
};

/// One insurance claim: `YYYY-MM-DD,claim_amount,policy_id,claim_type`.
struct InsuranceClaimRecord {
    std::string claim_date;     // as read
    double claim_amount = 0.0;
    std::string policy_id;
    std::string claim_type;
};

using TransactionRecord = std::variant<CreditCardRecord, InsuranceClaimRecord>;

// ─── Uniform record view ───────────────────────────────────────
// Graph and series construction only care about who paid whom how much.

double recordAmount(const TransactionRecord& record);

/// Card id or policy id: the edge source in the relationship graph.
const std::string& recordSource(const TransactionRecord& record);

/// Merchant or claim type: the edge target in the relationship graph.
const std::string& recordTarget(const TransactionRecord& record);

} // namespace fraudscope
