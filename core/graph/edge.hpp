#pragma once

#include <cstddef>
#include <cstdint>

namespace fraudscope {

/// A directed edge in the relationship graph: payer entity → payee entity.
/// Repeated (source, target) transactions fold into one edge: weights add
/// up, the timestamp tracks the latest transaction.
struct Edge {
    uint64_t id = 0;
    size_t source = 0;              // node index
    size_t target = 0;              // node index
    double weight = 0.0;            // summed transaction amount
    double timestamp = 0.0;         // latest transaction time
    size_t transaction_count = 0;

    Edge() = default;
    Edge(uint64_t id, size_t source, size_t target, double weight, double timestamp)
        : id(id), source(source), target(target),
          weight(weight), timestamp(timestamp), transaction_count(1) {}
};

} // namespace fraudscope
