#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace fraudscope {

/// Which side of a transaction an entity appeared on first.
enum class EntityRole {
    Source,     // card or policy
    Target,     // merchant or claim type
};

/// A node in the relationship graph: one account, merchant, policy or
/// claim type, identified by the string it carries in the input.
struct Node {
    size_t index = 0;
    std::string id;
    EntityRole role = EntityRole::Source;

    Node() = default;
    Node(size_t index, std::string id, EntityRole role)
        : index(index), id(std::move(id)), role(role) {}
};

} // namespace fraudscope
