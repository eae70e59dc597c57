#pragma once

#include "core/types.hpp"
#include <vector>

namespace ddlbridge {

/**
 * @brief Derives foreign-key dependency edges from transformed table nodes
 *
 * One edge per (owner, target) pair; repeated references between the same
 * pair are merged and their columns unioned in first-seen order.
 * Self-references are kept (DependencyEdge::is_self_reference).
 */
class DependencyExtractor {
public:
    [[nodiscard]] static std::vector<DependencyEdge> extract(const std::vector<StatementNode>& nodes);
};

} // namespace ddlbridge
