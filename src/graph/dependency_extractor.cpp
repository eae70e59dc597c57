#include "graph/dependency_extractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <iterator>

namespace ddlbridge {

namespace {

void add_column(std::vector<std::string>& columns, const std::string& column) {
    const bool present = std::ranges::any_of(columns, [&column](const std::string& c) {
        return utils::iequals(c, column);
    });
    if (!present) columns.push_back(column);
}

} // anonymous namespace

std::vector<DependencyEdge> DependencyExtractor::extract(const std::vector<StatementNode>& nodes) {
    std::vector<DependencyEdge> edges;

    for (const auto& node : nodes) {
        const auto* table = node.as<TableNode>();
        if (!table) continue;

        const ObjectKey owner = ObjectKey::from(table->name);
        for (const auto& c : table->constraints) {
            if (c.kind != ConstraintKind::FOREIGN_KEY) continue;

            const ObjectKey target = ObjectKey::from(c.ref_table);
            auto it = std::ranges::find_if(edges, [&](const DependencyEdge& e) {
                return e.from == owner && e.to == target;
            });
            if (it == edges.end()) {
                edges.push_back(DependencyEdge{owner, target, {}});
                it = std::prev(edges.end());
            }
            for (const auto& col : c.columns) {
                add_column(it->columns, col.name);
            }
        }
    }
    return edges;
}

} // namespace ddlbridge
