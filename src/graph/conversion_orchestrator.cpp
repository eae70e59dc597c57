#include "graph/conversion_orchestrator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <iterator>
#include <format>

namespace ddlbridge {

namespace {

template<typename T, typename Eq>
void append_unique(std::vector<T>& out, const T& value, Eq eq) {
    if (std::ranges::none_of(out, [&](const T& v) { return eq(v, value); })) {
        out.push_back(value);
    }
}

std::string join_columns(const std::vector<std::string>& columns) {
    std::string out;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ", ";
        out += columns[i];
    }
    return out;
}

} // anonymous namespace

ConversionOrchestrator::ConversionOrchestrator(const IConversionState& state,
                                               KnownObjectPredicate known_objects)
    : state_(state), known_objects_(std::move(known_objects)) {}

std::vector<DependencyGroup> ConversionOrchestrator::unresolved(
    const std::vector<DependencyEdge>& edges, const KeySet& same_file) const {

    std::vector<DependencyGroup> groups;
    for (const auto& edge : edges) {
        if (edge.is_self_reference()) continue;
        if (same_file.contains(edge.to)) continue;
        if (state_.has_output(edge.to)) continue;

        auto it = std::ranges::find_if(groups, [&edge](const DependencyGroup& g) {
            return g.target == edge.to;
        });
        if (it == groups.end()) {
            DependencyGroup group;
            group.target = edge.to;
            group.in_input_tree = !known_objects_ || known_objects_(edge.to);
            groups.push_back(std::move(group));
            it = std::prev(groups.end());
        }

        for (const auto& col : edge.columns) {
            append_unique(it->columns, col, [](const std::string& a, const std::string& b) {
                return utils::iequals(a, b);
            });
        }
        append_unique(it->referenced_by, edge.from, std::equal_to<ObjectKey>{});
    }

    std::ranges::sort(groups, [](const DependencyGroup& a, const DependencyGroup& b) {
        return a.target < b.target;
    });
    return groups;
}

std::vector<Diagnostic> ConversionOrchestrator::cycle_notes(
    const std::vector<DependencyEdge>& edges) {

    std::vector<Diagnostic> notes;
    for (size_t i = 0; i < edges.size(); ++i) {
        const auto& edge = edges[i];
        if (edge.is_self_reference()) {
            notes.push_back(Diagnostic{
                DiagnosticKind::DEPENDENCY_CYCLE,
                std::format("{} references itself ({})", edge.from.to_string(),
                            join_columns(edge.columns)),
                0});
            continue;
        }
        // Report each mutual pair once, at its first edge
        for (size_t j = i + 1; j < edges.size(); ++j) {
            if (edges[j].from == edge.to && edges[j].to == edge.from) {
                notes.push_back(Diagnostic{
                    DiagnosticKind::DEPENDENCY_CYCLE,
                    std::format("{} and {} reference each other", edge.from.to_string(),
                                edge.to.to_string()),
                    0});
            }
        }
    }
    return notes;
}

} // namespace ddlbridge
