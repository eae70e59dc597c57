#pragma once

#include "core/types.hpp"
#include "state/iconversion_state.hpp"

#include <functional>
#include <unordered_set>
#include <vector>

namespace ddlbridge {

/**
 * @brief Computes which referenced tables still need conversion
 *
 * Purely advisory: the result is reported, it never blocks writing the
 * current file's output.
 *
 * Thread-safety: const methods are safe for concurrent use as long as the
 * conversion state is not modified.
 */
class ConversionOrchestrator {
public:
    // true = a source table file exists for the key somewhere in the input tree
    using KnownObjectPredicate = std::function<bool(const ObjectKey&)>;
    using KeySet = std::unordered_set<ObjectKey, ObjectKeyHash>;

    explicit ConversionOrchestrator(const IConversionState& state,
                                    KnownObjectPredicate known_objects = {});

    /**
     * @brief Unresolved dependencies grouped by target
     *
     * Drops self-references, targets that already have output and targets
     * emitted alongside the referencing table (`same_file`), merges the
     * remaining edges per target (columns and owners unioned in first-seen
     * order) and sorts groups by (schema, table).
     */
    [[nodiscard]] std::vector<DependencyGroup> unresolved(
        const std::vector<DependencyEdge>& edges, const KeySet& same_file = {}) const;

    /**
     * @brief Informational notes for self and mutual references
     */
    [[nodiscard]] static std::vector<Diagnostic> cycle_notes(
        const std::vector<DependencyEdge>& edges);

private:
    const IConversionState& state_;
    KnownObjectPredicate known_objects_;
};

} // namespace ddlbridge
