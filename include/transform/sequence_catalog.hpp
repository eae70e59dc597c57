#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>

namespace ddlbridge {

/**
 * @brief Explicit sequence definitions known before a batch starts
 *
 * Keyed by the PostgreSQL sequence identifier (sequences.order_id_seq),
 * so a default referencing [Sequences].[OrderID] and a converted
 * nextval('sequences.order_id_seq') resolve to the same entry.
 *
 * Thread-safety: populated before conversion, read-only afterwards
 */
class SequenceCatalog {
public:
    explicit SequenceCatalog(std::string suffix = "_seq");

    // Registers a source definition; the first definition of a name wins
    bool add(const SequenceNode& source);

    // Lookup by PostgreSQL identifier (already suffixed)
    [[nodiscard]] const SequenceNode* find(const QualifiedName& target) const;

    [[nodiscard]] size_t size() const { return sequences_.size(); }
    [[nodiscard]] const std::string& suffix() const { return suffix_; }

private:
    std::string suffix_;
    std::unordered_map<std::string, SequenceNode> sequences_;
};

} // namespace ddlbridge
