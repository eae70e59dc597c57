#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ddlbridge {

/**
 * @brief Serializes PostgreSQL-shaped nodes to DDL text
 *
 * Canonical order, independent of source order:
 *   1. CREATE SCHEMA IF NOT EXISTS (owning table's schema first)
 *   2. One CREATE SEQUENCE per distinct sequence (explicit beats implicit)
 *   3. CREATE TABLE bodies (columns in ordinal order, constraints grouped
 *      PRIMARY KEY, UNIQUE, FOREIGN KEY, CHECK)
 *   4. Indexes, omission comments and review blocks in source order,
 *      followed by the aggregated index-property omission comment
 *   5. COMMENT ON: schema, then per table the table comment followed by
 *      column comments in column order
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class PgEmitter {
public:
    static constexpr size_t kTypeWidth = 14;
    static constexpr std::string_view kIndent = "    ";

    [[nodiscard]] std::string emit(const std::vector<StatementNode>& nodes,
                                   size_t omitted_index_properties = 0) const;

    [[nodiscard]] static std::string render_table(const TableNode& table);
    [[nodiscard]] static std::string render_sequence(const SequenceNode& seq);
    [[nodiscard]] static std::string render_index(const IndexNode& index);
    [[nodiscard]] static std::string render_comment(const ExtendedPropertyNode& prop);
    [[nodiscard]] static std::string render_constraint(const Constraint& c);

    // Prefix every line of `text` with "-- "
    [[nodiscard]] static std::string comment_lines(std::string_view text,
                                                   std::string_view indent = "");
};

} // namespace ddlbridge
