#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace ddlbridge {

/**
 * @brief Identifier normalization for PostgreSQL output
 *
 * Schema and table segments are folded to lowercase and emitted bare.
 * Column and constraint names keep their source casing; they are only
 * double-quoted when they are not plain identifiers or are PostgreSQL
 * keywords that cannot stand as a bare name (ORDER, USER, GROUP, ...).
 */
class IdentifierRules {
public:
    // [A-Za-z_][A-Za-z0-9_$]*
    [[nodiscard]] static bool is_plain(std::string_view name);

    // Plain name PostgreSQL rejects unquoted as a column or table name
    [[nodiscard]] static bool is_keyword(std::string_view name);

    // "My Col" -> "\"My Col\"", Order -> "\"Order\"", OrderID -> OrderID
    [[nodiscard]] static std::string quote(std::string_view name);

    // Lowercase schema (dbo when unqualified) and table
    [[nodiscard]] static QualifiedName object_name(const QualifiedName& name);

    // sales.orders
    [[nodiscard]] static std::string render_object(const QualifiedName& name);

    /**
     * @brief Sequence identifier derived from a T-SQL sequence reference
     *
     * [Sequences].[OrderID] -> sequences.order_id_seq. The suffix is
     * appended once; names already carrying it are left alone.
     */
    [[nodiscard]] static QualifiedName sequence_name(const QualifiedName& name,
                                                     std::string_view suffix);

    /**
     * @brief Replace [bracket] identifiers inside expression text
     *
     * Literals, comments and all other text are copied unchanged.
     */
    [[nodiscard]] static std::string strip_brackets(std::string_view expression);

    // 'it''s' quoting for literals
    [[nodiscard]] static std::string quote_literal(std::string_view value);
};

} // namespace ddlbridge
