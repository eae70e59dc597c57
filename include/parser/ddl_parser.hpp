#pragma once

#include "core/types.hpp"
#include "parser/lexer.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ddlbridge {

/**
 * @brief Statement-scoped parse failure
 *
 * Raised only for unbalanced brackets/parentheses and unterminated
 * literals, identifiers or comments. Anything merely unrecognized becomes
 * a RawNode instead.
 */
struct ParseError {
    size_t offset = 0;
    size_t line = 1;
    size_t column = 1;
    std::string reason;
    std::string statement_text;     // Verbatim text of the failing statement

    [[nodiscard]] std::string to_string() const;
};

struct ParseOutput {
    std::vector<StatementNode> nodes;
    std::vector<ParseError> errors;

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

/**
 * @brief DDL Parser - T-SQL table scripts to typed statement nodes
 *
 * Recognizes CREATE TABLE / SEQUENCE / SCHEMA / INDEX,
 * sp_addextendedproperty calls, and their PostgreSQL counterparts
 * (COMMENT ON, nextval defaults, IF NOT EXISTS) so converted output
 * re-parses to an equivalent node sequence. Every other statement is
 * returned verbatim as a RawNode.
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class DdlParser {
public:
    /**
     * @brief Parse a file
     * @param text Raw file contents
     * @return Nodes in source order, plus one error per failed statement
     */
    [[nodiscard]] ParseOutput parse(std::string_view text) const;
};

} // namespace ddlbridge
