#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ddlbridge {

enum class TokenKind {
    IDENTIFIER,         // Bare word (keywords included)
    QUOTED_IDENTIFIER,  // [name] or "name"
    STRING,             // 'text' or N'text'
    NUMBER,             // 42, 1.5, 1e3, 0x1F
    VARIABLE,           // @name, @@name
    SYMBOL,             // ( ) , . ; = <= <> ::
    END
};

/**
 * @brief Lexical token
 *
 * `raw` is a view into the text passed to Lexer::tokenize and is only valid
 * while that text is alive. `value` is the bracket/quote-stripped identifier
 * or the unescaped string literal contents.
 */
struct Token {
    TokenKind kind = TokenKind::END;
    std::string_view raw;
    std::string value;
    size_t offset = 0;
    size_t line = 1;
    bool national = false;      // N'...' string literal

    [[nodiscard]] bool is_keyword(std::string_view keyword) const;
    [[nodiscard]] bool is_symbol(std::string_view symbol) const {
        return kind == TokenKind::SYMBOL && raw == symbol;
    }
    [[nodiscard]] bool is_name() const {
        return kind == TokenKind::IDENTIFIER || kind == TokenKind::QUOTED_IDENTIFIER;
    }
};

struct LexError {
    size_t offset = 0;
    size_t line = 1;
    std::string reason;
};

// Byte range of a skipped comment, in file offsets
struct CommentSpan {
    size_t offset = 0;
    size_t length = 0;
    size_t line = 1;
};

struct LexResult {
    std::vector<Token> tokens;
    std::optional<LexError> error;
    std::vector<CommentSpan> comments;  // In source order
    bool has_comment = false;           // At least one comment was skipped
};

/**
 * @brief Byte range of one statement candidate inside a file.
 */
struct Segment {
    size_t offset = 0;
    size_t length = 0;
    size_t line = 1;
};

/**
 * @brief T-SQL / PostgreSQL DDL lexer - single-pass state machine
 *
 * Handles:
 * - [bracket] and "double-quoted" identifiers with doubled-quote escapes
 * - 'string' and N'national' literals with '' escapes, brackets inside
 *   literals are plain characters
 * - -- line comments and nested block comments (skipped, spans recorded)
 * - numeric literals including hex (0x..) and exponents
 *
 * Thread-safety: stateless, safe for concurrent use
 */
class Lexer {
public:
    /**
     * @brief Tokenize a text slice
     * @param text Slice of the file to tokenize
     * @param base_offset Offset of `text` within the file (for token offsets)
     * @param base_line Line number of the first byte of `text`
     * @return Tokens up to the first lexical error (if any)
     */
    [[nodiscard]] static LexResult tokenize(std::string_view text,
                                            size_t base_offset = 0,
                                            size_t base_line = 1);

    /**
     * @brief Split a file into statement segments
     *
     * Segments end at a batch separator line (GO, optionally followed by a
     * repeat count) or at a ';' outside literals, identifiers and comments.
     * A GO line always ends the current batch, even inside an unterminated
     * literal, so a malformed statement never swallows later batches.
     * Whitespace-only segments are dropped.
     */
    [[nodiscard]] static std::vector<Segment> split_statements(std::string_view text);
};

} // namespace ddlbridge
