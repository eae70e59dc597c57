#include "parser/lexer.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>

namespace ddlbridge {

// ============================================================================
// Character classification table, used instead of std::isdigit/isalpha/isalnum.
// Bytes >= 0x80 are identifier characters so UTF-8 names lex as a single word.
// ============================================================================
namespace {

enum CharClass : uint8_t {
    CC_OTHER   = 0,
    CC_SPACE   = 1,
    CC_DIGIT   = 2,
    CC_ALPHA   = 4,
    CC_IDENT   = 8,   // _ $ # and non-ASCII
};

struct CharTable {
    uint8_t cls[256];

    constexpr CharTable() : cls{} {
        for (int i = 0; i < 256; ++i) {
            cls[i] = (i >= 0x80) ? CC_IDENT : CC_OTHER;
        }
        cls[' '] = CC_SPACE; cls['\t'] = CC_SPACE;
        cls['\n'] = CC_SPACE; cls['\r'] = CC_SPACE;
        cls['\f'] = CC_SPACE; cls['\v'] = CC_SPACE;
        for (int i = '0'; i <= '9'; ++i) cls[i] = CC_DIGIT;
        for (int i = 'a'; i <= 'z'; ++i) cls[i] = CC_ALPHA;
        for (int i = 'A'; i <= 'Z'; ++i) cls[i] = CC_ALPHA;
        cls['_'] = CC_IDENT;
        cls['$'] = CC_IDENT;
        cls['#'] = CC_IDENT;
    }
};

static constexpr CharTable CT{};

inline bool ct_space(unsigned char c)       { return CT.cls[c] == CC_SPACE; }
inline bool ct_digit(unsigned char c)       { return CT.cls[c] == CC_DIGIT; }
inline bool ct_ident_start(unsigned char c) { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_IDENT; }
inline bool ct_ident_cont(unsigned char c)  { auto v = CT.cls[c]; return v == CC_ALPHA || v == CC_DIGIT || v == CC_IDENT || c == '@'; }
inline bool ct_hex(unsigned char c) {
    return ct_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Two-character operators recognized as a single SYMBOL token
constexpr std::string_view kTwoCharSymbols[] = {
    "<=", ">=", "<>", "!=", "!<", "!>", "::", "||"
};

bool is_go_line(std::string_view line) {
    const std::string trimmed = utils::trim(std::string(line));
    if (trimmed.size() < 2 || !utils::iequals(trimmed.substr(0, 2), "go")) {
        return false;
    }
    // "GO" or "GO <count>"
    const std::string rest = utils::trim(trimmed.substr(2));
    if (rest.empty()) return true;
    if (!ct_space(static_cast<unsigned char>(trimmed[2]))) return false;
    for (const char c : rest) {
        if (!ct_digit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

bool Token::is_keyword(std::string_view keyword) const {
    return kind == TokenKind::IDENTIFIER && utils::iequals(value, keyword);
}

// ============================================================================
// Tokenizer
// ============================================================================

LexResult Lexer::tokenize(std::string_view text, size_t base_offset, size_t base_line) {
    LexResult result;
    result.tokens.reserve(text.size() / 4);

    size_t line = base_line;
    const size_t len = text.size();
    size_t i = 0;

    auto fail = [&](size_t at, size_t at_line, std::string reason) {
        result.error = LexError{base_offset + at, at_line, std::move(reason)};
    };

    while (i < len) {
        const auto c = static_cast<unsigned char>(text[i]);
        const auto next_c = (i + 1 < len) ? static_cast<unsigned char>(text[i + 1])
                                          : static_cast<unsigned char>('\0');

        if (ct_space(c)) {
            if (c == '\n') ++line;
            ++i;
            continue;
        }

        // -- line comment
        if (c == '-' && next_c == '-') {
            result.has_comment = true;
            const size_t start = i;
            while (i < len && text[i] != '\n') ++i;
            size_t stop = i;
            if (stop > start && text[stop - 1] == '\r') --stop;
            result.comments.push_back(CommentSpan{base_offset + start, stop - start, line});
            continue;
        }

        // /* block comment */ (T-SQL allows nesting)
        if (c == '/' && next_c == '*') {
            result.has_comment = true;
            const size_t start = i;
            const size_t start_line = line;
            int depth = 0;
            while (i < len) {
                if (text[i] == '/' && i + 1 < len && text[i + 1] == '*') {
                    ++depth;
                    i += 2;
                } else if (text[i] == '*' && i + 1 < len && text[i + 1] == '/') {
                    --depth;
                    i += 2;
                    if (depth == 0) break;
                } else {
                    if (text[i] == '\n') ++line;
                    ++i;
                }
            }
            if (depth != 0) {
                fail(start, start_line, "unterminated block comment");
                return result;
            }
            result.comments.push_back(CommentSpan{base_offset + start, i - start, start_line});
            continue;
        }

        Token tok;
        tok.offset = base_offset + i;
        tok.line = line;
        const size_t start = i;

        // 'string' / N'string'
        const bool national = (c == 'N' || c == 'n') && next_c == '\'';
        if (c == '\'' || national) {
            tok.kind = TokenKind::STRING;
            tok.national = national;
            i += national ? 2 : 1;
            bool closed = false;
            while (i < len) {
                if (text[i] == '\'') {
                    if (i + 1 < len && text[i + 1] == '\'') {
                        tok.value += '\'';
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                if (text[i] == '\n') ++line;
                tok.value += text[i++];
            }
            if (!closed) {
                fail(start, tok.line, "unterminated string literal");
                return result;
            }
            tok.raw = text.substr(start, i - start);
            result.tokens.push_back(std::move(tok));
            continue;
        }

        // [bracket identifier] / "quoted identifier"
        if (c == '[' || c == '"') {
            const char close = (c == '[') ? ']' : '"';
            tok.kind = TokenKind::QUOTED_IDENTIFIER;
            ++i;
            bool closed = false;
            while (i < len) {
                if (text[i] == close) {
                    if (i + 1 < len && text[i + 1] == close) {
                        tok.value += close;
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                if (text[i] == '\n') ++line;
                tok.value += text[i++];
            }
            if (!closed) {
                fail(start, tok.line, c == '['
                    ? "unterminated bracket identifier"
                    : "unterminated quoted identifier");
                return result;
            }
            tok.raw = text.substr(start, i - start);
            result.tokens.push_back(std::move(tok));
            continue;
        }

        // Numeric literal
        if (ct_digit(c) || (c == '.' && ct_digit(next_c))) {
            tok.kind = TokenKind::NUMBER;
            if (c == '0' && (next_c == 'x' || next_c == 'X')) {
                i += 2;
                while (i < len && ct_hex(static_cast<unsigned char>(text[i]))) ++i;
            } else {
                while (i < len && (ct_digit(static_cast<unsigned char>(text[i])) || text[i] == '.')) ++i;
                if (i < len && (text[i] == 'e' || text[i] == 'E')) {
                    size_t j = i + 1;
                    if (j < len && (text[j] == '+' || text[j] == '-')) ++j;
                    if (j < len && ct_digit(static_cast<unsigned char>(text[j]))) {
                        i = j;
                        while (i < len && ct_digit(static_cast<unsigned char>(text[i]))) ++i;
                    }
                }
            }
            tok.raw = text.substr(start, i - start);
            tok.value = std::string(tok.raw);
            result.tokens.push_back(std::move(tok));
            continue;
        }

        // @variable / @@system_variable
        if (c == '@') {
            tok.kind = TokenKind::VARIABLE;
            ++i;
            while (i < len && ct_ident_cont(static_cast<unsigned char>(text[i]))) ++i;
            tok.raw = text.substr(start, i - start);
            tok.value = std::string(tok.raw);
            result.tokens.push_back(std::move(tok));
            continue;
        }

        // Identifier / keyword
        if (ct_ident_start(c)) {
            tok.kind = TokenKind::IDENTIFIER;
            ++i;
            while (i < len && ct_ident_cont(static_cast<unsigned char>(text[i]))) ++i;
            tok.raw = text.substr(start, i - start);
            tok.value = std::string(tok.raw);
            result.tokens.push_back(std::move(tok));
            continue;
        }

        // Symbols
        tok.kind = TokenKind::SYMBOL;
        size_t width = 1;
        if (i + 1 < len) {
            const std::string_view pair = text.substr(i, 2);
            for (const auto sym : kTwoCharSymbols) {
                if (pair == sym) {
                    width = 2;
                    break;
                }
            }
        }
        i += width;
        tok.raw = text.substr(start, width);
        tok.value = std::string(tok.raw);
        result.tokens.push_back(std::move(tok));
    }

    return result;
}

// ============================================================================
// Statement Splitter
// ============================================================================

std::vector<Segment> Lexer::split_statements(std::string_view text) {
    enum class State {
        NORMAL,
        IN_SINGLE_QUOTE,
        IN_DOUBLE_QUOTE,
        IN_BRACKET,
        IN_LINE_COMMENT,
        IN_BLOCK_COMMENT
    };

    std::vector<Segment> segments;
    const size_t len = text.size();

    State state = State::NORMAL;
    int comment_depth = 0;
    size_t line = 1;
    size_t seg_start = 0;
    size_t seg_line = 1;

    auto flush = [&](size_t end) {
        size_t b = seg_start;
        size_t first_line = seg_line;
        while (b < end && ct_space(static_cast<unsigned char>(text[b]))) {
            if (text[b] == '\n') ++first_line;
            ++b;
        }
        size_t e = end;
        while (e > b && ct_space(static_cast<unsigned char>(text[e - 1]))) --e;
        if (e > b) {
            segments.push_back(Segment{b, e - b, first_line});
        }
    };

    size_t i = 0;
    while (i < len) {
        // Batch separator: GO on its own line ends the batch in any state
        if (i == 0 || text[i - 1] == '\n') {
            size_t eol = text.find('\n', i);
            if (eol == std::string_view::npos) eol = len;
            if (is_go_line(text.substr(i, eol - i))) {
                flush(i);
                state = State::NORMAL;
                comment_depth = 0;
                i = (eol < len) ? eol + 1 : len;
                if (eol < len) ++line;
                seg_start = i;
                seg_line = line;
                continue;
            }
        }

        const char c = text[i];
        const char next_c = (i + 1 < len) ? text[i + 1] : '\0';

        switch (state) {
            case State::NORMAL:
                if (c == '\'') state = State::IN_SINGLE_QUOTE;
                else if (c == '"') state = State::IN_DOUBLE_QUOTE;
                else if (c == '[') state = State::IN_BRACKET;
                else if (c == '-' && next_c == '-') { state = State::IN_LINE_COMMENT; ++i; }
                else if (c == '/' && next_c == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    comment_depth = 1;
                    ++i;
                } else if (c == ';') {
                    flush(i);
                    seg_start = i + 1;
                    seg_line = line;
                }
                break;

            case State::IN_SINGLE_QUOTE:
                if (c == '\'') {
                    if (next_c == '\'') ++i;
                    else state = State::NORMAL;
                }
                break;

            case State::IN_DOUBLE_QUOTE:
                if (c == '"') {
                    if (next_c == '"') ++i;
                    else state = State::NORMAL;
                }
                break;

            case State::IN_BRACKET:
                if (c == ']') {
                    if (next_c == ']') ++i;
                    else state = State::NORMAL;
                }
                break;

            case State::IN_LINE_COMMENT:
                if (c == '\n') state = State::NORMAL;
                break;

            case State::IN_BLOCK_COMMENT:
                if (c == '/' && next_c == '*') {
                    ++comment_depth;
                    ++i;
                } else if (c == '*' && next_c == '/') {
                    ++i;
                    if (--comment_depth == 0) state = State::NORMAL;
                }
                break;
        }

        if (c == '\n') ++line;
        ++i;
    }
    flush(len);
    return segments;
}

} // namespace ddlbridge
