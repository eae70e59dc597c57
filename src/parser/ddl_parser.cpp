#include "parser/ddl_parser.hpp"
#include "core/utils.hpp"

#include <format>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace ddlbridge {

// Constexpr keywords (used 2+ times while parsing)
static constexpr std::string_view kCreate     = "CREATE";
static constexpr std::string_view kConstraint = "CONSTRAINT";
static constexpr std::string_view kPrimary    = "PRIMARY";
static constexpr std::string_view kUnique     = "UNIQUE";
static constexpr std::string_view kForeign    = "FOREIGN";
static constexpr std::string_view kReferences = "REFERENCES";
static constexpr std::string_view kCheck      = "CHECK";
static constexpr std::string_view kDefault    = "DEFAULT";
static constexpr std::string_view kNot        = "NOT";
static constexpr std::string_view kNull       = "NULL";
static constexpr std::string_view kWith       = "WITH";
static constexpr std::string_view kOn         = "ON";
static constexpr std::string_view kKey        = "KEY";

namespace {

/**
 * @brief Unexpected token inside a statement or table element.
 *
 * Never escapes the parser: the enclosing statement or element falls back
 * to verbatim text.
 */
struct SyntaxError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const Token& end_token() {
    static const Token tok;
    return tok;
}

/**
 * @brief Forward cursor over tokens [begin, end) of one statement.
 */
class TokenCursor {
public:
    TokenCursor(std::string_view source, const std::vector<Token>& tokens,
                size_t begin, size_t end)
        : source_(source), tokens_(tokens), pos_(begin), end_(end) {}

    [[nodiscard]] bool at_end() const { return pos_ >= end_; }
    [[nodiscard]] size_t position() const { return pos_; }
    void set_position(size_t pos) { pos_ = pos; }
    [[nodiscard]] size_t end() const { return end_; }

    [[nodiscard]] const Token& peek(size_t ahead = 0) const {
        return (pos_ + ahead < end_) ? tokens_[pos_ + ahead] : end_token();
    }

    const Token& next() {
        if (at_end()) throw SyntaxError("unexpected end of statement");
        return tokens_[pos_++];
    }

    bool accept_keyword(std::string_view keyword) {
        if (peek().is_keyword(keyword)) {
            ++pos_;
            return true;
        }
        return false;
    }

    // Accepts the full keyword sequence or nothing
    bool accept_keywords(std::initializer_list<std::string_view> keywords) {
        size_t ahead = 0;
        for (const auto kw : keywords) {
            if (!peek(ahead).is_keyword(kw)) return false;
            ++ahead;
        }
        pos_ += ahead;
        return true;
    }

    void expect_keyword(std::string_view keyword) {
        if (!accept_keyword(keyword)) {
            throw SyntaxError(std::format("expected {} near '{}'", keyword, peek().raw));
        }
    }

    bool accept_symbol(std::string_view symbol) {
        if (peek().is_symbol(symbol)) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect_symbol(std::string_view symbol) {
        if (!accept_symbol(symbol)) {
            throw SyntaxError(std::format("expected '{}' near '{}'", symbol, peek().raw));
        }
    }

    std::string expect_name() {
        const Token& tok = peek();
        if (!tok.is_name()) {
            throw SyntaxError(std::format("expected identifier near '{}'", tok.raw));
        }
        ++pos_;
        return tok.value;
    }

    // name ('.' name)* ; empty parts allowed for db..table
    std::vector<std::string> parse_name_parts() {
        std::vector<std::string> parts;
        parts.push_back(expect_name());
        while (peek().is_symbol(".")) {
            ++pos_;
            if (peek().is_symbol(".")) {
                parts.emplace_back();
                continue;
            }
            parts.push_back(expect_name());
        }
        return parts;
    }

    // Three/four-part names keep the last two parts (schema, object)
    QualifiedName parse_qualified_name() {
        auto parts = parse_name_parts();
        if (parts.size() == 1) return QualifiedName("", std::move(parts[0]));
        const size_t n = parts.size();
        return QualifiedName(std::move(parts[n - 2]), std::move(parts[n - 1]));
    }

    // Index just past the ')' matching the '(' at `from`
    [[nodiscard]] size_t matching_close(size_t from) const {
        int depth = 0;
        for (size_t i = from; i < end_; ++i) {
            if (tokens_[i].is_symbol("(")) ++depth;
            else if (tokens_[i].is_symbol(")")) {
                if (--depth == 0) return i + 1;
            }
        }
        throw SyntaxError("unbalanced parentheses");
    }

    // Consume a parenthesized group, returning the text between the parens
    std::string take_parenthesized() {
        if (!peek().is_symbol("(")) {
            throw SyntaxError(std::format("expected '(' near '{}'", peek().raw));
        }
        const size_t close = matching_close(pos_);
        std::string inner = (close - pos_ > 2)
            ? std::string(slice(pos_ + 1, close - 1))
            : std::string();
        pos_ = close;
        return inner;
    }

    // Verbatim source text covering tokens [from, to)
    [[nodiscard]] std::string_view slice(size_t from, size_t to) const {
        if (from >= to) return {};
        const size_t begin = tokens_[from].offset;
        const size_t finish = tokens_[to - 1].offset + tokens_[to - 1].raw.size();
        return source_.substr(begin, finish - begin);
    }

    [[nodiscard]] const Token& at(size_t index) const { return tokens_[index]; }

private:
    std::string_view source_;
    const std::vector<Token>& tokens_;
    size_t pos_;
    size_t end_;
};

size_t column_of(std::string_view text, size_t offset) {
    const size_t nl = text.rfind('\n', offset == 0 ? 0 : offset - 1);
    if (nl == std::string_view::npos || offset == 0) return offset + 1;
    return offset - nl;
}

// ============================================================================
// Column & Expression Helpers
// ============================================================================

// Column-option keywords that end a DEFAULT expression at depth 0
const std::unordered_set<std::string> DEFAULT_TERMINATORS = {
    "NOT", "NULL", "CONSTRAINT", "PRIMARY", "UNIQUE", "REFERENCES", "CHECK",
    "IDENTITY", "COLLATE", "GENERATED", "FOREIGN", "WITH", "SPARSE",
    "ROWGUIDCOL", "HIDDEN", "MASKED"
};

std::vector<IndexColumn> parse_index_columns(TokenCursor& cur) {
    std::vector<IndexColumn> cols;
    cur.expect_symbol("(");
    if (cur.accept_symbol(")")) return cols;
    do {
        IndexColumn col;
        col.name = cur.expect_name();
        if (cur.accept_keyword("ASC")) col.direction = "ASC";
        else if (cur.accept_keyword("DESC")) col.direction = "DESC";
        cols.push_back(std::move(col));
    } while (cur.accept_symbol(","));
    cur.expect_symbol(")");
    return cols;
}

std::vector<std::string> parse_name_list(TokenCursor& cur) {
    std::vector<std::string> names;
    cur.expect_symbol("(");
    do {
        names.push_back(cur.expect_name());
    } while (cur.accept_symbol(","));
    cur.expect_symbol(")");
    return names;
}

std::string parse_signed_number(TokenCursor& cur) {
    std::string sign;
    if (cur.peek().is_symbol("-") || cur.peek().is_symbol("+")) {
        sign = std::string(cur.next().raw);
    }
    const Token& tok = cur.next();
    if (tok.kind != TokenKind::NUMBER) {
        throw SyntaxError(std::format("expected number near '{}'", tok.raw));
    }
    return sign == "-" ? "-" + tok.value : tok.value;
}

TypeRef parse_type(TokenCursor& cur) {
    TypeRef type;
    const auto parts = cur.parse_name_parts();
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) type.name += '.';
        type.name += parts[i];
    }
    if (utils::iequals(type.name, "DOUBLE") && cur.accept_keyword("PRECISION")) {
        type.name += " PRECISION";
    }
    if (cur.accept_symbol("(")) {
        do {
            const Token& tok = cur.peek();
            if (tok.kind == TokenKind::NUMBER) {
                type.args.push_back(cur.next().value);
            } else if (tok.kind == TokenKind::IDENTIFIER) {
                type.args.push_back(utils::to_upper(cur.next().value));
            } else if (tok.is_symbol("-")) {
                type.args.push_back(parse_signed_number(cur));
            } else {
                throw SyntaxError(std::format("unexpected type argument '{}'", tok.raw));
            }
        } while (cur.accept_symbol(","));
        cur.expect_symbol(")");
    }
    return type;
}

bool is_function_call(TokenCursor& cur, size_t b, size_t e,
                      std::initializer_list<std::string_view> names) {
    if (e - b != 3) return false;
    const Token& fn = cur.at(b);
    if (fn.kind != TokenKind::IDENTIFIER) return false;
    if (!cur.at(b + 1).is_symbol("(") || !cur.at(b + 2).is_symbol(")")) return false;
    for (const auto name : names) {
        if (utils::iequals(fn.value, name)) return true;
    }
    return false;
}

/**
 * @brief Classify default-expression tokens [b, e) into a structured DefaultExpr.
 */
DefaultExpr classify_default(TokenCursor& cur, size_t b, size_t e) {
    DefaultExpr expr;

    // Strip redundant outer parentheses: ((0)) -> 0
    while (e - b >= 2 && cur.at(b).is_symbol("(") && cur.matching_close(b) == e) {
        ++b;
        --e;
    }

    expr.value = std::string(cur.slice(b, e));
    const size_t n = e - b;
    if (n == 0) return expr;

    const Token& first = cur.at(b);

    // NEXT VALUE FOR [schema].[sequence]
    if (n >= 4 && first.is_keyword("NEXT") && cur.at(b + 1).is_keyword("VALUE") &&
        cur.at(b + 2).is_keyword("FOR")) {
        const size_t saved = cur.position();
        cur.set_position(b + 3);
        try {
            QualifiedName seq = cur.parse_qualified_name();
            if (cur.position() == e) {
                expr.kind = DefaultKind::SEQUENCE_NEXT;
                expr.sequence = std::move(seq);
            }
        } catch (const SyntaxError&) {
            // OVER (...) or other trailing clauses: keep as expression
        }
        cur.set_position(saved);
        return expr;
    }

    // nextval('schema.sequence') / nextval('schema.sequence'::regclass)
    if (n >= 4 && first.is_keyword("nextval") && cur.at(b + 1).is_symbol("(") &&
        cur.at(b + 2).kind == TokenKind::STRING && cur.at(e - 1).is_symbol(")")) {
        const bool plain = (n == 4);
        const bool cast = (n == 6 && cur.at(b + 3).is_symbol("::") &&
                           cur.at(b + 4).is_keyword("regclass"));
        if (plain || cast) {
            const auto parts = utils::split(cur.at(b + 2).value, '.');
            expr.kind = DefaultKind::SEQUENCE_NEXT;
            if (parts.size() >= 2) {
                expr.sequence = QualifiedName(parts[parts.size() - 2], parts.back());
            } else if (parts.size() == 1) {
                expr.sequence = QualifiedName("", parts[0]);
            }
        }
        return expr;
    }

    if (n == 1) {
        if (first.kind == TokenKind::NUMBER) {
            expr.kind = DefaultKind::NUMBER;
            expr.value = first.value;
        } else if (first.kind == TokenKind::STRING) {
            expr.kind = DefaultKind::STRING;
            expr.value = first.value;
        } else if (first.is_keyword("NULL")) {
            expr.kind = DefaultKind::NULL_VALUE;
            expr.value = "NULL";
        } else if (first.is_keyword("TRUE") || first.is_keyword("FALSE")) {
            expr.kind = DefaultKind::BOOLEAN;
            expr.value = utils::to_upper(first.value);
        } else if (first.is_keyword("CURRENT_TIMESTAMP") || first.is_keyword("LOCALTIMESTAMP")) {
            expr.kind = DefaultKind::CURRENT_TIMESTAMP;
        }
        return expr;
    }

    if (n == 2 && (first.is_symbol("-") || first.is_symbol("+")) &&
        cur.at(b + 1).kind == TokenKind::NUMBER) {
        expr.kind = DefaultKind::NUMBER;
        expr.value = (first.is_symbol("-") ? "-" : "") + cur.at(b + 1).value;
        return expr;
    }

    if (is_function_call(cur, b, e, {"sysdatetime", "getdate", "sysdatetimeoffset",
                                     "now", "current_timestamp"})) {
        expr.kind = DefaultKind::CURRENT_TIMESTAMP;
    } else if (is_function_call(cur, b, e, {"sysutcdatetime", "getutcdate"})) {
        expr.kind = DefaultKind::UTC_TIMESTAMP;
    } else if (is_function_call(cur, b, e, {"newid", "newsequentialid",
                                            "gen_random_uuid", "uuid_generate_v4"})) {
        expr.kind = DefaultKind::UUID_GENERATE;
    } else if (n == 5 && first.is_keyword("CURRENT_TIMESTAMP") &&
               cur.at(b + 1).is_keyword("AT") && cur.at(b + 2).is_keyword("TIME") &&
               cur.at(b + 3).is_keyword("ZONE") && cur.at(b + 4).kind == TokenKind::STRING &&
               utils::iequals(cur.at(b + 4).value, "UTC")) {
        expr.kind = DefaultKind::UTC_TIMESTAMP;
    }
    return expr;
}

// ============================================================================
// Statement Parser
// ============================================================================

class StatementParser {
public:
    StatementParser(std::string_view source, const std::vector<Token>& tokens,
                    size_t begin, size_t end)
        : cur_(source, tokens, begin, end) {}

    StatementNode parse(SourceSpan span, std::string_view text) {
        try {
            if (auto node = dispatch()) {
                node->span = span;
                return std::move(*node);
            }
        } catch (const SyntaxError& e) {
            return StatementNode(
                RawNode{RawKind::UNRECOGNIZED, std::string(text),
                        std::format("unsupported statement shape: {}", e.what())},
                span);
        }
        return StatementNode(
            RawNode{RawKind::UNRECOGNIZED, std::string(text), "unrecognized statement"},
            span);
    }

private:
    std::optional<StatementNode> dispatch() {
        if (cur_.accept_keyword(kCreate)) {
            cur_.accept_keywords({"OR", "ALTER"});
            if (cur_.accept_keyword("TABLE")) return StatementNode(parse_table());
            if (cur_.accept_keyword("SEQUENCE")) return StatementNode(parse_sequence());
            if (cur_.accept_keyword("SCHEMA")) return StatementNode(parse_schema());
            if (cur_.peek().is_keyword(kUnique) || cur_.peek().is_keyword("CLUSTERED") ||
                cur_.peek().is_keyword("NONCLUSTERED") || cur_.peek().is_keyword("COLUMNSTORE") ||
                cur_.peek().is_keyword("INDEX")) {
                return StatementNode(parse_index());
            }
            return std::nullopt;
        }
        if (cur_.peek().is_keyword("EXEC") || cur_.peek().is_keyword("EXECUTE")) {
            cur_.next();
            const auto proc = cur_.parse_name_parts();
            if (utils::iequals(proc.back(), "sp_addextendedproperty")) {
                return StatementNode(parse_extended_property());
            }
            return std::nullopt;
        }
        if (cur_.accept_keywords({"COMMENT", kOn})) {
            return StatementNode(parse_comment_on());
        }
        return std::nullopt;
    }

    void expect_end() {
        if (!cur_.at_end()) {
            throw SyntaxError(std::format("unexpected '{}'", cur_.peek().raw));
        }
    }

    // ---- CREATE TABLE --------------------------------------------------------

    TableNode parse_table() {
        TableNode table;
        cur_.accept_keywords({"IF", kNot, "EXISTS"});
        table.name = cur_.parse_qualified_name();

        cur_.expect_symbol("(");
        const size_t body_close = cur_.matching_close(cur_.position() - 1) - 1;

        size_t ordinal = 0;
        size_t column_ordinal = 0;
        while (cur_.position() < body_close) {
            parse_table_element(table, ordinal++, column_ordinal, body_close);
            if (cur_.position() < body_close) cur_.expect_symbol(",");
        }
        cur_.expect_symbol(")");

        parse_table_tail(table);
        return table;
    }

    void parse_table_element(TableNode& table, size_t ordinal, size_t& column_ordinal,
                             size_t body_close) {
        const size_t start = cur_.position();
        try {
            if (cur_.accept_keyword(kConstraint)) {
                const std::string name = cur_.expect_name();
                table.constraints.push_back(parse_constraint_body(name, ordinal, table));
            } else if (cur_.peek().is_keyword(kPrimary) || cur_.peek().is_keyword(kUnique) ||
                       cur_.peek().is_keyword(kForeign) || cur_.peek().is_keyword(kCheck)) {
                table.constraints.push_back(parse_constraint_body("", ordinal, table));
            } else if (cur_.accept_keyword("PERIOD")) {
                cur_.expect_keyword("FOR");
                cur_.expect_keyword("SYSTEM_TIME");
                cur_.expect_symbol("(");
                PeriodClause period;
                period.start_column = cur_.expect_name();
                cur_.expect_symbol(",");
                period.end_column = cur_.expect_name();
                cur_.expect_symbol(")");
                table.period = std::move(period);
            } else if (cur_.peek().is_keyword("INDEX")) {
                throw SyntaxError("inline index definition");
            } else {
                Column col = parse_column(table, ordinal);
                col.ordinal = column_ordinal;
                table.columns.push_back(std::move(col));
                ++column_ordinal;
            }
            if (cur_.position() < body_close && !cur_.peek().is_symbol(",")) {
                throw SyntaxError(std::format("unexpected '{}'", cur_.peek().raw));
            }
        } catch (const SyntaxError& e) {
            // Keep the element verbatim up to the next top-level ','
            cur_.set_position(start);
            int depth = 0;
            while (cur_.position() < body_close) {
                const Token& tok = cur_.peek();
                if (depth == 0 && tok.is_symbol(",")) break;
                if (tok.is_symbol("(")) ++depth;
                else if (tok.is_symbol(")")) --depth;
                cur_.next();
            }
            // Drop constraints lifted from a column that turned out unmodeled
            std::erase_if(table.constraints,
                          [ordinal](const Constraint& c) { return c.ordinal == ordinal; });
            table.raw_elements.push_back(RawElement{
                std::string(cur_.slice(start, cur_.position())), e.what(), ordinal});
        }
    }

    Column parse_column(TableNode& table, size_t ordinal) {
        Column col;
        col.name = cur_.expect_name();
        if (cur_.peek().is_keyword("AS")) {
            throw SyntaxError("computed column");
        }
        col.type = parse_type(cur_);

        while (!cur_.at_end() && !cur_.peek().is_symbol(",") && !cur_.peek().is_symbol(")")) {
            if (cur_.accept_keyword(kNull)) {
                col.nullable = true;
            } else if (cur_.accept_keywords({kNot, kNull})) {
                col.nullable = false;
            } else if (cur_.accept_keyword("IDENTITY")) {
                IdentitySpec identity;
                if (cur_.accept_symbol("(")) {
                    identity.seed = parse_signed_number(cur_);
                    cur_.expect_symbol(",");
                    identity.increment = parse_signed_number(cur_);
                    cur_.expect_symbol(")");
                }
                cur_.accept_keywords({kNot, "FOR", "REPLICATION"});
                col.identity = std::move(identity);
            } else if (cur_.accept_keyword("GENERATED")) {
                parse_generated(col);
            } else if (cur_.accept_keyword("HIDDEN")) {
                col.hidden = true;
            } else if (cur_.accept_keyword("COLLATE")) {
                col.collation = cur_.expect_name();
            } else {
                std::string constraint_name;
                if (cur_.accept_keyword(kConstraint)) {
                    constraint_name = cur_.expect_name();
                }
                if (cur_.accept_keyword(kDefault)) {
                    col.default_value = parse_default();
                    col.default_value->constraint_name = std::move(constraint_name);
                } else if (cur_.peek().is_keyword(kPrimary) || cur_.peek().is_keyword(kUnique) ||
                           cur_.peek().is_keyword(kReferences) || cur_.peek().is_keyword(kForeign) ||
                           cur_.peek().is_keyword(kCheck)) {
                    table.constraints.push_back(
                        parse_inline_constraint(constraint_name, col.name, ordinal));
                } else {
                    throw SyntaxError(std::format("unsupported column option '{}'",
                                                  cur_.peek().raw));
                }
            }
        }
        return col;
    }

    void parse_generated(Column& col) {
        // GENERATED ALWAYS AS ROW START|END [HIDDEN]
        if (cur_.accept_keywords({"ALWAYS", "AS", "ROW"})) {
            if (cur_.accept_keyword("START")) col.generated = GeneratedKind::ROW_START;
            else if (cur_.accept_keyword("END")) col.generated = GeneratedKind::ROW_END;
            else throw SyntaxError("expected START or END after GENERATED ALWAYS AS ROW");
            if (cur_.accept_keyword("HIDDEN")) col.hidden = true;
            return;
        }
        // GENERATED {ALWAYS | BY DEFAULT} AS IDENTITY [(START WITH n INCREMENT BY n)]
        if (!cur_.accept_keyword("ALWAYS") && !cur_.accept_keywords({"BY", kDefault})) {
            throw SyntaxError("unsupported GENERATED clause");
        }
        cur_.expect_keyword("AS");
        cur_.expect_keyword("IDENTITY");
        IdentitySpec identity;
        if (cur_.accept_symbol("(")) {
            while (!cur_.accept_symbol(")")) {
                if (cur_.accept_keyword("START")) {
                    cur_.accept_keyword(kWith);
                    identity.seed = parse_signed_number(cur_);
                } else if (cur_.accept_keyword("INCREMENT")) {
                    cur_.accept_keyword("BY");
                    identity.increment = parse_signed_number(cur_);
                } else {
                    throw SyntaxError("unsupported identity option");
                }
            }
        }
        col.identity = std::move(identity);
    }

    DefaultExpr parse_default() {
        const size_t b = cur_.position();
        int depth = 0;
        while (!cur_.at_end()) {
            const Token& tok = cur_.peek();
            if (depth == 0) {
                if (tok.is_symbol(",") || tok.is_symbol(")")) break;
                if (cur_.position() > b && tok.kind == TokenKind::IDENTIFIER &&
                    DEFAULT_TERMINATORS.contains(utils::to_upper(tok.value))) {
                    break;
                }
            }
            if (tok.is_symbol("(")) ++depth;
            else if (tok.is_symbol(")")) --depth;
            cur_.next();
        }
        const size_t e = cur_.position();
        if (e == b) throw SyntaxError("empty DEFAULT expression");
        return classify_default(cur_, b, e);
    }

    Constraint parse_inline_constraint(const std::string& name, const std::string& column,
                                       size_t ordinal) {
        Constraint c;
        c.name = name;
        c.ordinal = ordinal;
        if (cur_.accept_keywords({kPrimary, kKey})) {
            c.kind = ConstraintKind::PRIMARY_KEY;
            c.clustering = parse_clustering();
            c.columns.push_back(IndexColumn{column, parse_direction()});
        } else if (cur_.accept_keyword(kUnique)) {
            c.kind = ConstraintKind::UNIQUE;
            c.clustering = parse_clustering();
            c.columns.push_back(IndexColumn{column, ""});
        } else if (cur_.peek().is_keyword(kReferences) || cur_.peek().is_keyword(kForeign)) {
            cur_.accept_keywords({kForeign, kKey});
            c.kind = ConstraintKind::FOREIGN_KEY;
            c.columns.push_back(IndexColumn{column, ""});
            parse_references(c);
        } else {
            cur_.expect_keyword(kCheck);
            c.kind = ConstraintKind::CHECK;
            cur_.accept_keywords({kNot, "FOR", "REPLICATION"});
            c.check_expression = cur_.take_parenthesized();
        }
        return c;
    }

    Constraint parse_constraint_body(const std::string& name, size_t ordinal, TableNode& table) {
        Constraint c;
        c.name = name;
        c.ordinal = ordinal;
        if (cur_.accept_keywords({kPrimary, kKey}) || cur_.accept_keyword(kUnique)) {
            const bool pk = cur_.at(cur_.position() - 1).is_keyword(kKey);
            c.kind = pk ? ConstraintKind::PRIMARY_KEY : ConstraintKind::UNIQUE;
            c.clustering = parse_clustering();
            c.columns = parse_index_columns(cur_);
            parse_constraint_index_options(table, name);
        } else if (cur_.accept_keywords({kForeign, kKey})) {
            c.kind = ConstraintKind::FOREIGN_KEY;
            for (auto& col : parse_name_list(cur_)) {
                c.columns.push_back(IndexColumn{std::move(col), ""});
            }
            parse_references(c);
        } else if (cur_.accept_keyword(kCheck)) {
            c.kind = ConstraintKind::CHECK;
            cur_.accept_keywords({kNot, "FOR", "REPLICATION"});
            c.check_expression = cur_.take_parenthesized();
        } else {
            throw SyntaxError(std::format("unsupported constraint '{}'", cur_.peek().raw));
        }
        return c;
    }

    // WITH (...) / ON [fg] after a PK or UNIQUE column list
    void parse_constraint_index_options(TableNode& table, const std::string& name) {
        const std::string label = name.empty() ? "CONSTRAINT" : "CONSTRAINT " + name;
        if (cur_.peek().is_keyword(kWith) && cur_.peek(1).is_symbol("(")) {
            const size_t b = cur_.position();
            cur_.next();
            (void)cur_.take_parenthesized();
            table.options.push_back(TableOption{label, std::string(cur_.slice(b, cur_.position()))});
        }
        if (cur_.peek().is_keyword(kOn)) {
            const size_t b = cur_.position();
            cur_.next();
            (void)cur_.parse_name_parts();
            if (cur_.peek().is_symbol("(")) (void)cur_.take_parenthesized();
            table.options.push_back(TableOption{label, std::string(cur_.slice(b, cur_.position()))});
        }
    }

    std::string parse_clustering() {
        if (cur_.accept_keyword("CLUSTERED")) return "CLUSTERED";
        if (cur_.accept_keyword("NONCLUSTERED")) return "NONCLUSTERED";
        return "";
    }

    std::string parse_direction() {
        if (cur_.accept_keyword("ASC")) return "ASC";
        if (cur_.accept_keyword("DESC")) return "DESC";
        return "";
    }

    void parse_references(Constraint& c) {
        cur_.expect_keyword(kReferences);
        c.ref_table = cur_.parse_qualified_name();
        if (cur_.peek().is_symbol("(")) {
            c.ref_columns = parse_name_list(cur_);
        }
        while (cur_.peek().is_keyword(kOn)) {
            cur_.next();
            std::string* target = nullptr;
            if (cur_.accept_keyword("DELETE")) target = &c.on_delete;
            else if (cur_.accept_keyword("UPDATE")) target = &c.on_update;
            else throw SyntaxError("expected DELETE or UPDATE after ON");

            if (cur_.accept_keyword("CASCADE")) *target = "CASCADE";
            else if (cur_.accept_keyword("RESTRICT")) *target = "RESTRICT";
            else if (cur_.accept_keywords({"NO", "ACTION"})) *target = "NO ACTION";
            else if (cur_.accept_keywords({"SET", kNull})) *target = "SET NULL";
            else if (cur_.accept_keywords({"SET", kDefault})) *target = "SET DEFAULT";
            else throw SyntaxError("unsupported referential action");
        }
        cur_.accept_keywords({kNot, "FOR", "REPLICATION"});
    }

    void parse_table_tail(TableNode& table) {
        while (!cur_.at_end()) {
            const size_t b = cur_.position();
            if (cur_.peek().is_keyword(kOn) || cur_.peek().is_keyword("TEXTIMAGE_ON") ||
                cur_.peek().is_keyword("FILESTREAM_ON")) {
                cur_.next();
                (void)cur_.parse_name_parts();
                if (cur_.peek().is_symbol("(")) (void)cur_.take_parenthesized();
                if (!table.storage_clause.empty()) table.storage_clause += ' ';
                table.storage_clause += cur_.slice(b, cur_.position());
            } else if (cur_.peek().is_keyword(kWith) && cur_.peek(1).is_symbol("(")) {
                cur_.next();
                parse_table_options(table);
            } else {
                table.options.push_back(TableOption{"", std::string(cur_.slice(b, cur_.end()))});
                cur_.set_position(cur_.end());
            }
        }
    }

    void parse_table_options(TableNode& table) {
        cur_.expect_symbol("(");
        const size_t close = cur_.matching_close(cur_.position() - 1) - 1;
        while (cur_.position() < close) {
            const size_t b = cur_.position();
            int depth = 0;
            while (cur_.position() < close) {
                const Token& tok = cur_.peek();
                if (depth == 0 && tok.is_symbol(",")) break;
                if (tok.is_symbol("(")) ++depth;
                else if (tok.is_symbol(")")) --depth;
                cur_.next();
            }
            const size_t e = cur_.position();
            if (e > b) {
                if (cur_.at(b).is_keyword("SYSTEM_VERSIONING")) {
                    parse_system_versioning(table, b, e);
                } else {
                    table.options.push_back(TableOption{
                        utils::to_upper(cur_.at(b).value), std::string(cur_.slice(b, e))});
                }
            }
            cur_.accept_symbol(",");
        }
        cur_.expect_symbol(")");
    }

    void parse_system_versioning(TableNode& table, size_t b, size_t e) {
        const size_t saved = cur_.position();
        cur_.set_position(b + 1);
        cur_.expect_symbol("=");
        table.system_versioning = cur_.accept_keyword(kOn);
        if (table.system_versioning && cur_.position() < e && cur_.accept_symbol("(")) {
            while (cur_.position() < e && !cur_.peek().is_symbol(")")) {
                if (cur_.accept_keyword("HISTORY_TABLE")) {
                    cur_.expect_symbol("=");
                    table.history_table = cur_.parse_qualified_name();
                } else {
                    cur_.next();
                }
            }
        }
        cur_.set_position(saved);
    }

    // ---- CREATE SEQUENCE -----------------------------------------------------

    SequenceNode parse_sequence() {
        SequenceNode seq;
        cur_.accept_keywords({"IF", kNot, "EXISTS"});
        seq.name = cur_.parse_qualified_name();
        while (!cur_.at_end()) {
            if (cur_.accept_keyword("AS")) {
                seq.type = parse_type(cur_);
            } else if (cur_.accept_keyword("START")) {
                cur_.accept_keyword(kWith);
                seq.start = parse_signed_number(cur_);
            } else if (cur_.accept_keyword("INCREMENT")) {
                cur_.accept_keyword("BY");
                seq.increment = parse_signed_number(cur_);
            } else if (cur_.accept_keyword("MINVALUE")) {
                seq.min_value = parse_signed_number(cur_);
            } else if (cur_.accept_keyword("MAXVALUE")) {
                seq.max_value = parse_signed_number(cur_);
            } else if (cur_.accept_keyword("CYCLE")) {
                seq.cycle = true;
            } else if (cur_.accept_keyword("CACHE")) {
                if (cur_.peek().kind == TokenKind::NUMBER) seq.cache = cur_.next().value;
            } else if (cur_.accept_keyword("NO")) {
                // NO MINVALUE | NO MAXVALUE | NO CYCLE | NO CACHE
                if (!cur_.accept_keyword("MINVALUE") && !cur_.accept_keyword("MAXVALUE") &&
                    !cur_.accept_keyword("CYCLE") && !cur_.accept_keyword("CACHE")) {
                    throw SyntaxError("unsupported NO option");
                }
            } else {
                throw SyntaxError(std::format("unsupported sequence option '{}'", cur_.peek().raw));
            }
        }
        return seq;
    }

    // ---- CREATE SCHEMA -------------------------------------------------------

    SchemaNode parse_schema() {
        SchemaNode schema;
        cur_.accept_keywords({"IF", kNot, "EXISTS"});
        schema.name = cur_.expect_name();
        if (cur_.accept_keyword("AUTHORIZATION")) {
            (void)cur_.expect_name();
        }
        expect_end();
        return schema;
    }

    // ---- CREATE INDEX --------------------------------------------------------

    IndexNode parse_index() {
        IndexNode index;
        index.unique = cur_.accept_keyword(kUnique);
        index.clustering = parse_clustering();
        index.columnstore = cur_.accept_keyword("COLUMNSTORE");
        cur_.expect_keyword("INDEX");
        cur_.accept_keyword("CONCURRENTLY");
        cur_.accept_keywords({"IF", kNot, "EXISTS"});
        index.name = cur_.expect_name();
        cur_.expect_keyword(kOn);
        index.table = cur_.parse_qualified_name();
        if (cur_.accept_keyword("USING")) {
            index.using_method = cur_.expect_name();
        }
        if (cur_.peek().is_symbol("(")) {
            index.columns = parse_index_columns(cur_);
        }
        if (cur_.accept_keyword("INCLUDE")) {
            index.include_columns = parse_name_list(cur_);
        }
        if (cur_.accept_keyword("WHERE")) {
            const size_t b = cur_.position();
            int depth = 0;
            while (!cur_.at_end()) {
                const Token& tok = cur_.peek();
                if (depth == 0 && ((tok.is_keyword(kWith) && cur_.peek(1).is_symbol("(")) ||
                                   tok.is_keyword(kOn))) {
                    break;
                }
                if (tok.is_symbol("(")) ++depth;
                else if (tok.is_symbol(")")) --depth;
                cur_.next();
            }
            index.where_clause = std::string(cur_.slice(b, cur_.position()));
        }
        if (cur_.peek().is_keyword(kWith) && cur_.peek(1).is_symbol("(")) {
            const size_t b = cur_.position();
            cur_.next();
            (void)cur_.take_parenthesized();
            index.with_options = std::string(cur_.slice(b, cur_.position()));
        }
        if (cur_.peek().is_keyword(kOn)) {
            const size_t b = cur_.position();
            cur_.next();
            (void)cur_.parse_name_parts();
            if (cur_.peek().is_symbol("(")) (void)cur_.take_parenthesized();
            index.storage_clause = std::string(cur_.slice(b, cur_.position()));
        }
        expect_end();
        return index;
    }

    // ---- sp_addextendedproperty ---------------------------------------------

    ExtendedPropertyNode parse_extended_property() {
        static constexpr std::string_view kPositional[] = {
            "@name", "@value", "@level0type", "@level0name",
            "@level1type", "@level1name", "@level2type", "@level2name"
        };

        std::unordered_map<std::string, std::optional<std::string>> args;
        size_t position = 0;
        while (!cur_.at_end()) {
            std::string key;
            if (cur_.peek().kind == TokenKind::VARIABLE && cur_.peek(1).is_symbol("=")) {
                key = utils::to_lower(cur_.next().value);
                cur_.next();
            } else if (position < std::size(kPositional)) {
                key = std::string(kPositional[position]);
            } else {
                throw SyntaxError("too many sp_addextendedproperty arguments");
            }
            ++position;

            const Token& tok = cur_.next();
            if (tok.kind == TokenKind::STRING || tok.is_name() ||
                tok.kind == TokenKind::NUMBER) {
                args[key] = tok.value;
            } else if (tok.is_keyword(kNull)) {
                args[key] = std::nullopt;
            } else {
                throw SyntaxError(std::format("unsupported argument value '{}'", tok.raw));
            }
            if (!cur_.accept_symbol(",")) break;
        }
        expect_end();

        auto get = [&args](std::string_view key) -> std::string {
            const auto it = args.find(std::string(key));
            return (it != args.end() && it->second) ? *it->second : std::string();
        };

        ExtendedPropertyNode prop;
        prop.property_name = get("@name");
        if (const auto it = args.find("@value"); it != args.end()) {
            prop.value = it->second;
        }
        const std::string level0 = utils::to_upper(get("@level0type"));
        prop.schema = get("@level0name");
        prop.object_type = utils::to_upper(get("@level1type"));
        prop.object_name = get("@level1name");
        prop.sub_type = utils::to_upper(get("@level2type"));
        prop.sub_name = get("@level2name");

        if (level0 != "SCHEMA") {
            prop.level = MetadataLevel::OTHER;
        } else if (prop.object_type.empty()) {
            prop.level = MetadataLevel::SCHEMA;
        } else if (prop.object_type != "TABLE") {
            prop.level = MetadataLevel::OTHER;
        } else if (prop.sub_type.empty()) {
            prop.level = MetadataLevel::TABLE;
        } else if (prop.sub_type == "COLUMN") {
            prop.level = MetadataLevel::COLUMN;
        } else if (prop.sub_type == "INDEX") {
            prop.level = MetadataLevel::INDEX;
        } else {
            prop.level = MetadataLevel::OTHER;
        }
        return prop;
    }

    // ---- COMMENT ON (PostgreSQL) ---------------------------------------------

    ExtendedPropertyNode parse_comment_on() {
        ExtendedPropertyNode prop;
        prop.property_name = "Description";
        prop.object_type = "TABLE";

        if (cur_.accept_keyword("SCHEMA")) {
            prop.level = MetadataLevel::SCHEMA;
            prop.object_type.clear();
            prop.schema = cur_.expect_name();
        } else if (cur_.accept_keyword("TABLE")) {
            prop.level = MetadataLevel::TABLE;
            const QualifiedName name = cur_.parse_qualified_name();
            prop.schema = name.schema;
            prop.object_name = name.name;
        } else if (cur_.accept_keyword("COLUMN")) {
            prop.level = MetadataLevel::COLUMN;
            prop.sub_type = "COLUMN";
            const auto parts = cur_.parse_name_parts();
            if (parts.size() < 2) throw SyntaxError("COMMENT ON COLUMN needs table.column");
            const size_t n = parts.size();
            prop.sub_name = parts[n - 1];
            prop.object_name = parts[n - 2];
            if (n >= 3) prop.schema = parts[n - 3];
        } else if (cur_.accept_keyword("INDEX")) {
            prop.level = MetadataLevel::INDEX;
            prop.sub_type = "INDEX";
            const QualifiedName name = cur_.parse_qualified_name();
            prop.schema = name.schema;
            prop.sub_name = name.name;
            prop.object_type.clear();
        } else {
            throw SyntaxError(std::format("unsupported COMMENT ON target '{}'", cur_.peek().raw));
        }

        cur_.expect_keyword("IS");
        const Token& tok = cur_.next();
        if (tok.kind == TokenKind::STRING) prop.value = tok.value;
        else if (!tok.is_keyword(kNull)) throw SyntaxError("expected string after IS");
        expect_end();
        return prop;
    }

    TokenCursor cur_;
};

// ============================================================================
// Balance Check & Statement Boundaries
// ============================================================================

std::optional<LexError> check_balance(const std::vector<Token>& tokens) {
    std::vector<const Token*> open;
    for (const auto& tok : tokens) {
        if (tok.is_symbol("(")) {
            open.push_back(&tok);
        } else if (tok.is_symbol(")")) {
            if (open.empty()) {
                return LexError{tok.offset, tok.line, "unbalanced parentheses: unexpected ')'"};
            }
            open.pop_back();
        } else if (tok.is_symbol("]")) {
            return LexError{tok.offset, tok.line, "unbalanced brackets: unexpected ']'"};
        }
    }
    if (!open.empty()) {
        return LexError{open.back()->offset, open.back()->line,
                        "unbalanced parentheses: '(' is never closed"};
    }
    return std::nullopt;
}

bool starts_structured_statement(const std::vector<Token>& tokens, size_t i) {
    const Token& tok = tokens[i];
    const Token* next = (i + 1 < tokens.size()) ? &tokens[i + 1] : nullptr;
    if (tok.is_keyword(kCreate)) return true;
    if (tok.is_keyword("EXEC") || tok.is_keyword("EXECUTE")) return true;
    if (tok.is_keyword("COMMENT") && next && next->is_keyword(kOn)) return true;
    return false;
}

// Statements separated by neither ';' nor GO: split at depth-0 statement
// keywords, only when the segment itself starts with one.
std::vector<std::pair<size_t, size_t>> statement_ranges(const std::vector<Token>& tokens) {
    std::vector<std::pair<size_t, size_t>> ranges;
    if (tokens.empty()) return ranges;
    if (!starts_structured_statement(tokens, 0) ||
        (tokens.size() > 1 && tokens[0].is_keyword(kCreate) &&
         !tokens[1].is_keyword("TABLE") && !tokens[1].is_keyword("SEQUENCE") &&
         !tokens[1].is_keyword("SCHEMA") && !tokens[1].is_keyword("INDEX") &&
         !tokens[1].is_keyword(kUnique) && !tokens[1].is_keyword("CLUSTERED") &&
         !tokens[1].is_keyword("NONCLUSTERED") && !tokens[1].is_keyword("COLUMNSTORE"))) {
        ranges.emplace_back(0, tokens.size());
        return ranges;
    }

    size_t start = 0;
    int depth = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].is_symbol("(")) ++depth;
        else if (tokens[i].is_symbol(")")) --depth;
        else if (depth == 0 && i > start && starts_structured_statement(tokens, i)) {
            ranges.emplace_back(start, i);
            start = i;
        }
    }
    ranges.emplace_back(start, tokens.size());
    return ranges;
}

} // anonymous namespace

// ============================================================================
// DdlParser Implementation
// ============================================================================

std::string ParseError::to_string() const {
    return std::format("line {}, column {}: {}", line, column, reason);
}

ParseOutput DdlParser::parse(std::string_view text) const {
    ParseOutput out;

    for (const auto& seg : Lexer::split_statements(text)) {
        const std::string_view seg_text = text.substr(seg.offset, seg.length);
        const SourceSpan seg_span{seg.offset, seg.length, seg.line};

        auto lexed = Lexer::tokenize(seg_text, seg.offset, seg.line);
        if (!lexed.error) {
            lexed.error = check_balance(lexed.tokens);
        }
        if (lexed.error) {
            ParseError err;
            err.offset = lexed.error->offset;
            err.line = lexed.error->line;
            err.column = column_of(text, lexed.error->offset);
            err.reason = std::move(lexed.error->reason);
            err.statement_text = std::string(seg_text);
            utils::log::debug(std::format("Parse error at {}", err.to_string()));
            out.errors.push_back(std::move(err));
            continue;
        }

        if (lexed.tokens.empty()) {
            out.nodes.emplace_back(RawNode{RawKind::COMMENT, std::string(seg_text), ""}, seg_span);
            continue;
        }

        const auto ranges = statement_ranges(lexed.tokens);
        const auto& comments = lexed.comments;
        size_t next_comment = 0;

        // Comments before `limit` between statements, verbatim as one node
        auto take_gap_comments = [&](size_t limit) {
            const size_t first = next_comment;
            while (next_comment < comments.size() && comments[next_comment].offset < limit) {
                ++next_comment;
            }
            if (first == next_comment) return;
            const CommentSpan& a = comments[first];
            const CommentSpan& z = comments[next_comment - 1];
            const size_t length = z.offset + z.length - a.offset;
            out.nodes.emplace_back(RawNode{RawKind::COMMENT, std::string(text.substr(a.offset, length)), ""},
                                   SourceSpan{a.offset, length, a.line});
        };

        for (const auto& [b, e] : ranges) {
            const size_t begin = lexed.tokens[b].offset;
            const size_t finish = lexed.tokens[e - 1].offset + lexed.tokens[e - 1].raw.size();
            const std::string_view stmt_text = text.substr(begin, finish - begin);

            take_gap_comments(begin);

            StatementParser parser(text, lexed.tokens, b, e);
            StatementNode node = parser.parse(SourceSpan{begin, finish - begin, lexed.tokens[b].line},
                                              stmt_text);
            const bool verbatim = node.as<RawNode>() != nullptr;
            out.nodes.push_back(std::move(node));

            // Comments between a structured statement's tokens follow it
            std::string inner;
            std::optional<CommentSpan> first_inner;
            for (; next_comment < comments.size() && comments[next_comment].offset < finish; ++next_comment) {
                if (verbatim) continue;     // Already part of the statement text
                const CommentSpan& c = comments[next_comment];
                if (!first_inner) first_inner = c;
                if (!inner.empty()) inner += '\n';
                inner += text.substr(c.offset, c.length);
            }
            if (first_inner) {
                out.nodes.emplace_back(RawNode{RawKind::COMMENT, std::move(inner), ""},
                                       SourceSpan{first_inner->offset,
                                                  finish - first_inner->offset, first_inner->line});
            }
        }
        take_gap_comments(std::string_view::npos);
    }

    return out;
}

} // namespace ddlbridge
