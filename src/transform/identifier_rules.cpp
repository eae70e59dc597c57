#include "transform/identifier_rules.hpp"
#include "parser/lexer.hpp"
#include "core/utils.hpp"

// libpg_query C API
extern "C" {
#include "pg_query.h"
}

#include <cctype>
#include <format>
#include <mutex>
#include <unordered_map>

namespace ddlbridge {

bool IdentifierRules::is_plain(std::string_view name) {
    if (name.empty()) return false;
    const auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (const char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && c != '_' && c != '$') return false;
    }
    return true;
}

bool IdentifierRules::is_keyword(std::string_view name) {
    if (!is_plain(name)) return false;

    // Answered by PostgreSQL's grammar: a bare name that cannot be a column
    // name is a reserved (or type/function-name) keyword
    static std::mutex mutex;
    static std::unordered_map<std::string, bool> known;

    std::string key = utils::to_lower(name);
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (const auto it = known.find(key); it != known.end()) return it->second;
    }

    const std::string statement = std::format("CREATE TABLE t ({} integer)", key);
    PgQueryParseResult result = pg_query_parse(statement.c_str());
    const bool keyword = result.error != nullptr;
    pg_query_free_parse_result(result);

    std::lock_guard<std::mutex> lock(mutex);
    known.emplace(std::move(key), keyword);
    return keyword;
}

std::string IdentifierRules::quote(std::string_view name) {
    if (is_plain(name) && !is_keyword(name)) return std::string(name);

    std::string out;
    out.reserve(name.size() + 2);
    out += '"';
    for (const char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

QualifiedName IdentifierRules::object_name(const QualifiedName& name) {
    const ObjectKey key = ObjectKey::from(name);
    return QualifiedName(key.schema, key.table);
}

std::string IdentifierRules::render_object(const QualifiedName& name) {
    const QualifiedName lowered = object_name(name);
    return quote(lowered.schema) + "." + quote(lowered.name);
}

QualifiedName IdentifierRules::sequence_name(const QualifiedName& name,
                                             std::string_view suffix) {
    const std::string schema = name.schema.empty()
        ? std::string(kDefaultSchema)
        : utils::to_lower(name.schema);

    std::string local = utils::snake_case(name.name);
    if (!suffix.empty() && !local.ends_with(suffix)) {
        local += suffix;
    }
    return QualifiedName(schema, std::move(local));
}

std::string IdentifierRules::strip_brackets(std::string_view expression) {
    if (expression.find('[') == std::string_view::npos) {
        return std::string(expression);
    }

    const auto lexed = Lexer::tokenize(expression);
    if (lexed.error) {
        return std::string(expression);
    }

    std::string out;
    out.reserve(expression.size());
    size_t copied = 0;
    for (const auto& tok : lexed.tokens) {
        if (tok.kind != TokenKind::QUOTED_IDENTIFIER || tok.raw.front() != '[') continue;
        out.append(expression.substr(copied, tok.offset - copied));
        out += quote(tok.value);
        copied = tok.offset + tok.raw.size();
    }
    out.append(expression.substr(copied));
    return out;
}

std::string IdentifierRules::quote_literal(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    for (const char c : value) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

} // namespace ddlbridge
