#include "emit/pg_emitter.hpp"
#include "transform/identifier_rules.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <unordered_map>

namespace ddlbridge {

namespace {

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string pad(std::string text, size_t width) {
    if (text.size() < width) text.append(width - text.size(), ' ');
    return text;
}

std::string rtrim(std::string text) {
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.pop_back();
    return text;
}

std::string render_index_columns(const std::vector<IndexColumn>& columns) {
    std::vector<std::string> parts;
    parts.reserve(columns.size());
    for (const auto& col : columns) {
        std::string part = IdentifierRules::quote(col.name);
        if (!col.direction.empty()) part += " " + col.direction;
        parts.push_back(std::move(part));
    }
    return join(parts, ", ");
}

std::vector<std::string> quote_all(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    out.reserve(names.size());
    for (const auto& n : names) out.push_back(IdentifierRules::quote(n));
    return out;
}

std::string render_default(const DefaultExpr& def) {
    if (def.kind == DefaultKind::STRING) return IdentifierRules::quote_literal(def.value);
    return def.value;
}

std::string render_column(const Column& col, size_t name_width) {
    std::string line = pad(IdentifierRules::quote(col.name), name_width);
    line += ' ';
    line += pad(col.type.to_string(), PgEmitter::kTypeWidth);

    if (col.identity) {
        line += std::format(" GENERATED BY DEFAULT AS IDENTITY (START WITH {} INCREMENT BY {})",
                            col.identity->seed, col.identity->increment);
    }
    if (col.default_value) {
        line += " DEFAULT ";
        line += render_default(*col.default_value);
    }
    if (col.nullable) {
        line += *col.nullable ? " NULL" : " NOT NULL";
    }
    return rtrim(std::move(line));
}

int constraint_rank(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::PRIMARY_KEY: return 0;
        case ConstraintKind::UNIQUE:      return 1;
        case ConstraintKind::FOREIGN_KEY: return 2;
        case ConstraintKind::CHECK:       return 3;
    }
    return 4;
}

std::string render_raw(const RawNode& raw) {
    switch (raw.kind) {
        case RawKind::COMMENT:
            return raw.text + "\n";
        case RawKind::OMISSION:
            return PgEmitter::comment_lines(raw.text);
        case RawKind::REVIEW:
        case RawKind::UNRECOGNIZED:
            return std::format("-- REVIEW: {}\n{}", raw.reason, PgEmitter::comment_lines(raw.text));
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Statement Rendering
// ============================================================================

std::string PgEmitter::comment_lines(std::string_view text, std::string_view indent) {
    std::string out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        out += indent;
        out += line.empty() ? "--" : "-- ";
        out += line;
        out += '\n';
        if (end == text.size()) break;
        start = end + 1;
    }
    return out;
}

std::string PgEmitter::render_constraint(const Constraint& c) {
    std::string out;
    if (!c.name.empty()) {
        out += "CONSTRAINT " + IdentifierRules::quote(c.name) + " ";
    }
    switch (c.kind) {
        case ConstraintKind::PRIMARY_KEY:
            out += std::format("PRIMARY KEY ({})", render_index_columns(c.columns));
            break;
        case ConstraintKind::UNIQUE:
            out += std::format("UNIQUE ({})", render_index_columns(c.columns));
            break;
        case ConstraintKind::FOREIGN_KEY: {
            std::vector<std::string> cols;
            for (const auto& col : c.columns) cols.push_back(IdentifierRules::quote(col.name));
            out += std::format("FOREIGN KEY ({}) REFERENCES {}", join(cols, ", "),
                               IdentifierRules::render_object(c.ref_table));
            if (!c.ref_columns.empty()) {
                out += std::format(" ({})", join(quote_all(c.ref_columns), ", "));
            }
            if (!c.on_delete.empty()) out += " ON DELETE " + c.on_delete;
            if (!c.on_update.empty()) out += " ON UPDATE " + c.on_update;
            break;
        }
        case ConstraintKind::CHECK:
            out += std::format("CHECK ({})", c.check_expression);
            break;
    }
    return out;
}

std::string PgEmitter::render_table(const TableNode& table) {
    std::vector<const Column*> columns;
    columns.reserve(table.columns.size());
    size_t name_width = 0;
    for (const auto& col : table.columns) {
        columns.push_back(&col);
        name_width = std::max(name_width, IdentifierRules::quote(col.name).size());
    }
    std::ranges::stable_sort(columns, [](const Column* a, const Column* b) {
        return a->ordinal < b->ordinal;
    });

    std::vector<const Constraint*> constraints;
    for (const auto& c : table.constraints) constraints.push_back(&c);
    std::ranges::stable_sort(constraints, [](const Constraint* a, const Constraint* b) {
        return constraint_rank(a->kind) < constraint_rank(b->kind);
    });

    // (text, is_comment): commas go on every definition but the last
    std::vector<std::pair<std::string, bool>> body;
    for (const Column* col : columns) {
        body.emplace_back(render_column(*col, name_width), false);
    }
    for (const auto& element : table.raw_elements) {
        body.emplace_back(std::format("-- REVIEW ({}):", element.reason), true);
        std::string lines = comment_lines(element.text);
        while (!lines.empty() && lines.back() == '\n') lines.pop_back();
        for (const auto& line : utils::split(lines, '\n')) {
            body.emplace_back(line, true);
        }
    }
    for (const Constraint* c : constraints) {
        body.emplace_back(render_constraint(*c), false);
    }

    size_t last_definition = body.size();
    for (size_t i = body.size(); i > 0; --i) {
        if (!body[i - 1].second) {
            last_definition = i - 1;
            break;
        }
    }

    std::string out = std::format("CREATE TABLE {} (\n", IdentifierRules::render_object(table.name));
    for (size_t i = 0; i < body.size(); ++i) {
        out += kIndent;
        out += body[i].first;
        if (!body[i].second && i != last_definition) out += ',';
        out += '\n';
    }
    out += ");\n";
    return out;
}

std::string PgEmitter::render_sequence(const SequenceNode& seq) {
    std::string out = std::format("CREATE SEQUENCE IF NOT EXISTS {}",
                                  IdentifierRules::render_object(seq.name));
    if (seq.type) out += " AS " + seq.type->to_string();
    if (seq.start) out += " START " + *seq.start;
    if (seq.increment) out += " INCREMENT " + *seq.increment;
    if (seq.min_value) out += " MINVALUE " + *seq.min_value;
    if (seq.max_value) out += " MAXVALUE " + *seq.max_value;
    if (seq.cache) out += " CACHE " + *seq.cache;
    if (seq.cycle) out += " CYCLE";
    out += ";\n";
    return out;
}

std::string PgEmitter::render_index(const IndexNode& index) {
    std::string out = std::format("CREATE {}INDEX {}\n{}ON {}",
                                  index.unique ? "UNIQUE " : "",
                                  IdentifierRules::quote(index.name), kIndent,
                                  IdentifierRules::render_object(index.table));
    if (!index.using_method.empty()) out += " USING " + index.using_method;
    if (!index.columns.empty()) out += std::format(" ({})", render_index_columns(index.columns));
    if (!index.include_columns.empty()) {
        out += std::format(" INCLUDE ({})", join(quote_all(index.include_columns), ", "));
    }
    if (!index.where_clause.empty()) out += " WHERE " + index.where_clause;
    out += ";\n";
    return out;
}

std::string PgEmitter::render_comment(const ExtendedPropertyNode& prop) {
    const std::string value = prop.value ? IdentifierRules::quote_literal(*prop.value)
                                         : std::string("NULL");
    const QualifiedName table(prop.schema, prop.object_name);
    switch (prop.level) {
        case MetadataLevel::SCHEMA:
            return std::format("COMMENT ON SCHEMA {} IS {};\n", IdentifierRules::quote(prop.schema), value);
        case MetadataLevel::COLUMN:
            return std::format("COMMENT ON COLUMN {}.{} IS {};\n",
                               IdentifierRules::render_object(table),
                               IdentifierRules::quote(prop.sub_name), value);
        case MetadataLevel::TABLE:
        case MetadataLevel::INDEX:
        case MetadataLevel::OTHER:
            break;
    }
    return std::format("COMMENT ON TABLE {} IS {};\n", IdentifierRules::render_object(table), value);
}

// ============================================================================
// Canonical Ordering
// ============================================================================

std::string PgEmitter::emit(const std::vector<StatementNode>& nodes,
                            size_t omitted_index_properties) const {
    std::vector<const TableNode*> tables;
    std::vector<const SequenceNode*> sequences;
    std::vector<const StatementNode*> trailing;     // indexes, omissions, raw text
    std::vector<const ExtendedPropertyNode*> comments;
    std::set<std::string> schemas;

    for (const auto& node : nodes) {
        if (const auto* t = node.as<TableNode>()) {
            tables.push_back(t);
            schemas.insert(t->name.schema);
        } else if (const auto* s = node.as<SequenceNode>()) {
            schemas.insert(s->name.schema);
            auto it = std::ranges::find_if(sequences, [s](const SequenceNode* e) {
                return e->name == s->name;
            });
            if (it == sequences.end()) {
                sequences.push_back(s);
            } else if ((*it)->implicit && !s->implicit) {
                *it = s;
            }
        } else if (const auto* i = node.as<IndexNode>()) {
            schemas.insert(i->table.schema);
            trailing.push_back(&node);
        } else if (const auto* p = node.as<ExtendedPropertyNode>()) {
            comments.push_back(p);
        } else if (const auto* sc = node.as<SchemaNode>()) {
            schemas.insert(sc->name);
        } else {
            trailing.push_back(&node);
        }
    }

    std::vector<std::string> blocks;

    // 1. Schemas: owning table's schema first
    std::vector<std::string> schema_order;
    if (!tables.empty()) schema_order.push_back(tables.front()->name.schema);
    for (const auto& s : schemas) {
        if (std::ranges::find(schema_order, s) == schema_order.end()) schema_order.push_back(s);
    }
    for (const auto& s : schema_order) {
        blocks.push_back(std::format("CREATE SCHEMA IF NOT EXISTS {};\n", IdentifierRules::quote(s)));
    }

    // 2. Sequences
    for (const SequenceNode* s : sequences) {
        blocks.push_back(render_sequence(*s));
    }

    // 3. Tables
    for (const TableNode* t : tables) {
        blocks.push_back(render_table(*t));
    }

    // 4. Indexes, omissions, review blocks
    for (const StatementNode* node : trailing) {
        if (const auto* i = node->as<IndexNode>()) {
            blocks.push_back(render_index(*i));
        } else if (const auto* r = node->as<RawNode>()) {
            blocks.push_back(render_raw(*r));
        }
    }
    if (omitted_index_properties > 0) {
        blocks.push_back(std::format(
            "-- INDEX extended properties omitted (PostgreSQL does not support index comments "
            "via standard DDL): {}\n", omitted_index_properties));
    }

    // 5. Metadata comments
    std::vector<bool> used(comments.size(), false);
    std::string schema_block;
    for (size_t i = 0; i < comments.size(); ++i) {
        if (comments[i]->level == MetadataLevel::SCHEMA) {
            schema_block += render_comment(*comments[i]);
            used[i] = true;
        }
    }
    if (!schema_block.empty()) blocks.push_back(std::move(schema_block));

    for (const TableNode* t : tables) {
        std::string table_block;
        std::vector<std::pair<size_t, size_t>> column_comments;   // (ordinal, comment index)
        for (size_t i = 0; i < comments.size(); ++i) {
            const auto* p = comments[i];
            if (used[i] || p->schema != t->name.schema || p->object_name != t->name.name) continue;
            if (p->level == MetadataLevel::TABLE) {
                table_block += render_comment(*p);
                used[i] = true;
            } else if (p->level == MetadataLevel::COLUMN) {
                const Column* col = t->find_column(p->sub_name);
                column_comments.emplace_back(col ? col->ordinal : t->columns.size(), i);
                used[i] = true;
            }
        }
        std::ranges::stable_sort(column_comments, {}, &std::pair<size_t, size_t>::first);

        std::string column_block;
        for (const auto& [ordinal, index] : column_comments) {
            column_block += render_comment(*comments[index]);
        }
        if (!table_block.empty()) blocks.push_back(std::move(table_block));
        if (!column_block.empty()) blocks.push_back(std::move(column_block));
    }

    // Comments on objects defined elsewhere
    std::string orphan_block;
    for (size_t i = 0; i < comments.size(); ++i) {
        if (!used[i]) orphan_block += render_comment(*comments[i]);
    }
    if (!orphan_block.empty()) blocks.push_back(std::move(orphan_block));

    return join(blocks, "\n");
}

} // namespace ddlbridge
