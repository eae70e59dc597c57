#include "transform/transformer.hpp"
#include "transform/identifier_rules.hpp"
#include "graph/dependency_extractor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace ddlbridge {

static constexpr std::string_view kCurrentTimestamp = "CURRENT_TIMESTAMP";
static constexpr std::string_view kUtcTimestamp     = "(CURRENT_TIMESTAMP AT TIME ZONE 'UTC')";
static constexpr std::string_view kUuidGenerate     = "gen_random_uuid()";
static constexpr std::string_view kDescription      = "Description";

size_t TransformResult::count_rules(RuleCategory category) const {
    return static_cast<size_t>(std::ranges::count_if(rules, [category](const AppliedRule& r) {
        return r.category == category;
    }));
}

Transformer::Transformer(TransformOptions options, const SequenceCatalog* catalog)
    : options_(std::move(options)),
      type_mapper_(options_.max_timestamp_precision),
      catalog_(catalog) {}

// ============================================================================
// Entry Point
// ============================================================================

TransformResult Transformer::transform(const std::vector<StatementNode>& source) const {
    TransformResult result;
    Context ctx{result, {}, {}};

    // Sequences defined in this file never need a synthesized declaration
    for (const auto& node : source) {
        if (const auto* seq = node.as<SequenceNode>()) {
            ctx.declared_sequences.insert(
                IdentifierRules::sequence_name(seq->name, options_.sequence_suffix).full_name());
        }
    }

    for (const auto& node : source) {
        transform_node(node, ctx);
    }

    result.edges = DependencyExtractor::extract(result.nodes);
    return result;
}

void Transformer::transform_node(const StatementNode& node, Context& ctx) const {
    std::visit([&](const auto& body) {
        using T = std::decay_t<decltype(body)>;
        if constexpr (std::is_same_v<T, TableNode>) {
            transform_table(body, node.span, ctx);
        } else if constexpr (std::is_same_v<T, SequenceNode>) {
            transform_sequence(body, node.span, ctx);
        } else if constexpr (std::is_same_v<T, IndexNode>) {
            transform_index(body, node.span, ctx);
        } else if constexpr (std::is_same_v<T, ExtendedPropertyNode>) {
            transform_property(body, node.span, ctx);
        } else if constexpr (std::is_same_v<T, SchemaNode>) {
            ctx.result.nodes.emplace_back(SchemaNode{utils::to_lower(body.name)}, node.span);
        } else {
            transform_raw(body, node.span, ctx);
        }
    }, node.body);
}

void Transformer::apply(Context& ctx, RuleCategory category, std::string code, std::string detail) {
    ctx.result.rules.push_back(AppliedRule{category, std::move(code), std::move(detail)});
}

void Transformer::omit(Context& ctx, const SourceSpan& span, std::string text) {
    ctx.result.nodes.emplace_back(RawNode{RawKind::OMISSION, std::move(text), ""}, span);
}

// ============================================================================
// Tables
// ============================================================================

void Transformer::transform_table(const TableNode& source, const SourceSpan& span,
                                  Context& ctx) const {
    TableNode table;
    table.name = IdentifierRules::object_name(source.name);
    const std::string target_name = table.name.full_name();
    if (source.name.full_name() != target_name) {
        apply(ctx, RuleCategory::IDENTIFIERS, "identifier.normalized",
              std::format("{} -> {}", source.name.full_name(), target_name));
    }

    // Temporal clauses
    const bool temporal = source.period || source.system_versioning || source.history_table;
    if (temporal) {
        ctx.result.flags.uses_temporal = true;
        if (source.period) {
            apply(ctx, RuleCategory::TEMPORAL, "temporal.period_dropped",
                  std::format("PERIOD FOR SYSTEM_TIME ({}, {})",
                              source.period->start_column, source.period->end_column));
        }
        if (source.system_versioning || source.history_table) {
            const std::string history = source.history_table
                ? IdentifierRules::object_name(*source.history_table).full_name()
                : std::string("none");
            apply(ctx, RuleCategory::TEMPORAL, "temporal.versioning_dropped",
                  std::format("SYSTEM_VERSIONING (history table {})", history));
        }
    }

    table.columns.reserve(source.columns.size());
    for (const auto& src_col : source.columns) {
        Column col = src_col;
        transform_column(source, col, span, ctx);
        table.columns.push_back(std::move(col));
    }

    for (const auto& src_constraint : source.constraints) {
        Constraint c = src_constraint;
        transform_constraint(c, ctx);
        table.constraints.push_back(std::move(c));
    }

    for (const auto& element : source.raw_elements) {
        table.raw_elements.push_back(element);
        apply(ctx, RuleCategory::REVIEW, "element.review",
              std::format("{}: {}", target_name, element.reason));
        ctx.result.diagnostics.push_back(Diagnostic{
            DiagnosticKind::UNMAPPED_CONSTRUCT,
            std::format("{} kept as review comment in {}", element.reason, target_name),
            span.line});
        utils::log::debug(std::format("Review: {} in {}", element.reason, target_name));
    }

    ctx.result.nodes.emplace_back(std::move(table), span);

    if (temporal) {
        const std::string history = source.history_table
            ? IdentifierRules::object_name(*source.history_table).full_name()
            : std::string();
        omit(ctx, span, history.empty()
            ? std::string("SYSTEM_VERSIONING omitted (PostgreSQL has no system-versioned tables)")
            : std::format("SYSTEM_VERSIONING omitted (history table {} is converted as an ordinary table)",
                          history));
    }

    if (!source.storage_clause.empty()) {
        apply(ctx, RuleCategory::STORAGE, "storage.filegroup_omitted", source.storage_clause);
        omit(ctx, span, std::format("Storage clause omitted (PostgreSQL has no filegroups): {}",
                                    source.storage_clause));
    }

    for (const auto& option : source.options) {
        apply(ctx, RuleCategory::STORAGE, "storage.option_omitted", option.text);
        if (option.name.starts_with("CONSTRAINT")) {
            omit(ctx, span, std::format("Index options of {} omitted: {}", option.name, option.text));
        } else {
            omit(ctx, span, std::format("Table option omitted: {}", option.text));
        }
    }
}

void Transformer::transform_column(const TableNode& source, Column& col, const SourceSpan& span,
                                   Context& ctx) const {
    const std::string where = std::format("{}.{}", source.name.name, col.name);

    // Temporal ROW START / ROW END columns
    if (col.generated != GeneratedKind::NONE) {
        const char* kind = (col.generated == GeneratedKind::ROW_START) ? "ROW START" : "ROW END";
        col.type = TypeRef{"TIMESTAMP", {std::to_string(std::clamp(options_.max_timestamp_precision, 0, 6))}};
        col.nullable = false;
        col.default_value = DefaultExpr{DefaultKind::CURRENT_TIMESTAMP,
                                        std::string(kCurrentTimestamp), {}, {}};
        col.generated = GeneratedKind::NONE;
        col.hidden = false;
        ctx.result.flags.uses_temporal = true;
        apply(ctx, RuleCategory::TEMPORAL, "temporal.column_retyped",
              std::format("{}: GENERATED ALWAYS AS {} -> {} NOT NULL DEFAULT CURRENT_TIMESTAMP",
                          where, kind, col.type.to_string()));
        return;
    }

    const TypeRef source_type = col.type;
    const TypeMapping mapping = type_mapper_.map(source_type);
    col.type = mapping.type;
    if (!mapping.mapped) {
        apply(ctx, RuleCategory::REVIEW, "type.unmapped",
              std::format("{}: {} passed through unchanged", where, source_type.to_string()));
        ctx.result.diagnostics.push_back(Diagnostic{
            DiagnosticKind::UNMAPPED_CONSTRUCT,
            std::format("No type rule for {} ({})", source_type.to_string(), where),
            span.line});
        utils::log::debug(std::format("Unmapped type {} in {}", source_type.to_string(), where));
    } else if (mapping.type != source_type) {
        apply(ctx, RuleCategory::TYPES, "type.mapped",
              std::format("{}: {} -> {}", where, source_type.to_string(), mapping.type.to_string()));
    }
    if (mapping.feature == TypeFeature::GEOGRAPHY) ctx.result.flags.uses_geography = true;
    if (mapping.feature == TypeFeature::GEOMETRY) ctx.result.flags.uses_geometry = true;

    if (col.identity) {
        ctx.result.flags.uses_identity = true;
        apply(ctx, RuleCategory::DEFAULTS, "identity.generated",
              std::format("{}: IDENTITY({},{}) -> GENERATED BY DEFAULT AS IDENTITY",
                          where, col.identity->seed, col.identity->increment));
    }

    if (col.default_value) {
        transform_default(where, source_type, *col.default_value, span, ctx);
    }

    if (col.hidden) {
        col.hidden = false;
        apply(ctx, RuleCategory::TEMPORAL, "column.hidden_dropped", where);
    }
    if (!col.collation.empty()) {
        apply(ctx, RuleCategory::REVIEW, "column.collation_dropped",
              std::format("{}: COLLATE {}", where, col.collation));
        col.collation.clear();
    }
}

void Transformer::transform_default(const std::string& column, const TypeRef& source_type,
                                    DefaultExpr& def, const SourceSpan& span,
                                    Context& ctx) const {
    if (!def.constraint_name.empty()) {
        apply(ctx, RuleCategory::DEFAULTS, "default.constraint_unwrapped",
              std::format("{}: CONSTRAINT {}", column, def.constraint_name));
        def.constraint_name.clear();
    }

    const std::string before = def.value;
    switch (def.kind) {
        case DefaultKind::SEQUENCE_NEXT: {
            const QualifiedName target =
                IdentifierRules::sequence_name(def.sequence, options_.sequence_suffix);
            def.value = std::format("nextval('{}')", target.full_name());
            def.sequence = target;
            if (before != def.value) {
                apply(ctx, RuleCategory::DEFAULTS, "default.sequence",
                      std::format("{}: {} -> {}", column, before, def.value));
            }
            ctx.result.flags.uses_sequences = true;
            register_sequence(target, span, ctx);
            break;
        }
        case DefaultKind::CURRENT_TIMESTAMP:
            def.value = std::string(kCurrentTimestamp);
            if (!utils::iequals(before, kCurrentTimestamp)) {
                apply(ctx, RuleCategory::DEFAULTS, "default.current_timestamp",
                      std::format("{}: {} -> {}", column, before, def.value));
            }
            break;
        case DefaultKind::UTC_TIMESTAMP:
            def.value = std::string(kUtcTimestamp);
            if (before != def.value) {
                apply(ctx, RuleCategory::DEFAULTS, "default.utc_timestamp",
                      std::format("{}: {} -> {}", column, before, def.value));
            }
            break;
        case DefaultKind::UUID_GENERATE:
            def.value = std::string(kUuidGenerate);
            if (!utils::iequals(before, kUuidGenerate)) {
                apply(ctx, RuleCategory::DEFAULTS, "default.uuid",
                      std::format("{}: {} -> {}", column, before, def.value));
            }
            break;
        case DefaultKind::NUMBER:
            // BIT 0/1 -> BOOLEAN FALSE/TRUE
            if ((utils::iequals(source_type.name, "BIT") || utils::iequals(source_type.name, "BOOLEAN")) &&
                (def.value == "0" || def.value == "1")) {
                def.kind = DefaultKind::BOOLEAN;
                def.value = (def.value == "1") ? "TRUE" : "FALSE";
                apply(ctx, RuleCategory::DEFAULTS, "default.boolean",
                      std::format("{}: {} -> {}", column, before, def.value));
            }
            break;
        case DefaultKind::NULL_VALUE:
            def.value = "NULL";
            break;
        case DefaultKind::STRING:
        case DefaultKind::BOOLEAN:
            break;
        case DefaultKind::EXPRESSION:
            def.value = IdentifierRules::strip_brackets(def.value);
            apply(ctx, RuleCategory::REVIEW, "default.expression",
                  std::format("{}: DEFAULT {}", column, def.value));
            utils::log::debug(std::format("Default expression kept for review: {} ({})",
                                          def.value, column));
            break;
    }
}

void Transformer::register_sequence(const QualifiedName& target, const SourceSpan& span,
                                    Context& ctx) const {
    const std::string key = target.full_name();
    if (!ctx.consumed_sequences.insert(key).second) return;
    if (ctx.declared_sequences.contains(key)) return;

    if (catalog_) {
        if (const SequenceNode* known = catalog_->find(target)) {
            ctx.result.nodes.emplace_back(target_sequence(*known), span);
            return;
        }
    }

    // Best-effort declaration, flagged for manual confirmation
    SequenceNode seq;
    seq.name = target;
    seq.start = "1";
    seq.increment = "1";
    seq.implicit = true;
    ctx.result.nodes.emplace_back(std::move(seq), span);

    apply(ctx, RuleCategory::REVIEW, "sequence.missing_definition", key);
    ctx.result.diagnostics.push_back(Diagnostic{
        DiagnosticKind::MISSING_SEQUENCE_DEFINITION,
        std::format("Sequence {} is not defined in this batch; declared with START 1 INCREMENT 1, "
                    "confirm manually", key),
        span.line});
    utils::log::warn(std::format("Missing sequence definition: {}", key));
}

// ============================================================================
// Constraints
// ============================================================================

void Transformer::transform_constraint(Constraint& c, Context& ctx) const {
    const std::string label = c.name.empty() ? std::string("(unnamed)") : c.name;

    if (!c.clustering.empty()) {
        apply(ctx, RuleCategory::CONSTRAINTS, "constraint.clustering_dropped",
              std::format("{}: {}", label, c.clustering));
        c.clustering.clear();
    }

    switch (c.kind) {
        case ConstraintKind::PRIMARY_KEY:
        case ConstraintKind::UNIQUE: {
            // PostgreSQL key constraints take bare column names
            bool had_direction = false;
            for (auto& col : c.columns) {
                had_direction |= !col.direction.empty();
                col.direction.clear();
            }
            if (had_direction) {
                apply(ctx, RuleCategory::CONSTRAINTS, "constraint.direction_dropped", label);
            }
            break;
        }
        case ConstraintKind::FOREIGN_KEY:
            c.ref_table = IdentifierRules::object_name(c.ref_table);
            break;
        case ConstraintKind::CHECK: {
            const std::string before = c.check_expression;
            c.check_expression = IdentifierRules::strip_brackets(before);
            apply(ctx, RuleCategory::REVIEW, "constraint.check_review",
                  std::format("{}: CHECK ({})", label, c.check_expression));
            break;
        }
    }
}

// ============================================================================
// Sequences, Indexes, Metadata, Raw
// ============================================================================

SequenceNode Transformer::target_sequence(const SequenceNode& source) const {
    SequenceNode seq = source;
    seq.name = IdentifierRules::sequence_name(source.name, options_.sequence_suffix);
    if (seq.type) {
        seq.type = type_mapper_.map(*seq.type).type;
    }
    return seq;
}

void Transformer::transform_sequence(const SequenceNode& source, const SourceSpan& span,
                                     Context& ctx) const {
    SequenceNode seq = target_sequence(source);
    if (seq.name != source.name) {
        apply(ctx, RuleCategory::IDENTIFIERS, "sequence.renamed",
              std::format("{} -> {}", source.name.full_name(), seq.name.full_name()));
    }
    ctx.result.flags.uses_sequences = true;
    ctx.result.nodes.emplace_back(std::move(seq), span);
}

void Transformer::transform_index(const IndexNode& source, const SourceSpan& span,
                                  Context& ctx) const {
    const std::string table = IdentifierRules::object_name(source.table).full_name();

    if (source.columnstore) {
        apply(ctx, RuleCategory::INDEXES, "index.columnstore_omitted",
              std::format("{} ON {}", source.name, table));
        omit(ctx, span, std::format("{}COLUMNSTORE INDEX {} ON {} omitted "
                                    "(PostgreSQL has no columnstore indexes)",
                                    source.clustering.empty() ? "" : source.clustering + " ",
                                    source.name, table));
        return;
    }

    IndexNode index = source;
    index.table = IdentifierRules::object_name(source.table);
    if (!index.clustering.empty()) {
        apply(ctx, RuleCategory::INDEXES, "index.clustering_dropped",
              std::format("{}: {}", index.name, index.clustering));
        index.clustering.clear();
    }
    if (!index.where_clause.empty()) {
        index.where_clause = IdentifierRules::strip_brackets(index.where_clause);
    }

    std::string storage;
    if (!index.with_options.empty()) storage = index.with_options;
    if (!index.storage_clause.empty()) {
        if (!storage.empty()) storage += ' ';
        storage += index.storage_clause;
    }
    index.with_options.clear();
    index.storage_clause.clear();

    const std::string name = index.name;
    ctx.result.nodes.emplace_back(std::move(index), span);

    if (!storage.empty()) {
        apply(ctx, RuleCategory::STORAGE, "storage.index_options_omitted",
              std::format("{}: {}", name, storage));
        omit(ctx, span, std::format("Index options of {} omitted: {}", name, storage));
    }
}

void Transformer::transform_property(const ExtendedPropertyNode& source, const SourceSpan& span,
                                     Context& ctx) const {
    ExtendedPropertyNode prop;
    prop.property_name = std::string(kDescription);
    prop.value = source.value;
    prop.level = source.level;
    prop.schema = source.schema.empty() ? std::string(kDefaultSchema) : utils::to_lower(source.schema);

    switch (source.level) {
        case MetadataLevel::SCHEMA:
            apply(ctx, RuleCategory::METADATA, "metadata.schema_comment", prop.schema);
            ctx.result.nodes.emplace_back(std::move(prop), span);
            return;
        case MetadataLevel::TABLE:
            prop.object_type = "TABLE";
            prop.object_name = utils::to_lower(source.object_name);
            apply(ctx, RuleCategory::METADATA, "metadata.table_comment",
                  std::format("{}.{}", prop.schema, prop.object_name));
            ctx.result.nodes.emplace_back(std::move(prop), span);
            return;
        case MetadataLevel::COLUMN:
            prop.object_type = "TABLE";
            prop.object_name = utils::to_lower(source.object_name);
            prop.sub_type = "COLUMN";
            prop.sub_name = source.sub_name;
            apply(ctx, RuleCategory::METADATA, "metadata.column_comment",
                  std::format("{}.{}.{}", prop.schema, prop.object_name, prop.sub_name));
            ctx.result.nodes.emplace_back(std::move(prop), span);
            return;
        case MetadataLevel::INDEX:
            ++ctx.result.omitted_index_properties;
            apply(ctx, RuleCategory::METADATA, "metadata.index_omitted",
                  std::format("{}.{}", source.object_name, source.sub_name));
            return;
        case MetadataLevel::OTHER:
            break;
    }

    std::string target = source.object_type.empty() ? std::string("object") : source.object_type;
    if (!source.sub_type.empty()) target += " " + source.sub_type;
    const std::string name = source.sub_name.empty() ? source.object_name : source.sub_name;
    apply(ctx, RuleCategory::METADATA, "metadata.other_omitted",
          std::format("{} {} ({})", target, name, source.property_name));
    omit(ctx, span, std::format("{} extended property on {} {} omitted "
                                "(no PostgreSQL comment target)",
                                source.property_name, target, name));
}

void Transformer::transform_raw(const RawNode& source, const SourceSpan& span,
                                Context& ctx) const {
    if (source.kind == RawKind::COMMENT) {
        ctx.result.nodes.emplace_back(source, span);
        return;
    }

    RawNode review = source;
    if (review.kind == RawKind::UNRECOGNIZED) {
        review.kind = RawKind::REVIEW;
        apply(ctx, RuleCategory::REVIEW, "statement.review",
              std::format("line {}: {}", span.line, source.reason));
        ctx.result.diagnostics.push_back(Diagnostic{
            DiagnosticKind::UNMAPPED_CONSTRUCT,
            std::format("Statement kept verbatim for review: {}", source.reason),
            span.line});
        utils::log::debug(std::format("Unrecognized statement at line {}: {}", span.line, source.reason));
    }
    ctx.result.nodes.emplace_back(std::move(review), span);
}

} // namespace ddlbridge
