#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace ddlbridge {

// Schema assumed for unqualified T-SQL object names
inline constexpr std::string_view kDefaultSchema = "dbo";

// ============================================================================
// Names & Identity
// ============================================================================

/**
 * @brief Multi-part object name as written in source, brackets stripped,
 *        casing preserved.
 */
struct QualifiedName {
    std::string schema;         // empty = unqualified
    std::string name;

    QualifiedName() = default;
    QualifiedName(std::string s, std::string n) : schema(std::move(s)), name(std::move(n)) {}

    [[nodiscard]] bool empty() const { return name.empty(); }

    std::string full_name() const {
        return schema.empty() ? name : (schema + "." + name);
    }

    bool operator==(const QualifiedName&) const = default;
};

/**
 * @brief Canonical (schema_lower, table_lower) identity.
 *
 * The only key used for dependency and conversion-state lookups. Always
 * lowercase and bracket-free; unqualified names resolve to kDefaultSchema.
 */
struct ObjectKey {
    std::string schema;
    std::string table;

    ObjectKey() = default;

    [[nodiscard]] static ObjectKey from(std::string_view schema, std::string_view table);
    [[nodiscard]] static ObjectKey from(const QualifiedName& name) {
        return from(name.schema, name.name);
    }

    std::string to_string() const { return schema + "." + table; }

    bool operator==(const ObjectKey&) const = default;
    auto operator<=>(const ObjectKey&) const = default;
};

struct ObjectKeyHash {
    size_t operator()(const ObjectKey& key) const noexcept {
        const size_t h1 = std::hash<std::string>{}(key.schema);
        const size_t h2 = std::hash<std::string>{}(key.table);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

struct SourceSpan {
    size_t offset = 0;          // Byte offset into the file
    size_t length = 0;
    size_t line = 1;            // 1-based line of the first byte
};

// ============================================================================
// Column-level Types
// ============================================================================

struct TypeRef {
    std::string name;               // Bracket-free, as written (multi-part joined by '.')
    std::vector<std::string> args;  // "18", "2", "MAX", ...

    [[nodiscard]] std::string to_string() const;

    bool operator==(const TypeRef&) const = default;
};

enum class DefaultKind {
    NUMBER,             // 0, -1.5
    STRING,             // 'text'
    BOOLEAN,            // TRUE / FALSE
    NULL_VALUE,
    SEQUENCE_NEXT,      // NEXT VALUE FOR [s].[n]  /  nextval('s.n')
    CURRENT_TIMESTAMP,  // sysdatetime(), getdate(), CURRENT_TIMESTAMP
    UTC_TIMESTAMP,      // sysutcdatetime(), getutcdate()
    UUID_GENERATE,      // newid(), newsequentialid(), gen_random_uuid()
    EXPRESSION          // Anything else, kept as text
};

/**
 * @brief Structured column default.
 *
 * `value` holds the number text, the unescaped string contents, TRUE/FALSE,
 * or the expression text depending on `kind`.
 */
struct DefaultExpr {
    DefaultKind kind = DefaultKind::EXPRESSION;
    std::string value;
    QualifiedName sequence;         // SEQUENCE_NEXT only
    std::string constraint_name;    // Named default-constraint wrapper (T-SQL)

    bool operator==(const DefaultExpr&) const = default;
};

enum class GeneratedKind { NONE, ROW_START, ROW_END };

struct IdentitySpec {
    std::string seed = "1";
    std::string increment = "1";

    bool operator==(const IdentitySpec&) const = default;
};

struct Column {
    std::string name;                       // Casing preserved verbatim
    TypeRef type;
    std::optional<bool> nullable;           // nullopt = not specified
    std::optional<DefaultExpr> default_value;
    std::optional<IdentitySpec> identity;
    GeneratedKind generated = GeneratedKind::NONE;
    bool hidden = false;
    std::string collation;
    size_t ordinal = 0;                     // 0-based position among columns

    bool operator==(const Column&) const = default;
};

// ============================================================================
// Constraints & Table Elements
// ============================================================================

enum class ConstraintKind { PRIMARY_KEY, UNIQUE, FOREIGN_KEY, CHECK };

struct IndexColumn {
    std::string name;
    std::string direction;      // "ASC", "DESC" or empty

    bool operator==(const IndexColumn&) const = default;
};

struct Constraint {
    ConstraintKind kind = ConstraintKind::CHECK;
    std::string name;                       // Empty for unnamed constraints
    std::vector<IndexColumn> columns;       // PK / UNIQUE / FK source columns
    std::string clustering;                 // "CLUSTERED", "NONCLUSTERED" or empty

    // FOREIGN KEY only
    QualifiedName ref_table;
    std::vector<std::string> ref_columns;
    std::string on_delete;                  // "CASCADE", "SET NULL", ...
    std::string on_update;

    // CHECK only
    std::string check_expression;

    size_t ordinal = 0;                     // Source position among table elements

    bool operator==(const Constraint&) const = default;
};

/**
 * @brief Table element recognized structurally but not modeled
 *        (computed column, inline index, ...). Kept verbatim.
 */
struct RawElement {
    std::string text;
    std::string reason;
    size_t ordinal = 0;

    bool operator==(const RawElement&) const = default;
};

struct PeriodClause {
    std::string start_column;
    std::string end_column;

    bool operator==(const PeriodClause&) const = default;
};

struct TableOption {
    std::string name;           // Upper-cased option name
    std::string text;           // Verbatim option text

    bool operator==(const TableOption&) const = default;
};

// ============================================================================
// Statement Nodes
// ============================================================================

struct TableNode {
    QualifiedName name;
    std::vector<Column> columns;
    std::vector<Constraint> constraints;
    std::vector<RawElement> raw_elements;

    // Temporal (system-versioned) clauses
    std::optional<PeriodClause> period;
    bool system_versioning = false;
    std::optional<QualifiedName> history_table;

    std::vector<TableOption> options;       // WITH (...) options other than versioning
    std::string storage_clause;             // ON [fg] TEXTIMAGE_ON [fg] ...

    [[nodiscard]] const Column* find_column(std::string_view column_name) const;

    bool operator==(const TableNode&) const = default;
};

struct SequenceNode {
    QualifiedName name;
    std::optional<TypeRef> type;
    std::optional<std::string> start;
    std::optional<std::string> increment;
    std::optional<std::string> min_value;
    std::optional<std::string> max_value;
    std::optional<std::string> cache;
    bool cycle = false;
    bool implicit = false;      // Registered from a column default, not declared

    bool operator==(const SequenceNode&) const = default;
};

struct IndexNode {
    std::string name;
    QualifiedName table;
    bool unique = false;
    std::string clustering;                 // "CLUSTERED", "NONCLUSTERED" or empty
    bool columnstore = false;
    std::vector<IndexColumn> columns;
    std::vector<std::string> include_columns;
    std::string where_clause;               // Filter predicate text (no WHERE keyword)
    std::string with_options;               // Verbatim WITH (...) text
    std::string storage_clause;             // Verbatim ON [fg] text
    std::string using_method;               // PostgreSQL USING method

    bool operator==(const IndexNode&) const = default;
};

enum class MetadataLevel { SCHEMA, TABLE, COLUMN, INDEX, OTHER };

/**
 * @brief Metadata comment: sp_addextendedproperty (source) or
 *        COMMENT ON (target).
 */
struct ExtendedPropertyNode {
    std::string property_name;              // "Description", "MS_Description", ...
    std::optional<std::string> value;       // nullopt = NULL
    MetadataLevel level = MetadataLevel::TABLE;
    std::string schema;
    std::string object_type;                // level1 type ("TABLE", "VIEW", ...)
    std::string object_name;
    std::string sub_type;                   // level2 type ("COLUMN", "INDEX", ...)
    std::string sub_name;

    bool operator==(const ExtendedPropertyNode&) const = default;
};

struct SchemaNode {
    std::string name;

    bool operator==(const SchemaNode&) const = default;
};

enum class RawKind {
    UNRECOGNIZED,   // Statement the parser could not classify
    COMMENT,        // Comment-only text between statements
    OMISSION,       // Construct deliberately omitted by a rule
    REVIEW          // Construct kept verbatim, needs manual review
};

struct RawNode {
    RawKind kind = RawKind::UNRECOGNIZED;
    std::string text;           // Verbatim source text
    std::string reason;         // Human-readable explanation

    bool operator==(const RawNode&) const = default;
};

enum class NodeKind { TABLE, SEQUENCE, INDEX, EXTENDED_PROPERTY, SCHEMA, RAW };

/**
 * @brief Closed tagged variant over every statement shape.
 *
 * The alternative order matches NodeKind.
 */
struct StatementNode {
    using Body = std::variant<TableNode, SequenceNode, IndexNode,
                              ExtendedPropertyNode, SchemaNode, RawNode>;

    Body body;
    SourceSpan span;

    StatementNode() : body(RawNode{}) {}
    template<typename T>
        requires (!std::is_same_v<std::decay_t<T>, StatementNode>)
    StatementNode(T node, SourceSpan s = {}) : body(std::move(node)), span(s) {}

    [[nodiscard]] NodeKind kind() const { return static_cast<NodeKind>(body.index()); }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(body); }

    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&body); }

    template<typename T>
    [[nodiscard]] T* as() { return std::get_if<T>(&body); }
};

// ============================================================================
// Dependencies
// ============================================================================

/**
 * @brief Foreign-key reference from one table to another.
 *
 * `columns` is an insertion-ordered set of referencing source column names.
 */
struct DependencyEdge {
    ObjectKey from;
    ObjectKey to;
    std::vector<std::string> columns;

    [[nodiscard]] bool is_self_reference() const { return from == to; }

    bool operator==(const DependencyEdge&) const = default;
};

/**
 * @brief Unresolved dependencies on one target, merged across owners.
 */
struct DependencyGroup {
    ObjectKey target;
    std::vector<std::string> columns;
    std::vector<ObjectKey> referenced_by;
    bool in_input_tree = true;      // false = target has no source object at all

    bool operator==(const DependencyGroup&) const = default;
};

// ============================================================================
// Applied Rules, Flags & Diagnostics
// ============================================================================

enum class RuleCategory {
    IDENTIFIERS,
    TYPES,
    DEFAULTS,
    TEMPORAL,
    CONSTRAINTS,
    INDEXES,
    METADATA,
    STORAGE,
    REVIEW
};

inline constexpr const char* rule_category_name(RuleCategory category) {
    switch (category) {
        case RuleCategory::IDENTIFIERS: return "identifiers";
        case RuleCategory::TYPES:       return "types";
        case RuleCategory::DEFAULTS:    return "defaults";
        case RuleCategory::TEMPORAL:    return "temporal";
        case RuleCategory::CONSTRAINTS: return "constraints";
        case RuleCategory::INDEXES:     return "indexes";
        case RuleCategory::METADATA:    return "metadata";
        case RuleCategory::STORAGE:     return "storage";
        case RuleCategory::REVIEW:      return "review";
    }
    return "unknown";
}

/**
 * @brief Tag recording one rule application, e.g.
 *        {TYPES, "type.mapped", "NVARCHAR(50) -> VARCHAR(50)"}.
 */
struct AppliedRule {
    RuleCategory category = RuleCategory::REVIEW;
    std::string code;
    std::string detail;

    bool operator==(const AppliedRule&) const = default;
};

struct FeatureFlags {
    bool uses_geography = false;
    bool uses_geometry = false;
    bool uses_temporal = false;
    bool uses_identity = false;
    bool uses_sequences = false;

    void merge(const FeatureFlags& other) {
        uses_geography |= other.uses_geography;
        uses_geometry |= other.uses_geometry;
        uses_temporal |= other.uses_temporal;
        uses_identity |= other.uses_identity;
        uses_sequences |= other.uses_sequences;
    }

    bool operator==(const FeatureFlags&) const = default;
};

enum class DiagnosticKind {
    PARSE_ERROR,
    UNMAPPED_CONSTRUCT,
    MISSING_SEQUENCE_DEFINITION,
    DEPENDENCY_CYCLE,
    OUTPUT_VALIDATION
};

inline constexpr const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::PARSE_ERROR:                 return "parse_error";
        case DiagnosticKind::UNMAPPED_CONSTRUCT:          return "unmapped_construct";
        case DiagnosticKind::MISSING_SEQUENCE_DEFINITION: return "missing_sequence_definition";
        case DiagnosticKind::DEPENDENCY_CYCLE:            return "dependency_cycle";
        case DiagnosticKind::OUTPUT_VALIDATION:           return "output_validation";
    }
    return "unknown";
}

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::UNMAPPED_CONSTRUCT;
    std::string message;
    size_t line = 0;            // 0 = not tied to a source line

    bool operator==(const Diagnostic&) const = default;
};

} // namespace ddlbridge
