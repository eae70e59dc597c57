#pragma once

#include "core/types.hpp"
#include "transform/sequence_catalog.hpp"
#include "transform/type_mapper.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace ddlbridge {

struct TransformOptions {
    std::string sequence_suffix = "_seq";
    int max_timestamp_precision = 6;
};

/**
 * @brief Output of one file's transformation
 */
struct TransformResult {
    std::vector<StatementNode> nodes;           // PostgreSQL-shaped nodes
    std::vector<DependencyEdge> edges;          // FK edges, merged per (from, to)
    std::vector<AppliedRule> rules;             // In application order
    std::vector<Diagnostic> diagnostics;
    FeatureFlags flags;
    size_t omitted_index_properties = 0;

    [[nodiscard]] size_t count_rules(RuleCategory category) const;
};

/**
 * @brief Rule engine: SQL Server statement nodes -> PostgreSQL statement nodes
 *
 * Applies the identifier, type, default, temporal, constraint, index and
 * metadata rules to every node. Nothing is dropped silently: constructs
 * without a PostgreSQL counterpart become OMISSION or REVIEW raw nodes
 * and are recorded as applied rules.
 *
 * Thread-safety: const methods are safe for concurrent use
 */
class Transformer {
public:
    explicit Transformer(TransformOptions options = {},
                         const SequenceCatalog* catalog = nullptr);

    [[nodiscard]] TransformResult transform(const std::vector<StatementNode>& source) const;

    [[nodiscard]] const TransformOptions& options() const { return options_; }

private:
    struct Context {
        TransformResult& result;
        std::unordered_set<std::string> declared_sequences;   // Defined in this file
        std::unordered_set<std::string> consumed_sequences;   // Registered for emission
    };

    void transform_node(const StatementNode& node, Context& ctx) const;
    void transform_table(const TableNode& source, const SourceSpan& span, Context& ctx) const;
    void transform_column(const TableNode& source, Column& col, const SourceSpan& span,
                          Context& ctx) const;
    void transform_default(const std::string& column, const TypeRef& source_type,
                           DefaultExpr& def, const SourceSpan& span, Context& ctx) const;
    void transform_constraint(Constraint& c, Context& ctx) const;
    void transform_sequence(const SequenceNode& source, const SourceSpan& span,
                            Context& ctx) const;
    void transform_index(const IndexNode& source, const SourceSpan& span, Context& ctx) const;
    void transform_property(const ExtendedPropertyNode& source, const SourceSpan& span,
                            Context& ctx) const;
    void transform_raw(const RawNode& source, const SourceSpan& span, Context& ctx) const;

    void register_sequence(const QualifiedName& target, const SourceSpan& span,
                           Context& ctx) const;
    [[nodiscard]] SequenceNode target_sequence(const SequenceNode& source) const;

    static void apply(Context& ctx, RuleCategory category, std::string code, std::string detail);
    static void omit(Context& ctx, const SourceSpan& span, std::string text);

    TransformOptions options_;
    TypeMapper type_mapper_;
    const SequenceCatalog* catalog_;
};

} // namespace ddlbridge
