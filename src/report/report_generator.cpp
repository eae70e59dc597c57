#include "report/report_generator.hpp"

#include <array>
#include <string>

namespace ddlbridge {

namespace {

constexpr std::array ALL_CATEGORIES = {
    RuleCategory::IDENTIFIERS, RuleCategory::TYPES, RuleCategory::DEFAULTS,
    RuleCategory::TEMPORAL, RuleCategory::CONSTRAINTS, RuleCategory::INDEXES,
    RuleCategory::METADATA, RuleCategory::STORAGE, RuleCategory::REVIEW
};

nlohmann::ordered_json rules_section(const std::vector<AppliedRule>& rules) {
    nlohmann::ordered_json section = nlohmann::ordered_json::object();
    for (const auto category : ALL_CATEGORIES) {
        nlohmann::ordered_json applied = nlohmann::ordered_json::array();
        for (const auto& rule : rules) {
            if (rule.category != category) continue;
            applied.push_back({{"code", rule.code}, {"detail", rule.detail}});
        }
        if (applied.empty()) continue;

        const size_t count = applied.size();
        section[rule_category_name(category)] = {
            {"count", count},
            {"applied", std::move(applied)}
        };
    }
    return section;
}

nlohmann::ordered_json features_section(const FeatureFlags& flags) {
    return {
        {"uses_geography", flags.uses_geography},
        {"uses_geometry", flags.uses_geometry},
        {"uses_temporal", flags.uses_temporal},
        {"uses_identity", flags.uses_identity},
        {"uses_sequences", flags.uses_sequences}
    };
}

nlohmann::ordered_json diagnostics_section(const std::vector<Diagnostic>& diagnostics) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& d : diagnostics) {
        nlohmann::ordered_json entry = {
            {"kind", diagnostic_kind_name(d.kind)},
            {"message", d.message}
        };
        if (d.line > 0) entry["line"] = d.line;
        out.push_back(std::move(entry));
    }
    return out;
}

nlohmann::ordered_json dependencies_section(const std::vector<DependencyGroup>& groups) {
    nlohmann::ordered_json out = nlohmann::ordered_json::array();
    for (const auto& g : groups) {
        nlohmann::ordered_json owners = nlohmann::ordered_json::array();
        for (const auto& owner : g.referenced_by) owners.push_back(owner.to_string());
        out.push_back({
            {"target", g.target.to_string()},
            {"columns", g.columns},
            {"referenced_by", std::move(owners)},
            {"in_input_tree", g.in_input_tree}
        });
    }
    return out;
}

} // anonymous namespace

nlohmann::ordered_json ReportGenerator::generate(const ConversionReport& report) {
    nlohmann::ordered_json j;
    j["source"] = report.source_path;
    j["output"] = report.output_path;
    j["tables"] = report.tables;
    j[std::string(kRules)] = rules_section(report.rules);
    j[std::string(kFeatures)] = features_section(report.flags);
    j[std::string(kDiagnostics)] = diagnostics_section(report.diagnostics);
    if (!report.unresolved.empty()) {
        j[std::string(kDependencies)] = dependencies_section(report.unresolved);
    }
    return j;
}

std::string ReportGenerator::to_string(const ConversionReport& report) {
    return generate(report).dump(2) + "\n";
}

} // namespace ddlbridge
