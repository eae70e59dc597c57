#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ddlbridge {

/**
 * @brief Per-file conversion summary
 */
struct ConversionReport {
    std::string source_path;
    std::string output_path;
    std::vector<std::string> tables;            // schema.table, in source order
    std::vector<AppliedRule> rules;
    std::vector<DependencyGroup> unresolved;
    FeatureFlags flags;
    std::vector<Diagnostic> diagnostics;
};

/**
 * @brief Structured (JSON) report generation
 *
 * Layout:
 *   source, output, tables,
 *   rules        - one section per triggered category, in category order
 *   features     - all feature flags
 *   diagnostics  - array, possibly empty
 *   unresolved_dependencies - only when at least one group remains
 */
class ReportGenerator {
public:
    static constexpr std::string_view kRules        = "rules";
    static constexpr std::string_view kFeatures     = "features";
    static constexpr std::string_view kDiagnostics  = "diagnostics";
    static constexpr std::string_view kDependencies = "unresolved_dependencies";

    [[nodiscard]] static nlohmann::ordered_json generate(const ConversionReport& report);

    // Pretty-printed, newline-terminated
    [[nodiscard]] static std::string to_string(const ConversionReport& report);
};

} // namespace ddlbridge
