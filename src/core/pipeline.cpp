#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "emit/output_validator.hpp"

#include <format>
#include <stdexcept>

namespace ddlbridge {

namespace {

const IConversionState& require_state(const IConversionState* state) {
    if (!state) {
        throw std::invalid_argument("ConversionPipeline requires a conversion state");
    }
    return *state;
}

} // anonymous namespace

ConversionPipeline::ConversionPipeline(PipelineComponents components)
    : c_(std::move(components)),
      transformer_(c_.transform, c_.catalog),
      orchestrator_(require_state(c_.state), c_.known_objects) {}

Result<FileConversion> ConversionPipeline::convert(std::string_view text,
                                                   const std::string& source_path) const {
    utils::Timer timer;

    // 1. Parse
    const ParseOutput parsed = parser_.parse(text);
    if (!parsed.ok()) {
        std::string message = std::format("{}: {} parse error(s)", source_path, parsed.errors.size());
        for (const auto& err : parsed.errors) {
            message += "\n  - ";
            message += err.to_string();
        }
        return Result<FileConversion>::error(ErrorCategory::PARSE_ERROR, std::move(message));
    }

    FileConversion out;
    for (const auto& node : parsed.nodes) {
        if (const auto* table = node.as<TableNode>()) {
            out.primary_table = table->name;
            break;
        }
    }
    if (out.primary_table.empty()) {
        return Result<FileConversion>::error(
            ErrorCategory::TRANSFORM_ERROR,
            std::format("{}: no CREATE TABLE statement found", source_path));
    }

    // 2. Transform
    TransformResult transformed = transformer_.transform(parsed.nodes);

    // 3. Resolve (tables written by this file count as converted)
    ConversionOrchestrator::KeySet emitted;
    for (const auto& node : transformed.nodes) {
        if (const auto* table = node.as<TableNode>()) emitted.insert(ObjectKey::from(table->name));
    }
    auto unresolved = orchestrator_.unresolved(transformed.edges, emitted);
    for (auto& note : ConversionOrchestrator::cycle_notes(transformed.edges)) {
        transformed.diagnostics.push_back(std::move(note));
    }

    // 4. Emit
    out.ddl = emitter_.emit(transformed.nodes, transformed.omitted_index_properties);

    // 5. Validate
    if (c_.validate_output) {
        const auto validation = OutputValidator::validate(out.ddl);
        if (validation.is_error()) {
            utils::log::warn(std::format("{}: emitted DDL failed validation: {}",
                                         source_path, validation.error_message()));
            transformed.diagnostics.push_back(Diagnostic{
                DiagnosticKind::OUTPUT_VALIDATION, validation.error_message(), 0});
        }
    }

    // 6. Report
    ConversionReport& report = out.report;
    report.source_path = source_path;
    if (c_.output_locator) {
        report.output_path = c_.output_locator(out.primary_table).string();
    }
    for (const auto& node : transformed.nodes) {
        if (const auto* table = node.as<TableNode>()) {
            report.tables.push_back(table->name.full_name());
        }
    }
    report.rules = std::move(transformed.rules);
    report.unresolved = std::move(unresolved);
    report.flags = transformed.flags;
    report.diagnostics = std::move(transformed.diagnostics);
    out.report_json = ReportGenerator::to_string(report);

    utils::log::debug(std::format("{}: converted {} table(s), {} rule(s), {} unresolved in {}ms",
                                  source_path, report.tables.size(), report.rules.size(),
                                  report.unresolved.size(), timer.elapsed_ms().count()));
    return Result<FileConversion>::ok(std::move(out));
}

} // namespace ddlbridge
