#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "emit/pg_emitter.hpp"
#include "graph/conversion_orchestrator.hpp"
#include "parser/ddl_parser.hpp"
#include "report/report_generator.hpp"
#include "state/iconversion_state.hpp"
#include "transform/sequence_catalog.hpp"
#include "transform/transformer.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace ddlbridge {

/**
 * @brief Collaborators of one conversion pipeline
 */
struct PipelineComponents {
    const IConversionState* state = nullptr;            // Required
    const SequenceCatalog* catalog = nullptr;            // Optional pre-scanned sequences
    ConversionOrchestrator::KnownObjectPredicate known_objects;
    std::function<std::filesystem::path(const QualifiedName&)> output_locator;
    TransformOptions transform;
    bool validate_output = true;
};

/**
 * @brief Result of converting one source file
 */
struct FileConversion {
    QualifiedName primary_table;    // First table, source casing, brackets stripped
    std::string ddl;
    std::string report_json;
    ConversionReport report;
};

/**
 * @brief Per-file conversion coordinator
 *
 * Stages:
 * 1. Parse (statement-scoped errors skip the file)
 * 2. Transform (rule engine + dependency edges)
 * 3. Resolve (unresolved dependency groups, cycle notes)
 * 4. Emit (canonical PostgreSQL DDL)
 * 5. Validate (libpg_query, advisory)
 * 6. Report
 *
 * Thread-safety: convert() is const and safe for concurrent use
 */
class ConversionPipeline {
public:
    explicit ConversionPipeline(PipelineComponents components);

    /**
     * @brief Convert one file's text
     * @param text Source file contents
     * @param source_path Path recorded in the report and log lines
     * @return FileConversion, or PARSE_ERROR / TRANSFORM_ERROR
     */
    [[nodiscard]] Result<FileConversion> convert(std::string_view text,
                                                 const std::string& source_path) const;

private:
    PipelineComponents c_;
    DdlParser parser_;
    Transformer transformer_;
    ConversionOrchestrator orchestrator_;
    PgEmitter emitter_;
};

} // namespace ddlbridge
