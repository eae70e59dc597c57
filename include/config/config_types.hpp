#pragma once

#include <cstdint>
#include <string>

namespace ddlbridge {

// ============================================================================
// Configuration Types
// ============================================================================

struct InputConfig {
    std::string root = "mssql";             // <root>/<Schema>/Tables/<Table>.sql
    std::string table_dir = "Tables";
    std::string sequence_dir = "Sequences";
};

struct OutputConfig {
    std::string root = "postgres";
    std::string report_suffix = ".report.json";
};

struct ConversionConfig {
    uint32_t workers = 1;                   // 1-64
    bool validate_output = true;            // libpg_query syntax check
    std::string sequence_suffix = "_seq";
    int max_timestamp_precision = 6;        // 0-6
};

struct LoggingConfig {
    std::string level = "info";             // debug | info | warn | error
};

struct BridgeConfig {
    InputConfig input;
    OutputConfig output;
    ConversionConfig conversion;
    LoggingConfig logging;
};

} // namespace ddlbridge
