#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "transform/sequence_catalog.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ddlbridge {

/**
 * @brief Outcome of one input file in a batch
 */
struct FileOutcome {
    std::filesystem::path source;
    bool success = false;
    ErrorCategory category = ErrorCategory::NONE;
    std::string error;                      // Empty on success
    QualifiedName table;                    // Primary table (success only)
    std::filesystem::path output;           // DDL path (success only)
    size_t unresolved = 0;                  // Unresolved dependency groups
    size_t diagnostics = 0;
};

struct BatchSummary {
    std::vector<FileOutcome> files;         // Input order
    size_t converted = 0;
    size_t failed = 0;

    [[nodiscard]] bool all_ok() const { return failed == 0; }
};

/**
 * @brief Batch entry point: converts table files into the output tree
 *
 * Per run:
 * 1. Collect table files from each target (file or directory)
 * 2. Pre-scan the input tree: known tables, sequence definitions
 * 3. Snapshot the output tree (hasOutput)
 * 4. Convert files on `conversion.workers` threads
 * 5. Write DDL + report atomically per table
 *
 * A failing file never aborts the batch; outcomes keep input order.
 */
class BatchConverter {
public:
    explicit BatchConverter(BridgeConfig config);

    /**
     * @brief Convert every table file under the given targets
     * @param targets Files or directories; empty = configured input root
     */
    [[nodiscard]] BatchSummary run(const std::vector<std::filesystem::path>& targets) const;

    /**
     * @brief Table files under a target, sorted
     *
     * A regular file is returned as-is. A directory is walked recursively
     * for *.sql files whose parent directory is named `table_dir`
     * (case-insensitive).
     */
    [[nodiscard]] static Result<std::vector<std::filesystem::path>> collect_table_files(
        const std::filesystem::path& target, std::string_view table_dir);

    /**
     * @brief Parse every file under <root>/<Schema>/<sequence_dir>/
     */
    [[nodiscard]] static SequenceCatalog scan_sequences(const std::filesystem::path& root,
                                                        std::string_view sequence_dir,
                                                        std::string suffix);

    /**
     * @brief Keys of every table file under <root>/<Schema>/<table_dir>/
     */
    [[nodiscard]] static std::unordered_set<ObjectKey, ObjectKeyHash> scan_known_tables(
        const std::filesystem::path& root, std::string_view table_dir);

    [[nodiscard]] const BridgeConfig& config() const { return config_; }

private:
    BridgeConfig config_;
};

} // namespace ddlbridge
