#pragma once

#include "state/iconversion_state.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>

namespace ddlbridge {

/**
 * @brief PostgreSQL output tree: <root>/<Schema>/Tables/<Table>.sql
 *
 * Output paths keep the caller's casing; has_output() is answered from a
 * snapshot taken by refresh() and matches case-insensitively. The snapshot
 * holds every DDL file's table plus every table listed in a report whose
 * DDL exists (files converting several tables are named after the first).
 *
 * Thread-safety: refresh() must not run concurrently with readers.
 * Path functions and has_output() are safe for concurrent use.
 */
class OutputTree : public IConversionState {
public:
    static constexpr std::string_view kTableDir = "Tables";
    static constexpr std::string_view kDdlExtension = ".sql";

    explicit OutputTree(std::filesystem::path root,
                        std::string report_suffix = ".report.json");

    [[nodiscard]] std::filesystem::path output_path(std::string_view schema,
                                                    std::string_view table) const;
    [[nodiscard]] std::filesystem::path report_path(std::string_view schema,
                                                    std::string_view table) const;

    /**
     * @brief Re-scan the tree and replace the snapshot
     * @return Number of converted tables found
     */
    size_t refresh();

    [[nodiscard]] bool has_output(const ObjectKey& key) const override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] size_t size() const { return snapshot_.size(); }

private:
    std::filesystem::path root_;
    std::string report_suffix_;
    std::unordered_set<ObjectKey, ObjectKeyHash> snapshot_;
};

} // namespace ddlbridge
