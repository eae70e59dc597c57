#include "state/output_tree.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <system_error>

namespace ddlbridge {

namespace fs = std::filesystem;

namespace {

// Tables listed in a report ("schema.table"); a file holding several
// tables has a single DDL named after the first one
void add_reported_tables(const fs::path& report,
                         std::unordered_set<ObjectKey, ObjectKeyHash>& out) {
    std::ifstream in(report);
    const auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("tables") ||
        !doc["tables"].is_array()) {
        utils::log::debug(std::format("Ignoring unreadable report {}", report.string()));
        return;
    }
    for (const auto& entry : doc["tables"]) {
        if (!entry.is_string()) continue;
        const auto name = entry.get<std::string>();
        const auto dot = name.find('.');
        if (dot == std::string::npos) {
            out.insert(ObjectKey::from("", name));
        } else {
            out.insert(ObjectKey::from(std::string_view(name).substr(0, dot),
                                       std::string_view(name).substr(dot + 1)));
        }
    }
}

} // anonymous namespace

OutputTree::OutputTree(fs::path root, std::string report_suffix)
    : root_(std::move(root)), report_suffix_(std::move(report_suffix)) {}

fs::path OutputTree::output_path(std::string_view schema, std::string_view table) const {
    const std::string_view dir = schema.empty() ? kDefaultSchema : schema;
    return root_ / fs::path(std::string(dir)) / fs::path(std::string(kTableDir)) /
           fs::path(std::string(table) + std::string(kDdlExtension));
}

fs::path OutputTree::report_path(std::string_view schema, std::string_view table) const {
    const std::string_view dir = schema.empty() ? kDefaultSchema : schema;
    return root_ / fs::path(std::string(dir)) / fs::path(std::string(kTableDir)) /
           fs::path(std::string(table) + report_suffix_);
}

size_t OutputTree::refresh() {
    snapshot_.clear();

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return 0;
    }

    for (const auto& schema_dir : fs::directory_iterator(root_, ec)) {
        if (!schema_dir.is_directory(ec)) continue;
        const fs::path tables = schema_dir.path() / std::string(kTableDir);
        if (!fs::is_directory(tables, ec)) continue;

        for (const auto& entry : fs::directory_iterator(tables, ec)) {
            if (!entry.is_regular_file(ec)) continue;
            const fs::path& p = entry.path();
            const std::string file = p.filename().string();
            if (file.ends_with(report_suffix_)) {
                // Only reports whose DDL landed count
                const std::string stem = file.substr(0, file.size() - report_suffix_.size());
                if (fs::exists(tables / (stem + std::string(kDdlExtension)), ec)) {
                    add_reported_tables(p, snapshot_);
                }
                continue;
            }
            if (p.extension().string() != kDdlExtension) continue;
            snapshot_.insert(ObjectKey::from(schema_dir.path().filename().string(),
                                             p.stem().string()));
        }
    }
    if (ec) {
        utils::log::warn(std::format("Output tree scan of {} incomplete: {}",
                                     root_.string(), ec.message()));
    }

    utils::log::debug(std::format("Output tree {}: {} converted tables",
                                  root_.string(), snapshot_.size()));
    return snapshot_.size();
}

bool OutputTree::has_output(const ObjectKey& key) const {
    return snapshot_.contains(key);
}

} // namespace ddlbridge
