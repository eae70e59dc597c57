#include "batch/output_writer.hpp"
#include "core/utils.hpp"

#include <format>
#include <functional>
#include <fstream>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

namespace ddlbridge {

namespace fs = std::filesystem;

namespace {

fs::path sibling(const fs::path& target, std::string_view extension) {
    const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    return target.parent_path() /
           std::format(".{}.{:x}{}", target.filename().string(), tid, extension);
}

Result<void> write_file(const fs::path& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<void>::error(ErrorCategory::IO_ERROR,
                                   std::format("Cannot open {} for writing", path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
        return Result<void>::error(ErrorCategory::IO_ERROR,
                                   std::format("Failed writing {}", path.string()));
    }
    return Result<void>::ok();
}

// Removes leftover temporaries on every exit path
class TempFiles {
public:
    void add(fs::path p) { paths_.push_back(std::move(p)); }
    ~TempFiles() {
        std::error_code ec;
        for (const auto& p : paths_) fs::remove(p, ec);
    }

private:
    std::vector<fs::path> paths_;
};

} // anonymous namespace

Result<void> OutputWriter::write(const fs::path& ddl_path, std::string_view ddl,
                                 const fs::path& report_path, std::string_view report) const {
    const auto guard = locks_.acquire(ddl_path);

    std::error_code ec;
    fs::create_directories(ddl_path.parent_path(), ec);
    if (ec) {
        return Result<void>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot create {}: {}", ddl_path.parent_path().string(), ec.message()));
    }
    if (report_path.parent_path() != ddl_path.parent_path()) {
        fs::create_directories(report_path.parent_path(), ec);
        if (ec) {
            return Result<void>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot create {}: {}", report_path.parent_path().string(), ec.message()));
        }
    }

    TempFiles temps;
    const fs::path report_tmp = sibling(report_path, ".tmp");
    const fs::path ddl_tmp = sibling(ddl_path, ".tmp");
    temps.add(report_tmp);
    temps.add(ddl_tmp);

    if (auto r = write_file(report_tmp, report); r.is_error()) return r;
    if (auto r = write_file(ddl_tmp, ddl); r.is_error()) return r;

    // A previous report is set aside until the new DDL is in place
    std::optional<fs::path> backup;
    if (fs::exists(report_path, ec)) {
        backup = sibling(report_path, ".bak");
        fs::rename(report_path, *backup, ec);
        if (ec) {
            return Result<void>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot set aside {}: {}", report_path.string(), ec.message()));
        }
    }
    auto restore_report = [&] {
        std::error_code restore_ec;
        fs::remove(report_path, restore_ec);
        if (backup) {
            fs::rename(*backup, report_path, restore_ec);
            if (restore_ec) {
                utils::log::error(std::format("Cannot restore {} from {}: {}", report_path.string(),
                                              backup->string(), restore_ec.message()));
            }
        }
    };

    fs::rename(report_tmp, report_path, ec);
    if (ec) {
        restore_report();
        return Result<void>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot move report into {}: {}", report_path.string(), ec.message()));
    }
    fs::rename(ddl_tmp, ddl_path, ec);
    if (ec) {
        restore_report();
        return Result<void>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot move DDL into {}: {}", ddl_path.string(), ec.message()));
    }

    if (backup) {
        fs::remove(*backup, ec);
        if (ec) {
            utils::log::warn(std::format("Cannot remove {}: {}", backup->string(), ec.message()));
        }
    }
    return Result<void>::ok();
}

} // namespace ddlbridge
