#pragma once

#include "batch/path_lock_registry.hpp"
#include "core/error.hpp"

#include <filesystem>
#include <string_view>

namespace ddlbridge {

/**
 * @brief Writes one converted table (DDL + report) atomically
 *
 * Both files are written to temporary siblings first, then renamed into
 * place: report first, DDL last. The DDL file is what marks a table as
 * converted, so a failure at any step leaves no new DDL behind and never
 * touches a previously written one. A previous report is kept aside
 * until the DDL lands and is put back if it does not.
 *
 * Thread-safety: safe for concurrent use; writers of the same DDL path
 * are serialized through the PathLockRegistry.
 */
class OutputWriter {
public:
    explicit OutputWriter(PathLockRegistry& locks) : locks_(locks) {}

    [[nodiscard]] Result<void> write(const std::filesystem::path& ddl_path,
                                     std::string_view ddl,
                                     const std::filesystem::path& report_path,
                                     std::string_view report) const;

private:
    PathLockRegistry& locks_;
};

} // namespace ddlbridge
