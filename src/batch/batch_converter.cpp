#include "batch/batch_converter.hpp"
#include "batch/output_writer.hpp"
#include "batch/path_lock_registry.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "parser/ddl_parser.hpp"
#include "state/output_tree.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <thread>

namespace ddlbridge {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSqlExtension = ".sql";

Result<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
                                          std::format("Cannot open {}", path.string()));
    }
    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
                                          std::format("Failed reading {}", path.string()));
    }
    return Result<std::string>::ok(std::move(buffer));
}

bool is_sql_file(const fs::path& p) {
    return utils::iequals(p.extension().string(), kSqlExtension);
}

// Visits <root>/<Schema>/<dir>/*.sql as (schema directory name, file)
template<typename Fn>
void for_each_object_file(const fs::path& root, std::string_view dir, Fn&& fn) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return;

    for (const auto& schema_dir : fs::directory_iterator(root, ec)) {
        if (!schema_dir.is_directory(ec)) continue;
        for (const auto& kind_dir : fs::directory_iterator(schema_dir.path(), ec)) {
            if (!kind_dir.is_directory(ec)) continue;
            if (!utils::iequals(kind_dir.path().filename().string(), dir)) continue;
            for (const auto& entry : fs::directory_iterator(kind_dir.path(), ec)) {
                if (!entry.is_regular_file(ec) || !is_sql_file(entry.path())) continue;
                fn(schema_dir.path().filename().string(), entry.path());
            }
        }
    }
    if (ec) {
        utils::log::warn(std::format("Scan of {} incomplete: {}", root.string(), ec.message()));
    }
}

FileOutcome failure(fs::path source, ErrorCategory category, std::string message) {
    FileOutcome out;
    out.source = std::move(source);
    out.success = false;
    out.category = category;
    out.error = std::move(message);
    return out;
}

} // anonymous namespace

BatchConverter::BatchConverter(BridgeConfig config) : config_(std::move(config)) {}

// ============================================================================
// Discovery
// ============================================================================

Result<std::vector<fs::path>> BatchConverter::collect_table_files(const fs::path& target,
                                                                  std::string_view table_dir) {
    using R = Result<std::vector<fs::path>>;
    std::error_code ec;

    if (fs::is_regular_file(target, ec)) {
        return R::ok({target});
    }
    if (!fs::is_directory(target, ec)) {
        return R::error(ErrorCategory::IO_ERROR,
                        std::format("{}: no such file or directory", target.string()));
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(target, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !is_sql_file(entry.path())) continue;
        if (!utils::iequals(entry.path().parent_path().filename().string(), table_dir)) continue;
        files.push_back(entry.path());
    }
    if (ec) {
        return R::error(ErrorCategory::IO_ERROR,
                        std::format("Cannot walk {}: {}", target.string(), ec.message()));
    }

    std::sort(files.begin(), files.end());
    return R::ok(std::move(files));
}

SequenceCatalog BatchConverter::scan_sequences(const fs::path& root, std::string_view sequence_dir,
                                               std::string suffix) {
    SequenceCatalog catalog(std::move(suffix));
    const DdlParser parser;

    for_each_object_file(root, sequence_dir, [&](const std::string&, const fs::path& file) {
        const auto text = read_file(file);
        if (text.is_error()) {
            utils::log::warn(text.error_message());
            return;
        }
        const ParseOutput parsed = parser.parse(text.value());
        for (const auto& err : parsed.errors) {
            utils::log::warn(std::format("{}: {}", file.string(), err.to_string()));
        }
        for (const auto& node : parsed.nodes) {
            if (const auto* seq = node.as<SequenceNode>()) {
                if (!catalog.add(*seq)) {
                    utils::log::debug(std::format("{}: duplicate sequence {} ignored",
                                                  file.string(), seq->name.full_name()));
                }
            }
        }
    });

    utils::log::debug(std::format("Sequence catalog: {} definitions under {}",
                                  catalog.size(), root.string()));
    return catalog;
}

std::unordered_set<ObjectKey, ObjectKeyHash> BatchConverter::scan_known_tables(
    const fs::path& root, std::string_view table_dir) {
    std::unordered_set<ObjectKey, ObjectKeyHash> known;
    for_each_object_file(root, table_dir, [&](const std::string& schema, const fs::path& file) {
        known.insert(ObjectKey::from(schema, file.stem().string()));
    });
    return known;
}

// ============================================================================
// Batch run
// ============================================================================

BatchSummary BatchConverter::run(const std::vector<fs::path>& targets) const {
    utils::Timer timer;
    BatchSummary summary;

    const fs::path input_root(config_.input.root);
    std::vector<fs::path> roots = targets;
    if (roots.empty()) roots.push_back(input_root);

    // 1. Collect (failed targets become failed outcomes, in place)
    struct WorkItem {
        fs::path source;
        std::optional<FileOutcome> preset;   // Set when the target itself failed
    };
    std::vector<WorkItem> work;
    for (const auto& target : roots) {
        auto files = collect_table_files(target, config_.input.table_dir);
        if (files.is_error()) {
            utils::log::error(files.error_message());
            work.push_back({target, failure(target, files.error_category(), files.error_message())});
            continue;
        }
        for (auto& f : files.value()) work.push_back({std::move(f), std::nullopt});
    }

    // 2. Pre-scan input tree
    const SequenceCatalog catalog = scan_sequences(input_root, config_.input.sequence_dir,
                                                   config_.conversion.sequence_suffix);
    auto known = scan_known_tables(input_root, config_.input.table_dir);
    for (const auto& item : work) {
        // Files converted from outside the input root still count as present
        const fs::path& p = item.source;
        if (!item.preset && utils::iequals(p.parent_path().filename().string(),
                                           config_.input.table_dir)) {
            known.insert(ObjectKey::from(p.parent_path().parent_path().filename().string(),
                                         p.stem().string()));
        }
    }

    // 3. Snapshot output tree
    OutputTree tree(config_.output.root, config_.output.report_suffix);
    const size_t existing = tree.refresh();

    PipelineComponents components;
    components.state = &tree;
    components.catalog = &catalog;
    components.known_objects = [&known](const ObjectKey& key) { return known.contains(key); };
    components.output_locator = [&tree](const QualifiedName& name) {
        return tree.output_path(name.schema, name.name);
    };
    components.transform.sequence_suffix = config_.conversion.sequence_suffix;
    components.transform.max_timestamp_precision = config_.conversion.max_timestamp_precision;
    components.validate_output = config_.conversion.validate_output;
    const ConversionPipeline pipeline(std::move(components));

    PathLockRegistry locks;
    const OutputWriter writer(locks);

    utils::log::info(std::format("Converting {} file(s) with {} worker(s), {} table(s) already converted",
                                 work.size(), config_.conversion.workers, existing));

    // 4. Convert
    auto convert_one = [&](const WorkItem& item) -> FileOutcome {
        if (item.preset) return *item.preset;

        const utils::Timer file_timer;
        const std::string source = item.source.string();

        const auto text = read_file(item.source);
        if (text.is_error()) {
            utils::log::error(text.error_message());
            return failure(item.source, text.error_category(), text.error_message());
        }

        auto converted = pipeline.convert(text.value(), source);
        if (converted.is_error()) {
            utils::log::error(std::format("Skipping {}", converted.error_message()));
            return failure(item.source, converted.error_category(), converted.error_message());
        }
        const FileConversion& conv = converted.value();

        for (const auto& d : conv.report.diagnostics) {
            utils::log::debug(std::format("{}: [{}] {}", source,
                                          diagnostic_kind_name(d.kind), d.message));
        }

        const auto& t = conv.primary_table;
        const fs::path ddl_path = tree.output_path(t.schema, t.name);
        const fs::path report_path = tree.report_path(t.schema, t.name);
        const auto written = writer.write(ddl_path, conv.ddl, report_path, conv.report_json);
        if (written.is_error()) {
            utils::log::error(std::format("{}: {}", source, written.error_message()));
            return failure(item.source, written.error_category(), written.error_message());
        }

        FileOutcome out;
        out.source = item.source;
        out.success = true;
        out.table = t;
        out.output = ddl_path;
        out.unresolved = conv.report.unresolved.size();
        out.diagnostics = conv.report.diagnostics.size();
        utils::log::info(std::format("{} -> {} ({} unresolved, {}ms)", source, ddl_path.string(),
                                     out.unresolved, file_timer.elapsed_ms().count()));
        return out;
    };

    summary.files.resize(work.size());
    auto run_item = [&](size_t i) {
        try {
            summary.files[i] = convert_one(work[i]);
        } catch (const std::exception& e) {
            utils::log::error(std::format("{}: {}", work[i].source.string(), e.what()));
            summary.files[i] = failure(work[i].source, ErrorCategory::INTERNAL_ERROR, e.what());
        }
    };

    const size_t thread_count = std::min<size_t>(
        std::max<uint32_t>(config_.conversion.workers, 1), work.size());
    if (thread_count <= 1) {
        for (size_t i = 0; i < work.size(); ++i) run_item(i);
    } else {
        std::atomic<size_t> next{0};
        std::vector<std::thread> workers;
        workers.reserve(thread_count);
        for (size_t w = 0; w < thread_count; ++w) {
            workers.emplace_back([&] {
                for (size_t i = next.fetch_add(1); i < work.size(); i = next.fetch_add(1)) {
                    run_item(i);
                }
            });
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }

    for (const auto& f : summary.files) {
        if (f.success) ++summary.converted;
        else ++summary.failed;
    }

    utils::log::info(std::format("Batch finished: {} converted, {} failed in {}ms",
                                 summary.converted, summary.failed, timer.elapsed_ms().count()));
    return summary;
}

} // namespace ddlbridge
