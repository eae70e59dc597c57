#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace ddlbridge {

static constexpr std::string_view kInclude = "include";
static constexpr std::string_view kRoot    = "root";
static constexpr int kMaxIncludeDepth      = 10;

// ============================================================================
// Document loading: includes, env substitution
// ============================================================================

namespace {

// "${NAME}" -> value of NAME; unset variables become ""
std::string substitute_env(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    for (size_t open = text.find("${"); open != std::string::npos; open = text.find("${", pos)) {
        const size_t close = text.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(text, pos, open - pos);
        const std::string name = text.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

void substitute_env(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = substitute_env(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) substitute_env(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) substitute_env(child);
    }
}

// Nested tables merge key by key; anything else in `top` replaces `bottom`
void overlay(toml::table& bottom, const toml::table& top) {
    for (const auto& [key, value] : top) {
        auto* nested = bottom.get_as<toml::table>(key.str());
        if (nested && value.is_table()) {
            overlay(*nested, *value.as_table());
        } else {
            bottom.insert_or_assign(key, value);
        }
    }
}

std::vector<std::string> include_list(const toml::table& doc) {
    std::vector<std::string> names;
    const auto node = doc[kInclude];
    if (const auto* single = node.as_string()) {
        names.push_back(single->get());
    } else if (const auto* many = node.as_array()) {
        for (const auto& item : *many) {
            if (const auto* name = item.as_string()) names.push_back(name->get());
        }
    }
    return names;
}

/**
 * @brief Parse a config file and fold in its includes, depth-first
 *
 * Each included document is layered under the including one, so the
 * including file wins. `chain` holds the canonical paths currently open.
 */
toml::table load_document(const std::filesystem::path& file,
                          std::unordered_set<std::string>& chain, int depth) {
    namespace fs = std::filesystem;
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    const std::string canonical = fs::canonical(file).string();
    if (!chain.insert(canonical).second) {
        throw std::runtime_error(std::format("Circular config include: {}", canonical));
    }

    toml::table doc = toml::parse_file(canonical);
    const auto includes = include_list(doc);
    doc.erase(kInclude);

    toml::table merged;
    for (const auto& name : includes) {
        overlay(merged, load_document(fs::path(canonical).parent_path() / name, chain, depth + 1));
    }
    overlay(merged, doc);

    chain.erase(canonical);
    return merged;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extraction ----------------------------------------------------

InputConfig ConfigLoader::extract_input(const toml::table& root) {
    InputConfig cfg;
    const auto* input = root["input"].as_table();
    if (!input) return cfg;
    const auto& in = *input;

    cfg.root = in[kRoot].value_or(cfg.root);
    cfg.table_dir = in["table_dir"].value_or(cfg.table_dir);
    cfg.sequence_dir = in["sequence_dir"].value_or(cfg.sequence_dir);
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& out = *output;

    cfg.root = out[kRoot].value_or(cfg.root);
    cfg.report_suffix = out["report_suffix"].value_or(cfg.report_suffix);
    return cfg;
}

ConversionConfig ConfigLoader::extract_conversion(const toml::table& root) {
    ConversionConfig cfg;
    const auto* conversion = root["conversion"].as_table();
    if (!conversion) return cfg;
    const auto& c = *conversion;

    // Out-of-range values are kept as-is and rejected by validate_config()
    const auto workers = c["workers"].value_or(int64_t{1});
    cfg.workers = (workers < 0) ? 0u : static_cast<uint32_t>(std::min<int64_t>(workers, 1 << 20));
    cfg.validate_output = c["validate_output"].value_or(true);
    cfg.sequence_suffix = c["sequence_suffix"].value_or(cfg.sequence_suffix);
    cfg.max_timestamp_precision = static_cast<int>(
        std::clamp<int64_t>(c["max_timestamp_precision"].value_or(int64_t{6}), -1, 100));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

BridgeConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    BridgeConfig config;
    config.input = extract_input(tbl);
    config.output = extract_output(tbl);
    config.conversion = extract_conversion(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(BridgeConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        std::unordered_set<std::string> chain;
        auto tbl = load_document(config_path, chain, 0);
        substitute_env(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        substitute_env(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const BridgeConfig& config) {
    std::vector<std::string> errors;

    if (config.input.root.empty()) {
        errors.emplace_back("input.root must not be empty");
    }
    if (config.output.root.empty()) {
        errors.emplace_back("output.root must not be empty");
    }
    if (!config.input.root.empty() && !config.output.root.empty()) {
        namespace fs = std::filesystem;
        const auto in = fs::weakly_canonical(fs::absolute(config.input.root));
        const auto out = fs::weakly_canonical(fs::absolute(config.output.root));
        if (in == out) {
            errors.push_back(std::format("output.root must differ from input.root ({})",
                                         config.input.root));
        }
    }
    if (config.input.table_dir.empty()) {
        errors.emplace_back("input.table_dir must not be empty");
    }
    if (config.output.report_suffix.empty()) {
        errors.emplace_back("output.report_suffix must not be empty");
    }

    if (config.conversion.sequence_suffix.empty()) {
        errors.emplace_back("conversion.sequence_suffix must not be empty");
    }

    if (!utils::in_range<1, 64>(config.conversion.workers)) {
        errors.push_back(std::format("conversion.workers must be 1-64, got {}",
                                     config.conversion.workers));
    }
    if (!utils::in_range<0, 6>(config.conversion.max_timestamp_precision)) {
        errors.push_back(std::format("conversion.max_timestamp_precision must be 0-6, got {}",
                                     config.conversion.max_timestamp_precision));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    return errors;
}

} // namespace ddlbridge
