#pragma once

#include "config/config_types.hpp"

#include <toml.hpp>

#include <string>
#include <vector>

namespace ddlbridge {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        BridgeConfig config;

        static LoadResult ok(BridgeConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to ddlbridge.toml
     * @return LoadResult with parsed config or error
     *
     * Supports ${ENV_VAR} expansion in string values and
     * include = "other.toml" / include = [...] directives, resolved
     * relative to the including file (main file wins on conflicts).
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content (include directives are not resolved)
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Validate a config, collecting every problem
     * @return Error messages (empty = valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const BridgeConfig& config);

private:
    static InputConfig extract_input(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root);
    static ConversionConfig extract_conversion(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static BridgeConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(BridgeConfig config);
};

} // namespace ddlbridge
