#include "batch/batch_converter.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace ddlbridge;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFileFailed = 1;
constexpr int kExitConfigError = 2;

constexpr std::string_view kDefaultConfigFile = "ddlbridge.toml";

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [--config FILE] [PATH...]\n"
        "\n"
        "Converts T-SQL table DDL into PostgreSQL DDL.\n"
        "Each PATH is a table file or a directory; with no PATH the\n"
        "configured input root is converted.\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE   Configuration file (default: {} if present)\n"
        "  -h, --help          Show this help\n",
        argv0, kDefaultConfigFile);
}

struct CliArgs {
    std::string config_file;
    bool explicit_config = false;
    std::vector<std::filesystem::path> paths;
    bool help = false;
};

// Returns an error message on bad usage
std::string parse_args(int argc, char* argv[], CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) return std::format("{} requires a file argument", arg);
            args.config_file = argv[++i];
            args.explicit_config = true;
        } else if (arg.starts_with("--config=")) {
            args.config_file = std::string(arg.substr(9));
            args.explicit_config = true;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            return std::format("unknown option {}", arg);
        } else {
            args.paths.emplace_back(std::string(arg));
        }
    }
    return {};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        CliArgs args;
        if (const auto usage_error = parse_args(argc, argv, args); !usage_error.empty()) {
            utils::log::error(usage_error);
            print_usage(argv[0]);
            return kExitConfigError;
        }
        if (args.help) {
            print_usage(argv[0]);
            return kExitOk;
        }

        // Configuration
        BridgeConfig config;
        std::error_code ec;
        const std::string config_file = args.explicit_config
            ? args.config_file : std::string(kDefaultConfigFile);
        if (args.explicit_config || std::filesystem::exists(config_file, ec)) {
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitConfigError;
            }
            config = std::move(loaded.config);
        } else {
            const auto errors = ConfigLoader::validate_config(config);
            if (!errors.empty()) {
                for (const auto& err : errors) utils::log::error(err);
                return kExitConfigError;
            }
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::info(std::format("ddlbridge: {} -> {}",
            args.paths.empty() ? config.input.root : std::format("{} path(s)", args.paths.size()),
            config.output.root));

        // Convert
        const BatchConverter converter(std::move(config));
        const BatchSummary summary = converter.run(args.paths);

        for (const auto& f : summary.files) {
            if (!f.success) {
                std::cerr << std::format("FAILED {} [{}]: {}\n", f.source.string(),
                                         error_category_name(f.category), f.error);
            }
        }
        return summary.all_ok() ? kExitOk : kExitFileFailed;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFileFailed;
    }
}
