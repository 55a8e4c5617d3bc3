#include "match_command.hpp"

#include "normxcorr/config/configuration.hpp"
#include "normxcorr/correlation/matcher.hpp"
#include "normxcorr/io/image_io.hpp"
#include "normxcorr/pipeline/match_runner.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << normxcorr::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// default-config
// ============================================================================
int cmd_default_config() {
    normxcorr::config::Config cfg;
    std::cout << cfg.to_yaml() << std::endl;
    return 0;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    std::string yaml_text;
    if (path.empty()) {
        yaml_text = use_stdin ? read_stdin() : yaml_arg;
    }

    json result;
    result["errors"] = normxcorr::config::check_config(path, yaml_text);
    result["valid"] = result["errors"].empty();
    if (!path.empty()) result["path"] = path;

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// compare <a> <b> [--config P]
// ============================================================================
int cmd_compare(const std::string& a_path, const std::string& b_path, const std::string& config_path) {
    json result;
    result["a"] = a_path;
    result["b"] = b_path;
    try {
        normxcorr::config::Config cfg;
        if (!config_path.empty()) {
            cfg = normxcorr::config::Config::load(config_path);
        }
        cfg.validate();

        const auto reduction = normxcorr::io::string_to_channel_reduction(cfg.input.channel_reduction);
        const auto a = normxcorr::io::load_raster(a_path, reduction, cfg.input.fits_full_scale);
        const auto b = normxcorr::io::load_raster(b_path, reduction, cfg.input.fits_full_scale);
        const double score = normxcorr::correlation::similarity_score(
            a, b, normxcorr::pipeline::make_correlation_options(cfg));
        result["score"] = score;
    } catch (const std::exception& e) {
        result["error"] = e.what();
        print_json(result);
        return 1;
    }
    print_json(result);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: normxcorr_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  match <template> <search> [--config P] [--out DIR] [--run-id ID]\n"
              << "                                  Locate template in search image\n"
              << "  compare <a> <b> [--config P]    Similarity score of two equal-sized images\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate config\n"
              << "  default-config                  Print default config YAML\n"
              << "  get-schema                      Print JSON schema for config\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "default-config") {
        return cmd_default_config();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 2;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "match") {
        std::string template_path = get_positional(0);
        std::string search_path = get_positional(1);
        if (template_path.empty() || search_path.empty()) {
            std::cerr << "match requires <template> and <search> arguments\n";
            return 2;
        }
        return run_match_command(template_path, search_path, get_arg("--config", "-c"),
                                 get_arg("--out", "-o"), get_arg("--run-id"));
    }

    if (command == "compare") {
        std::string a_path = get_positional(0);
        std::string b_path = get_positional(1);
        if (a_path.empty() || b_path.empty()) {
            std::cerr << "compare requires two image arguments\n";
            return 2;
        }
        return cmd_compare(a_path, b_path, get_arg("--config", "-c"));
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
