/**
 * dfy CLI - Common utilities and types
 */

#pragma once

#include <dfy/build_input.hpp>
#include <dfy/error.hpp>
#include <dfy/platform.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dfy::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr at a level matching the global flags.
 */
inline void configure_logging(const GlobalOptions& opts) {
    // stdout carries the rendered Dockerfile
    if (!spdlog::get("dfy")) {
        auto logger = spdlog::stderr_color_mt("dfy");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are logged immediately.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else {
            spdlog::warn("{}", msg);
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
}

/**
 * Output utilities.
 */
inline void print_error(const dfy::Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = dfy::error_code_to_string(error.code());
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.message() << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Read a build description file ("-" reads stdin) and parse it.
 * Parser warnings go to the warning collector.
 */
inline dfy::Result<dfy::BuildDescription> load_description(const std::string& input) {
    std::string content;
    if (input == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        auto file = dfy::read_file(input);
        if (!file) {
            return dfy::Result<dfy::BuildDescription>::err(
                dfy::Error(dfy::ErrorCode::IO_ERROR, "failed to read input file: " + input));
        }
        content = std::move(*file);
    }

    auto parsed = dfy::parse_build_input(content);
    for (const auto& warning : parsed.warnings) {
        get_warning_collector().add(warning);
    }
    if (!parsed.ok) {
        return dfy::Result<dfy::BuildDescription>::err(dfy::Error(parsed.error_code, parsed.error));
    }

    if (!parsed.description.image.empty()) {
        spdlog::info("building image {}", parsed.description.image);
    }
    spdlog::debug("loaded {} named stage(s) from {}", parsed.description.stages.size(), input);

    return dfy::Result<dfy::BuildDescription>::ok(std::move(parsed.description));
}

} // namespace dfy::cli
