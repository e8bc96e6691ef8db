/**
 * dfy CLI - check command
 *
 * Validate copy references and print the order stages will be emitted in.
 */

#include "../common.hpp"
#include <dfy/dockerfile.hpp>
#include <CLI/CLI.hpp>

namespace dfy::cli::commands {

namespace {

struct CheckOptions {
    std::string input;
};

std::string display_name(const std::string& name) {
    return name.empty() ? "(final)" : name;
}

std::string join_names(const std::vector<std::string>& names) {
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) result += ", ";
        result += display_name(name);
    }
    return result;
}

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json);

    auto description = load_description(check_opts.input);
    if (description.isErr()) {
        print_error(description.error(), opts.json);
        return 1;
    }

    auto plan = dfy::plan_stages(description.value());
    if (plan.isErr()) {
        print_error(plan.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json stages = nlohmann::json::array();
        for (const auto& stage : plan.value()) {
            nlohmann::json s;
            s["name"] = stage.name;
            s["final"] = stage.name.empty();
            s["dependents"] = stage.dependents;
            s["dependencies"] = stage.dependencies;
            stages.push_back(s);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["stages"] = stages;
        output_json(j);
        return 0;
    }

    if (opts.quiet) {
        return 0;
    }

    size_t index = 1;
    for (const auto& stage : plan.value()) {
        std::cout << index++ << ". " << display_name(stage.name);
        if (!stage.dependencies.empty()) {
            std::cout << "  copies from: " << join_names(stage.dependencies);
        }
        if (!stage.dependents.empty()) {
            std::cout << "  used by: " << join_names(stage.dependents);
        }
        std::cout << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;
    app->add_option("input", check_opts.input, "Build description JSON (or - for stdin)")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace dfy::cli::commands
