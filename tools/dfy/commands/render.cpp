/**
 * dfy CLI - render command
 *
 * Render a build description into a Dockerfile.
 */

#include "../common.hpp"
#include <dfy/dockerfile.hpp>
#include <CLI/CLI.hpp>

namespace dfy::cli::commands {

namespace {

struct RenderOptions {
    std::string input;
    std::string output;
};

int cmd_render(const GlobalOptions& opts, const RenderOptions& render_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json);

    auto description = load_description(render_opts.input);
    if (description.isErr()) {
        print_error(description.error(), opts.json);
        return 1;
    }

    // Rendered in memory first so a failure never leaves a partial Dockerfile
    auto rendered = dfy::render_dockerfile(description.value());
    if (rendered.isErr()) {
        print_error(rendered.error(), opts.json);
        return 1;
    }
    const std::string& text = rendered.value();

    if (render_opts.output.empty()) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["dockerfile"] = text;
            if (!description.value().image.empty()) {
                j["image"] = description.value().image;
            }
            output_json(j);
        } else {
            std::cout << text;
            std::cout.flush();
            if (!std::cout) {
                print_error(dfy::Error(dfy::ErrorCode::WRITE_FAILED, "failed to write to stdout"), opts.json);
                return 1;
            }
        }
        return 0;
    }

    auto written = dfy::atomic_write_file(render_opts.output, text);
    if (written.isErr()) {
        print_error(written.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["output"] = render_opts.output;
        j["bytes"] = text.size();
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Rendered " << render_opts.output << " (" << text.size() << " bytes)" << std::endl;
    }

    return 0;
}

} // anonymous namespace

void setup_render(CLI::App* app, GlobalOptions& opts) {
    static RenderOptions render_opts;
    app->add_option("input", render_opts.input, "Build description JSON (or - for stdin)")->required();
    app->add_option("-o,--output", render_opts.output, "Write the Dockerfile here instead of stdout");

    app->callback([&opts]() {
        std::exit(cmd_render(opts, render_opts));
    });
}

} // namespace dfy::cli::commands
