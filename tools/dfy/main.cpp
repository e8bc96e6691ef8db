/**
 * dfy CLI - Entry Point
 *
 * Renders declarative build descriptions into Dockerfiles.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef DFY_VERSION
#define DFY_VERSION "unknown"
#endif

// Forward declarations for commands
namespace dfy::cli::commands {
    void setup_render(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace dfy::cli;

    CLI::App app{"dfy - render declarative build descriptions into Dockerfiles"};
    app.set_version_flag("-V,--version", DFY_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* render_cmd = app.add_subcommand("render", "Render a Dockerfile");
    commands::setup_render(render_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Validate stages and show their order");
    commands::setup_check(check_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
