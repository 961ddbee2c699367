#include <latbench/cli/commands.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <exception>

int main(int argc, char* argv[]) {
    try {
        latbench::cli::useStderrLogger();
        spdlog::set_level(spdlog::level::info);

        CLI::App app{"HTTP latency benchmark harness", "latbench"};
        app.set_version_flag("--version", "1.0.0");

        latbench::cli::CliContext ctx;
        latbench::cli::registerCommands(app, ctx);

        CLI11_PARSE(app, argc, argv);
        return ctx.exitCode;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return latbench::cli::kExitFailure;
    }
}
