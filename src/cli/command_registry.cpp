#include <latbench/cli/commands.h>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace latbench::cli {

namespace {
constexpr const char* kLoggerName = "latbench";
} // namespace

void useStderrLogger() {
    if (spdlog::default_logger()->name() == kLoggerName) {
        return;
    }
    // stdout carries the summary table or --json document
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(logger);
}

void registerLoggingOptions(CLI::App& app, CliContext& ctx) {
    app.add_option("--log-level", ctx.logLevel, "Log level")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_flag("-v,--verbose", ctx.verbose, "Enable debug logging");
    app.add_flag("--quiet", ctx.quiet, "Only log warnings and errors");
}

void applyLogging(const CliContext& ctx) {
    useStderrLogger();
    auto level = spdlog::level::from_str(ctx.logLevel);
    if (ctx.verbose) {
        level = spdlog::level::debug;
    } else if (ctx.quiet) {
        level = spdlog::level::warn;
    }
    spdlog::set_level(level);
}

void registerCommands(CLI::App& app, CliContext& ctx) {
    registerLoggingOptions(app, ctx);
    registerSerpCommand(app, ctx);
    registerProxyCommand(app, ctx);
    registerEnginesCommand(app, ctx);
    app.require_subcommand(1);
    app.fallthrough();
}

} // namespace latbench::cli
