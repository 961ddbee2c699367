#pragma once

#include <memory>
#include <string>

#include <latbench/bench/http_transport.h>

namespace CLI {
class App;
}

namespace latbench::cli {

// Process exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitConfigError = 2;

/**
 * Shared state between the command callbacks and main(). Subcommand callbacks cannot return a
 * value through CLI11, so they store the exit code here.
 */
struct CliContext {
    int exitCode{kExitOk};
    // Transport used for runs; null means the libcurl transport.
    std::shared_ptr<bench::IHttpTransport> transport;

    // Global logging flags
    std::string logLevel{"info"};
    bool verbose{false};
    bool quiet{false};
};

/// Global logging flags: --log-level, -v/--verbose, --quiet.
void registerLoggingOptions(CLI::App& app, CliContext& ctx);

/// Route the default spdlog logger to stderr. Idempotent.
void useStderrLogger();

/// Apply the logging flags to spdlog (called at the start of every command).
void applyLogging(const CliContext& ctx);

void registerSerpCommand(CLI::App& app, CliContext& ctx);
void registerProxyCommand(CLI::App& app, CliContext& ctx);
void registerEnginesCommand(CLI::App& app, CliContext& ctx);

/// Register every latbench subcommand.
void registerCommands(CLI::App& app, CliContext& ctx);

} // namespace latbench::cli
