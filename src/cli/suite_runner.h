#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <latbench/cli/commands.h>
#include <latbench/config/bench_config.h>

namespace CLI {
class App;
}

namespace latbench::cli {

/// Options shared by `serp` and `proxy`. Unset optionals leave lower layers untouched.
struct RunOpts {
    std::optional<std::size_t> concurrency;
    std::optional<double> rate;
    std::optional<double> connectTimeoutSec;
    std::optional<double> readTimeoutSec;
    std::optional<std::size_t> requests;
    bool noCsv{false};
    std::optional<std::size_t> batchSize;
    std::optional<std::string> outputDir;
    std::optional<double> progressIntervalSec;
    std::optional<std::string> configPath;
    bool emitJson{false};
};

struct SerpOpts {
    std::vector<std::string> engines;
    std::optional<std::string> endpoint;
};

struct ProxyOpts {
    std::optional<std::string> url;
    std::vector<std::string> regions;
    std::vector<std::string> countries;
    std::optional<std::string> proxyTemplate;
    std::optional<std::string> authTemplate;
};

void addRunOptions(CLI::App& sub, RunOpts& opts);

/**
 * Resolve configuration (defaults, file, environment, flags) for a suite.
 * Fails with ErrorCode::ConfigurationError on a bad file or flag.
 */
Result<config::BenchConfig> resolveConfig(config::Suite suite, const RunOpts& opts);

/// Run one suite end to end and return the process exit code.
int runSuite(config::Suite suite, const config::BenchConfig& cfg,
             std::vector<bench::TargetDescriptor> targets, const RunOpts& opts,
             CliContext& ctx);

} // namespace latbench::cli
