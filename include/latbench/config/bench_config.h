#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <latbench/bench/benchmark_runner.h>
#include <latbench/catalog/proxy_catalog.h>
#include <latbench/catalog/serp_catalog.h>
#include <latbench/config/config_helpers.h>
#include <latbench/core/types.h>

namespace latbench::config {

struct OutputSettings {
    std::filesystem::path baseDir{"."};
    bool detailedCsv{true};
    bool jsonSummary{true};
};

/// Per-suite values that take precedence over [run] when set.
struct SuiteOverrides {
    std::optional<std::size_t> requests;
    std::optional<std::size_t> concurrency;
    std::optional<std::size_t> batchSize;
    std::optional<std::chrono::milliseconds> progressInterval;
};

enum class Suite { Serp, Proxy };

const char* suiteName(Suite suite) noexcept;

/**
 * Everything the CLI needs for a run. Filled in layers: built-in defaults, then the config
 * file, then the environment; command-line flags are applied last by the CLI.
 */
struct BenchConfig {
    bench::RunParameters run;
    catalog::SerpSuiteOptions serp;
    SuiteOverrides serpRun;
    catalog::ProxySuiteOptions proxy;
    SuiteOverrides proxyRun;
    OutputSettings output;
};

/// Built-in defaults. The proxy suite runs larger: 1000 requests per target at concurrency
/// 100, 2000-row detail batches and a 30 s progress interval.
BenchConfig defaultBenchConfig();

/// [run] parameters with the suite's overrides applied; category is the suite name.
bench::RunParameters runParametersFor(const BenchConfig& config, Suite suite);

/**
 * Apply a parsed config map. Recognized keys:
 *   [run]    concurrency, rate, connect_timeout, read_timeout, requests, detailed_csv,
 *            batch_size, progress_interval, verify_tls
 *   [serp]   endpoint, engines, api_key, requests, concurrency, batch_size, progress_interval
 *   [proxy]  url, proxy_template, auth_template, regions, countries, requests, concurrency,
 *            batch_size, progress_interval
 *   [output] dir, json
 * Timeouts and intervals are in (fractional) seconds. Unknown keys are ignored with a warning.
 */
Result<void> applyConfigMap(BenchConfig& config, const ConfigMap& values);

/// Load and apply a config file. A missing file is not an error unless `required`.
Result<void> applyConfigFile(BenchConfig& config, const std::filesystem::path& path,
                             bool required);

/// SERP_API_KEY and LATBENCH_OUTPUT_DIR.
void applyEnvironment(BenchConfig& config);

} // namespace latbench::config
