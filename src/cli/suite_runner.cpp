/*
 * latbench/src/cli/suite_runner.cpp
 *
 * Shared plumbing for the `serp` and `proxy` subcommands:
 * - Common run options (concurrency, rate, timeouts, output)
 * - Config layering: defaults -> config file -> environment -> flags
 * - Output directory, detail/summary writers and the console summary
 */

#include "suite_runner.h"

#include <latbench/bench/benchmark_runner.h>
#include <latbench/export/report_writers.h>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>

namespace latbench::cli {

namespace {

std::chrono::milliseconds secondsToMs(double s) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

void printSummaryTable(const std::vector<bench::SummaryRow>& rows) {
    fmt::print("\n{:<22} {:>8} {:>8} {:>9} {:>12} {:>12} {:>12} {:>10}\n", "target", "total",
               "success", "rate(%)", "mean(s)", "min(s)", "max(s)", "size(KB)");
    fmt::print("{}\n", std::string(100, '-'));
    for (const auto& r : rows) {
        fmt::print("{:<22} {:>8} {:>8} {:>9} {:>12} {:>12} {:>12} {:>10}\n", r.targetId,
                   r.totalRequests, r.successCount,
                   exporting::formatOptional(r.successRatePercent, 2),
                   exporting::formatOptional(r.meanLatencySeconds, 4),
                   exporting::formatOptional(r.minLatencySeconds, 4),
                   exporting::formatOptional(r.maxLatencySeconds, 4),
                   exporting::formatOptional(r.meanSizeKb, 2));
    }
    fmt::print("\n");
}

void logFailureReasons(const std::vector<bench::SummaryRow>& rows) {
    for (const auto& r : rows) {
        for (const auto& [reason, count] : r.failuresByReason) {
            spdlog::info("[{}] {} x {}", r.targetId, count, reason);
        }
    }
}

} // namespace

void addRunOptions(CLI::App& sub, RunOpts& opts) {
    sub.add_option("-c,--concurrency", opts.concurrency, "Maximum requests in flight.")
        ->check(CLI::Range(1, 10000));
    sub.add_option("--rate", opts.rate, "Requests per second across the run (0 = unlimited).")
        ->check(CLI::NonNegativeNumber);
    sub.add_option("--connect-timeout", opts.connectTimeoutSec, "Connect timeout in seconds.")
        ->check(CLI::PositiveNumber);
    sub.add_option("--read-timeout", opts.readTimeoutSec,
                   "Read timeout in seconds (after connect).")
        ->check(CLI::PositiveNumber);
    sub.add_option("-n,--requests", opts.requests, "Requests per target.");
    sub.add_flag("--no-csv", opts.noCsv, "Disable the detailed per-request CSV.");
    sub.add_option("--batch-size", opts.batchSize, "Detail rows per CSV flush.")
        ->check(CLI::Range(1, 1000000));
    sub.add_option("--output-dir", opts.outputDir, "Base directory for result folders.");
    sub.add_option("--progress-interval", opts.progressIntervalSec,
                   "Seconds between progress reports (0 disables).")
        ->check(CLI::NonNegativeNumber);
    sub.add_option("--config", opts.configPath, "Path to a latbench config.toml.");
    sub.add_flag("--json", opts.emitJson, "Print the summary as JSON to stdout.");
}

Result<config::BenchConfig> resolveConfig(config::Suite suite, const RunOpts& opts) {
    using namespace latbench::config;

    BenchConfig cfg = defaultBenchConfig();

    const bool explicitPath =
        opts.configPath.has_value() || (std::getenv("LATBENCH_CONFIG") != nullptr &&
                                        *std::getenv("LATBENCH_CONFIG") != '\0');
    const auto path = get_config_path(opts.configPath.value_or(""));
    if (auto r = applyConfigFile(cfg, path, explicitPath); !r) {
        return r.error();
    }

    applyEnvironment(cfg);

    // Flags
    SuiteOverrides& suiteRun = suite == Suite::Serp ? cfg.serpRun : cfg.proxyRun;
    if (opts.concurrency)
        suiteRun.concurrency = *opts.concurrency;
    if (opts.requests)
        suiteRun.requests = *opts.requests;
    if (opts.batchSize)
        suiteRun.batchSize = *opts.batchSize;
    if (opts.progressIntervalSec)
        suiteRun.progressInterval = secondsToMs(*opts.progressIntervalSec);
    if (opts.rate)
        cfg.run.ratePerSecond = *opts.rate;
    if (opts.connectTimeoutSec)
        cfg.run.connectTimeout = secondsToMs(*opts.connectTimeoutSec);
    if (opts.readTimeoutSec)
        cfg.run.readTimeout = secondsToMs(*opts.readTimeoutSec);
    if (opts.noCsv)
        cfg.output.detailedCsv = false;
    if (opts.outputDir)
        cfg.output.baseDir = expand_tilde(*opts.outputDir);

    return cfg;
}

int runSuite(config::Suite suite, const config::BenchConfig& cfg,
             std::vector<bench::TargetDescriptor> targets, const RunOpts& opts,
             CliContext& ctx) {
    const auto params = config::runParametersFor(cfg, suite);
    if (auto v = bench::validateRunParameters(params, targets); !v) {
        spdlog::error("{}", v.error().message);
        return kExitConfigError;
    }

    auto dir = exporting::makeDatedOutputDir(cfg.output.baseDir,
                                             fmt::format("{}_results", config::suiteName(suite)));
    if (!dir) {
        spdlog::error("{}", dir.error().message);
        return kExitFailure;
    }
    const auto outDir = dir.value();

    std::unique_ptr<exporting::CsvDetailWriter> detail;
    if (params.detailedLogging) {
        detail = std::make_unique<exporting::CsvDetailWriter>(outDir / exporting::kDetailFileName);
        if (auto r = detail->open(); !r) {
            spdlog::error("{}", r.error().message);
            return kExitFailure;
        }
    }

    exporting::MultiSummaryWriter summary;
    summary.add(
        std::make_unique<exporting::CsvSummaryWriter>(outDir / exporting::kSummaryCsvFileName));
    if (cfg.output.jsonSummary) {
        summary.add(std::make_unique<exporting::JsonSummaryWriter>(
            outDir / exporting::kSummaryJsonFileName));
    }

    spdlog::info("Output folder: {}", outDir.string());
    spdlog::info("Concurrency: {}, rate: {}, timeouts: connect {}ms / read {}ms",
                 params.concurrency,
                 params.ratePerSecond > 0.0 ? fmt::format("{:g}/s", params.ratePerSecond)
                                            : std::string("unlimited"),
                 params.connectTimeout.count(), params.readTimeout.count());

    auto transport = ctx.transport ? ctx.transport
                                   : std::shared_ptr<bench::IHttpTransport>(
                                         bench::makeCurlHttpTransport());
    bench::BenchmarkRunner runner(transport);

    auto onProgress = [](const bench::ProgressSnapshot& s) {
        const double pct = s.total ? 100.0 * static_cast<double>(s.completed) /
                                         static_cast<double>(s.total)
                                   : 100.0;
        spdlog::info("[Progress] {}/{} ({:.1f}%) in-flight={} successes={} elapsed={:.1f}s",
                     s.completed, s.total, pct, s.inFlight, s.successes, toSeconds(s.elapsed));
    };

    auto report = runner.run(targets, params, detail.get(), summary, onProgress);
    if (!report) {
        spdlog::error("Run failed: {}", report.error().message);
        return report.error().code == ErrorCode::ConfigurationError ? kExitConfigError
                                                                     : kExitFailure;
    }

    const auto& r = report.value();
    if (r.cleanupFailures > 0) {
        spdlog::warn("{} sessions failed to release cleanly", r.cleanupFailures);
    }
    if (r.detailFlushErrors > 0) {
        spdlog::warn("{} detail batches could not be written", r.detailFlushErrors);
    }

    if (opts.emitJson) {
        nlohmann::json out;
        out["category"] = params.category;
        out["wall_clock_s"] = toSeconds(r.wallClock);
        out["total_requests"] = r.totalRequests;
        out["output_dir"] = outDir.string();
        out["summaries"] = exporting::toJson(r.summaries);
        fmt::print("{}\n", out.dump(2));
    } else {
        printSummaryTable(r.summaries);
        logFailureReasons(r.summaries);
        spdlog::info("Total time: {:.2f}s for {} requests", toSeconds(r.wallClock),
                     r.totalRequests);
    }
    return kExitOk;
}

} // namespace latbench::cli
