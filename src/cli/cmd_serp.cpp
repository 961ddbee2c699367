/*
 * latbench/src/cli/cmd_serp.cpp
 *
 * `latbench serp`: latency of every SERP API engine over fresh HTTPS connections.
 * Requires SERP_API_KEY (or [serp] api_key in the config file).
 */

#include "suite_runner.h"

#include <latbench/catalog/serp_catalog.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace latbench::cli {

void registerSerpCommand(CLI::App& app, CliContext& ctx) {
    auto* sub = app.add_subcommand("serp", "Benchmark SERP API engines (one target per engine).");

    auto run = std::make_shared<RunOpts>();
    auto opts = std::make_shared<SerpOpts>();

    addRunOptions(*sub, *run);
    sub->add_option("--engines", opts->engines, "Engines to test (default: full catalog).");
    sub->add_option("--endpoint", opts->endpoint, "SERP API endpoint URL.");

    sub->callback([&ctx, run, opts]() {
        applyLogging(ctx);

        auto cfg = resolveConfig(config::Suite::Serp, *run);
        if (!cfg) {
            spdlog::error("{}", cfg.error().message);
            ctx.exitCode = kExitConfigError;
            return;
        }
        auto& c = cfg.value();
        if (!opts->engines.empty())
            c.serp.engines = opts->engines;
        if (opts->endpoint)
            c.serp.endpoint = *opts->endpoint;

        if (c.serp.apiKey.empty()) {
            spdlog::error("SERP_API_KEY is not set (environment or [serp] api_key)");
            ctx.exitCode = kExitConfigError;
            return;
        }
        for (const auto& engine : c.serp.engines) {
            if (!catalog::isKnownEngine(engine)) {
                spdlog::warn("Engine '{}' is not in the catalog; using the default query", engine);
            }
        }

        auto targets = catalog::makeSerpTargets(c.serp);
        spdlog::info("Engines to test: {}", targets.size());
        ctx.exitCode = runSuite(config::Suite::Serp, c, std::move(targets), *run, ctx);
    });

    sub->footer(R"(Notes:
  - Every request opens a fresh connection (no keep-alive) and carries no_cache=true plus a
    unique timestamp parameter, so cached answers never shorten the measured latency.
  - Results land in <output-dir>/serp_results_<date>/.)");
}

} // namespace latbench::cli
