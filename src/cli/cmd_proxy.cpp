/*
 * latbench/src/cli/cmd_proxy.cpp
 *
 * `latbench proxy`: latency of an IP echo endpoint through regional proxy gateways.
 */

#include "suite_runner.h"

#include <latbench/catalog/proxy_catalog.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace latbench::cli {

void registerProxyCommand(CLI::App& app, CliContext& ctx) {
    auto* sub = app.add_subcommand(
        "proxy", "Benchmark an IP echo endpoint through regional proxies (one target per region "
                 "or region/country).");

    auto run = std::make_shared<RunOpts>();
    auto opts = std::make_shared<ProxyOpts>();

    addRunOptions(*sub, *run);
    sub->add_option("--url", opts->url, "Probe URL (default: https://ipinfo.io/json).");
    sub->add_option("--regions", opts->regions, "Region codes (default: na eu as).");
    sub->add_option("--countries", opts->countries,
                    "Country codes; one target per region/country pair.");
    sub->add_option("--proxy-template", opts->proxyTemplate,
                    "Proxy host template with {region}, e.g. gw.{region}.example.net:9999.");
    sub->add_option("--auth-template", opts->authTemplate,
                    "Proxy credentials 'user:password'; the user may contain {country}.");

    sub->callback([&ctx, run, opts]() {
        applyLogging(ctx);

        auto cfg = resolveConfig(config::Suite::Proxy, *run);
        if (!cfg) {
            spdlog::error("{}", cfg.error().message);
            ctx.exitCode = kExitConfigError;
            return;
        }
        auto& c = cfg.value();
        if (opts->url)
            c.proxy.probeUrl = *opts->url;
        if (!opts->regions.empty())
            c.proxy.regions = opts->regions;
        if (!opts->countries.empty())
            c.proxy.countries = opts->countries;
        if (opts->proxyTemplate)
            c.proxy.proxyTemplate = *opts->proxyTemplate;
        if (opts->authTemplate)
            c.proxy.authTemplate = *opts->authTemplate;

        if (c.proxy.proxyTemplate.empty()) {
            spdlog::warn("No proxy template configured; probing {} directly", c.proxy.probeUrl);
        }

        auto targets = catalog::makeProxyTargets(c.proxy);
        for (const auto& t : targets) {
            spdlog::debug("Target {} ({})", t.id, t.label);
        }
        ctx.exitCode = runSuite(config::Suite::Proxy, c, std::move(targets), *run, ctx);
    });
}

} // namespace latbench::cli
