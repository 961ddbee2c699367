#include <latbench/catalog/serp_catalog.h>
#include <latbench/cli/commands.h>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace latbench::cli {

namespace {

std::string describeQuery(const std::vector<bench::QueryParam>& params) {
    std::string out;
    for (const auto& p : params) {
        if (!out.empty())
            out += " ";
        out += p.name + "=" + p.value;
    }
    return out;
}

} // namespace

void registerEnginesCommand(CLI::App& app, CliContext& ctx) {
    auto* sub = app.add_subcommand("engines", "List the SERP engine catalog and default queries.");
    auto emitJson = std::make_shared<bool>(false);
    sub->add_flag("--json", *emitJson, "Emit the catalog as JSON.");

    sub->callback([&ctx, emitJson]() {
        applyLogging(ctx);
        if (*emitJson) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& engine : catalog::serpEngines()) {
                nlohmann::json params = nlohmann::json::object();
                for (const auto& p : catalog::engineQuery(engine)) {
                    params[p.name] = p.value;
                }
                arr.push_back({{"engine", engine}, {"params", params}});
            }
            fmt::print("{}\n", arr.dump(2));
        } else {
            for (const auto& engine : catalog::serpEngines()) {
                fmt::print("{:<18} {}\n", engine, describeQuery(catalog::engineQuery(engine)));
            }
        }
        ctx.exitCode = kExitOk;
    });
}

} // namespace latbench::cli
