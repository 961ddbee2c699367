#include <gtest/gtest.h>
#include <latbench/cli/commands.h>
#include <latbench/export/report_writers.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

#include "support/bench_fakes.h"
#include "support/temp_dir_scope.hpp"

using namespace latbench;
using namespace latbench::test_support;

namespace {

class CliCommandsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::setenv("XDG_CONFIG_HOME", tmp_.path().c_str(), 1);
        ::unsetenv("LATBENCH_CONFIG");
        ::unsetenv("SERP_API_KEY");
        ::unsetenv("LATBENCH_OUTPUT_DIR");

        transport_ = std::make_shared<ScriptedTransport>([](const bench::RequestSpec& spec) {
            SessionScript s;
            if (spec.url.find("serp") != std::string::npos) {
                s.response = jsonResponse(
                    200, R"({"search_metadata":{"status":"Success"},"organic_results":[{"t":1}]})");
            } else {
                s.response = jsonResponse(200, R"({"ip":"198.51.100.4","country":"NL"})");
            }
            return s;
        });
        ctx_.transport = transport_;
        cli::registerCommands(app_, ctx_);
    }

    void TearDown() override { ::unsetenv("XDG_CONFIG_HOME"); }

    void parse(const std::string& args) { app_.parse(args, false); }

    std::filesystem::path onlyResultDir() const {
        std::filesystem::path found;
        for (const auto& entry : std::filesystem::directory_iterator(outDir())) {
            if (entry.is_directory()) {
                found = entry.path();
            }
        }
        return found;
    }

    std::filesystem::path outDir() const { return tmp_.path() / "out"; }

    TempDirScope tmp_{TempDirScope::unique_under("latbench-cli")};
    std::shared_ptr<ScriptedTransport> transport_;
    cli::CliContext ctx_;
    CLI::App app_{"latbench test", "latbench"};
};

} // namespace

TEST_F(CliCommandsTest, ProxyRunWritesReports) {
    parse("proxy --regions eu as --requests 2 --concurrency 2 --progress-interval 0 "
          "--proxy-template gw.{region}.example:1 --output-dir " +
          outDir().string());
    EXPECT_EQ(ctx_.exitCode, cli::kExitOk);
    EXPECT_EQ(transport_->opened(), 4u);

    for (const auto& req : transport_->requests()) {
        ASSERT_TRUE(req.proxy.has_value());
        EXPECT_NE(req.proxy->find(".example:1"), std::string::npos);
    }

    auto dir = onlyResultDir();
    ASSERT_FALSE(dir.empty());
    EXPECT_EQ(dir.filename().string().rfind("proxy_results_", 0), 0u);
    EXPECT_TRUE(std::filesystem::exists(dir / exporting::kDetailFileName));
    EXPECT_TRUE(std::filesystem::exists(dir / exporting::kSummaryCsvFileName));
    EXPECT_TRUE(std::filesystem::exists(dir / exporting::kSummaryJsonFileName));
}

TEST_F(CliCommandsTest, NoCsvSkipsDetailFile) {
    parse("proxy --regions na --requests 1 --no-csv --progress-interval 0 --output-dir " +
          outDir().string());
    EXPECT_EQ(ctx_.exitCode, cli::kExitOk);
    auto dir = onlyResultDir();
    ASSERT_FALSE(dir.empty());
    EXPECT_FALSE(std::filesystem::exists(dir / exporting::kDetailFileName));
    EXPECT_TRUE(std::filesystem::exists(dir / exporting::kSummaryCsvFileName));
}

TEST_F(CliCommandsTest, JsonFlagKeepsStdoutParseable) {
    testing::internal::CaptureStdout();
    parse("proxy --regions eu --requests 2 --progress-interval 0 --json --output-dir " +
          outDir().string());
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(ctx_.exitCode, cli::kExitOk);

    auto doc = nlohmann::json::parse(out, nullptr, false);
    ASSERT_FALSE(doc.is_discarded()) << out;
    EXPECT_EQ(doc["category"], "proxy");
    EXPECT_EQ(doc["total_requests"], 2);
    ASSERT_EQ(doc["summaries"].size(), 1u);
    EXPECT_EQ(doc["summaries"][0]["success_count"], 2);
}

TEST_F(CliCommandsTest, SerpWithoutApiKeyIsConfigError) {
    parse("serp --engines google --requests 1 --output-dir " + outDir().string());
    EXPECT_EQ(ctx_.exitCode, cli::kExitConfigError);
    EXPECT_EQ(transport_->opened(), 0u);
}

TEST_F(CliCommandsTest, SerpSendsKeyAndEngine) {
    ::setenv("SERP_API_KEY", "test-key", 1);
    parse("serp --engines google bing --requests 1 --progress-interval 0 --endpoint "
          "https://serp.example/search.json --output-dir " +
          outDir().string());
    ::unsetenv("SERP_API_KEY");

    EXPECT_EQ(ctx_.exitCode, cli::kExitOk);
    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 2u);
    for (const auto& req : requests) {
        EXPECT_EQ(req.url, "https://serp.example/search.json");
        bool hasKey = false;
        for (const auto& q : req.query) {
            hasKey = hasKey || (q.name == "api_key" && q.value == "test-key");
        }
        EXPECT_TRUE(hasKey);
    }
}

TEST_F(CliCommandsTest, MissingExplicitConfigIsConfigError) {
    parse("proxy --config " + (tmp_.path() / "nope.toml").string() + " --output-dir " +
          outDir().string());
    EXPECT_EQ(ctx_.exitCode, cli::kExitConfigError);
    EXPECT_EQ(transport_->opened(), 0u);
}

TEST_F(CliCommandsTest, ConfigFileFeedsRun) {
    auto cfgPath = tmp_.path() / "bench.toml";
    {
        std::ofstream out(cfgPath);
        out << "[proxy]\nregions = [\"eu\"]\nrequests = 3\nprogress_interval = 0\n";
    }
    parse("proxy --config " + cfgPath.string() + " --output-dir " + outDir().string());
    EXPECT_EQ(ctx_.exitCode, cli::kExitOk);
    EXPECT_EQ(transport_->opened(), 3u);
}

TEST_F(CliCommandsTest, RejectsUnknownLogLevel) {
    EXPECT_THROW(parse("--log-level chatty engines"), CLI::ValidationError);
}

TEST_F(CliCommandsTest, RequiresSubcommand) {
    EXPECT_THROW(parse(""), CLI::RequiredError);
}
