#include <latbench/config/bench_config.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <functional>
#include <unordered_map>

namespace latbench::config {

namespace {

using Setter = std::function<Result<void>(BenchConfig&, const std::string&)>;

Error keyError(const std::string& key, const Error& e) {
    return Error{ErrorCode::ConfigurationError, key + ": " + e.message};
}

Result<std::size_t> parseCount(const std::string& key, const std::string& raw) {
    auto v = parse_integer(raw);
    if (!v) {
        return keyError(key, v.error());
    }
    if (v.value() < 0) {
        return Error{ErrorCode::ConfigurationError, key + ": must not be negative"};
    }
    return static_cast<std::size_t>(v.value());
}

Result<std::chrono::milliseconds> parseSeconds(const std::string& key, const std::string& raw) {
    auto v = parse_double(raw);
    if (!v) {
        return keyError(key, v.error());
    }
    if (!std::isfinite(v.value()) || v.value() < 0.0) {
        return Error{ErrorCode::ConfigurationError, key + ": must be a non-negative duration"};
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(v.value() * 1000.0)));
}

Result<bool> parseFlag(const std::string& key, const std::string& raw) {
    auto v = parse_bool(raw);
    if (!v) {
        return keyError(key, v.error());
    }
    return v.value();
}

// Suite override setters shared by [serp] and [proxy].
void addSuiteSetters(std::unordered_map<std::string, Setter>& out, const std::string& section,
                     SuiteOverrides BenchConfig::*member) {
    out[section + ".requests"] = [section, member](BenchConfig& c,
                                                   const std::string& raw) -> Result<void> {
        auto v = parseCount(section + ".requests", raw);
        if (!v)
            return v.error();
        (c.*member).requests = v.value();
        return {};
    };
    out[section + ".concurrency"] = [section, member](BenchConfig& c,
                                                      const std::string& raw) -> Result<void> {
        auto v = parseCount(section + ".concurrency", raw);
        if (!v)
            return v.error();
        (c.*member).concurrency = v.value();
        return {};
    };
    out[section + ".batch_size"] = [section, member](BenchConfig& c,
                                                     const std::string& raw) -> Result<void> {
        auto v = parseCount(section + ".batch_size", raw);
        if (!v)
            return v.error();
        (c.*member).batchSize = v.value();
        return {};
    };
    out[section + ".progress_interval"] = [section, member](
                                              BenchConfig& c,
                                              const std::string& raw) -> Result<void> {
        auto v = parseSeconds(section + ".progress_interval", raw);
        if (!v)
            return v.error();
        (c.*member).progressInterval = v.value();
        return {};
    };
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = [] {
        std::unordered_map<std::string, Setter> t;

        // [run]
        t["run.concurrency"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseCount("run.concurrency", raw);
            if (!v)
                return v.error();
            c.run.concurrency = v.value();
            return {};
        };
        t["run.rate"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parse_double(raw);
            if (!v)
                return keyError("run.rate", v.error());
            c.run.ratePerSecond = v.value();
            return {};
        };
        t["run.connect_timeout"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseSeconds("run.connect_timeout", raw);
            if (!v)
                return v.error();
            c.run.connectTimeout = v.value();
            return {};
        };
        t["run.read_timeout"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseSeconds("run.read_timeout", raw);
            if (!v)
                return v.error();
            c.run.readTimeout = v.value();
            return {};
        };
        t["run.requests"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseCount("run.requests", raw);
            if (!v)
                return v.error();
            c.run.requestsPerTarget = v.value();
            return {};
        };
        t["run.detailed_csv"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseFlag("run.detailed_csv", raw);
            if (!v)
                return v.error();
            c.run.detailedLogging = v.value();
            c.output.detailedCsv = v.value();
            return {};
        };
        t["run.batch_size"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseCount("run.batch_size", raw);
            if (!v)
                return v.error();
            c.run.batchSize = v.value();
            return {};
        };
        t["run.progress_interval"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseSeconds("run.progress_interval", raw);
            if (!v)
                return v.error();
            c.run.progressInterval = v.value();
            return {};
        };
        t["run.verify_tls"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseFlag("run.verify_tls", raw);
            if (!v)
                return v.error();
            c.run.verifyTls = v.value();
            return {};
        };

        // [serp]
        t["serp.endpoint"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.serp.endpoint = raw;
            return {};
        };
        t["serp.engines"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.serp.engines = parse_list(raw);
            return {};
        };
        t["serp.api_key"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.serp.apiKey = raw;
            return {};
        };
        addSuiteSetters(t, "serp", &BenchConfig::serpRun);

        // [proxy]
        t["proxy.url"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.proxy.probeUrl = raw;
            return {};
        };
        t["proxy.proxy_template"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.proxy.proxyTemplate = raw;
            return {};
        };
        t["proxy.auth_template"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.proxy.authTemplate = raw;
            return {};
        };
        t["proxy.regions"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.proxy.regions = parse_list(raw);
            return {};
        };
        t["proxy.countries"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.proxy.countries = parse_list(raw);
            return {};
        };
        addSuiteSetters(t, "proxy", &BenchConfig::proxyRun);

        // [output]
        t["output.dir"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            c.output.baseDir = expand_tilde(raw);
            return {};
        };
        t["output.json"] = [](BenchConfig& c, const std::string& raw) -> Result<void> {
            auto v = parseFlag("output.json", raw);
            if (!v)
                return v.error();
            c.output.jsonSummary = v.value();
            return {};
        };
        return t;
    }();
    return table;
}

} // namespace

const char* suiteName(Suite suite) noexcept {
    switch (suite) {
        case Suite::Serp:
            return "serp";
        case Suite::Proxy:
            return "proxy";
    }
    return "benchmark";
}

BenchConfig defaultBenchConfig() {
    BenchConfig c;
    c.proxyRun.requests = 1000;
    c.proxyRun.concurrency = 100;
    c.proxyRun.batchSize = 2000;
    c.proxyRun.progressInterval = std::chrono::seconds(30);
    return c;
}

bench::RunParameters runParametersFor(const BenchConfig& config, Suite suite) {
    bench::RunParameters p = config.run;
    p.category = suiteName(suite);
    p.detailedLogging = config.output.detailedCsv && config.run.detailedLogging;

    const SuiteOverrides& o = suite == Suite::Serp ? config.serpRun : config.proxyRun;
    if (o.requests)
        p.requestsPerTarget = *o.requests;
    if (o.concurrency)
        p.concurrency = *o.concurrency;
    if (o.batchSize)
        p.batchSize = *o.batchSize;
    if (o.progressInterval)
        p.progressInterval = *o.progressInterval;
    return p;
}

Result<void> applyConfigMap(BenchConfig& config, const ConfigMap& values) {
    const auto& table = setters();
    for (const auto& [key, raw] : values) {
        auto it = table.find(key);
        if (it == table.end()) {
            spdlog::warn("[Config] Ignoring unknown key '{}'", key);
            continue;
        }
        if (auto r = it->second(config, raw); !r) {
            return r;
        }
    }
    return {};
}

Result<void> applyConfigFile(BenchConfig& config, const std::filesystem::path& path,
                             bool required) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::ConfigurationError, "Config file not found: " + path.string()};
        }
        spdlog::debug("[Config] No config file at {}", path.string());
        return {};
    }

    auto parsed = parse_config_file(path);
    if (!parsed) {
        return Error{ErrorCode::ConfigurationError, parsed.error().message};
    }
    spdlog::debug("[Config] Loaded {} keys from {}", parsed.value().size(), path.string());
    return applyConfigMap(config, parsed.value());
}

void applyEnvironment(BenchConfig& config) {
    if (const char* key = std::getenv("SERP_API_KEY"); key && *key) {
        config.serp.apiKey = key;
    }
    if (const char* dir = std::getenv("LATBENCH_OUTPUT_DIR"); dir && *dir) {
        config.output.baseDir = expand_tilde(dir);
    }
}

} // namespace latbench::config
