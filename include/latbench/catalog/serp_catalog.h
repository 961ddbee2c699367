#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <latbench/bench/target.h>

namespace latbench::catalog {

inline constexpr const char* kDefaultSerpEndpoint = "https://serpapi.com/search.json";

/// Every engine the SERP suite knows, in catalog order.
const std::vector<std::string>& serpEngines();

bool isKnownEngine(std::string_view engine);

/// Engine-specific query parameters ("q" for most engines, structured for google_flights).
/// Unknown engines get q=test.
std::vector<bench::QueryParam> engineQuery(std::string_view engine);

struct SerpSuiteOptions {
    std::string endpoint{kDefaultSerpEndpoint};
    std::string apiKey;
    std::vector<std::string> engines; // empty = full catalog
};

/// One target per engine: api_key, engine, no_cache=true, the engine query and a per-request
/// `timestamp` uniqueness token, validated with serpApiRules().
std::vector<bench::TargetDescriptor> makeSerpTargets(const SerpSuiteOptions& options);

} // namespace latbench::catalog
