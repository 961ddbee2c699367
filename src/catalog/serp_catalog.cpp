#include <latbench/catalog/serp_catalog.h>

#include <algorithm>
#include <map>

namespace latbench::catalog {

namespace {

const std::map<std::string, std::string, std::less<>>& simpleQueries() {
    static const std::map<std::string, std::string, std::less<>> queries = {
        {"google", "test query"},
        {"bing", "test query"},
        {"yahoo", "test query"},
        {"duckduckgo", "test query"},
        {"baidu", "\xE6\xB5\x8B\xE8\xAF\x95"},           // 测试
        {"yandex", "\xD1\x82\xD0\xB5\xD1\x81\xD1\x82"},   // тест
        {"naver", "\xED\x85\x8C\xEC\x8A\xA4\xED\x8A\xB8"}, // 테스트
        {"google_maps", "coffee shop"},
        {"google_scholar", "machine learning"},
        {"google_news", "technology"},
        {"google_shopping", "laptop"},
        {"google_images", "nature"},
        {"google_videos", "tutorial"},
        {"google_jobs", "software engineer"},
        {"google_patents", "artificial intelligence"},
        {"google_finance", "AAPL"},
        {"amazon", "laptop"},
        {"ebay", "laptop"},
        {"walmart", "laptop"},
        {"home_depot", "paint"},
        {"youtube", "python tutorial"},
        {"tiktok", "funny"},
        {"reddit", "technology"},
        {"apple_app_store", "instagram"},
        {"google_play", "instagram"},
        {"yelp", "restaurants"},
        {"tripadvisor", "hotels"},
        {"linkedin_jobs", "software engineer"},
        {"indeed", "software engineer"},
        {"glassdoor", "software engineer"},
    };
    return queries;
}

} // namespace

const std::vector<std::string>& serpEngines() {
    static const std::vector<std::string> engines = {
        // Major search engines
        "google", "bing", "yahoo", "duckduckgo", "baidu", "yandex", "naver",
        // Google verticals
        "google_maps", "google_scholar", "google_news", "google_shopping", "google_images",
        "google_videos", "google_jobs", "google_patents", "google_finance", "google_flights",
        // E-commerce
        "amazon", "ebay", "walmart", "home_depot",
        // Social and media
        "youtube", "tiktok", "reddit",
        // App stores
        "apple_app_store", "google_play",
        // Travel and reviews
        "yelp", "tripadvisor",
        // Jobs
        "linkedin_jobs", "indeed", "glassdoor"};
    return engines;
}

bool isKnownEngine(std::string_view engine) {
    const auto& all = serpEngines();
    return std::find(all.begin(), all.end(), engine) != all.end();
}

std::vector<bench::QueryParam> engineQuery(std::string_view engine) {
    if (engine == "google_flights") {
        return {{"departure_id", "SFO"}, {"arrival_id", "LAX"}, {"outbound_date", "2024-12-01"}};
    }
    const auto& queries = simpleQueries();
    auto it = queries.find(engine);
    return {{"q", it != queries.end() ? it->second : std::string("test")}};
}

std::vector<bench::TargetDescriptor> makeSerpTargets(const SerpSuiteOptions& options) {
    const auto& engines = options.engines.empty() ? serpEngines() : options.engines;

    std::vector<bench::TargetDescriptor> targets;
    targets.reserve(engines.size());
    for (const auto& engine : engines) {
        bench::TargetDescriptor t;
        t.id = engine;
        t.label = engine;
        t.endpoint = options.endpoint;
        t.query = {{"api_key", options.apiKey}, {"engine", engine}, {"no_cache", "true"}};
        for (auto& q : engineQuery(engine)) {
            t.query.push_back(std::move(q));
        }
        t.cacheBusterParam = "timestamp";
        t.rules = bench::serpApiRules();
        targets.push_back(std::move(t));
    }
    return targets;
}

} // namespace latbench::catalog
