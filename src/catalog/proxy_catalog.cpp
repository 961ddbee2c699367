#include <latbench/catalog/proxy_catalog.h>

namespace latbench::catalog {

namespace {

std::string replaceAll(std::string s, std::string_view token, std::string_view value) {
    std::size_t pos = 0;
    while ((pos = s.find(token, pos)) != std::string::npos) {
        s.replace(pos, token.size(), value);
        pos += value.size();
    }
    return s;
}

bench::TargetDescriptor probeTarget(const ProxySuiteOptions& options, const std::string& region,
                                    const std::string& country) {
    bench::TargetDescriptor t;
    t.id = country.empty() ? region : region + "/" + country;
    t.label = country.empty() ? regionLabel(region) : regionLabel(region) + " " + country;
    t.endpoint = options.probeUrl;
    t.proxy = buildProxyUrl(options, region, country);
    t.rules = bench::jsonObjectRules();
    t.extractFields = {"ip", "country"};
    return t;
}

} // namespace

std::string regionLabel(std::string_view region) {
    if (region == "na")
        return "Americas";
    if (region == "eu")
        return "Europe";
    if (region == "as")
        return "Asia";
    return std::string(region);
}

std::optional<std::string> buildProxyUrl(const ProxySuiteOptions& options, std::string_view region,
                                         std::string_view country) {
    if (options.proxyTemplate.empty()) {
        return std::nullopt;
    }

    std::string host = replaceAll(options.proxyTemplate, "{region}", region);
    if (options.authTemplate.empty()) {
        return "http://" + host;
    }

    std::string user = options.authTemplate;
    std::string password;
    if (auto colon = options.authTemplate.find(':'); colon != std::string::npos) {
        user = options.authTemplate.substr(0, colon);
        password = options.authTemplate.substr(colon + 1);
    }
    user = replaceAll(user, "{country}", country);

    return "http://" + user + ":" + password + "@" + host;
}

std::vector<bench::TargetDescriptor> makeProxyTargets(const ProxySuiteOptions& options) {
    std::vector<bench::TargetDescriptor> targets;
    for (const auto& region : options.regions) {
        if (options.countries.empty()) {
            targets.push_back(probeTarget(options, region, {}));
            continue;
        }
        for (const auto& country : options.countries) {
            targets.push_back(probeTarget(options, region, country));
        }
    }
    return targets;
}

} // namespace latbench::catalog
