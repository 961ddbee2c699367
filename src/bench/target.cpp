#include <latbench/bench/target.h>

#include <fmt/format.h>

namespace latbench::bench {

std::string defaultUniquenessToken(std::size_t requestIndex) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const double seconds = std::chrono::duration<double>(now).count();
    return fmt::format("{:.6f}_{}", seconds, requestIndex);
}

std::vector<WorkItem> expandWorkQueue(const std::vector<TargetDescriptor>& targets,
                                      std::size_t defaultCount, const TokenSource& tokenSource) {
    std::size_t total = 0;
    for (const auto& t : targets) {
        total += t.requestCount.value_or(defaultCount);
    }

    std::vector<WorkItem> items;
    items.reserve(total);

    std::size_t index = 0;
    for (const auto& t : targets) {
        auto shared = std::make_shared<const TargetDescriptor>(t);
        const std::size_t count = t.requestCount.value_or(defaultCount);
        for (std::size_t seq = 1; seq <= count; ++seq) {
            WorkItem item;
            item.target = shared;
            item.sequence = seq;
            item.requestIndex = ++index;
            item.params = t.query;
            if (t.cacheBusterParam && tokenSource) {
                item.params.push_back({*t.cacheBusterParam, tokenSource(item.requestIndex)});
            }
            items.push_back(std::move(item));
        }
    }
    return items;
}

ConnectionPolicy effectivePolicy(const ConnectionPolicy& base, const TargetDescriptor& target) {
    ConnectionPolicy p = base;
    if (target.connectTimeout)
        p.connectTimeout = *target.connectTimeout;
    if (target.readTimeout)
        p.readTimeout = *target.readTimeout;
    return p;
}

RequestSpec toRequestSpec(const WorkItem& item) {
    RequestSpec spec;
    spec.url = item.target->endpoint;
    spec.query = item.params;
    spec.headers = item.target->headers;
    spec.proxy = item.target->proxy;
    return spec;
}

} // namespace latbench::bench
