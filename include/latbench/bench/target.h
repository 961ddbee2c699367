#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <latbench/bench/http_transport.h>
#include <latbench/bench/response_classifier.h>

namespace latbench::bench {

/**
 * One logical target to benchmark: an endpoint plus the parameters and rules that make it a
 * distinct row in the summary. Immutable once the work queue has been expanded.
 */
struct TargetDescriptor {
    std::string id;
    std::string label; // human readable, defaults to id
    std::string endpoint;
    std::vector<QueryParam> query;
    std::vector<Header> headers;
    std::optional<std::string> proxy;

    std::optional<std::chrono::milliseconds> connectTimeout;
    std::optional<std::chrono::milliseconds> readTimeout;
    std::optional<std::size_t> requestCount;

    // Query parameter that receives a per-request uniqueness token (disables caching).
    std::optional<std::string> cacheBusterParam;

    ValidationRules rules;
    // Top-level body fields copied into RequestOutcome::extracted after timing.
    std::vector<std::string> extractFields;
};

/**
 * One scheduled request. Items are handed to the dispatcher exactly once.
 */
struct WorkItem {
    std::shared_ptr<const TargetDescriptor> target;
    std::size_t sequence{0};     // 1-based within the target
    std::size_t requestIndex{0}; // 1-based within the run
    std::vector<QueryParam> params;
};

using TokenSource = std::function<std::string(std::size_t requestIndex)>;

/// "<epoch seconds>_<requestIndex>", unique per request within a run.
std::string defaultUniquenessToken(std::size_t requestIndex);

/**
 * Expand targets into the flat, ordered work queue: target by target, sequence 1..N where N is
 * the target's requestCount or defaultCount.
 */
std::vector<WorkItem> expandWorkQueue(const std::vector<TargetDescriptor>& targets,
                                      std::size_t defaultCount,
                                      const TokenSource& tokenSource = defaultUniquenessToken);

/// Effective policy for a target (per-target timeout overrides applied).
ConnectionPolicy effectivePolicy(const ConnectionPolicy& base, const TargetDescriptor& target);

/// Resolve a work item to the request the transport will send.
RequestSpec toRequestSpec(const WorkItem& item);

} // namespace latbench::bench
