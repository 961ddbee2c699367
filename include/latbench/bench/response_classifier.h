#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <latbench/bench/outcome.h>

namespace latbench::bench {

/**
 * Per-target validation rules. The classifier applies them in a fixed order:
 * transport error, HTTP status, body parse, required metadata, reported error, empty result.
 * Empty fields disable the corresponding check.
 */
struct ValidationRules {
    int expectedStatus{200};
    bool requireJsonObject{true};

    // Required top-level object; its absence is MissingMetadata.
    std::string metadataField;
    // Inside metadataField: statusField == errorStatusValue means the service reported an error.
    std::string metadataStatusField{"status"};
    std::string errorStatusValue{"error"};
    std::string metadataErrorField{"error"};

    // Top-level field whose presence means the service reported an error.
    std::string errorField;

    // At least one of these must be present and non-empty, unless the object has more than
    // minTopLevelKeys keys. Empty list disables the check.
    std::vector<std::string> resultFields;
    std::size_t minTopLevelKeys{2};
};

/// Rules for a search API that wraps results with search_metadata.
ValidationRules serpApiRules();

/// Rules for an endpoint that answers with any JSON object (e.g. an IP echo service).
ValidationRules jsonObjectRules();

/// Parse a response body; nullopt when the body is not well-formed JSON.
std::optional<nlohmann::json> parseBody(const std::string& body);

/**
 * Pure classification of a raw response. `parsed` is the result of parseBody(); it is ignored
 * when the transport failed or the status is not the expected one.
 */
Classification classify(const RawResponse& response, const std::optional<nlohmann::json>& parsed,
                        const ValidationRules& rules);

/// Convenience overload that parses the body itself.
Classification classify(const RawResponse& response, const ValidationRules& rules);

} // namespace latbench::bench
