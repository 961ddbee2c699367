#include <latbench/bench/response_classifier.h>

namespace latbench::bench {

namespace {

std::string jsonText(const nlohmann::json& v) {
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return v.dump();
}

bool hasContent(const nlohmann::json& v) {
    if (v.is_null())
        return false;
    if (v.is_array() || v.is_object() || v.is_string())
        return !v.empty();
    return true;
}

} // namespace

ValidationRules serpApiRules() {
    ValidationRules r;
    r.expectedStatus = 200;
    r.requireJsonObject = true;
    r.metadataField = "search_metadata";
    r.errorField = "error";
    r.resultFields = {"organic_results", "inline_images",  "local_results",
                      "shopping_results", "jobs_results",  "news_results",
                      "video_results",    "answer_box",    "knowledge_graph"};
    r.minTopLevelKeys = 2;
    return r;
}

ValidationRules jsonObjectRules() {
    ValidationRules r;
    r.expectedStatus = 200;
    r.requireJsonObject = true;
    return r;
}

std::optional<nlohmann::json> parseBody(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

Classification classify(const RawResponse& response, const std::optional<nlohmann::json>& parsed,
                        const ValidationRules& rules) {
    if (response.transportFailed()) {
        return Classification::transportFailure(response.transportError,
                                                response.transportMessage);
    }

    if (!response.status) {
        return Classification::transportFailure(TransportErrorKind::Other,
                                                "No HTTP status received");
    }
    if (*response.status != rules.expectedStatus) {
        return Classification::httpFailure(*response.status,
                                           "HTTP " + std::to_string(*response.status));
    }

    if (!rules.requireJsonObject) {
        return Classification::ok();
    }
    if (!parsed || !parsed->is_object()) {
        return Classification::failure(FailureKind::ParseError, "Invalid JSON response");
    }
    const auto& body = *parsed;

    if (!rules.metadataField.empty() && !body.contains(rules.metadataField)) {
        std::string detail = "Missing " + rules.metadataField;
        if (!rules.errorField.empty() && body.contains(rules.errorField)) {
            detail += ": " + jsonText(body.at(rules.errorField));
        }
        return Classification::failure(FailureKind::MissingMetadata, std::move(detail));
    }

    if (!rules.errorField.empty() && body.contains(rules.errorField)) {
        return Classification::failure(FailureKind::ReportedError,
                                       "API Error: " + jsonText(body.at(rules.errorField)));
    }

    if (!rules.metadataField.empty()) {
        const auto& meta = body.at(rules.metadataField);
        if (meta.is_object() && meta.contains(rules.metadataStatusField) &&
            meta.at(rules.metadataStatusField).is_string() &&
            meta.at(rules.metadataStatusField).get<std::string>() == rules.errorStatusValue) {
            std::string text = meta.contains(rules.metadataErrorField)
                                   ? jsonText(meta.at(rules.metadataErrorField))
                                   : std::string("Unknown error");
            return Classification::failure(FailureKind::ReportedError, "Search error: " + text);
        }
    }

    if (!rules.resultFields.empty()) {
        bool found = false;
        for (const auto& field : rules.resultFields) {
            auto it = body.find(field);
            if (it != body.end() && hasContent(*it)) {
                found = true;
                break;
            }
        }
        if (!found && body.size() <= rules.minTopLevelKeys) {
            return Classification::failure(FailureKind::EmptyResult, "No results found");
        }
    }

    return Classification::ok();
}

Classification classify(const RawResponse& response, const ValidationRules& rules) {
    if (response.transportFailed() || response.status != rules.expectedStatus) {
        return classify(response, std::nullopt, rules);
    }
    return classify(response, parseBody(response.body), rules);
}

} // namespace latbench::bench
