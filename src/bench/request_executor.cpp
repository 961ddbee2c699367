#include <latbench/bench/request_executor.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <utility>

namespace latbench::bench {

namespace {

// Closes the session exactly once, on every exit path, and records how that went.
class SessionGuard {
public:
    SessionGuard(std::unique_ptr<IHttpSession> session, RequestOutcome& outcome)
        : session_(std::move(session)), outcome_(outcome) {}

    ~SessionGuard() { close(); }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    IHttpSession& session() { return *session_; }

    void close() noexcept {
        if (!session_) {
            return;
        }
        try {
            auto r = session_->close();
            if (r) {
                outcome_.cleanup = CleanupStatus::Released;
            } else {
                outcome_.cleanup = CleanupStatus::Failed;
                outcome_.cleanupError = r.error().message;
            }
        } catch (const std::exception& e) {
            outcome_.cleanup = CleanupStatus::Failed;
            outcome_.cleanupError = e.what();
        }
        session_.reset();
        if (outcome_.cleanup == CleanupStatus::Failed) {
            spdlog::warn("[Executor] session release failed for {} #{}: {}", outcome_.targetId,
                         outcome_.sequence, outcome_.cleanupError.value_or(""));
        }
    }

private:
    std::unique_ptr<IHttpSession> session_;
    RequestOutcome& outcome_;
};

RequestOutcome skeletonFor(const WorkItem& item) {
    RequestOutcome out;
    out.targetId = item.target ? item.target->id : std::string{};
    out.sequence = item.sequence;
    out.requestIndex = item.requestIndex;
    return out;
}

void extractFields(const nlohmann::json& body, const std::vector<std::string>& fields,
                   std::map<std::string, std::string>& into) {
    for (const auto& f : fields) {
        auto it = body.find(f);
        if (it == body.end() || it->is_null()) {
            continue;
        }
        into[f] = it->is_string() ? it->get<std::string>() : it->dump();
    }
}

} // namespace

RequestExecutor::RequestExecutor(IHttpTransport& transport, ConnectionPolicy policy,
                                 IClock& clock)
    : transport_(transport), policy_(std::move(policy)), clock_(clock) {}

RequestOutcome RequestExecutor::execute(const WorkItem& item) const {
    RequestOutcome out = skeletonFor(item);
    const TargetDescriptor& target = *item.target;

    auto opened = transport_.open(toRequestSpec(item), effectivePolicy(policy_, target));
    if (!opened) {
        const auto now = clock_.now();
        out.wallStart = std::chrono::system_clock::now();
        out.start = out.end = now;
        out.classification = Classification::failure(
            FailureKind::Internal, "Failed to open session: " + opened.error().message);
        return out;
    }

    SessionGuard guard(std::move(opened).value(), out);

    RawResponse raw;
    try {
        out.wallStart = std::chrono::system_clock::now();
        out.start = clock_.now();
        raw = guard.session().perform();
        out.end = clock_.now();
    } catch (const std::exception& e) {
        out.end = clock_.now();
        out.elapsed = out.end - out.start;
        guard.close();
        out.classification = Classification::failure(FailureKind::Internal, e.what());
        return out;
    }
    out.elapsed = out.end - out.start;

    // Everything below is outside the measured interval.
    guard.close();

    out.httpStatus = raw.status;
    if (!raw.transportFailed()) {
        out.payloadBytes = raw.body.size();
    }

    std::optional<nlohmann::json> parsed;
    if (!raw.transportFailed() && raw.status == target.rules.expectedStatus &&
        (target.rules.requireJsonObject || !target.extractFields.empty())) {
        parsed = parseBody(raw.body);
    }
    out.classification = classify(raw, parsed, target.rules);

    if (parsed && parsed->is_object() && !target.extractFields.empty()) {
        extractFields(*parsed, target.extractFields, out.extracted);
    }
    if (!out.success()) {
        spdlog::debug("[Executor] {} #{} failed ({}): {}", out.targetId, out.sequence,
                      out.classification.reasonCode(), out.errorDetail().value_or(""));
    }
    return out;
}

RequestOutcome makeInternalFailure(const WorkItem& item, std::string detail, TimePoint start,
                                   TimePoint end) {
    RequestOutcome out = skeletonFor(item);
    out.wallStart = std::chrono::system_clock::now();
    out.start = start;
    out.end = end;
    out.elapsed = end - start;
    out.classification = Classification::failure(FailureKind::Internal, std::move(detail));
    return out;
}

} // namespace latbench::bench
