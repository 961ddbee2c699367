#pragma once

#include <latbench/bench/http_transport.h>
#include <latbench/bench/outcome.h>
#include <latbench/bench/target.h>
#include <latbench/core/clock.h>

namespace latbench::bench {

/**
 * Performs one isolated request for a work item and turns it into a RequestOutcome.
 *
 * The measured interval is [start, end]: start is taken after the session has been opened,
 * end immediately after the full body has been received (or the transport failed). Session
 * release, body parsing, classification and field extraction all happen after `end`.
 *
 * Thread-safe: the executor holds no per-request state.
 */
class RequestExecutor {
public:
    RequestExecutor(IHttpTransport& transport, ConnectionPolicy policy,
                    IClock& clock = steadyClock());

    RequestOutcome execute(const WorkItem& item) const;

    const ConnectionPolicy& policy() const noexcept { return policy_; }

private:
    IHttpTransport& transport_;
    ConnectionPolicy policy_;
    IClock& clock_;
};

/// Failure outcome for a work item that never produced a response (executor threw, etc.).
RequestOutcome makeInternalFailure(const WorkItem& item, std::string detail, TimePoint start,
                                   TimePoint end);

} // namespace latbench::bench
