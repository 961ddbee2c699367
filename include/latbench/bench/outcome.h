#pragma once

/*
 * latbench - Request outcome vocabulary
 *
 * A RequestOutcome is produced exactly once per work item by the request executor (or by the
 * dispatcher when the executor throws) and is never mutated after it is handed to the sink.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <latbench/core/clock.h>

namespace latbench::bench {

// ================================
// Classification enums
// ================================

/**
 * Transport-level failure categories reported by an HTTP transport.
 */
enum class TransportErrorKind {
    None = 0,
    ConnectTimeout,
    ReadTimeout,
    DnsFailure,
    ConnectionRefused,
    TlsFailure,
    ConnectionReset,
    ProxyFailure,
    Other
};

/**
 * Why a request counted as a failure. None means success.
 */
enum class FailureKind {
    None = 0,
    Transport,
    HttpStatus,
    ParseError,
    MissingMetadata,
    ReportedError,
    EmptyResult,
    Internal
};

/**
 * Result of releasing the per-request connection/session.
 */
enum class CleanupStatus { NotOpened, Released, Failed };

const char* transportErrorName(TransportErrorKind kind) noexcept;
const char* failureKindName(FailureKind kind) noexcept;
const char* cleanupStatusName(CleanupStatus status) noexcept;

// ===================
// Data objects
// ===================

/**
 * Success, or exactly one failure reason with its detail text.
 */
struct Classification {
    FailureKind kind{FailureKind::None};
    TransportErrorKind transport{TransportErrorKind::None};
    std::optional<int> httpStatus;
    std::string detail;

    bool success() const noexcept { return kind == FailureKind::None; }

    /// Stable reason code: "ok", "transport:read_timeout", "http:503", "parse_error", ...
    std::string reasonCode() const;

    static Classification ok() { return {}; }
    static Classification failure(FailureKind kind, std::string detail);
    static Classification transportFailure(TransportErrorKind kind, std::string detail);
    static Classification httpFailure(int status, std::string detail);
};

/**
 * Bytes and status as the transport saw them. Transport errors are data, not exceptions.
 */
struct RawResponse {
    std::optional<int> status;
    std::string body;
    TransportErrorKind transportError{TransportErrorKind::None};
    std::string transportMessage;

    bool transportFailed() const noexcept { return transportError != TransportErrorKind::None; }
};

/**
 * Immutable record of one request attempt.
 */
struct RequestOutcome {
    std::string targetId;
    std::size_t sequence{0};     // 1-based position within the target
    std::size_t requestIndex{0}; // 1-based position within the run

    WallTimePoint wallStart{};
    TimePoint start{};
    TimePoint end{};
    Duration elapsed{0};

    std::optional<int> httpStatus;
    std::optional<std::uint64_t> payloadBytes;

    Classification classification;
    CleanupStatus cleanup{CleanupStatus::NotOpened};
    std::optional<std::string> cleanupError;

    // Fields pulled out of the body after timing, e.g. ip/country for proxy probes.
    std::map<std::string, std::string> extracted;

    bool success() const noexcept { return classification.success(); }

    /// Present only for failures; first line, at most 300 characters.
    std::optional<std::string> errorDetail() const;
};

/// Keep the first line of an error message and cap it at maxLen characters (with "...").
std::string truncateErrorText(std::string_view text, std::size_t maxLen = 300);

} // namespace latbench::bench
