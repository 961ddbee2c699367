#include <latbench/bench/outcome.h>

namespace latbench::bench {

const char* transportErrorName(TransportErrorKind kind) noexcept {
    switch (kind) {
        case TransportErrorKind::None:
            return "none";
        case TransportErrorKind::ConnectTimeout:
            return "connect_timeout";
        case TransportErrorKind::ReadTimeout:
            return "read_timeout";
        case TransportErrorKind::DnsFailure:
            return "dns_failure";
        case TransportErrorKind::ConnectionRefused:
            return "connection_refused";
        case TransportErrorKind::TlsFailure:
            return "tls_failure";
        case TransportErrorKind::ConnectionReset:
            return "connection_reset";
        case TransportErrorKind::ProxyFailure:
            return "proxy_failure";
        case TransportErrorKind::Other:
            return "other";
    }
    return "other";
}

const char* failureKindName(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None:
            return "ok";
        case FailureKind::Transport:
            return "transport";
        case FailureKind::HttpStatus:
            return "http";
        case FailureKind::ParseError:
            return "parse_error";
        case FailureKind::MissingMetadata:
            return "missing_metadata";
        case FailureKind::ReportedError:
            return "reported_error";
        case FailureKind::EmptyResult:
            return "empty_result";
        case FailureKind::Internal:
            return "internal";
    }
    return "internal";
}

const char* cleanupStatusName(CleanupStatus status) noexcept {
    switch (status) {
        case CleanupStatus::NotOpened:
            return "not_opened";
        case CleanupStatus::Released:
            return "released";
        case CleanupStatus::Failed:
            return "failed";
    }
    return "failed";
}

std::string Classification::reasonCode() const {
    switch (kind) {
        case FailureKind::Transport:
            return std::string("transport:") + transportErrorName(transport);
        case FailureKind::HttpStatus:
            return "http:" + (httpStatus ? std::to_string(*httpStatus) : std::string("unknown"));
        default:
            return failureKindName(kind);
    }
}

Classification Classification::failure(FailureKind kind, std::string detail) {
    Classification c;
    c.kind = kind;
    c.detail = std::move(detail);
    return c;
}

Classification Classification::transportFailure(TransportErrorKind kind, std::string detail) {
    Classification c;
    c.kind = FailureKind::Transport;
    c.transport = kind == TransportErrorKind::None ? TransportErrorKind::Other : kind;
    c.detail = std::move(detail);
    return c;
}

Classification Classification::httpFailure(int status, std::string detail) {
    Classification c;
    c.kind = FailureKind::HttpStatus;
    c.httpStatus = status;
    c.detail = std::move(detail);
    return c;
}

std::optional<std::string> RequestOutcome::errorDetail() const {
    if (classification.success()) {
        return std::nullopt;
    }
    if (classification.detail.empty()) {
        return classification.reasonCode();
    }
    return truncateErrorText(classification.detail);
}

std::string truncateErrorText(std::string_view text, std::size_t maxLen) {
    auto nl = text.find_first_of("\r\n");
    std::string_view firstLine = nl == std::string_view::npos ? text : text.substr(0, nl);
    if (firstLine.size() <= maxLen) {
        return std::string(firstLine);
    }
    std::string out(firstLine.substr(0, maxLen));
    out += "...";
    return out;
}

} // namespace latbench::bench
