/*
 * http_transport_curl.cpp
 *
 * Notes
 * - One CURL easy handle per session; the handle is created in open() and destroyed in close(),
 *   so the measured interval in perform() never includes handle setup.
 * - FRESH_CONNECT + FORBID_REUSE + "Connection: close" keep every request on its own TCP
 *   (and TLS) connection.
 * - Transport failures come back as RawResponse::transportError, never as exceptions.
 */

#include <latbench/bench/http_transport.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace latbench::bench {

namespace {

std::once_flag curlInitFlag;

void ensureCurlGlobalInit() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

// Map CURLcode to a transport error category
TransportErrorKind mapCurlCode(CURLcode code, bool connected) {
    switch (code) {
        case CURLE_OK:
            return TransportErrorKind::None;
        case CURLE_OPERATION_TIMEDOUT:
            return connected ? TransportErrorKind::ReadTimeout : TransportErrorKind::ConnectTimeout;
        case CURLE_COULDNT_RESOLVE_HOST:
            return TransportErrorKind::DnsFailure;
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportErrorKind::ProxyFailure;
        case CURLE_COULDNT_CONNECT:
            return TransportErrorKind::ConnectionRefused;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            return TransportErrorKind::TlsFailure;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return TransportErrorKind::ConnectionReset;
        default:
            return TransportErrorKind::Other;
    }
}

// CURL write callback: accumulate the body in a std::string
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

std::string escape(CURL* curl, const std::string& s) {
    char* out = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size()));
    if (!out) {
        return s;
    }
    std::string result(out);
    curl_free(out);
    return result;
}

std::string appendQuery(CURL* curl, const std::string& base, const std::vector<QueryParam>& query) {
    if (query.empty()) {
        return base;
    }
    std::string url = base;
    url.push_back(base.find('?') == std::string::npos ? '?' : '&');
    bool first = true;
    for (const auto& q : query) {
        if (!first)
            url.push_back('&');
        first = false;
        url += escape(curl, q.name);
        url.push_back('=');
        url += escape(curl, q.value);
    }
    return url;
}

class CurlSession final : public IHttpSession {
public:
    CurlSession(CURL* curl, curl_slist* headers, bool tls)
        : curl_(curl), headers_(headers), tls_(tls) {
        errbuf_[0] = '\0';
        curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf_);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &write_cb);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body_);
    }

    ~CurlSession() override {
        auto r = close();
        (void)r;
    }

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    RawResponse perform() override {
        RawResponse out;
        if (!curl_) {
            out.transportError = TransportErrorKind::Other;
            out.transportMessage = "session already closed";
            return out;
        }

        CURLcode rc = curl_easy_perform(curl_);

        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        if (status > 0) {
            out.status = static_cast<int>(status);
        }

        if (rc != CURLE_OK) {
            // For https the connection is usable only once the TLS handshake is done.
            curl_off_t connectedUs = 0;
            curl_easy_getinfo(curl_, tls_ ? CURLINFO_APPCONNECT_TIME_T : CURLINFO_CONNECT_TIME_T,
                              &connectedUs);
            out.transportError = mapCurlCode(rc, connectedUs > 0);
            out.transportMessage = curl_easy_strerror(rc);
            if (errbuf_[0] != '\0') {
                out.transportMessage += ": ";
                out.transportMessage += errbuf_;
            }
            return out;
        }

        out.body = std::move(body_);
        body_.clear();
        return out;
    }

    Result<void> close() override {
        if (headers_) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        return {};
    }

private:
    CURL* curl_{nullptr};
    curl_slist* headers_{nullptr};
    bool tls_{false};
    std::string body_;
    char errbuf_[CURL_ERROR_SIZE];
};

class CurlHttpTransport final : public IHttpTransport {
public:
    CurlHttpTransport() { ensureCurlGlobalInit(); }

    Result<std::unique_ptr<IHttpSession>> open(const RequestSpec& request,
                                               const ConnectionPolicy& policy) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        auto headers = request.headers;
        if (!policy.reuseConnections) {
            headers.push_back({"Connection", "close"});
        }
        curl_slist* headerList = build_header_list(headers);

        // The session owns curl + headerList from here on.
        const bool tls = request.url.rfind("https://", 0) == 0;
        auto session = std::make_unique<CurlSession>(curl, headerList, tls);

        const std::string url = appendQuery(curl, request.url, request.query);
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        if (!policy.userAgent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, policy.userAgent.c_str());
        }

        // Timeouts: connect budget, then read budget on top of it.
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(policy.connectTimeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>((policy.connectTimeout + policy.readTimeout).count()));

        // Connection isolation
        if (!policy.reuseConnections) {
            curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
            curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);
        }

        // TLS
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, policy.verifyTls ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, policy.verifyTls ? 2L : 0L);

        // Proxy
        if (request.proxy && !request.proxy->empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
        }

        spdlog::trace("[CurlTransport] open {}", request.url);
        return std::unique_ptr<IHttpSession>(std::move(session));
    }
};

} // namespace

std::unique_ptr<IHttpTransport> makeCurlHttpTransport() {
    return std::make_unique<CurlHttpTransport>();
}

} // namespace latbench::bench
