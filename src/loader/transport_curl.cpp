/*
 * transport_curl.cpp
 *
 * Notes
 * - Streams one resource with a single GET using the libcurl easy API.
 * - Every session is single-use: fresh easy handle, no connection reuse, and
 *   "Cache-Control: no-cache" so no intermediate cache answers for us.
 * - Response metadata is reported once the header block of the final
 *   (non-1xx, non-redirect) response is complete.
 * - Cooperative cancellation through the caller's std::stop_token, checked in
 *   both the write and the transfer-info callbacks.
 */

#include <mediacache/loader/transport.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace mediacache::loader {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_FILE_COULDNT_READ_FILE:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

// Per-session state shared by the header, write and transfer-info callbacks.
struct SessionContext {
    const TransportCallbacks* callbacks{nullptr};
    std::stop_token stop;

    long status{0};
    ResponseMetadata pending;
    bool responseDelivered{false};
    bool httpError{false};
    bool cancelRequested{false};
    bool sinkAborted{false};
    std::uint64_t received{0};

    void deliverResponse() {
        responseDelivered = true;
        if (callbacks->onResponse) {
            callbacks->onResponse(pending);
        }
    }
};

bool isInterimOrRedirect(long status) {
    return (status >= 100 && status < 200) || (status >= 300 && status < 400);
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<SessionContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // A status line opens a new response (redirect hops, 100-continue).
    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        ctx->pending = ResponseMetadata{};
        ctx->status = 0;
        auto sp = line.find(' ');
        if (sp != std::string_view::npos) {
            auto code = trim(line.substr(sp + 1, 3));
            long parsed = 0;
            auto res = std::from_chars(code.data(), code.data() + code.size(), parsed);
            if (res.ec == std::errc()) {
                ctx->status = parsed;
            }
        }
        return total;
    }

    if (line.empty()) {
        if (ctx->status != 0 && isInterimOrRedirect(ctx->status)) {
            return total;
        }
        if (ctx->status >= 400) {
            ctx->httpError = true;
            return total;
        }
        if (!ctx->responseDelivered) {
            ctx->deliverResponse();
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->pending.expectedLength = tmp;
        }
    } else if (key == "content-type") {
        auto semi = val.find(';');
        auto mime = to_lower(trim(std::string_view(val).substr(0, semi)));
        if (!mime.empty()) {
            ctx->pending.contentType = std::move(mime);
        }
    }
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<SessionContext*>(userdata);
    if (ctx->stop.stop_requested()) {
        ctx->cancelRequested = true;
        return 0; // => CURLE_WRITE_ERROR
    }
    if (ctx->httpError) {
        return 0;
    }
    // Protocols without a header block (file://) never reach the blank line.
    if (!ctx->responseDelivered) {
        ctx->deliverResponse();
    }
    if (total == 0)
        return 0;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    if (ctx->callbacks->onData && !ctx->callbacks->onData(bytes)) {
        ctx->sinkAborted = true;
        return 0;
    }
    ctx->received += total;
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<SessionContext*>(userdata);
    if (ctx != nullptr && ctx->stop.stop_requested()) {
        ctx->cancelRequested = true;
        return 1; // => CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    list = curl_slist_append(list, "Cache-Control: no-cache");
    list = curl_slist_append(list, "Pragma: no-cache");
    return list;
}

void configure_common(CURL* curl, const TransportConfig& config) {
    if (config.timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config.timeout.count()));
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config.connectTimeout.count()));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.tls.insecure ? 0L : 2L);
    if (!config.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, config.tls.caPath.c_str());
    }

    if (config.proxy && !config.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, config.proxy->c_str());
    }
    if (!config.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.userAgent.c_str());
    }

    // Single-use session
    curl_easy_setopt(curl, CURLOPT_FRESH_CONNECT, 1L);
    curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

} // namespace

class CurlTransport final : public ITransport {
public:
    explicit CurlTransport(TransportConfig config) : config_(std::move(config)) {
        ensureCurlGlobalInit();
    }
    ~CurlTransport() override = default;

    Result<void> stream(const TransportRequest& request, const TransportCallbacks& callbacks,
                        std::stop_token stop) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(config_.headers);

        SessionContext ctx;
        ctx.callbacks = &callbacks;
        ctx.stop = std::move(stop);

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);

        configure_common(curl, config_);

        spdlog::debug("transport: GET {}", request.url);
        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (ctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (ctx.httpError || http_status >= 400) {
            return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(http_status)};
        }
        if (ctx.sinkAborted) {
            return Error{ErrorCode::InvalidState, "Transfer aborted by consumer"};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "stream(GET)");
        }
        // Empty bodies still produce a response.
        if (!ctx.responseDelivered) {
            ctx.deliverResponse();
        }

        spdlog::debug("transport: {} finished, {} bytes (HTTP {})", request.url, ctx.received,
                      http_status);
        return {};
    }

private:
    TransportConfig config_;
};

std::shared_ptr<ITransport> makeCurlTransport(TransportConfig config) {
    return std::make_shared<CurlTransport>(std::move(config));
}

} // namespace mediacache::loader
