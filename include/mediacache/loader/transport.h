#pragma once

/*
 * Transport abstraction for the progressive loader.
 *
 * A transport streams the bytes of exactly one resource with a single
 * range-agnostic GET. It reports the final response's metadata, then ordered
 * data chunks, and returns once the stream ends. All callbacks run on the
 * thread that called stream().
 */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <mediacache/core/types.h>
#include <mediacache/loader/buffer_store.h>

namespace mediacache::loader {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Session-level transport settings.
 */
struct TransportConfig {
    std::chrono::milliseconds connectTimeout{15000};
    std::chrono::milliseconds timeout{0}; // 0 = no overall limit (long media streams)
    std::string userAgent{"mediacache/1.0"};
    std::optional<std::string> proxy;
    TlsConfig tls{};
    std::vector<Header> headers;
};

struct TransportRequest {
    std::string url;
};

struct TransportCallbacks {
    /// Final (non-redirect) response metadata. May be called again if the
    /// transport restarts the response; the consumer resets its buffer.
    std::function<void(const ResponseMetadata&)> onResponse;
    /// One chunk of body bytes. Return false to abort the transfer.
    std::function<bool(ByteSpan)> onData;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Stream the resource. Returns success at end-of-stream, an Error otherwise.
     * A stop request aborts the transfer with OperationCancelled.
     */
    virtual Result<void> stream(const TransportRequest& request,
                                const TransportCallbacks& callbacks, std::stop_token stop) = 0;
};

/**
 * Factory for the libcurl-backed transport. Every stream() call uses a fresh
 * easy handle, forbids connection reuse and asks intermediaries not to serve a
 * cached copy.
 */
std::shared_ptr<ITransport> makeCurlTransport(TransportConfig config = {});

} // namespace mediacache::loader
