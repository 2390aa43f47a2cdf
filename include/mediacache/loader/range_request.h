#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <mediacache/core/types.h>

namespace mediacache::loader {

using RequestId = std::uint64_t;

/// Requested length meaning "everything from the offset to the end of the resource".
inline constexpr std::uint64_t kToEndOfResource = std::numeric_limits<std::uint64_t>::max();

/**
 * Content information handed to a consumer before any bytes.
 */
struct ContentInformation {
    std::optional<std::string> contentType;
    std::optional<std::uint64_t> contentLength;
    bool byteRangeAccessSupported{true};
};

/**
 * Delivery channel for one range request. Every callback is optional.
 *
 * Callbacks run while the owning loader holds its per-resource lock; they must
 * not call back into the loader. A request ends with exactly one onFinished or
 * onFailed, unless it was cancelled.
 */
struct RangeSink {
    std::function<void(const ContentInformation&)> onContentInformation;
    std::function<void(ByteSpan)> onData;
    std::function<void()> onFinished;
    std::function<void(const Error&)> onFailed;
};

struct PendingRangeRequest {
    RequestId id{0};
    std::uint64_t requestedOffset{0};
    std::uint64_t requestedLength{0};
    std::uint64_t currentOffset{0};
    bool wantsContentInformation{false};
    bool contentInformationDelivered{false};
    RangeSink sink;

    /// One past the last byte this request wants, saturating for open-ended requests.
    std::uint64_t requestedEnd() const noexcept {
        if (requestedLength > kToEndOfResource - requestedOffset) {
            return kToEndOfResource;
        }
        return requestedOffset + requestedLength;
    }
};

/**
 * Set of outstanding range requests for one resource. Owns no bytes.
 * Insertion order is preserved so reconciliation visits requests in the order
 * consumers issued them. Not synchronized.
 */
class RangeRequestLedger {
public:
    /**
     * Add a request. Its id is assigned here; currentOffset starts at requestedOffset.
     */
    RequestId add(std::uint64_t offset, std::uint64_t length, RangeSink sink,
                  bool wantsContentInformation = false);

    /**
     * Remove a request. Returns false if the id is unknown (already satisfied,
     * failed or cancelled); never an error.
     */
    bool remove(RequestId id);

    PendingRangeRequest* find(RequestId id);
    const PendingRangeRequest* find(RequestId id) const;

    bool contains(RequestId id) const { return find(id) != nullptr; }
    std::size_t size() const noexcept { return requests_.size(); }
    bool empty() const noexcept { return requests_.empty(); }

    /// Ids in insertion order.
    std::vector<RequestId> ids() const;

    /**
     * Remove every request and hand them back to the caller.
     */
    std::vector<PendingRangeRequest> drain();

private:
    std::vector<PendingRangeRequest> requests_;
    RequestId nextId_{1};
};

} // namespace mediacache::loader
