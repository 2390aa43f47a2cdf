#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <mediacache/core/types.h>

namespace mediacache::loader {

/**
 * Response metadata for one fetch: what the server (or the caller, in
 * pre-supplied mode) told us about the resource.
 */
struct ResponseMetadata {
    std::optional<std::string> contentType;
    std::optional<std::uint64_t> expectedLength;
};

/**
 * Append-only growing byte buffer for a single in-flight resource.
 *
 * The store never drops bytes that were appended during a fetch. Once frozen it
 * rejects further mutation; reads stay valid for the lifetime of the store.
 * Not synchronized: the owning ProgressiveLoader serializes access.
 */
class BufferStore {
public:
    BufferStore() = default;

    /**
     * Append a chunk. Returns InvalidState if the store is frozen.
     */
    Result<void> append(ByteSpan chunk);

    /**
     * Drop all bytes and metadata (a new response is starting).
     * Returns InvalidState if the store is frozen.
     */
    Result<void> reset();

    void setMetadata(ResponseMetadata meta) { metadata_ = std::move(meta); }
    const std::optional<ResponseMetadata>& metadata() const noexcept { return metadata_; }

    /**
     * Bytes in [offset, offset + length) clipped to what is buffered. The span is
     * invalidated by the next append.
     */
    ByteSpan slice(std::uint64_t offset, std::uint64_t length) const noexcept;

    std::uint64_t size() const noexcept { return static_cast<std::uint64_t>(bytes_.size()); }
    bool empty() const noexcept { return bytes_.empty(); }
    const ByteVector& bytes() const noexcept { return bytes_; }

    void freeze() noexcept { frozen_ = true; }
    bool frozen() const noexcept { return frozen_; }

    /**
     * Replace the contents wholesale (pre-supplied data). Freezes the store.
     */
    void adopt(ByteVector bytes, ResponseMetadata meta);

private:
    ByteVector bytes_;
    std::optional<ResponseMetadata> metadata_;
    bool frozen_{false};
};

} // namespace mediacache::loader
