#include <mediacache/loader/buffer_store.h>

#include <algorithm>

namespace mediacache::loader {

Result<void> BufferStore::append(ByteSpan chunk) {
    if (frozen_) {
        return Error{ErrorCode::InvalidState, "append on a frozen buffer"};
    }
    bytes_.insert(bytes_.end(), chunk.begin(), chunk.end());
    return {};
}

Result<void> BufferStore::reset() {
    if (frozen_) {
        return Error{ErrorCode::InvalidState, "reset on a frozen buffer"};
    }
    bytes_.clear();
    metadata_.reset();
    return {};
}

ByteSpan BufferStore::slice(std::uint64_t offset, std::uint64_t length) const noexcept {
    const auto total = size();
    if (offset >= total || length == 0) {
        return {};
    }
    const auto available = std::min<std::uint64_t>(length, total - offset);
    return ByteSpan{bytes_.data() + offset, static_cast<std::size_t>(available)};
}

void BufferStore::adopt(ByteVector bytes, ResponseMetadata meta) {
    bytes_ = std::move(bytes);
    metadata_ = std::move(meta);
    frozen_ = true;
}

} // namespace mediacache::loader
