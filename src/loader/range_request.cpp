#include <mediacache/loader/range_request.h>

#include <algorithm>
#include <utility>

namespace mediacache::loader {

RequestId RangeRequestLedger::add(std::uint64_t offset, std::uint64_t length, RangeSink sink,
                                  bool wantsContentInformation) {
    PendingRangeRequest request;
    request.id = nextId_++;
    request.requestedOffset = offset;
    request.requestedLength = length;
    request.currentOffset = offset;
    request.wantsContentInformation = wantsContentInformation;
    request.sink = std::move(sink);
    requests_.push_back(std::move(request));
    return requests_.back().id;
}

bool RangeRequestLedger::remove(RequestId id) {
    auto it = std::find_if(requests_.begin(), requests_.end(),
                           [id](const PendingRangeRequest& r) { return r.id == id; });
    if (it == requests_.end()) {
        return false;
    }
    requests_.erase(it);
    return true;
}

PendingRangeRequest* RangeRequestLedger::find(RequestId id) {
    auto it = std::find_if(requests_.begin(), requests_.end(),
                           [id](const PendingRangeRequest& r) { return r.id == id; });
    return it == requests_.end() ? nullptr : &*it;
}

const PendingRangeRequest* RangeRequestLedger::find(RequestId id) const {
    auto it = std::find_if(requests_.begin(), requests_.end(),
                           [id](const PendingRangeRequest& r) { return r.id == id; });
    return it == requests_.end() ? nullptr : &*it;
}

std::vector<RequestId> RangeRequestLedger::ids() const {
    std::vector<RequestId> out;
    out.reserve(requests_.size());
    for (const auto& r : requests_) {
        out.push_back(r.id);
    }
    return out;
}

std::vector<PendingRangeRequest> RangeRequestLedger::drain() {
    std::vector<PendingRangeRequest> out;
    out.swap(requests_);
    return out;
}

} // namespace mediacache::loader
