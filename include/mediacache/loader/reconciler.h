#pragma once

#include <cstdint>
#include <vector>

#include <mediacache/loader/buffer_store.h>
#include <mediacache/loader/range_request.h>

namespace mediacache::loader {

enum class ReconcileMode {
    /// The buffer may still grow; requests finish only once their full range is buffered.
    Streaming,
    /// The buffer stopped growing; every request finishes with whatever is available.
    Completed
};

struct ReconcileReport {
    std::uint64_t deliveredBytes{0};
    std::vector<RequestId> satisfied;
};

/**
 * One reconciliation pass: match every pending request against the buffered
 * bytes, deliver what is newly available and remove satisfied requests from the
 * ledger (their sinks receive onFinished).
 *
 * Content information is only reported once response metadata exists; in
 * Streaming mode a request that asked for it is not satisfied before it has
 * been delivered. Never blocks; only copies in-memory bytes to sinks.
 */
ReconcileReport reconcile(const BufferStore& buffer, RangeRequestLedger& ledger,
                          ReconcileMode mode);

/**
 * Content information derived from the buffer, if any is known yet. In
 * Completed mode an unknown length is filled in from the buffered size.
 */
std::optional<ContentInformation> contentInformationFor(const BufferStore& buffer,
                                                        ReconcileMode mode);

} // namespace mediacache::loader
