#include <mediacache/loader/reconciler.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mediacache::loader {

std::optional<ContentInformation> contentInformationFor(const BufferStore& buffer,
                                                        ReconcileMode mode) {
    const auto& meta = buffer.metadata();
    if (!meta) {
        // No response yet: leave everything unset rather than guessing.
        return std::nullopt;
    }
    ContentInformation info;
    info.contentType = meta->contentType;
    info.contentLength = meta->expectedLength;
    if (!info.contentLength && mode == ReconcileMode::Completed) {
        info.contentLength = buffer.size();
    }
    info.byteRangeAccessSupported = true;
    return info;
}

ReconcileReport reconcile(const BufferStore& buffer, RangeRequestLedger& ledger,
                          ReconcileMode mode) {
    ReconcileReport report;
    if (ledger.empty()) {
        return report;
    }

    const auto info = contentInformationFor(buffer, mode);
    const std::uint64_t bufferLength = buffer.size();

    for (RequestId id : ledger.ids()) {
        auto* request = ledger.find(id);
        if (request == nullptr) {
            continue;
        }

        if (request->wantsContentInformation && !request->contentInformationDelivered && info) {
            if (request->sink.onContentInformation) {
                request->sink.onContentInformation(*info);
            }
            request->contentInformationDelivered = true;
        }

        const std::uint64_t requestedEnd = request->requestedEnd();
        if (bufferLength > request->currentOffset && requestedEnd > request->currentOffset) {
            const std::uint64_t bytesToRespond = std::min(bufferLength - request->currentOffset,
                                                          requestedEnd - request->currentOffset);
            auto slice = buffer.slice(request->currentOffset, bytesToRespond);
            if (!slice.empty()) {
                if (request->sink.onData) {
                    request->sink.onData(slice);
                }
                request->currentOffset += slice.size();
                report.deliveredBytes += slice.size();
            }
        }

        bool satisfied = false;
        if (mode == ReconcileMode::Completed) {
            satisfied = true;
        } else {
            const bool infoReady =
                !request->wantsContentInformation || request->contentInformationDelivered;
            satisfied = infoReady && bufferLength >= requestedEnd;
        }

        if (satisfied) {
            auto onFinished = std::move(request->sink.onFinished);
            ledger.remove(id);
            report.satisfied.push_back(id);
            if (onFinished) {
                onFinished();
            }
        }
    }

    if (!report.satisfied.empty()) {
        spdlog::trace("reconcile: delivered {} bytes, satisfied {} request(s), {} pending",
                      report.deliveredBytes, report.satisfied.size(), ledger.size());
    }
    return report;
}

} // namespace mediacache::loader
