#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <mediacache/cache/cache_key.h>

namespace mediacache::media {

enum class TranscodeStatus { Running, Completed, Failed, Cancelled };

const char* transcodeStatusName(TranscodeStatus status);

/**
 * One running ffmpeg export. Produced by VideoTranscoder::start().
 *
 * The child writes into a hidden temporary sibling of the output path which is
 * renamed into place only when ffmpeg exits cleanly. Destroying the job
 * cancels it.
 */
class TranscodeJob {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };
    struct Launch;

public:
    using Callback = std::function<void(const std::optional<std::filesystem::path>&)>;

    // Created through VideoTranscoder::start only.
    TranscodeJob(PrivateTag, Launch launch);
    ~TranscodeJob();

    TranscodeJob(const TranscodeJob&) = delete;
    TranscodeJob& operator=(const TranscodeJob&) = delete;

    /// Stop the child (SIGTERM, then SIGKILL after the grace period). Idempotent.
    void cancel();

    /// Block until the job finishes and its callback has returned. Output path on
    /// success, nullopt otherwise.
    std::optional<std::filesystem::path> wait();

    TranscodeStatus status() const;
    int exitCode() const;

private:
    friend class VideoTranscoder;

    struct Launch {
        std::filesystem::path executable;
        std::vector<std::string> args;
        std::filesystem::path tempOutput;
        std::filesystem::path output;
        std::chrono::milliseconds killGrace;
        Callback callback;
    };

    void run(std::stop_token token);
    void finish(TranscodeStatus status, std::optional<std::filesystem::path> result);

    Launch launch_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    TranscodeStatus status_{TranscodeStatus::Running};
    std::optional<std::filesystem::path> result_;
    int exitCode_{-1};
    std::jthread worker_;
};

/**
 * Scales a video to fit a target resolution by running an external ffmpeg.
 */
class VideoTranscoder {
public:
    struct Config {
        std::filesystem::path ffmpegPath{"ffmpeg"};
        int crf{23};
        std::chrono::milliseconds killGrace{2000};
    };

    VideoTranscoder();
    explicit VideoTranscoder(Config config);

    /**
     * Launch the export. The optional callback runs on the job's worker thread
     * once the job reaches a terminal state; it must not release the last
     * reference to the job.
     */
    std::shared_ptr<TranscodeJob> start(const std::filesystem::path& input,
                                        const std::filesystem::path& output,
                                        const cache::RenderSize& resolution,
                                        TranscodeJob::Callback callback = {}) const;

    /// ffmpeg argument list (without the executable) for one export.
    std::vector<std::string> buildArguments(const std::filesystem::path& input,
                                            const std::filesystem::path& output,
                                            const cache::RenderSize& resolution) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace mediacache::media
