#include <mediacache/media/video_transcoder.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediacache::media {

namespace fs = std::filesystem;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds{20};

std::atomic<std::uint64_t> gTempCounter{0};

// Hidden sibling that keeps the output extension so ffmpeg can pick the muxer.
fs::path temporarySibling(const fs::path& output) {
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    std::string fn = "." + output.stem().string() + "." + std::to_string(now_ns) + "-" +
                     std::to_string(gTempCounter.fetch_add(1)) + ".tmp" +
                     output.extension().string();
    return output.parent_path() / fn;
}

void removeQuietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        spdlog::debug("transcode: failed to remove {}: {}", p.string(), ec.message());
    }
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Returns true once the child has been reaped.
bool waitForExit(pid_t pid, std::chrono::milliseconds timeout, int& exitCode) {
    auto start = std::chrono::steady_clock::now();
    do {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exitCode = decodeWaitStatus(status);
            return true;
        }
        if (r < 0 && errno != EINTR) {
            return true;
        }
        std::this_thread::sleep_for(kPollInterval);
    } while (std::chrono::steady_clock::now() - start < timeout);
    return false;
}

} // namespace

const char* transcodeStatusName(TranscodeStatus status) {
    switch (status) {
        case TranscodeStatus::Running:
            return "running";
        case TranscodeStatus::Completed:
            return "completed";
        case TranscodeStatus::Failed:
            return "failed";
        case TranscodeStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

TranscodeJob::TranscodeJob(PrivateTag, Launch launch) : launch_(std::move(launch)) {
    worker_ = std::jthread([this](std::stop_token token) { run(token); });
}

TranscodeJob::~TranscodeJob() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

void TranscodeJob::cancel() {
    worker_.request_stop();
}

std::optional<fs::path> TranscodeJob::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return status_ != TranscodeStatus::Running; });
    return result_;
}

TranscodeStatus TranscodeJob::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

int TranscodeJob::exitCode() const {
    std::lock_guard lock(mutex_);
    return exitCode_;
}

void TranscodeJob::finish(TranscodeStatus status, std::optional<fs::path> result) {
    if (launch_.callback) {
        launch_.callback(result);
    }
    {
        std::lock_guard lock(mutex_);
        status_ = status;
        result_ = std::move(result);
    }
    cv_.notify_all();
}

void TranscodeJob::run(std::stop_token token) {
    if (token.stop_requested()) {
        finish(TranscodeStatus::Cancelled, std::nullopt);
        return;
    }

    std::vector<char*> argv;
    std::string exe = launch_.executable.string();
    argv.push_back(exe.data());
    for (auto& arg : launch_.args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::warn("transcode: fork() failed: {}", std::strerror(errno));
        finish(TranscodeStatus::Failed, std::nullopt);
        return;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    spdlog::debug("transcode: spawned {} (pid={}) -> {}", exe, pid, launch_.output.string());

    int exitCode = -1;
    bool exited = false;
    while (!exited) {
        if (token.stop_requested()) {
            spdlog::info("transcode: cancelling pid={}", pid);
            if (kill(pid, SIGTERM) == 0 && waitForExit(pid, launch_.killGrace, exitCode)) {
                exited = true;
            } else {
                spdlog::warn("transcode: forcefully killing pid={}", pid);
                kill(pid, SIGKILL);
                int status = 0;
                while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }
                exitCode = decodeWaitStatus(status);
            }
            {
                std::lock_guard lock(mutex_);
                exitCode_ = exitCode;
            }
            removeQuietly(launch_.tempOutput);
            finish(TranscodeStatus::Cancelled, std::nullopt);
            return;
        }
        exited = waitForExit(pid, kPollInterval, exitCode);
    }

    {
        std::lock_guard lock(mutex_);
        exitCode_ = exitCode;
    }

    std::error_code ec;
    if (exitCode != 0 || !fs::exists(launch_.tempOutput, ec)) {
        spdlog::warn("transcode: {} exited with code {}", exe, exitCode);
        removeQuietly(launch_.tempOutput);
        finish(TranscodeStatus::Failed, std::nullopt);
        return;
    }

    fs::rename(launch_.tempOutput, launch_.output, ec);
    if (ec) {
        spdlog::warn("transcode: rename {} -> {} failed: {}", launch_.tempOutput.string(),
                     launch_.output.string(), ec.message());
        removeQuietly(launch_.tempOutput);
        finish(TranscodeStatus::Failed, std::nullopt);
        return;
    }

    spdlog::debug("transcode: wrote {}", launch_.output.string());
    finish(TranscodeStatus::Completed, launch_.output);
}

VideoTranscoder::VideoTranscoder() : VideoTranscoder(Config{}) {}

VideoTranscoder::VideoTranscoder(Config config) : config_(std::move(config)) {}

std::vector<std::string> VideoTranscoder::buildArguments(const fs::path& input,
                                                         const fs::path& output,
                                                         const cache::RenderSize& resolution) const {
    const auto w = std::max(2L, std::lround(resolution.width));
    const auto h = std::max(2L, std::lround(resolution.height));
    std::string filter = "scale=" + std::to_string(w) + ":" + std::to_string(h) +
                         ":force_original_aspect_ratio=decrease,"
                         "scale=trunc(iw/2)*2:trunc(ih/2)*2";
    return {"-hide_banner",
            "-loglevel",
            "error",
            "-nostdin",
            "-i",
            input.string(),
            "-vf",
            filter,
            "-c:v",
            "libx264",
            "-preset",
            "veryfast",
            "-crf",
            std::to_string(config_.crf),
            "-c:a",
            "aac",
            "-movflags",
            "+faststart",
            "-y",
            output.string()};
}

std::shared_ptr<TranscodeJob> VideoTranscoder::start(const fs::path& input, const fs::path& output,
                                                     const cache::RenderSize& resolution,
                                                     TranscodeJob::Callback callback) const {
    TranscodeJob::Launch launch;
    launch.executable = config_.ffmpegPath;
    launch.tempOutput = temporarySibling(output);
    launch.args = buildArguments(input, launch.tempOutput, resolution);
    launch.output = output;
    launch.killGrace = config_.killGrace;
    launch.callback = std::move(callback);
    return std::make_shared<TranscodeJob>(TranscodeJob::PrivateTag{}, std::move(launch));
}

} // namespace mediacache::media
