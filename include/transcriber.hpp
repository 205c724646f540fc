#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "audio_extractor.hpp"
#include "http_session.hpp"
#include "progress_estimator.hpp"
#include "progress_sink.hpp"
#include "retry.hpp"
#include "scribe_config.hpp"
#include "speech_api.hpp"

namespace scribe {

enum class MediaKind { Audio, Video, Unsupported };

// By extension, case-insensitive.
MediaKind classify_media(const std::string& path, const FormatRule& formats);

// Top-level entry point: one media file in, transcript (or failure text) out.
// Owns one HTTP session for its lifetime; open() before use, close() after.
class Transcriber {
public:
    // curl transport and ffmpeg extraction as configured.
    explicit Transcriber(const ScribeConfig& cfg);

    // Caller-owned collaborators; they must outlive the Transcriber.
    Transcriber(const ScribeConfig& cfg, HttpTransport& http, AudioExtractor& extractor,
                Sleeper sleep = real_sleep);

    ~Transcriber();

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    void open();
    // Cancels the running job, if any, then releases the session.
    void close();
    bool is_open() const;

    // Returns the transcript, the unsupported-format message, or
    // "<processing_error>\n❌ <reason>". Transcription errors are never thrown;
    // the sink (optional) always ends on 100% or an error tick.
    std::string process_file(const std::string& path, ProgressSink* sink = nullptr);

    // Stops the job currently in process_file; it fails as cancelled.
    void cancel();

    // Whether process_file would attempt path rather than reject its format.
    bool accepts(const std::string& path) const;

private:
    std::string transcribe(const std::string& path, MediaKind kind, ProgressBridge& progress,
                           const std::shared_ptr<CancellationSignal>& signal);
    std::string upload(const std::string& path, ProgressBridge& progress);

    ScribeConfig cfg_;
    std::unique_ptr<HttpTransport> owned_http_;
    std::unique_ptr<AudioExtractor> owned_extractor_;
    HttpTransport* http_;
    AudioExtractor* extractor_;
    RemoteSpeechApi api_;
    RetryExecutor retry_;

    std::mutex active_mu_;
    std::shared_ptr<CancellationSignal> active_;
};

} // namespace scribe
