#include <algorithm>
#include <cctype>
#include <filesystem>

#include "errors.hpp"
#include "job_poller.hpp"
#include "scribe_log.hpp"
#include "transcriber.hpp"

namespace fs = std::filesystem;

namespace scribe {

static constexpr const char* kFileTooLarge    = "файл слишком большой для загрузки";
static constexpr const char* kAudioTooLarge   = "аудио слишком большое после извлечения";
static constexpr const char* kFileNotFound    = "файл не найден";
static constexpr const char* kCancelled       = "транскрибация отменена";
static constexpr const char* kServiceFail     = "ошибка сервиса транскрибации";
static constexpr const char* kInternalError   = "внутренняя ошибка";

static constexpr int kExtractedPercent      = 20;
static constexpr int kAudioUploadedPercent  = 20;
static constexpr int kVideoUploadedPercent  = 30;

MediaKind classify_media(const std::string& path, const FormatRule& formats) {
    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (ext.empty()) return MediaKind::Unsupported;
    if (formats.is_video(ext)) return MediaKind::Video;
    if (formats.is_audio(ext)) return MediaKind::Audio;
    return MediaKind::Unsupported;
}

Transcriber::Transcriber(const ScribeConfig& cfg)
    : cfg_(cfg),
      owned_http_(std::make_unique<CurlSession>(cfg.api)),
      owned_extractor_(std::make_unique<FfmpegExtractor>(cfg.ffmpeg, cfg.temp_dir)),
      http_(owned_http_.get()),
      extractor_(owned_extractor_.get()),
      api_(*http_),
      retry_(cfg.retry) {
    SLOG(info) << "Transcriber initialized with base_url: " << cfg_.api.base_url;
}

Transcriber::Transcriber(const ScribeConfig& cfg, HttpTransport& http, AudioExtractor& extractor, Sleeper sleep)
    : cfg_(cfg),
      http_(&http),
      extractor_(&extractor),
      api_(http),
      retry_(cfg.retry, std::move(sleep)) {}

Transcriber::~Transcriber() {
    try {
        close();
    } catch (const std::exception& e) {
        SLOG(error) << "error while closing transcriber: " << e.what();
    }
}

void Transcriber::open() { http_->open(); }

void Transcriber::close() {
    cancel();
    http_->close();
}

bool Transcriber::is_open() const { return http_->is_open(); }

void Transcriber::cancel() {
    std::lock_guard<std::mutex> lk(active_mu_);
    if (active_) {
        SLOG(info) << "cancelling active transcription";
        active_->set();
    }
}

bool Transcriber::accepts(const std::string& path) const {
    return classify_media(path, cfg_.formats) != MediaKind::Unsupported;
}

std::string Transcriber::process_file(const std::string& path, ProgressSink* sink) {
    SLOG(info) << "Starting process_file for " << path;

    const MediaKind kind = classify_media(path, cfg_.formats);
    if (kind == MediaKind::Unsupported) {
        SLOG(warning) << "Unsupported format: " << path;
        return cfg_.messages.unsupported_format;
    }

    ProgressBridge progress(sink);
    auto signal = std::make_shared<CancellationSignal>();
    {
        std::lock_guard<std::mutex> lk(active_mu_);
        active_ = signal;
    }
    struct ActiveReset {
        Transcriber* self;
        ~ActiveReset() {
            std::lock_guard<std::mutex> lk(self->active_mu_);
            self->active_.reset();
        }
    } reset{this};

    std::string failure;
    int failed_at = 0;
    try {
        return transcribe(path, kind, progress, signal);
    } catch (const TranscriptionFailure& e) {
        failure = e.what();
        failed_at = e.progress();
    } catch (const NetworkExhausted& e) {
        SLOG(error) << e.what();
        failure = "ошибка сети после " + std::to_string(e.attempts()) + " попыток";
        failed_at = progress.last_percent();
    } catch (const RemoteBusinessError& e) {
        SLOG(error) << e.what();
        failure = kServiceFail;
        failed_at = progress.last_percent();
    } catch (const std::exception& e) {
        SLOG(error) << "unexpected error processing " << path << ": " << e.what();
        failure = std::string(kInternalError) + ": " + e.what();
        failed_at = progress.last_percent();
    }

    if (!progress.failure_reported()) progress.fail(failed_at, failure);
    SLOG(error) << "Transcription error: " << failure;
    return cfg_.messages.processing_error + "\n\xE2\x9D\x8C " + failure;
}

std::string Transcriber::transcribe(const std::string& path, MediaKind kind, ProgressBridge& progress,
                                    const std::shared_ptr<CancellationSignal>& signal) {
    progress.report(0);

    // declared before any early exit so the extracted file is removed on every path
    TempFile extracted;
    std::string upload_path = path;
    int uploaded_percent = kAudioUploadedPercent;

    if (kind == MediaKind::Video) {
        SLOG(info) << "Processing video file";
        extracted = extractor_->extract(path);
        if (signal->is_set()) throw TranscriptionFailure(kCancelled, 0);

        std::error_code ec;
        const auto size = fs::file_size(extracted.path(), ec);
        if (ec) throw TranscriptionFailure(kFileNotFound, 0);
        if (size > cfg_.max_file_size) throw TranscriptionFailure(kAudioTooLarge, kExtractedPercent);

        progress.report(kExtractedPercent);
        upload_path = extracted.path();
        uploaded_percent = kVideoUploadedPercent;
    } else {
        SLOG(info) << "Processing audio file";
    }

    const std::string url = upload(upload_path, progress);
    if (signal->is_set()) throw TranscriptionFailure(kCancelled, progress.last_percent());
    progress.report(uploaded_percent);

    JobPoller poller(api_, retry_, progress, cfg_.poll, signal);
    return poller.run(url, cfg_.api.language_code, uploaded_percent);
}

std::string Transcriber::upload(const std::string& path, ProgressBridge& progress) {
    SLOG(info) << "Uploading file: " << path;

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) throw TranscriptionFailure(kFileNotFound, progress.last_percent());
    if (size > cfg_.max_file_size) throw TranscriptionFailure(kFileTooLarge, progress.last_percent());

    return retry_.run("upload", [&]{ return api_.upload(path); });
}

} // namespace scribe
