#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>

#include "audio_extractor.hpp"
#include "errors.hpp"
#include "scribe_log.hpp"

namespace fs = std::filesystem;

namespace scribe {

static constexpr const char* kExtractFailed = "не удалось извлечь аудио";

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempFile::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    if (fs::remove(path_, ec)) {
        SLOG(info) << "Removed temp audio: " << path_;
    } else if (ec) {
        SLOG(warning) << "could not remove temp file " << path_ << ": " << ec.message();
    }
    path_.clear();
}

// Single-quote for /bin/sh: ' -> '\''
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    return out + "'";
}

static std::string unique_suffix() {
    static std::atomic<unsigned> counter{0};
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(ticks) + "_" + std::to_string(counter++);
}

TempFile FfmpegExtractor::extract(const std::string& video_path) {
    std::error_code ec;
    const fs::path dir = temp_dir_.empty() ? fs::temp_directory_path(ec) : fs::path(temp_dir_);
    if (ec) throw TranscriptionFailure(kExtractFailed, 0);
    fs::create_directories(dir, ec);

    const fs::path out = dir / (fs::path(video_path).stem().string() + "_" + unique_suffix() + ".mp3");
    // owned from here on, so a half-written file is removed on failure too
    TempFile audio(out.string());

    const std::string cmd = shell_quote(ffmpeg_) + " -y -loglevel error -i " + shell_quote(video_path) +
                            " -vn -acodec libmp3lame " + shell_quote(out.string());
    SLOG(info) << "Extracting audio: " << video_path << " -> " << out.string();

    const int ret = std::system(cmd.c_str());
    if (ret != 0) {
        SLOG(error) << "ffmpeg extraction failed (exit " << ret << ") for " << video_path;
        throw TranscriptionFailure(kExtractFailed, 0);
    }
    if (!fs::exists(out, ec)) {
        SLOG(error) << "ffmpeg reported success but produced no file: " << out.string();
        throw TranscriptionFailure(kExtractFailed, 0);
    }
    return audio;
}

} // namespace scribe
