#pragma once
#include <string>

namespace scribe {

// Owns a file on disk and removes it when destroyed. Move-only.
class TempFile {
public:
    TempFile() = default;
    explicit TempFile(std::string path) : path_(std::move(path)) {}
    ~TempFile() { remove(); }

    TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
    TempFile& operator=(TempFile&& other) noexcept;

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

private:
    void remove() noexcept;

    std::string path_;
};

// Strips the audio track out of a video container.
class AudioExtractor {
public:
    virtual ~AudioExtractor() = default;

    // Throws TranscriptionFailure (progress 0) when no audio could be produced.
    virtual TempFile extract(const std::string& video_path) = 0;
};

class FfmpegExtractor : public AudioExtractor {
public:
    // Empty temp_dir means the system temporary directory.
    FfmpegExtractor(std::string ffmpeg, std::string temp_dir)
        : ffmpeg_(std::move(ffmpeg)), temp_dir_(std::move(temp_dir)) {}

    TempFile extract(const std::string& video_path) override;

private:
    std::string ffmpeg_;
    std::string temp_dir_;
};

} // namespace scribe
