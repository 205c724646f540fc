#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace scribe {

// Extension lists, lowercase, no leading dot.
struct FormatRule {
    std::vector<std::string> audio{"mp3", "wav", "ogg", "m4a", "flac"};
    std::vector<std::string> video{"mp4", "avi", "mov", "mkv", "wmv"};

    bool is_audio(const std::string& ext) const;
    bool is_video(const std::string& ext) const;
};

struct RemoteApi {
    std::string base_url{"https://api.assemblyai.com/v2"};
    std::string api_key;           // empty = read ASSEMBLYAI_API_KEY
    std::string language_code{"ru"};
    long        connect_timeout_ms{10000};
    long        transfer_timeout_ms{0}; // 0 = no limit
    bool        verify_tls{true};
};

struct RetryPolicy {
    int  max_attempts{3};
    long base_delay_ms{1000};
};

struct PollConfig {
    long interval_ms{3000};
    long estimate_duration_ms{30000};
    long tick_interval_ms{500};
    int  near_max_percent{95};
    long timeout_ms{0};            // 0 = poll until terminal
};

struct ProgressBarStyle {
    int         total_dots{10};
    std::string filled{"\xF0\x9F\x9F\xA2"};   // green circle
    std::string empty{"\xE2\x9A\xAA"};        // white circle
};

struct Messages {
    std::string processing_error{
        "\xE2\x9D\x8C Произошла ошибка при обработке файла. Попробуйте еще раз."};
    std::string unsupported_format{
        "\xE2\x9D\x8C Неподдерживаемый формат файла."};
};

struct ScribeConfig {
    RemoteApi        api;
    RetryPolicy      retry;
    PollConfig       poll;
    FormatRule       formats;
    Messages         messages;
    ProgressBarStyle progress_bar;

    long          callback_timeout_ms{3000};
    std::size_t   callback_queue_capacity{32};
    std::uintmax_t max_file_size{500ull * 1024 * 1024};
    std::string   ffmpeg{"ffmpeg"};
    std::string   temp_dir;        // empty = system temp directory
    std::string   log_level{"info"};
};

// Fills *out from a parsed config document. Keys absent from the document keep
// their defaults. Returns false (and logs) when the result is unusable.
bool parse_config(const nlohmann::json& root, ScribeConfig* out);

// Reads and parses a JSON config file; throws ConfigError on failure.
ScribeConfig load_config_file(const std::string& path);

// Key from config, else the ASSEMBLYAI_API_KEY environment variable.
std::string resolve_api_key(const RemoteApi& api);

} // namespace scribe
