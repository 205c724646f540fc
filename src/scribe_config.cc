#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "errors.hpp"
#include "scribe_config.hpp"
#include "scribe_log.hpp"

using json = nlohmann::json;

namespace scribe {

static std::string to_lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool contains_ext(const std::vector<std::string>& list, const std::string& ext) {
    const auto e = to_lower_copy(ext);
    return std::find(list.begin(), list.end(), e) != list.end();
}

bool FormatRule::is_audio(const std::string& ext) const { return contains_ext(audio, ext); }
bool FormatRule::is_video(const std::string& ext) const { return contains_ext(video, ext); }

// "mp3" or ["mp3", ".WAV"] -> normalized list; anything else leaves `into` untouched.
static void parse_ext_list(const json& j, std::vector<std::string>& into) {
    std::vector<std::string> out;
    auto push = [&](std::string s) {
        if (!s.empty() && s.front() == '.') s.erase(0, 1);
        if (!s.empty()) out.push_back(to_lower_copy(s));
    };
    if (j.is_string()) {
        push(j.get<std::string>());
    } else if (j.is_array()) {
        for (const auto& el : j) {
            if (el.is_string()) push(el.get<std::string>());
        }
    } else {
        return;
    }
    into = std::move(out);
}

bool parse_config(const json& root, ScribeConfig* out) {
    try {
        ScribeConfig c;

        if (root.contains("api")) {
            const auto& a = root["api"];
            c.api.base_url            = a.value("base_url", c.api.base_url);
            c.api.api_key             = a.value("api_key", c.api.api_key);
            c.api.language_code       = a.value("language_code", c.api.language_code);
            c.api.connect_timeout_ms  = a.value("connect_timeout_ms", c.api.connect_timeout_ms);
            c.api.transfer_timeout_ms = a.value("transfer_timeout_ms", c.api.transfer_timeout_ms);
            c.api.verify_tls          = a.value("verify_tls", c.api.verify_tls);
        }
        while (!c.api.base_url.empty() && c.api.base_url.back() == '/') c.api.base_url.pop_back();

        if (root.contains("retry")) {
            const auto& r = root["retry"];
            c.retry.max_attempts  = r.value("max_attempts", c.retry.max_attempts);
            c.retry.base_delay_ms = r.value("base_delay_ms", c.retry.base_delay_ms);
        }

        if (root.contains("poll")) {
            const auto& p = root["poll"];
            c.poll.interval_ms          = p.value("interval_ms", c.poll.interval_ms);
            c.poll.estimate_duration_ms = p.value("estimate_duration_ms", c.poll.estimate_duration_ms);
            c.poll.tick_interval_ms     = p.value("tick_interval_ms", c.poll.tick_interval_ms);
            c.poll.near_max_percent     = p.value("near_max_percent", c.poll.near_max_percent);
            c.poll.timeout_ms           = p.value("timeout_ms", c.poll.timeout_ms);
        }

        if (root.contains("formats")) {
            const auto& f = root["formats"];
            if (f.contains("audio")) parse_ext_list(f["audio"], c.formats.audio);
            if (f.contains("video")) parse_ext_list(f["video"], c.formats.video);
        }

        if (root.contains("messages")) {
            const auto& m = root["messages"];
            c.messages.processing_error   = m.value("processing_error", c.messages.processing_error);
            c.messages.unsupported_format = m.value("unsupported_format", c.messages.unsupported_format);
        }

        if (root.contains("progress_bar")) {
            const auto& b = root["progress_bar"];
            c.progress_bar.total_dots = b.value("total_dots", c.progress_bar.total_dots);
            c.progress_bar.filled     = b.value("filled", c.progress_bar.filled);
            c.progress_bar.empty      = b.value("empty", c.progress_bar.empty);
        }

        c.callback_timeout_ms     = root.value("callback_timeout_ms", c.callback_timeout_ms);
        c.callback_queue_capacity = root.value("callback_queue_capacity", c.callback_queue_capacity);
        c.max_file_size           = root.value("max_file_size", c.max_file_size);
        c.ffmpeg                  = root.value("ffmpeg", c.ffmpeg);
        c.temp_dir                = root.value("temp_dir", c.temp_dir);
        c.log_level               = to_lower_copy(root.value("log_level", c.log_level));

        if (c.api.base_url.empty()) {
            SLOG(error) << "config: api.base_url is empty";
            return false;
        }
        if (c.retry.max_attempts < 1 || c.retry.base_delay_ms < 0) {
            SLOG(error) << "config: retry.max_attempts must be >= 1 and base_delay_ms >= 0";
            return false;
        }
        if (c.poll.interval_ms <= 0 || c.poll.tick_interval_ms <= 0 || c.poll.estimate_duration_ms <= 0) {
            SLOG(error) << "config: poll intervals must be positive";
            return false;
        }
        if (c.poll.near_max_percent < 1 || c.poll.near_max_percent > 99) {
            SLOG(error) << "config: poll.near_max_percent must be within [1,99]";
            return false;
        }
        if (c.callback_queue_capacity == 0 || c.progress_bar.total_dots <= 0) {
            SLOG(error) << "config: callback_queue_capacity and progress_bar.total_dots must be positive";
            return false;
        }

        *out = std::move(c);
    } catch (const std::exception& e) {
        SLOG(error) << "parse_config error: " << e.what();
        return false;
    }
    return true;
}

ScribeConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw ConfigError("cannot open config file: " + path);

    json root;
    try {
        root = json::parse(in, /*cb*/nullptr, /*allow_exceptions*/true, /*ignore_comments*/true);
    } catch (const std::exception& e) {
        throw ConfigError("config file " + path + " is not valid JSON: " + e.what());
    }

    ScribeConfig cfg;
    if (!parse_config(root, &cfg)) throw ConfigError("invalid config: " + path);
    SLOG(info) << "Loaded config from " << path << " (base_url=" << cfg.api.base_url << ")";
    return cfg;
}

std::string resolve_api_key(const RemoteApi& api) {
    if (!api.api_key.empty()) return api.api_key;
    if (const char* envk = std::getenv("ASSEMBLYAI_API_KEY")) return envk;
    return {};
}

} // namespace scribe
