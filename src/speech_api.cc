#include <unordered_map>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "scribe_log.hpp"
#include "speech_api.hpp"

using json = nlohmann::json;

namespace scribe {

const char* to_string(JobStatus s) noexcept {
    switch (s) {
    case JobStatus::Queued:     return "queued";
    case JobStatus::Processing: return "processing";
    case JobStatus::Completed:  return "completed";
    case JobStatus::Error:      return "error";
    }
    return "unknown";
}

static int rank(JobStatus s) {
    switch (s) {
    case JobStatus::Queued:     return 0;
    case JobStatus::Processing: return 1;
    case JobStatus::Completed:
    case JobStatus::Error:      return 2;
    }
    return 0;
}

bool Job::apply(const StatusReport& r) {
    if (terminal() || rank(r.status) < rank(status)) return false;
    status = r.status;
    if (terminal()) {
        result_text = r.text;
        error_code  = r.error_code;
    }
    return true;
}

std::string error_message_for(const std::string& code) {
    static const std::unordered_map<std::string, std::string> table = {
        {"audio_too_long",       "слишком долгое аудио"},
        {"audio_too_short",      "слишком короткое аудио"},
        {"invalid_audio",        "неверный формат аудио"},
        {"file_too_large",       "слишком большой файл"},
        {"rate_limit_exceeded",  "превышен лимит запросов"},
        {"insufficient_credits", "недостаточно кредитов"},
        {"internal_error",       "внутренняя ошибка сервиса"},
    };
    auto it = table.find(code);
    return it != table.end() ? it->second : "неизвестная ошибка";
}

void check_http_status(const HttpResponse& resp, const std::string& what) {
    if (resp.status / 100 == 2) return;

    const std::string body = resp.body.size() > 512 ? resp.body.substr(0, 512) + "..." : resp.body;
    const std::string msg = what + ": HTTP " + std::to_string(resp.status) + " body: " + body;
    switch (resp.status) {
    case 408: case 429: case 500: case 502: case 503: case 504:
        throw NetworkError(msg);
    default:
        throw RemoteBusinessError(resp.status, msg);
    }
}

static json parse_body(const HttpResponse& resp, const std::string& what) {
    try {
        return json::parse(resp.body);
    } catch (const std::exception& e) {
        throw RemoteBusinessError(resp.status, what + ": JSON parse error: " + e.what());
    }
}

static std::string require_string(const json& j, const char* key, long status, const std::string& what) {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) {
        throw RemoteBusinessError(status, what + ": response has no \"" + key + "\"");
    }
    return j[key].get<std::string>();
}

std::string RemoteSpeechApi::upload(const std::string& file_path) {
    auto resp = http_.post_file("/upload", file_path);
    check_http_status(resp, "upload");
    auto url = require_string(parse_body(resp, "upload"), "upload_url", resp.status, "upload");
    SLOG(info) << "File uploaded: " << url;
    return url;
}

std::string RemoteSpeechApi::submit(const std::string& audio_url, const std::string& language_code) {
    const json payload = {{"audio_url", audio_url}, {"language_code", language_code}};
    auto resp = http_.post_json("/transcript", payload.dump());
    check_http_status(resp, "submit");
    auto id = require_string(parse_body(resp, "submit"), "id", resp.status, "submit");
    SLOG(info) << "Got transcript ID: " << id;
    return id;
}

StatusReport RemoteSpeechApi::fetch(const std::string& job_id) {
    auto resp = http_.get("/transcript/" + job_id);
    check_http_status(resp, "status");
    const json j = parse_body(resp, "status");
    const auto status = require_string(j, "status", resp.status, "status");

    StatusReport r;
    if      (status == "queued")     r.status = JobStatus::Queued;
    else if (status == "processing") r.status = JobStatus::Processing;
    else if (status == "completed")  r.status = JobStatus::Completed;
    else if (status == "error")      r.status = JobStatus::Error;
    else throw RemoteBusinessError(resp.status, "status: unknown job status \"" + status + "\"");

    if (j.contains("text") && j["text"].is_string())             r.text = j["text"].get<std::string>();
    if (j.contains("error_code") && j["error_code"].is_string()) r.error_code = j["error_code"].get<std::string>();
    return r;
}

} // namespace scribe
