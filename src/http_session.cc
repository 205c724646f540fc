#include <cstdio>
#include <cstdlib>
#include <memory>

#include <curl/curl.h>

#include "errors.hpp"
#include "http_session.hpp"
#include "scribe_log.hpp"

namespace scribe {

// curl_global_init/cleanup are process-wide; sessions share one reference count.
static std::mutex g_curl_mutex;
static int g_curl_refcount = 0;

static bool acquire_curl_global() {
    std::lock_guard<std::mutex> lk(g_curl_mutex);
    if (g_curl_refcount == 0) {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            SLOG(error) << "curl_global_init failed: " << curl_easy_strerror(rc);
            return false;
        }
    }
    ++g_curl_refcount;
    return true;
}

static void release_curl_global() {
    std::lock_guard<std::mutex> lk(g_curl_mutex);
    if (g_curl_refcount <= 0) return;
    if (--g_curl_refcount == 0) curl_global_cleanup();
}

static size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

static size_t read_file(char* buf, size_t size, size_t nmemb, void* userdata) {
    return std::fread(buf, 1, size * nmemb, static_cast<std::FILE*>(userdata));
}

struct FileCloser { void operator()(std::FILE* f) const { if (f) std::fclose(f); } };
struct SlistFree  { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };

CurlSession::CurlSession(const RemoteApi& cfg) : cfg_(cfg) {}

CurlSession::~CurlSession() { close(); }

void CurlSession::open() {
    std::lock_guard<std::mutex> lk(mu_);
    if (curl_) return;

    if (!global_acquired_) {
        global_acquired_ = acquire_curl_global();
        if (!global_acquired_) throw NetworkError("curl global initialisation failed");
    }
    curl_ = curl_easy_init();
    if (!curl_) throw NetworkError("curl_easy_init failed");

    api_key_ = resolve_api_key(cfg_);
    if (api_key_.empty()) SLOG(warning) << "no API key configured; requests will be unauthenticated";
    SLOG(info) << "HTTP session opened for " << cfg_.base_url;
}

void CurlSession::close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        SLOG(debug) << "HTTP session closed";
    }
    if (global_acquired_) {
        release_curl_global();
        global_acquired_ = false;
    }
}

bool CurlSession::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return curl_ != nullptr;
}

HttpResponse CurlSession::post_file(const std::string& path, const std::string& file_path) {
    return perform(Method::PostFile, path, file_path);
}

HttpResponse CurlSession::post_json(const std::string& path, const std::string& body) {
    return perform(Method::PostJson, path, body);
}

HttpResponse CurlSession::get(const std::string& path) {
    return perform(Method::Get, path, {});
}

HttpResponse CurlSession::perform(Method method, const std::string& path, const std::string& payload) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!curl_) throw SessionNotReady("HTTP session is not open");

    // reset keeps the connection cache, only options are cleared
    curl_easy_reset(curl_);

    curl_slist* raw_headers = nullptr;
    if (!api_key_.empty()) {
        raw_headers = curl_slist_append(raw_headers, ("authorization: " + api_key_).c_str());
    }
    std::unique_ptr<std::FILE, FileCloser> file;
    const std::string url = cfg_.base_url + path;

    switch (method) {
    case Method::Get:
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        break;
    case Method::PostJson:
        raw_headers = curl_slist_append(raw_headers, "content-type: application/json");
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        break;
    case Method::PostFile: {
        file.reset(std::fopen(payload.c_str(), "rb"));
        if (!file) {
            curl_slist_free_all(raw_headers);
            throw TranscriptionFailure("cannot open file for upload: " + payload, 0);
        }
        std::fseek(file.get(), 0, SEEK_END);
        const long size = std::ftell(file.get());
        std::fseek(file.get(), 0, SEEK_SET);
        raw_headers = curl_slist_append(raw_headers, "content-type: application/octet-stream");
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_READFUNCTION, read_file);
        curl_easy_setopt(curl_, CURLOPT_READDATA, file.get());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(size));
        break;
    }
    }
    std::unique_ptr<curl_slist, SlistFree> headers(raw_headers);

    std::string resp;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, cfg_.connect_timeout_ms);
    if (cfg_.transfer_timeout_ms > 0) curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, cfg_.transfer_timeout_ms);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, cfg_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, cfg_.verify_tls ? 2L : 0L);

    if (const char* v = std::getenv("SCRIBE_HTTP_VERBOSE")) {
        if (std::string(v) == "1" || std::string(v) == "true") curl_easy_setopt(curl_, CURLOPT_VERBOSE, 1L);
    }

    SLOG(debug) << (method == Method::Get ? "GET " : "POST ") << url;

    long http_code = 0;
    const CURLcode rc = curl_easy_perform(curl_);
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    if (rc != CURLE_OK) {
        throw NetworkError(std::string("CURL ") + curl_easy_strerror(rc) + " (" + url + ")");
    }
    return HttpResponse{http_code, std::move(resp)};
}

} // namespace scribe
