#pragma once
#include <mutex>
#include <string>

#include "scribe_config.hpp"

typedef void CURL;

namespace scribe {

struct HttpResponse {
    long        status{0};
    std::string body;
};

// Request/response transport bound to one base URL and one set of auth
// headers. Paths are relative to the base URL ("/upload").
// Every request throws SessionNotReady outside open()/close(), and
// NetworkError when no HTTP response was obtained at all.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual HttpResponse post_file(const std::string& path, const std::string& file_path) = 0;
    virtual HttpResponse post_json(const std::string& path, const std::string& body) = 0;
    virtual HttpResponse get(const std::string& path) = 0;
};

// libcurl easy handle kept alive between open() and close(), so its
// connection cache is reused by every request of the session.
class CurlSession : public HttpTransport {
public:
    explicit CurlSession(const RemoteApi& cfg);
    ~CurlSession() override;

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    void open() override;
    void close() override;
    bool is_open() const override;

    HttpResponse post_file(const std::string& path, const std::string& file_path) override;
    HttpResponse post_json(const std::string& path, const std::string& body) override;
    HttpResponse get(const std::string& path) override;

private:
    enum class Method { Get, PostJson, PostFile };

    HttpResponse perform(Method method, const std::string& path, const std::string& payload);

    RemoteApi cfg_;
    std::string api_key_;
    CURL* curl_{nullptr};
    bool global_acquired_{false};
    mutable std::mutex mu_;
};

} // namespace scribe
