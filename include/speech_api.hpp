#pragma once
#include <optional>
#include <string>

#include "http_session.hpp"

namespace scribe {

enum class JobStatus { Queued, Processing, Completed, Error };

const char* to_string(JobStatus s) noexcept;

// One status read of a remote job.
struct StatusReport {
    JobStatus                  status{JobStatus::Queued};
    std::optional<std::string> text;
    std::optional<std::string> error_code;
};

// A remote transcription job. Only the poller mutates it, one status read at
// a time; status never moves backwards.
struct Job {
    std::string                id;
    JobStatus                  status{JobStatus::Queued};
    std::optional<std::string> result_text;
    std::optional<std::string> error_code;

    bool terminal() const noexcept {
        return status == JobStatus::Completed || status == JobStatus::Error;
    }

    // Applies a status read. Returns false (leaving the job untouched) when the
    // report would move the status backwards or the job is already terminal.
    bool apply(const StatusReport& r);
};

// The three calls of the remote speech-to-text service. Implementations throw
// NetworkError for transient failures and RemoteBusinessError otherwise; retry
// policy is applied by the caller.
class SpeechApi {
public:
    virtual ~SpeechApi() = default;

    // POST /upload -> upload_url
    virtual std::string upload(const std::string& file_path) = 0;
    // POST /transcript -> id
    virtual std::string submit(const std::string& audio_url, const std::string& language_code) = 0;
    // GET /transcript/{id}
    virtual StatusReport fetch(const std::string& job_id) = 0;
};

class RemoteSpeechApi : public SpeechApi {
public:
    explicit RemoteSpeechApi(HttpTransport& http) : http_(http) {}

    std::string upload(const std::string& file_path) override;
    std::string submit(const std::string& audio_url, const std::string& language_code) override;
    StatusReport fetch(const std::string& job_id) override;

private:
    HttpTransport& http_;
};

// Remote error_code -> human readable message.
std::string error_message_for(const std::string& code);

// Throws NetworkError for retryable statuses (408, 429, 5xx gateway class) and
// RemoteBusinessError for any other non-2xx status.
void check_http_status(const HttpResponse& resp, const std::string& what);

} // namespace scribe
