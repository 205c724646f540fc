#pragma once
#include <stdexcept>
#include <string>

namespace scribe {

// Transient transport failure: connection reset, timeout, 5xx gateway errors.
// The retry executor retries these and nothing else.
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

// Retry budget consumed. Wraps the message of the last NetworkError.
class NetworkExhausted : public std::runtime_error {
public:
    NetworkExhausted(int attempts, const std::string& last_error)
        : std::runtime_error("network error after " + std::to_string(attempts) +
                             " attempts: " + last_error),
          attempts_(attempts), last_error_(last_error) {}

    int attempts() const noexcept { return attempts_; }
    const std::string& last_error() const noexcept { return last_error_; }

private:
    int attempts_;
    std::string last_error_;
};

// Non-retryable response from the remote service (4xx, unexpected body).
class RemoteBusinessError : public std::runtime_error {
public:
    RemoteBusinessError(long http_status, const std::string& what)
        : std::runtime_error(what), http_status_(http_status) {}

    long http_status() const noexcept { return http_status_; }

private:
    long http_status_;
};

// Domain-level failure carrying the progress reached when it happened.
class TranscriptionFailure : public std::runtime_error {
public:
    TranscriptionFailure(const std::string& message, int progress)
        : std::runtime_error(message), progress_(progress) {}

    int progress() const noexcept { return progress_; }

private:
    int progress_;
};

// Session used before open() or after close().
class SessionNotReady : public std::logic_error {
public:
    explicit SessionNotReady(const std::string& what) : std::logic_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace scribe
