#include <algorithm>
#include <cctype>

#include "job_poller.hpp"
#include "scribe_log.hpp"

namespace scribe {

static constexpr const char* kEmptyText   = "получен пустой текст транскрипции";
static constexpr const char* kCancelled   = "транскрибация отменена";
static constexpr const char* kTimedOut    = "превышено время ожидания транскрибации";
static constexpr const char* kServiceFail = "ошибка сервиса транскрибации";

const char* to_string(PollState s) noexcept {
    switch (s) {
    case PollState::Created:   return "created";
    case PollState::Submitted: return "submitted";
    case PollState::Polling:   return "polling";
    case PollState::Completed: return "completed";
    case PollState::Failed:    return "failed";
    }
    return "unknown";
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

JobPoller::JobPoller(SpeechApi& api, RetryExecutor& retry, ProgressBridge& progress,
                     const PollConfig& cfg, std::shared_ptr<CancellationSignal> signal)
    : api_(api), retry_(retry), progress_(progress), cfg_(cfg), signal_(std::move(signal)),
      estimator_(signal_, std::chrono::milliseconds(cfg.tick_interval_ms)) {}

void JobPoller::transition(PollState next) {
    if (next == state_) return;
    SLOG(debug) << "job " << (job_.id.empty() ? "-" : job_.id) << ": "
                << to_string(state_) << " -> " << to_string(next);
    state_ = next;
}

// The final tick goes out only after the estimator has returned, so a caller
// never sees progress move after the terminal update.
void JobPoller::stop_estimator() {
    signal_->set();
    estimator_.join();
}

// Terminal failures land at the near-max bound, or where progress already is
// if a low bound would move it backwards.
int JobPoller::near_max() const {
    return std::max(cfg_.near_max_percent, progress_.last_percent());
}

TranscriptionFailure JobPoller::failure(const std::string& message, int progress) {
    stop_estimator();
    if (!progress_.failure_reported()) progress_.fail(progress, message);
    transition(PollState::Failed);
    SLOG(error) << "job " << (job_.id.empty() ? "-" : job_.id) << " failed at " << progress << "%: " << message;
    return TranscriptionFailure(message, progress);
}

std::string JobPoller::run(const std::string& audio_url, const std::string& language_code, int start_progress) {
    if (state_ != PollState::Created) throw std::logic_error("JobPoller::run called twice");

    try {
        if (signal_->is_set()) throw failure(kCancelled, progress_.last_percent());

        job_.id = retry_.run("submit", [&]{ return api_.submit(audio_url, language_code); });
        if (job_.id.empty()) throw failure(kServiceFail, progress_.last_percent());
        transition(PollState::Submitted);

        return poll(start_progress);
    } catch (const TranscriptionFailure& e) {
        if (state_ != PollState::Failed) throw failure(e.what(), e.progress());
        throw;
    } catch (const NetworkExhausted& e) {
        stop_estimator();
        SLOG(error) << e.what();
        throw failure("ошибка сети после " + std::to_string(e.attempts()) + " попыток",
                      progress_.last_percent());
    } catch (const RemoteBusinessError& e) {
        stop_estimator();
        SLOG(error) << e.what();
        throw failure(kServiceFail, progress_.last_percent());
    } catch (const SessionNotReady& e) {
        stop_estimator();
        SLOG(error) << e.what();
        throw failure(std::string("внутренняя ошибка: ") + e.what(), progress_.last_percent());
    } catch (const std::exception& e) {
        stop_estimator();
        SLOG(error) << "unexpected error in job " << job_.id << ": " << e.what();
        throw failure(std::string("внутренняя ошибка: ") + e.what(), progress_.last_percent());
    }
}

std::string JobPoller::poll(int start_progress) {
    using clock = std::chrono::steady_clock;
    const auto started = clock::now();

    const auto window = make_window(start_progress, std::max(cfg_.near_max_percent, start_progress),
                                    std::chrono::milliseconds(cfg_.estimate_duration_ms));
    estimator_.start(window, [this](int pct) { progress_.report(pct); });
    transition(PollState::Polling);

    while (true) {
        const StatusReport report = retry_.run("status", [&]{ return api_.fetch(job_.id); });
        if (!job_.apply(report)) {
            SLOG(warning) << "job " << job_.id << ": ignoring status " << to_string(report.status)
                          << " after " << to_string(job_.status);
        }
        SLOG(info) << "Transcript " << job_.id << " status: " << to_string(job_.status);

        if (job_.status == JobStatus::Completed) {
            stop_estimator();
            // no text field and empty text are the same failure
            const std::string text = job_.result_text.value_or("");
            if (is_blank(text)) throw failure(kEmptyText, near_max());
            progress_.report(100);
            transition(PollState::Completed);
            return text;
        }
        if (job_.status == JobStatus::Error) {
            stop_estimator();
            const std::string code = job_.error_code.value_or("unknown");
            SLOG(warning) << "job " << job_.id << ": remote error_code=" << code;
            throw failure(error_message_for(code), near_max());
        }

        if (cfg_.timeout_ms > 0 &&
            clock::now() - started >= std::chrono::milliseconds(cfg_.timeout_ms)) {
            stop_estimator();
            throw failure(kTimedOut, progress_.last_percent());
        }
        if (signal_->wait_for(std::chrono::milliseconds(cfg_.interval_ms))) {
            stop_estimator();
            throw failure(kCancelled, progress_.last_percent());
        }
    }
}

} // namespace scribe
