#pragma once
#include <memory>
#include <string>

#include "errors.hpp"
#include "progress_estimator.hpp"
#include "progress_sink.hpp"
#include "retry.hpp"
#include "scribe_config.hpp"
#include "speech_api.hpp"

namespace scribe {

enum class PollState { Created, Submitted, Polling, Completed, Failed };

const char* to_string(PollState s) noexcept;

// Drives one remote job: submit, then poll until completed or error, with a
// progress estimator filling the wait. Single use.
class JobPoller {
public:
    JobPoller(SpeechApi& api, RetryExecutor& retry, ProgressBridge& progress,
              const PollConfig& cfg, std::shared_ptr<CancellationSignal> signal);

    // Returns the non-blank transcript. Every failure, remote or local, leaves
    // as TranscriptionFailure after an error tick has been delivered.
    std::string run(const std::string& audio_url, const std::string& language_code, int start_progress);

    PollState state() const { return state_; }
    const Job& job() const { return job_; }

private:
    std::string poll(int start_progress);
    void transition(PollState next);
    void stop_estimator();
    int near_max() const;
    TranscriptionFailure failure(const std::string& message, int progress);

    SpeechApi& api_;
    RetryExecutor& retry_;
    ProgressBridge& progress_;
    PollConfig cfg_;
    std::shared_ptr<CancellationSignal> signal_;
    ProgressEstimator estimator_;

    PollState state_{PollState::Created};
    Job job_;
};

} // namespace scribe
