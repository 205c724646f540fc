#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "errors.hpp"
#include "fakes.hpp"
#include "job_poller.hpp"

using namespace scribe;
using namespace scribe::test;
using namespace std::chrono;

namespace {

struct Harness {
    ScribeConfig cfg = fast_config();
    FakeSpeechApi api;
    RecordingSink sink;
    ProgressBridge progress{&sink};
    std::shared_ptr<CancellationSignal> signal = std::make_shared<CancellationSignal>();
    RetryExecutor retry{cfg.retry, [](milliseconds){}};

    std::unique_ptr<JobPoller> poller() {
        return std::make_unique<JobPoller>(api, retry, progress, cfg.poll, signal);
    }
};

void assert_non_decreasing_until_terminal(const std::vector<ProgressEvent>& ev) {
    for (std::size_t i = 1; i < ev.size(); ++i) {
        if (ev[i].message) {
            assert(i == ev.size() - 1);
            continue;
        }
        assert(ev[i].percent >= ev[i - 1].percent);
    }
}

std::string expect_failure(Harness& h, int* progress_out = nullptr) {
    auto p = h.poller();
    try {
        p->run("https://cdn.fake/upload/1", "ru", 20);
    } catch (const TranscriptionFailure& e) {
        assert(p->state() == PollState::Failed);
        if (progress_out) *progress_out = e.progress();
        return e.what();
    }
    assert(false && "expected TranscriptionFailure");
    return {};
}

} // namespace

int main() {
    std::cout << "[Test] Starting Job Poller Test..." << std::endl;

    // queued, processing, processing, completed("hello")
    {
        Harness h;
        h.api.script = {status(JobStatus::Queued), status(JobStatus::Processing),
                        status(JobStatus::Processing), completed("hello")};
        h.progress.report(20);

        auto p = h.poller();
        auto text = p->run("https://cdn.fake/upload/1", "ru", 20);
        assert(text == "hello");
        assert(p->state() == PollState::Completed);
        assert(p->job().id == "job-1");
        assert(p->job().status == JobStatus::Completed);
        assert(h.api.fetch_calls == 4);
        assert(h.signal->is_set());

        auto ev = h.sink.events();
        assert(ev.back().percent == 100);
        assert(!ev.back().message);
        assert_non_decreasing_until_terminal(ev);
        for (std::size_t i = 0; i + 1 < ev.size(); ++i) assert(ev[i].percent <= 95);
    }

    // processing, error(rate_limit_exceeded)
    {
        Harness h;
        h.api.script = {status(JobStatus::Processing), errored("rate_limit_exceeded")};
        int at = -1;
        auto msg = expect_failure(h, &at);
        assert(msg == "превышен лимит запросов");
        assert(at == 95);

        auto ev = h.sink.events();
        assert(ev.back().message && *ev.back().message == "превышен лимит запросов");
        assert(ev.back().percent == 95);
        for (const auto& e : ev) assert(e.percent != 100);
    }

    // Unknown or missing error code.
    {
        Harness h;
        h.api.script = {StatusReport{JobStatus::Error, std::string("partial text"), std::nullopt}};
        assert(expect_failure(h) == "неизвестная ошибка");
    }

    // Completed with empty, missing or blank text: one failure kind, never 100.
    {
        Harness a, b, c;
        a.api.script = {completed("")};
        b.api.script = {StatusReport{JobStatus::Completed, std::nullopt, std::nullopt}};
        c.api.script = {status(JobStatus::Processing), completed(" \n\t ")};
        int pa = -1, pb = -1;
        auto ma = expect_failure(a, &pa);
        auto mb = expect_failure(b, &pb);
        auto mc = expect_failure(c);
        assert(ma == mb && mb == mc);
        assert(pa == 95 && pb == 95);
        for (const auto& e : a.sink.events()) assert(e.percent != 100);
        assert(a.progress.failure_reported());
    }

    // Submit exhausts its retry budget.
    {
        Harness h;
        h.api.submit_network_failures = -1;
        h.progress.report(20);
        int at = -1;
        auto msg = expect_failure(h, &at);
        assert(h.api.submit_calls == 3);
        assert(h.api.fetch_calls == 0);
        assert(msg == "ошибка сети после 3 попыток");
        assert(at == 20);
        assert(h.sink.events().back().message);
    }

    // Transient status failures are absorbed by the retry executor.
    {
        Harness h;
        h.api.fetch_network_failures = 2;
        h.api.script = {completed("retried fine")};
        auto p = h.poller();
        assert(p->run("u", "ru", 20) == "retried fine");
        assert(h.api.fetch_calls == 3);
    }

    // A status that moves backwards is ignored.
    {
        Harness h;
        h.api.script = {status(JobStatus::Processing), status(JobStatus::Queued), completed("forward only")};
        auto p = h.poller();
        assert(p->run("u", "ru", 20) == "forward only");
        assert(p->job().status == JobStatus::Completed);
    }

    // The estimator fills the wait, capped at the near-max bound.
    {
        Harness h;
        h.cfg.poll.estimate_duration_ms = 100;
        h.api.script = {status(JobStatus::Processing)};
        for (int i = 0; i < 10; ++i) h.api.script.push_back(status(JobStatus::Processing));
        h.api.script.push_back(completed("slow job"));

        auto p = h.poller();
        assert(p->run("u", "ru", 30) == "slow job");
        auto ev = h.sink.events();
        assert(ev.size() > 2);
        int max_before_final = 0;
        for (std::size_t i = 0; i + 1 < ev.size(); ++i) max_before_final = std::max(max_before_final, ev[i].percent);
        assert(max_before_final > 30 && max_before_final <= 95);
        assert(ev.back().percent == 100);
    }

    // Cancellation from another thread ends the poll loop.
    {
        Harness h;
        h.api.script = {status(JobStatus::Processing)};
        std::thread canceller([&] {
            std::this_thread::sleep_for(milliseconds(100));
            h.signal->set();
        });
        auto msg = expect_failure(h);
        canceller.join();
        assert(msg == "транскрибация отменена");
        assert(h.sink.events().back().message);
    }

    // Overall poll timeout.
    {
        Harness h;
        h.cfg.poll.timeout_ms = 80;
        h.api.script = {status(JobStatus::Queued)};
        auto msg = expect_failure(h);
        assert(msg == "превышено время ожидания транскрибации");
    }

    // A sink that cancels from inside its own callback ends the job instead of hanging.
    {
        ScribeConfig cfg = fast_config();
        FakeSpeechApi api;
        api.script = {status(JobStatus::Processing)};
        auto signal = std::make_shared<CancellationSignal>();
        std::vector<ProgressEvent> seen;
        DirectSink sink([&](int pct, const std::optional<std::string>& msg) {
            seen.push_back(ProgressEvent{pct, msg});
            if (pct >= 40) signal->set();
        });
        ProgressBridge progress(&sink);
        RetryExecutor retry(cfg.retry, [](milliseconds){});
        progress.report(30);

        JobPoller p(api, retry, progress, cfg.poll, signal);
        bool failed = false;
        try {
            p.run("u", "ru", 30);
        } catch (const TranscriptionFailure& e) {
            failed = true;
            assert(std::string(e.what()) == "транскрибация отменена");
            assert(e.progress() >= 40);
        }
        assert(failed);
        assert(p.state() == PollState::Failed);
        assert(seen.back().message);
        assert_non_decreasing_until_terminal(seen);
    }

    // A near-max bound below the progress already shown never moves it backwards.
    {
        Harness h;
        h.cfg.poll.near_max_percent = 25;
        h.api.script = {status(JobStatus::Processing), errored("rate_limit_exceeded")};
        h.progress.report(30);
        int at = -1;
        auto p = h.poller();
        try {
            p->run("u", "ru", 30);
        } catch (const TranscriptionFailure& e) {
            at = e.progress();
        }
        assert(at == 30);
        auto ev = h.sink.events();
        assert(ev.back().message && ev.back().percent == 30);
        for (const auto& e : ev) assert(e.percent >= 30);
    }

    // Single use.
    {
        Harness h;
        h.api.script = {completed("once")};
        auto p = h.poller();
        assert(p->run("u", "ru", 20) == "once");
        bool threw = false;
        try {
            p->run("u", "ru", 20);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[PASS] Job Poller Test." << std::endl;
    return 0;
}
