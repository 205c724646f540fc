#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace scribe {

// Set-once flag shared between a job's poll loop and its estimator.
// Never cleared; a new job gets a new signal.
class CancellationSignal {
public:
    void set();
    bool is_set() const;

    // Sleeps up to d. Returns true as soon as the signal is set.
    bool wait_for(std::chrono::milliseconds d) const;

    // Invokes fn unless already set. Returns whether fn ran. set() from another
    // thread waits for a running fn, so no fn is in progress once it returns;
    // set() from inside fn returns at once.
    template <typename F>
    bool run_unless_set(F&& fn) {
        if (!begin_tick()) return false;
        struct TickEnd {
            CancellationSignal* self;
            ~TickEnd() { self->end_tick(); }
        } end{this};
        fn();
        return true;
    }

private:
    bool begin_tick();
    void end_tick();

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool set_{false};
    bool in_tick_{false};
    std::thread::id tick_thread_;
};

struct ProgressWindow {
    int start{0};
    int end{0};
    std::chrono::milliseconds duration{0};
};

// Bounds clamped into [0,100], end capped at 99 unless allow_complete,
// start never above end.
ProgressWindow make_window(int start, int end, std::chrono::milliseconds duration,
                           bool allow_complete = false);

using TickFn = std::function<void(int)>;

// Interpolates start..end over window.duration, calling on_tick whenever the
// value grows. Returns when the signal is set or the duration has elapsed.
void simulate_progress(const ProgressWindow& window, CancellationSignal& signal,
                       const TickFn& on_tick, std::chrono::milliseconds tick_interval);

// Runs simulate_progress on its own thread, one window at a time.
class ProgressEstimator {
public:
    ProgressEstimator(std::shared_ptr<CancellationSignal> signal, std::chrono::milliseconds tick_interval)
        : signal_(std::move(signal)), tick_interval_(tick_interval) {}
    ~ProgressEstimator();

    ProgressEstimator(const ProgressEstimator&) = delete;
    ProgressEstimator& operator=(const ProgressEstimator&) = delete;

    // Throws std::logic_error if a window is still running.
    void start(const ProgressWindow& window, TickFn on_tick);

    // Waits for the running window, if any, to return.
    void join();

    bool running() const { return worker_.joinable(); }

private:
    std::shared_ptr<CancellationSignal> signal_;
    std::chrono::milliseconds tick_interval_;
    std::thread worker_;
};

} // namespace scribe
