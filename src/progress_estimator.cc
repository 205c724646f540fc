#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "progress_estimator.hpp"
#include "scribe_log.hpp"

namespace scribe {

void CancellationSignal::set() {
    std::unique_lock<std::mutex> lk(mu_);
    set_ = true;
    cv_.notify_all();
    if (tick_thread_ == std::this_thread::get_id()) return;
    cv_.wait(lk, [&]{ return !in_tick_; });
}

bool CancellationSignal::begin_tick() {
    std::lock_guard<std::mutex> lk(mu_);
    if (set_) return false;
    in_tick_ = true;
    tick_thread_ = std::this_thread::get_id();
    return true;
}

void CancellationSignal::end_tick() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        in_tick_ = false;
        tick_thread_ = std::thread::id();
    }
    cv_.notify_all();
}

bool CancellationSignal::is_set() const {
    std::lock_guard<std::mutex> lk(mu_);
    return set_;
}

bool CancellationSignal::wait_for(std::chrono::milliseconds d) const {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [&]{ return set_; });
}

ProgressWindow make_window(int start, int end, std::chrono::milliseconds duration, bool allow_complete) {
    const int cap = allow_complete ? 100 : 99;
    ProgressWindow w;
    w.end      = std::clamp(end, 0, cap);
    w.start    = std::clamp(start, 0, w.end);
    w.duration = duration;
    return w;
}

void simulate_progress(const ProgressWindow& window, CancellationSignal& signal,
                       const TickFn& on_tick, std::chrono::milliseconds tick_interval) {
    if (!on_tick || window.duration.count() <= 0) return;

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    const double duration = static_cast<double>(window.duration.count());
    int last = window.start;

    while (!signal.is_set()) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - t0);
        if (elapsed >= window.duration) break;

        int pct = window.start +
                  static_cast<int>(std::floor(elapsed.count() / duration * (window.end - window.start)));
        pct = std::min(pct, window.end);

        if (pct > last) {
            const bool ran = signal.run_unless_set([&] {
                try {
                    on_tick(pct);
                } catch (const std::exception& e) {
                    SLOG(error) << "progress tick failed: " << e.what();
                } catch (...) {
                    SLOG(error) << "progress tick failed: unknown exception";
                }
            });
            if (!ran) break;
            last = pct;
        }

        if (signal.wait_for(tick_interval)) break;
    }
    SLOG(trace) << "progress estimator stopped at " << last << "%";
}

ProgressEstimator::~ProgressEstimator() {
    if (worker_.joinable()) {
        signal_->set();
        worker_.join();
    }
}

void ProgressEstimator::start(const ProgressWindow& window, TickFn on_tick) {
    if (worker_.joinable()) throw std::logic_error("progress estimator already running");
    auto signal = signal_;
    auto tick   = tick_interval_;
    worker_ = std::thread([window, signal, tick, on_tick = std::move(on_tick)] {
        simulate_progress(window, *signal, on_tick, tick);
    });
}

void ProgressEstimator::join() {
    if (worker_.joinable()) worker_.join();
}

} // namespace scribe
