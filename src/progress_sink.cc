#include <algorithm>

#include "progress_sink.hpp"
#include "scribe_log.hpp"

namespace scribe {

bool ProgressChannel::send(ProgressEvent ev, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!not_full_.wait_for(lk, timeout, [&]{ return closed_ || q_.size() < capacity_; })) return false;
    if (closed_) return false;
    q_.push_back(std::move(ev));
    lk.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<ProgressEvent> ProgressChannel::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!not_empty_.wait_for(lk, timeout, [&]{ return closed_ || !q_.empty(); })) return std::nullopt;
    if (q_.empty()) return std::nullopt;
    ProgressEvent ev = std::move(q_.front());
    q_.pop_front();
    lk.unlock();
    not_full_.notify_one();
    return ev;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
}

void ChannelSink::deliver(int percent, const std::optional<std::string>& message) {
    if (!channel_->send(ProgressEvent{percent, message}, timeout_)) {
        ++dropped_;
        SLOG(warning) << "progress update " << percent << "% dropped: receiver did not accept it within "
                      << timeout_.count() << " ms";
    }
}

void ProgressBridge::report(int percent) {
    deliver(percent, std::nullopt);
}

void ProgressBridge::fail(int percent, const std::string& message) {
    deliver(percent, message);
}

int ProgressBridge::last_percent() const {
    std::lock_guard<std::mutex> lk(mu_);
    return last_ < 0 ? 0 : last_;
}

bool ProgressBridge::failure_reported() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failed_;
}

void ProgressBridge::deliver(int percent, const std::optional<std::string>& message) {
    const int pct = std::clamp(percent, 0, 100);

    std::lock_guard<std::mutex> lk(mu_);
    if (failed_) {
        SLOG(debug) << "progress " << pct << "% after failure tick ignored";
        return;
    }
    if (!message && pct == last_) return;

    last_ = pct;
    if (message) failed_ = true;
    if (!sink_) return;

    try {
        sink_->deliver(pct, message);
    } catch (const std::exception& e) {
        SLOG(error) << "progress sink failed at " << pct << "%: " << e.what();
    } catch (...) {
        SLOG(error) << "progress sink failed at " << pct << "%: unknown exception";
    }
}

std::string render_progress_bar(int percent, const std::optional<std::string>& error,
                                const ProgressBarStyle& style) {
    if (error) return "\xE2\x9D\x8C " + *error;

    const int pct    = std::clamp(percent, 0, 100);
    const int dots   = std::max(style.total_dots, 0);
    const int filled = pct * dots / 100;

    std::string bar;
    for (int i = 0; i < filled; ++i)    bar += style.filled;
    for (int i = filled; i < dots; ++i) bar += style.empty;
    return bar + " " + std::to_string(pct) + "%";
}

} // namespace scribe
