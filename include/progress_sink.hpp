#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "scribe_config.hpp"

namespace scribe {

struct ProgressEvent {
    int                        percent{0};
    std::optional<std::string> message;   // set on the failure tick only
};

// Receiver of (percent, optional error message) updates.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void deliver(int percent, const std::optional<std::string>& message) = 0;
};

// Invokes a function inline, on whichever thread produced the update.
class DirectSink : public ProgressSink {
public:
    using Fn = std::function<void(int, const std::optional<std::string>&)>;

    explicit DirectSink(Fn fn) : fn_(std::move(fn)) {}
    void deliver(int percent, const std::optional<std::string>& message) override { fn_(percent, message); }

private:
    Fn fn_;
};

// Bounded multi-producer queue between the transcription side and a
// presentation loop running elsewhere.
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Waits up to timeout for room. False when still full or the channel is closed.
    bool send(ProgressEvent ev, std::chrono::milliseconds timeout);

    // Waits up to timeout for an event. Empty on timeout, or once closed and drained.
    std::optional<ProgressEvent> receive(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    std::size_t size() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mu_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<ProgressEvent> q_;
    bool closed_{false};
};

// Posts into a ProgressChannel. An event that cannot be queued within the
// timeout is logged and dropped; the caller never blocks longer than that.
class ChannelSink : public ProgressSink {
public:
    ChannelSink(std::shared_ptr<ProgressChannel> channel, std::chrono::milliseconds timeout)
        : channel_(std::move(channel)), timeout_(timeout) {}

    void deliver(int percent, const std::optional<std::string>& message) override;

    std::size_t dropped() const { return dropped_.load(); }

private:
    std::shared_ptr<ProgressChannel> channel_;
    std::chrono::milliseconds timeout_;
    std::atomic<std::size_t> dropped_{0};
};

// Front of every sink: clamps to [0,100], skips exact repeats, keeps a sink
// failure from reaching the pipeline, and remembers what was last shown.
class ProgressBridge {
public:
    explicit ProgressBridge(ProgressSink* sink) : sink_(sink) {}

    void report(int percent);
    void fail(int percent, const std::string& message);

    int  last_percent() const;
    bool failure_reported() const;

private:
    void deliver(int percent, const std::optional<std::string>& message);

    ProgressSink* sink_;
    mutable std::mutex mu_;
    int  last_{-1};
    bool failed_{false};
};

// "🟢🟢⚪⚪⚪⚪⚪⚪⚪⚪ 20%" or "❌ message"; no state, no I/O.
std::string render_progress_bar(int percent, const std::optional<std::string>& error,
                                const ProgressBarStyle& style);

} // namespace scribe
