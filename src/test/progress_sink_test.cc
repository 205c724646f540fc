#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "fakes.hpp"
#include "progress_sink.hpp"

using namespace scribe;
using namespace scribe::test;
using namespace std::chrono;

class ThrowingSink : public ProgressSink {
public:
    int calls{0};
    void deliver(int, const std::optional<std::string>&) override {
        ++calls;
        throw std::runtime_error("message to edit not found");
    }
};

int main() {
    std::cout << "[Test] Starting Progress Sink Test..." << std::endl;

    // Clamping, duplicate suppression, failure latch.
    {
        RecordingSink sink;
        ProgressBridge bridge(&sink);
        bridge.report(-7);
        bridge.report(0);
        bridge.report(42);
        bridge.report(42);
        bridge.report(250);
        assert(bridge.last_percent() == 100);
        assert(!bridge.failure_reported());

        bridge.fail(95, "превышен лимит запросов");
        bridge.report(100);
        bridge.fail(10, "second failure");

        auto ev = sink.events();
        assert(ev.size() == 4);
        assert(ev[0].percent == 0 && !ev[0].message);
        assert(ev[1].percent == 42);
        assert(ev[2].percent == 100);
        assert(ev[3].percent == 95 && ev[3].message && *ev[3].message == "превышен лимит запросов");
        assert(bridge.failure_reported());
        for (const auto& e : ev) assert(e.percent >= 0 && e.percent <= 100);
    }

    // No sink is fine; a failing sink never reaches the caller.
    {
        ProgressBridge silent(nullptr);
        silent.report(30);
        assert(silent.last_percent() == 30);

        ThrowingSink bad;
        ProgressBridge bridge(&bad);
        bridge.report(10);
        bridge.report(20);
        bridge.fail(20, "boom");
        assert(bad.calls == 3);
    }

    // Non-standard exceptions from a sink are contained too.
    {
        int calls = 0;
        DirectSink odd([&](int, const std::optional<std::string>&){ ++calls; throw 7; });
        ProgressBridge bridge(&odd);
        bridge.report(40);
        bridge.fail(40, "gone");
        assert(calls == 2);
        assert(bridge.failure_reported());
    }

    // Direct sink runs inline.
    {
        auto caller = std::this_thread::get_id();
        std::thread::id seen;
        DirectSink sink([&](int, const std::optional<std::string>&){ seen = std::this_thread::get_id(); });
        ProgressBridge bridge(&sink);
        bridge.report(5);
        assert(seen == caller);
    }

    // Channel: events cross threads in order.
    {
        auto channel = std::make_shared<ProgressChannel>(8);
        ChannelSink sink(channel, milliseconds(100));
        std::vector<int> received;
        std::thread ui([&] {
            while (true) {
                auto ev = channel->receive(milliseconds(50));
                if (!ev) {
                    if (channel->closed()) break;
                    continue;
                }
                received.push_back(ev->percent);
            }
        });
        ProgressBridge bridge(&sink);
        for (int p = 0; p <= 100; p += 10) bridge.report(p);
        channel->close();
        ui.join();
        assert(received.size() == 11);
        for (std::size_t i = 1; i < received.size(); ++i) assert(received[i] > received[i - 1]);
        assert(sink.dropped() == 0);
    }

    // Channel: a stalled receiver costs at most the timeout per event, then drops.
    {
        auto channel = std::make_shared<ProgressChannel>(1);
        ChannelSink sink(channel, milliseconds(50));
        const auto t0 = steady_clock::now();
        sink.deliver(10, std::nullopt);
        sink.deliver(20, std::nullopt);
        sink.deliver(30, std::string("late"));
        const auto took = steady_clock::now() - t0;
        assert(sink.dropped() == 2);
        assert(took >= milliseconds(90));
        assert(took < seconds(2));
        assert(channel->size() == 1);

        auto first = channel->receive(milliseconds(10));
        assert(first && first->percent == 10);
        assert(!channel->receive(milliseconds(10)));
    }

    // Closed channel: no more sends, remaining events still drain.
    {
        ProgressChannel channel(4);
        assert(channel.send(ProgressEvent{1, std::nullopt}, milliseconds(10)));
        channel.close();
        assert(!channel.send(ProgressEvent{2, std::nullopt}, milliseconds(10)));
        auto ev = channel.receive(milliseconds(10));
        assert(ev && ev->percent == 1);
        assert(!channel.receive(milliseconds(10)));
    }

    // Progress bar rendering.
    {
        ProgressBarStyle ascii;
        ascii.total_dots = 10;
        ascii.filled = "#";
        ascii.empty = ".";
        assert(render_progress_bar(0, std::nullopt, ascii) == ".......... 0%");
        assert(render_progress_bar(25, std::nullopt, ascii) == "##........ 25%");
        assert(render_progress_bar(99, std::nullopt, ascii) == "#########. 99%");
        assert(render_progress_bar(100, std::nullopt, ascii) == "########## 100%");
        assert(render_progress_bar(140, std::nullopt, ascii) == "########## 100%");
        assert(render_progress_bar(95, std::string("слишком короткое аудио"), ascii) ==
               "\xE2\x9D\x8C слишком короткое аудио");

        ProgressBarStyle def;
        const std::string g = "\xF0\x9F\x9F\xA2", w = "\xE2\x9A\xAA";
        std::string expected;
        for (int i = 0; i < 3; ++i) expected += g;
        for (int i = 0; i < 7; ++i) expected += w;
        assert(render_progress_bar(30, std::nullopt, def) == expected + " 30%");
    }

    std::cout << "[PASS] Progress Sink Test." << std::endl;
    return 0;
}
