#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "scribe_config.hpp"
#include "scribe_log.hpp"
#include "transcriber.hpp"

using namespace scribe;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] [--log-level LEVEL] FILE...\n"
              << "\n"
              << "Transcribes audio/video files through the remote speech service.\n"
              << "Progress goes to stderr, each transcript to stdout.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE      JSON config (defaults used when omitted)\n"
              << "  -l, --log-level LEVEL  trace|debug|info|warning|error|fatal\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_level;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        } else {
            files.push_back(arg);
        }
    }
    if (files.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    ScribeConfig cfg;
    try {
        if (!config_path.empty()) cfg = load_config_file(config_path);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    init_logging(log_level.empty() ? cfg.log_level : log_level);

    auto channel = std::make_shared<ProgressChannel>(cfg.callback_queue_capacity);
    ChannelSink sink(channel, std::chrono::milliseconds(cfg.callback_timeout_ms));
    std::atomic<bool> any_failed{false};

    // Presentation loop: the only place that touches the terminal's progress line.
    std::thread ui([&] {
        while (true) {
            auto ev = channel->receive(std::chrono::milliseconds(200));
            if (!ev) {
                if (channel->closed()) break;
                continue;
            }
            if (ev->message) any_failed = true;
            std::cerr << "\r" << render_progress_bar(ev->percent, ev->message, cfg.progress_bar)
                      << (ev->message || ev->percent >= 100 ? "\n" : "") << std::flush;
        }
    });

    int rc = 0;
    try {
        Transcriber transcriber(cfg);
        transcriber.open();
        for (const auto& file : files) {
            // unsupported files never reach the progress channel
            if (!transcriber.accepts(file)) any_failed = true;
            std::cout << transcriber.process_file(file, &sink) << std::endl;
        }
        transcriber.close();
    } catch (const std::exception& e) {
        SLOG(fatal) << "scribe: " << e.what();
        rc = 1;
    }

    channel->close();
    ui.join();

    if (sink.dropped() > 0) SLOG(warning) << sink.dropped() << " progress updates were dropped";
    if (rc == 0 && any_failed) rc = 3;
    return rc;
}
