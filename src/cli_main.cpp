/**
 * ferry-cli - headless front-end
 *
 * Copies one folder and prints the same progress slots the window shows,
 * driven by the engine's event channel. Ctrl+C cancels the copy.
 */

#include "logger.hpp"
#include "settings.hpp"
#include "transfer_engine.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <set>
#include <string>

using namespace ferry;

static std::atomic<bool> interrupted{false};

static void on_interrupt(int) {
    interrupted.store(true);
}

static void print_usage() {
    std::cout << "Usage: ferry-cli [options] <source> <destination>\n\n"
              << "Options:\n"
              << "  --verify    Verify every copy with SHA-256\n"
              << "  --debug     Enable debug logging\n"
              << "  --quiet     Only print the final outcome\n"
              << "  --help      Show this help message\n";
}

static void print_progress(const AggregateProgress& p) {
    std::cout << "\r" << p.percent << "% | " << p.files_text() << " files | " << p.size_text()
              << " | " << p.speed_text() << " | ETA " << p.eta_text() << " | " << p.elapsed_text()
              << " | " << p.status_text << "\033[K" << std::flush;
}

static void print_notifications(TransferEngine& engine, std::set<NotificationId>& printed) {
    auto visible = engine.visible_notifications();
    for (const auto& n : *visible) {
        if (printed.insert(n.id).second) {
            std::cout << "\r\033[K[" << severity_name(n.severity) << "] " << n.message << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    bool debug_mode = false;
    bool quiet = false;
    bool verify = false;
    std::string source;
    std::string destination;

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--verify") {
            verify = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (source.empty()) {
            source = arg;
        } else if (destination.empty()) {
            destination = arg;
        } else {
            print_usage();
            return 2;
        }
    }
    if (source.empty() || destination.empty()) {
        print_usage();
        return 2;
    }

    auto& settings = SettingsManager::getInstance();
    settings.load();

    Logger::init(debug_mode ? LogLevel::DEBUG : settings.get_log_level(), Logger::default_log_path());
    // The progress line owns the terminal
    Logger::set_console_enabled(debug_mode);

    EngineConfig config = settings.engine_config();
    if (verify) {
        config.verify_checksums = true;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    TransferEngine engine(config);
    auto events = engine.subscribe();

    JobId job = engine.start(JobRequest{source, destination});
    std::set<NotificationId> printed;
    bool cancel_sent = false;
    std::shared_ptr<const AggregateProgress> last;

    for (;;) {
        if (interrupted.load() && !cancel_sent) {
            engine.cancel(job);
            cancel_sent = true;
        }

        auto event = events->pop_for(std::chrono::milliseconds(200));
        engine.expire_notifications();
        if (!quiet) {
            print_notifications(engine, printed);
        }

        if (event && event->job_id == job) {
            last = event->snapshot;
            if (event->kind == ProgressEventKind::Finished) break;
        } else {
            // Idle tick: refresh elapsed time and idle ETA
            last = engine.snapshot(job);
            if (last && is_terminal(last->status)) break;
        }
        if (!quiet && last) {
            print_progress(*last);
        }
    }

    if (!quiet) {
        print_notifications(engine, printed);
    }

    auto final_snapshot = engine.snapshot(job);
    engine.shutdown();

    if (!final_snapshot) return 1;
    if (!quiet) {
        print_progress(*final_snapshot);
    }
    std::cout << "\n" << final_snapshot->status_text << "\n";
    Logger::shutdown();

    switch (final_snapshot->status) {
        case JobStatus::Completed:
            return final_snapshot->files_skipped == 0 ? 0 : 3;
        case JobStatus::Cancelled:
            return 130;
        default:
            return 1;
    }
}
