/**
 * Ferry - folder copy with live progress
 *
 * GTK4 front-end over the transfer engine:
 * - Source/destination folder selection
 * - Live status, files, size, ETA and elapsed time
 * - Pause, resume and cancel
 * - In-window notification overlay plus desktop notifications
 */

#include "app_window.hpp"
#include "desktop_notifier.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include "transfer_engine.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <gtk/gtk.h>
#include <glib-unix.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <execinfo.h>
#include <cxxabi.h>
#include <openssl/opensslv.h>

using namespace ferry;

/**
 * Crash handler - writes stack trace to log file
 */
static void crash_handler(int sig) {
    const char* home = getenv("HOME");
    std::string crash_file = home ? std::string(home) + "/.cache/ferry/crash.log" : "/tmp/ferry-crash.log";

    if (home) {
        std::string cache_dir = std::string(home) + "/.cache/ferry";
        mkdir(cache_dir.c_str(), 0755);
    }

    FILE* f = fopen(crash_file.c_str(), "a");
    if (!f) f = stderr;

    time_t now = time(nullptr);
    char time_buf[64];
    strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", localtime(&now));

    fprintf(f, "\n========== CRASH REPORT ==========\n");
    fprintf(f, "Time: %s\n", time_buf);
    fprintf(f, "Signal: %d (%s)\n", sig,
            sig == SIGSEGV ? "SIGSEGV (Segmentation fault)" :
            sig == SIGABRT ? "SIGABRT (Abort)" :
            sig == SIGFPE ? "SIGFPE (Floating point exception)" :
            sig == SIGBUS ? "SIGBUS (Bus error)" :
            sig == SIGILL ? "SIGILL (Illegal instruction)" : "Unknown");

    void* stack[64];
    int stack_size = backtrace(stack, 64);
    char** symbols = backtrace_symbols(stack, stack_size);

    fprintf(f, "\nStack trace (%d frames):\n", stack_size);
    for (int i = 0; i < stack_size && symbols; i++) {
        std::string symbol(symbols[i]);
        size_t start = symbol.find('(');
        size_t end = symbol.find('+', start);

        if (start != std::string::npos && end != std::string::npos) {
            std::string mangled = symbol.substr(start + 1, end - start - 1);
            int status;
            char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
            if (status == 0 && demangled) {
                fprintf(f, "  [%d] %s\n      -> %s\n", i, symbols[i], demangled);
                free(demangled);
            } else {
                fprintf(f, "  [%d] %s\n", i, symbols[i]);
            }
        } else {
            fprintf(f, "  [%d] %s\n", i, symbols[i]);
        }
    }
    free(symbols);

    fprintf(f, "===================================\n\n");

    if (f != stderr) {
        fclose(f);
        fprintf(stderr, "\n*** CRASH: Signal %d. Stack trace saved to %s ***\n", sig, crash_file.c_str());
    }

    // Re-raise the signal to get core dump if enabled
    signal(sig, SIG_DFL);
    raise(sig);
}

static GtkApplication* global_app = nullptr;
static std::unique_ptr<TransferEngine> global_engine;

/**
 * Graceful shutdown handler for SIGTERM/SIGINT (GLib version)
 */
static gboolean shutdown_handler_glib(gpointer /*user_data*/) {
    Logger::info("[Shutdown] Signal received - cancelling transfers...");

    SettingsManager::getInstance().save();
    AppWindow::getInstance().shutdown();

    if (global_engine) {
        global_engine->shutdown();
        Logger::info("[Shutdown] Transfer engine stopped");
    }

    if (global_app) {
        g_application_quit(G_APPLICATION(global_app));
    }
    return G_SOURCE_REMOVE;
}

static void install_crash_handlers() {
    struct rlimit core_limit;
    core_limit.rlim_cur = RLIM_INFINITY;
    core_limit.rlim_max = RLIM_INFINITY;
    setrlimit(RLIMIT_CORE, &core_limit);

    signal(SIGSEGV, crash_handler);
    signal(SIGABRT, crash_handler);
    signal(SIGFPE, crash_handler);
    signal(SIGBUS, crash_handler);
    signal(SIGILL, crash_handler);

    // These work with the GTK main loop unlike plain signal()
    g_unix_signal_add(SIGTERM, shutdown_handler_glib, nullptr);
    g_unix_signal_add(SIGINT, shutdown_handler_glib, nullptr);
}

struct LaunchOptions {
    std::string source;
    std::string destination;
};

static LaunchOptions launch_options;

int main(int argc, char* argv[]) {
    install_crash_handlers();

    // Parse arguments and build new argv without consumed options
    bool debug_mode = false;
    std::vector<char*> new_argv;
    new_argv.push_back(argv[0]);

    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        if (arg == "--debug") {
            debug_mode = true;
        } else if (arg == "--source" && i + 1 < argc) {
            launch_options.source = argv[++i];
        } else if (arg == "--destination" && i + 1 < argc) {
            launch_options.destination = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Ferry - copy folders with live progress\n\n"
                      << "Usage: ferry [options]\n\n"
                      << "Options:\n"
                      << "  --source DIR         Prefill the source folder\n"
                      << "  --destination DIR    Prefill the destination folder\n"
                      << "  --debug              Enable debug logging\n"
                      << "  --help               Show this help message\n";
            return 0;
        } else {
            // Keep unconsumed arguments for GTK
            new_argv.push_back(argv[i]);
        }
    }
    int new_argc = static_cast<int>(new_argv.size());

    auto& settings = SettingsManager::getInstance();
    settings.load();

    LogLevel level = debug_mode ? LogLevel::DEBUG : settings.get_log_level();
    Logger::init(level, Logger::default_log_path());
    Logger::info("Ferry - Starting...");
    Logger::info("[Init] Settings loaded from " + settings.get_config_path());
    Logger::info(std::string("[Init] ") + OPENSSL_VERSION_TEXT);
    Logger::info("[Init] GTK version: " + std::to_string(gtk_get_major_version()) + "." +
                 std::to_string(gtk_get_minor_version()) + "." +
                 std::to_string(gtk_get_micro_version()));

    global_engine = std::make_unique<TransferEngine>(settings.engine_config());

    GtkApplication* app = gtk_application_new("io.github.ferry", G_APPLICATION_FLAGS_NONE);
    global_app = app;

    g_signal_connect(app, "activate", G_CALLBACK(+[](GtkApplication* app, gpointer) {
        Logger::debug("[Activate] GTK activate signal received");

        AppWindow& app_window = AppWindow::getInstance();
        if (!app_window.initialize(app, *global_engine)) {
            Logger::error("Fatal: Failed to initialize application window. Exiting.");
            g_application_quit(G_APPLICATION(app));
            return;
        }

        DesktopNotifier::getInstance().init(G_APPLICATION(app));

        app_window.set_source_folder(launch_options.source);
        app_window.set_destination_folder(launch_options.destination);
        app_window.show();
    }), nullptr);

    int status = g_application_run(G_APPLICATION(app), new_argc, new_argv.data());

    Logger::info("[Shutdown] Application run completed, cleaning up...");
    AppWindow::getInstance().shutdown();
    global_engine->shutdown();
    global_engine.reset();
    settings.save();

    g_object_unref(app);
    global_app = nullptr;

    Logger::info("Ferry - Exiting.");
    Logger::shutdown();
    return status;
}
