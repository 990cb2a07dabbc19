/**
 * filemover - moves files out of a directory once they stop changing
 *
 * Runs as a long-lived daemon: the orchestrator cycles on its own thread
 * while the main thread runs a GLib main loop for SIGTERM/SIGINT handling
 * and desktop notifications.
 */

#include "load_sampler.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "metrics_store.hpp"
#include "notifications.hpp"
#include "orchestrator.hpp"
#include "pushover_notifier.hpp"
#include "settings.hpp"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cxxabi.h>
#include <execinfo.h>
#include <glib-unix.h>
#include <gio/gio.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace filemover;

namespace {

constexpr int EXIT_CONFIG_INVALID = 2;

// Set before crash handlers are installed; read from the handler only
char crash_file_path[4096] = "/tmp/filemover-crash.log";

/**
 * Crash handler - writes stack trace to the crash log next to the log file
 */
void crash_handler(int sig) {
    FILE* f = fopen(crash_file_path, "a");
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
    for (int i = 0; symbols && i < stack_size; i++) {
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
        fprintf(stderr, "\n*** CRASH: Signal %d. Stack trace saved to %s ***\n", sig, crash_file_path);
    }

    // Re-raise the signal to get core dump if enabled
    signal(sig, SIG_DFL);
    raise(sig);
}

void install_crash_handlers(const std::string& log_file) {
    std::string dir = std::filesystem::path(log_file).parent_path().string();
    if (!dir.empty()) {
        snprintf(crash_file_path, sizeof(crash_file_path), "%s/crash.log", dir.c_str());
    }

    struct rlimit core_limit;
    core_limit.rlim_cur = RLIM_INFINITY;
    core_limit.rlim_max = RLIM_INFINITY;
    setrlimit(RLIMIT_CORE, &core_limit);

    signal(SIGSEGV, crash_handler);
    signal(SIGABRT, crash_handler);
    signal(SIGFPE, crash_handler);
    signal(SIGBUS, crash_handler);
    signal(SIGILL, crash_handler);
}

struct CommandLine {
    std::string config_path = Settings::default_config_path();
    std::string source;
    std::string destination;
    bool dry_run = false;
    bool verify = false;
    bool once = false;
    bool check_config = false;
    bool write_config = false;
    bool debug = false;
    bool help = false;
    std::string error;
};

void print_usage() {
    std::cout << "filemover - move files once they stop changing\n\n"
              << "Usage: filemover [options]\n\n"
              << "Options:\n"
              << "  --config PATH    Settings file (default ~/.config/filemover/settings.json)\n"
              << "  --source DIR     Directory to watch\n"
              << "  --dest DIR       Directory to move stable files into\n"
              << "  --dry-run        Log intended moves without touching files\n"
              << "  --verify         Verify SHA-256 of each copy before committing\n"
              << "  --once           Run a single cycle and exit\n"
              << "  --check-config   Validate settings and exit\n"
              << "  --write-config   Save the merged settings to the settings file and exit\n"
              << "  --debug          Enable debug logging\n"
              << "  --help           Show this help message\n";
}

CommandLine parse_args(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                cmd.error = arg + " requires a value";
                return;
            }
            out = argv[++i];
        };

        if (arg == "--config") {
            value(cmd.config_path);
        } else if (arg == "--source") {
            value(cmd.source);
        } else if (arg == "--dest") {
            value(cmd.destination);
        } else if (arg == "--dry-run") {
            cmd.dry_run = true;
        } else if (arg == "--verify") {
            cmd.verify = true;
        } else if (arg == "--once") {
            cmd.once = true;
        } else if (arg == "--check-config") {
            cmd.check_config = true;
        } else if (arg == "--write-config") {
            cmd.write_config = true;
        } else if (arg == "--debug") {
            cmd.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else {
            cmd.error = "unknown option: " + arg;
        }
        if (!cmd.error.empty()) break;
    }
    return cmd;
}

struct SignalContext {
    Orchestrator* orchestrator;
};

gboolean shutdown_handler_glib(gpointer user_data) {
    auto* ctx = static_cast<SignalContext*>(user_data);
    Logger::info("[Shutdown] Signal received, stopping after the current cycle...");
    ctx->orchestrator->request_shutdown();
    return G_SOURCE_CONTINUE;
}

gboolean quit_loop(gpointer user_data) {
    g_main_loop_quit(static_cast<GMainLoop*>(user_data));
    return G_SOURCE_REMOVE;
}

GApplication* register_application() {
    GApplication* app = g_application_new("io.github.filemover", G_APPLICATION_NON_UNIQUE);
    GError* error = nullptr;
    if (!g_application_register(app, nullptr, &error)) {
        Logger::warn("[Init] Desktop notifications unavailable: " +
                     std::string(error ? error->message : "registration failed"));
        if (error) g_error_free(error);
        g_object_unref(app);
        return nullptr;
    }
    return app;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd = parse_args(argc, argv);
    if (cmd.help) {
        print_usage();
        return 0;
    }
    if (!cmd.error.empty()) {
        std::cerr << "filemover: " << cmd.error << "\n\n";
        print_usage();
        return EXIT_CONFIG_INVALID;
    }

    Settings settings(cmd.config_path);
    bool loaded = settings.load();

    if (!cmd.source.empty()) settings.set_string("source_dir", cmd.source);
    if (!cmd.destination.empty()) settings.set_string("destination_dir", cmd.destination);
    if (cmd.dry_run) settings.set_bool("dry_run", true);
    if (cmd.verify) settings.set_bool("verify_checksum", true);
    if (cmd.debug) settings.set_bool("debug_logging", true);

    bool debug_mode = settings.debug_logging();
    Logger::init(debug_mode ? LogLevel::DEBUG : LogLevel::INFO, settings.log_file());
    install_crash_handlers(settings.log_file());
    Logger::info("filemover - Starting...");
    if (!loaded) Logger::debug("[Init] Running on defaults and command line values");
    if (debug_mode) Logger::debug("Debug mode enabled");

    if (cmd.write_config) {
        bool saved = settings.save();
        std::cout << (saved ? "Settings written to " : "Failed to write ") << settings.path() << "\n";
        Logger::shutdown();
        return saved ? 0 : 1;
    }

    std::vector<std::string> errors = settings.validate();
    if (!errors.empty()) {
        std::cerr << "Invalid configuration (" << settings.path() << "):\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
            Logger::error("[Settings] " + error);
        }
        Logger::shutdown();
        return EXIT_CONFIG_INVALID;
    }
    if (cmd.check_config) {
        std::cout << "Configuration OK\n";
        Logger::shutdown();
        return 0;
    }

    EngineContext context;
    context.config = settings.to_config();

    // Notifications
    auto notifications = std::make_shared<NotificationManager>(context.config.notification_rate_limit);
    GApplication* app = nullptr;
    if (settings.desktop_notifications()) {
        app = register_application();
        if (app) {
            notifications->add_sink(std::make_shared<DesktopNotifier>(app));
        }
    }
    std::string pushover_token = settings.get_string("pushover_app_token");
    std::string pushover_user = settings.get_string("pushover_user_key");
    if (!pushover_token.empty() && !pushover_user.empty()) {
        auto pushover = std::make_shared<PushoverNotifier>(
            pushover_token, pushover_user,
            PushoverNotifier::parse_devices(settings.get_string("selected_devices")));
        if (pushover->verify()) {
            notifications->add_sink(pushover);
        } else {
            Logger::error("[Init] Pushover credentials rejected, Pushover notifications disabled");
        }
    }
    Logger::info("[Init] " + std::to_string(notifications->sink_count()) + " notification channel(s) active");
    context.notifier = notifications;

    // Metrics
    std::shared_ptr<MetricsStore> store;
    std::string metrics_db = settings.metrics_db();
    if (!metrics_db.empty()) {
        store = std::make_shared<MetricsStore>(metrics_db);
        if (!store->initialize()) {
            Logger::warn("[Init] Metrics will not be persisted");
            store.reset();
        }
    }
    auto metrics = std::make_shared<MetricsCollector>(store);
    if (!metrics->load()) {
        Logger::warn("[Init] Could not load previous metrics");
    }
    context.metrics = metrics;

    // Load sensing
    auto sampler = std::make_shared<ProcLoadSampler>(context.config.destination_dir);
    if (sampler->available()) {
        context.load_sampler = sampler;
    } else {
        Logger::info("[Init] /proc not available, concurrency fixed at max_workers");
        context.load_sampler = std::make_shared<NullLoadSampler>();
    }

    Orchestrator orchestrator(context);

    int exit_code = 0;
    if (cmd.once) {
        orchestrator.run_once();
        exit_code = orchestrator.statistics().total_errors() > 0 ? 1 : 0;
    } else {
        GMainLoop* loop = g_main_loop_new(nullptr, FALSE);
        SignalContext signal_ctx{&orchestrator};
        guint term_source = g_unix_signal_add(SIGTERM, shutdown_handler_glib, &signal_ctx);
        guint int_source = g_unix_signal_add(SIGINT, shutdown_handler_glib, &signal_ctx);

        std::thread worker([&orchestrator, loop]() {
            try {
                orchestrator.run();
            } catch (const std::exception& e) {
                Logger::error("[Main] Orchestrator terminated: " + std::string(e.what()));
            }
            g_idle_add(quit_loop, loop);
        });

        g_main_loop_run(loop);
        worker.join();

        g_source_remove(term_source);
        g_source_remove(int_source);
        g_main_loop_unref(loop);
    }

    if (!metrics->flush()) {
        Logger::warn("[Shutdown] Metrics could not be persisted");
    }
    Logger::info("[Shutdown] Last 24h: " + metrics->performance_summary(24).to_string());

    if (store) {
        store->close();
    }
    if (app) {
        g_object_unref(app);
    }

    size_t abandoned = orchestrator.abandoned_transfers();
    Logger::info("filemover - Exiting");
    Logger::shutdown();

    if (abandoned > 0) {
        // Detached transfer threads may still be running; skip static destructors under them
        std::fflush(nullptr);
        _exit(exit_code);
    }
    return exit_code;
}
