// =============================================================================
// scrcpy-pilot - entry point
// =============================================================================
// Startup order: config -> logging -> instance lock -> tool resolution ->
// supervisor thread -> discovery poller -> terminal UI (main thread).
// Teardown runs the other way round, and the lock is released only after
// every scrcpy child has been stopped.
// =============================================================================

#include <getopt.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "child_process.hpp"
#include "command_channel.hpp"
#include "config_loader.hpp"
#include "device_discovery.hpp"
#include "instance_lock.hpp"
#include "pilot_log.hpp"
#include "session_supervisor.hpp"
#include "snapshot.hpp"
#include "subprocess.hpp"
#include "terminal_ui.hpp"

namespace {

constexpr int EXIT_ALREADY_RUNNING = 1;
constexpr int EXIT_STARTUP_ERROR   = 2;
constexpr int EXIT_USAGE           = 64;

std::atomic<bool> g_interrupted{false};

extern "C" void onTerminationSignal(int) {
    g_interrupted.store(true);
}

void installSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onTerminationSignal;
    sigemptyset(&sa.sa_mask);
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        sigaction(sig, &sa, nullptr);
    }
    signal(SIGPIPE, SIG_IGN);
}

void printUsage(FILE* out, const char* argv0) {
    fprintf(out,
            "Usage: %s [options]\n"
            "\n"
            "Mirror every connected Android device with scrcpy from one terminal dashboard.\n"
            "\n"
            "Options:\n"
            "  -c, --config <path>   configuration file (default: scrcpy-pilot.json,\n"
            "                        then $XDG_CONFIG_HOME/scrcpy-pilot/config.json)\n"
            "  -h, --help            show this help and exit\n"
            "  -v, --version         print the version and exit\n",
            argv0);
}

pilot::Result<std::string> resolveTool(const std::string& name, const std::string& configured,
                                       const pilot::config::ToolsConfig& tools) {
    if (!configured.empty()) {
        return pilot::findExecutable(configured, {});
    }
    std::vector<std::string> dirs{tools.scrcpy_dir};
    std::string exe_dir = pilot::executableDir();
    if (!exe_dir.empty()) dirs.push_back(exe_dir);
    return pilot::findExecutable(name, dirs);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;

    static const struct option long_opts[] = {
        {"config",  required_argument, nullptr, 'c'},
        {"help",    no_argument,       nullptr, 'h'},
        {"version", no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0},
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:hv", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'h':
                printUsage(stdout, argv[0]);
                return 0;
            case 'v':
                printf("%s %s\n", pilot::config::APP_NAME, pilot::config::APP_VERSION);
                return 0;
            default:
                printUsage(stderr, argv[0]);
                return EXIT_USAGE;
        }
    }
    if (optind < argc) {
        fprintf(stderr, "%s: unexpected argument '%s'\n", argv[0], argv[optind]);
        printUsage(stderr, argv[0]);
        return EXIT_USAGE;
    }

    // --- Configuration / logging ---
    pilot::config::AppConfig cfg = pilot::config::loadConfig(config_path, !config_path.empty());
    pilot::log::setLogLevel(pilot::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !pilot::log::openLogFile(cfg.log.log_path.c_str())) {
        PLOG_WARN("main", "Cannot open log file %s: %s", cfg.log.log_path.c_str(), strerror(errno));
    }
    PLOG_INFO("main", "%s %s starting (pid %d)", pilot::config::APP_NAME,
              pilot::config::APP_VERSION, static_cast<int>(getpid()));

    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        PLOG_FATAL("main", "stdin/stdout must be a terminal");
        fprintf(stderr, "%s: needs an interactive terminal\n", argv[0]);
        return EXIT_STARTUP_ERROR;
    }

    // --- Single instance ---
    std::string lock_path = cfg.lock.lock_path.empty() ? pilot::InstanceLock::defaultPath()
                                                       : cfg.lock.lock_path;
    auto lock = pilot::InstanceLock::acquire(lock_path);
    if (lock.is_err()) {
        const pilot::Error& err = lock.error();
        if (err.kind == pilot::ErrorKind::AlreadyRunning) {
            auto holder = pilot::readLockHolder(lock_path);
            if (holder.is_ok()) {
                fprintf(stderr, "%s is already running (pid %d)\n", pilot::config::APP_NAME,
                        static_cast<int>(holder.value().pid));
            } else {
                fprintf(stderr, "%s is already running\n", pilot::config::APP_NAME);
            }
            PLOG_ERROR("main", "Already running: %s", err.message.c_str());
            return EXIT_ALREADY_RUNNING;
        }
        PLOG_FATAL("main", "Instance lock %s: %s", lock_path.c_str(), err.message.c_str());
        fprintf(stderr, "%s: cannot create lock %s: %s\n", argv[0], lock_path.c_str(),
                err.message.c_str());
        return EXIT_STARTUP_ERROR;
    }

    // --- Tools ---
    auto adb = resolveTool("adb", cfg.tools.adb_path, cfg.tools);
    auto scrcpy = resolveTool("scrcpy", cfg.tools.scrcpy_path, cfg.tools);
    for (const auto* tool : {&adb, &scrcpy}) {
        if (tool->is_err()) {
            PLOG_FATAL("main", "%s", tool->error().message.c_str());
            fprintf(stderr, "%s: %s\n", argv[0], tool->error().message.c_str());
            return EXIT_STARTUP_ERROR;
        }
    }
    PLOG_INFO("main", "adb: %s", adb.value().c_str());
    PLOG_INFO("main", "scrcpy: %s", scrcpy.value().c_str());

    installSignalHandlers();

    // --- Core ---
    pilot::CommandChannel channel;
    pilot::SnapshotStore store;

    pilot::PosixProcessLauncher launcher(
        [&channel](const std::string& device_id, pid_t pid, const std::string& line) {
            channel.post(pilot::ProcessOutput{device_id, pid, line});
        },
        [&channel](const std::string& device_id, pid_t pid, pilot::ExitStatus status) {
            channel.post(pilot::ProcessExited{device_id, pid, status});
        });

    pilot::SessionSupervisor supervisor(
        pilot::SupervisorConfig::fromAppConfig(cfg, scrcpy.value()), channel, launcher, store);

    std::atomic<bool> ui_stop{false};
    std::thread supervisor_thread([&supervisor, &ui_stop] {
        supervisor.run();
        ui_stop.store(true);
    });

    pilot::DiscoveryPoller poller(adb.value(), cfg.discovery, channel);
    poller.start();

    // --- UI (main thread) ---
    pilot::log::setConsoleOutput(false);
    pilot::TerminalUi ui(cfg.ui, store, channel);
    auto ui_result = ui.run(ui_stop, g_interrupted);
    pilot::log::setConsoleOutput(true);

    int exit_code = 0;
    if (ui_result.is_err()) {
        PLOG_FATAL("main", "Terminal UI: %s", ui_result.error().message.c_str());
        fprintf(stderr, "%s: %s\n", argv[0], ui_result.error().message.c_str());
        channel.post(pilot::ShutdownRequest{});
        exit_code = EXIT_STARTUP_ERROR;
    }

    // --- Teardown ---
    supervisor_thread.join();
    poller.stop();
    channel.close();
    lock.value().release();

    PLOG_INFO("main", "Exited cleanly");
    pilot::log::closeLogFile();
    return exit_code;
}
