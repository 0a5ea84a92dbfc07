/**
 * @file main.cpp
 * @brief wardend entry point
 */

#include "wardend/core/daemon.h"
#include "wardend/ipc/server.h"
#include "wardend/ipc/handlers.h"
#include "wardend/watcher/arbiter.h"
#include "wardend/logger.h"
#include "wardend/config.h"
#include "wardend/common.h"
#include <iostream>
#include <getopt.h>
#include <memory>

using namespace wardend;

void print_version() {
    std::cout << NAME << " " << VERSION << std::endl;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "Process supervisor daemon\n\n"
              << "Options:\n"
              << "  -c, --config PATH    Configuration file path\n"
              << "                       (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -t, --check-config   Validate the configuration and exit\n"
              << "  -v, --verbose        Enable debug logging\n"
              << "  -f, --foreground     Log to stderr instead of the journal\n"
              << "  -h, --help           Show this help message\n"
              << "  --version            Show version information\n"
              << "\n"
              << "Signals:\n"
              << "  SIGTERM, SIGINT, SIGQUIT   Stop all watchers and exit\n"
              << "  SIGHUP                     Reload the configuration\n"
              << "  SIGUSR1                    Log watcher status\n"
              << "\n"
              << "systemd integration:\n"
              << "  systemctl start wardend       Start the daemon\n"
              << "  systemctl reload wardend      Reload the configuration\n"
              << "  journalctl -u wardend -f      View logs\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool verbose = false;
    bool foreground = false;
    bool check_only = false;
    
    static struct option long_options[] = {
        {"config",       required_argument, nullptr, 'c'},
        {"check-config", no_argument,       nullptr, 't'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {"foreground",   no_argument,       nullptr, 'f'},
        {"help",         no_argument,       nullptr, 'h'},
        {"version",      no_argument,       nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };
    
    int opt;
    while ((opt = getopt_long(argc, argv, "c:tvfhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 't':
                check_only = true;
                break;
            case 'v':
                verbose = true;
                break;
            case 'f':
                foreground = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 'V':
                print_version();
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }
    
    // Journald unless running in the foreground
    Logger::init(verbose ? LogLevel::DEBUG : LogLevel::INFO, !foreground);
    
    if (check_only) {
        auto config = Config::load(config_path);
        if (!config) {
            std::cerr << config_path << ": invalid configuration" << std::endl;
            return 1;
        }
        std::cout << config_path << ": " << config->watchers.size() << " watchers, OK" << std::endl;
        return 0;
    }
    
    LOG_INFO("main", "wardend starting - version " + std::string(VERSION));
    
    auto& daemon = Daemon::instance();
    if (!daemon.initialize(config_path)) {
        LOG_ERROR("main", "Failed to initialize daemon");
        return 1;
    }
    if (verbose) {
        Logger::set_level(LogLevel::DEBUG);
    }
    
    const auto config = ConfigManager::instance().get();
    
    auto ipc_server = std::make_unique<IPCServer>(
        config.socket_path,
        config.max_requests_per_sec,
        config.socket_backlog,
        config.socket_timeout_ms
    );
    
    Arbiter* arbiter = daemon.get_service<Arbiter>();
    if (!arbiter) {
        LOG_ERROR("main", "Arbiter missing after initialization");
        return 1;
    }
    Handlers::register_all(*ipc_server, *arbiter);
    
    daemon.register_service(std::move(ipc_server));
    
    // Blocks until shutdown
    int exit_code = daemon.run();
    
    LOG_INFO("main", "wardend shutdown complete");
    Logger::shutdown();
    
    return exit_code;
}
