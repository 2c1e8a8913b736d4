/**
 * @file main.cpp
 * @brief ragd backend daemon entry point
 */

#include "ragd/common.h"
#include "ragd/config.h"
#include "ragd/core/daemon.h"
#include "ragd/core/handlers.h"
#include "ragd/ipc/server.h"
#include "ragd/ipc/socket_stream.h"
#include "ragd/logger.h"
#include "ragd/net/http_transport.h"
#include "ragd/net/offline_guard.h"
#include "ragd/net/ollama_client.h"

#include <cstring>
#include <iostream>
#include <memory>

using namespace ragd;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  -c, --config PATH   Configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -s, --socket PATH   Override the socket path\n"
              << "  -v, --verbose       Log at DEBUG level\n"
              << "  -V, --version       Print version and exit\n"
              << "  -h, --help          Show this help\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string socket_override;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if ((std::strcmp(arg, "-c") == 0 || std::strcmp(arg, "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--socket") == 0) && i + 1 < argc) {
            socket_override = argv[++i];
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            verbose = true;
        } else if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--version") == 0) {
            std::cout << NAME << " " << VERSION << std::endl;
            return 0;
        } else if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    auto& daemon = Daemon::instance();
    if (!daemon.initialize(config_path)) {
        std::cerr << "Failed to initialize " << NAME << std::endl;
        return 1;
    }
    if (verbose) {
        Logger::set_level(LogLevel::DEBUG);
    }

    Config config = ConfigManager::instance().get();

    // Lives until main returns, so every outbound request made by a service
    // goes through the guard
    OfflineGuard::Handle offline;
    if (config.offline) {
        offline = OfflineGuard::install();
        LOG_INFO("main", "Offline mode: outbound network restricted to loopback");
    }

    auto ollama = std::make_shared<OllamaClient>(
        default_http_transport(), config.ollama_url, config.ollama_model,
        Duration(config.http_timeout_ms));

    ServerOptions options;
    options.socket_path = resolve_socket_path(socket_override.empty() ? config.socket_path : socket_override);
    options.backlog = config.socket_backlog;
    options.read_timeout = Duration(config.socket_timeout_ms);
    options.max_requests_per_sec = config.max_requests_per_sec;
    options.job_queue_capacity = static_cast<size_t>(config.job_queue_capacity);

    auto server = std::make_unique<IPCServer>(options);

    HandlerContext context;
    context.data_dir = config.data_dir;
    context.ollama = ollama;
    context.query = std::make_shared<OllamaQueryService>(ollama, config.data_dir);
    Handlers::register_all(*server, std::move(context));

    daemon.register_service(std::move(server));

    int exit_code = daemon.run();

    offline.restore();
    Logger::shutdown();
    return exit_code;
}
