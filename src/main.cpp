#include "config.hpp"
#include "console_ui.hpp"
#include "directory_scanner.hpp"
#include "http_server.hpp"
#include "maintenance_loop.hpp"
#include "server_log.hpp"
#include "session_pool.hpp"
#include "source_registry.hpp"
#include "ssh_session.hpp"
#include "stream_hub.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <string>
#include <thread>

using namespace tailf;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

void print_usage(const char* program) {
    std::cout << "tailf-hub - live log tailing for local and SSH-reachable files\n\n";
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config PATH     JSON configuration file\n";
    std::cout << "  --http-port PORT  HTTP port for the SSE server (default: 8000)\n";
    std::cout << "  --tui             Interactive console instead of plain log output\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program << " --config tailf.json --http-port 8000\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    int http_port = -1;
    bool use_tui = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
        else if (arg == "--http-port" && i + 1 < argc) {
            try {
                http_port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                http_port = -1;
            }
            if (http_port <= 0 || http_port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        }
        else if (arg == "--tui") {
            use_tui = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        AppConfig config = config_path.empty() ? AppConfig{} : AppConfig::load(config_path);
        if (http_port > 0) {
            config.server.port = static_cast<std::uint16_t>(http_port);
        }
        ServerLog::log("Main", config_path.empty()
            ? std::string("No configuration given, starting empty")
            : "Configuration: " + config_path);

        SshConnector connector;
        SessionPool pool(connector, PoolSettings::from(config.engine));

        HubSettings hub_settings;
        hub_settings.queue_capacity = config.engine.queue_capacity;
        hub_settings.backlog_lines = config.engine.backlog_lines;
        StreamHub hub(hub_settings);

        SourceRegistry registry(hub, pool, TailerSettings::from(config.engine));
        registry.load(config);

        DirectoryScanner scanner(registry, pool);
        scanner.scan_all();

        MaintenanceLoop maintenance;
        maintenance.schedule_every("pool-sweep", config.engine.sweep_interval, [&pool]() {
            pool.sweep();
        });
        maintenance.schedule_every("directory-rescan", config.engine.rescan_interval, [&scanner]() {
            scanner.scan_all();
        });

        registry.start();
        maintenance.start();

        HttpServer http(registry, hub, pool, config.server);
        http.start();

        if (use_tui) {
            ConsoleUI ui(registry, hub, pool, scanner, maintenance, config.server.port);
            ServerLog::set_sink(ui.get_log_sink());
            ui.run(running);
            ServerLog::set_sink(nullptr);
        } else {
            ServerLog::log("Main", "Ready. SSE endpoint: http://localhost:" +
                           std::to_string(config.server.port) + "/api/logs/stream?source=<id>");
            while (running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        ServerLog::log("Main", "Shutting down...");
        http.stop();
        maintenance.stop();
        registry.stop();
        hub.close_all();
        pool.close_all();
        ServerLog::log("Main", "Shutdown complete");

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
