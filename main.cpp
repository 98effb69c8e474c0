#include "engine/ExecutionManager.hpp"
#include "engine/NodeHandlerRegistry.hpp"
#include "nodes/register.hpp"
#include "server/EventHub.hpp"
#include "server/HttpServer.hpp"
#include "server/Logger.hpp"
#include "server/RequestHandler.hpp"
#include "storage/BatchStorage.hpp"
#include <csignal>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>

using namespace automflow;
using namespace automflow::server;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }

    struct ServerOptions {
        std::string address = "0.0.0.0";
        unsigned short port = 8080;
        std::string dbPath = "./automflow.db";   // empty disables persistence
        std::string logFile;
        LogLevel logLevel = LogLevel::INFO;
        engine::ExecutionManagerConfig manager;
    };

    std::string trim(std::string s) {
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
        return s;
    }

    int parseInt(const std::string& key, const std::string& value) {
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size()) throw std::invalid_argument(value);
            return parsed;
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid value for " + key + ": " + value);
        }
    }

    /**
     * Apply one setting, by config-file key
     */
    void applySetting(ServerOptions& options, const std::string& key, const std::string& value) {
        if (key == "port") {
            int port = parseInt(key, value);
            if (port < 0 || port > 65535) throw std::invalid_argument("Invalid port: " + value);
            options.port = static_cast<unsigned short>(port);
        } else if (key == "address") {
            options.address = value;
        } else if (key == "workers") {
            options.manager.maxWorkers = parseInt(key, value);
            if (options.manager.maxWorkers < 1) throw std::invalid_argument("workers must be at least 1");
        } else if (key == "db") {
            options.dbPath = value;
        } else if (key == "log_level") {
            options.logLevel = Logger::parseLevel(value, options.logLevel);
        } else if (key == "log_file") {
            options.logFile = value;
        } else if (key == "eviction_ms") {
            options.manager.evictionDelayMs = parseInt(key, value);
        } else if (key == "output") {
            options.manager.defaultOutputPath = value;
        } else {
            LOG_WARN("Unknown config key: " + key);
        }
    }

    /**
     * key=value lines, '#' comments. A leading '@' on the path is accepted.
     */
    std::map<std::string, std::string> readConfigFile(std::string path) {
        if (!path.empty() && path[0] == '@') path = path.substr(1);
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + path);
        }

        std::map<std::string, std::string> params;
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            auto eq = line.find('=');
            if (eq == std::string::npos) continue;
            params[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
        }
        return params;
    }

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [options]\n"
                  << "Options:\n"
                  << "  -p, --port PORT        Port to listen on (default: 8080)\n"
                  << "  -a, --address ADDR     Address to bind to (default: 0.0.0.0)\n"
                  << "  -w, --workers N        Global worker cap (default: 4)\n"
                  << "  -d, --db PATH          SQLite database for batches (default: ./automflow.db, \"\" disables)\n"
                  << "  -l, --log-level LVL    Log level: debug, info, warn, error (default: info)\n"
                  << "  --log-file PATH        Also write logs to a file\n"
                  << "  --eviction-ms MS       Keep finished executions in memory this long (default: 5000)\n"
                  << "  --output PATH          Default batch output path (default: ./output)\n"
                  << "  --config FILE          Settings file (key=value lines, @file syntax)\n"
                  << "                         Keys: port address workers db log_level log_file eviction_ms output\n"
                  << "  -h, --help             Show this help\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        ServerOptions options;

        // Options sur la ligne de commande, le fichier de config d'abord
        std::map<std::string, std::string> cliSettings;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << std::endl;
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "-p" || arg == "--port") cliSettings["port"] = value;
            else if (arg == "-a" || arg == "--address") cliSettings["address"] = value;
            else if (arg == "-w" || arg == "--workers") cliSettings["workers"] = value;
            else if (arg == "-d" || arg == "--db") cliSettings["db"] = value;
            else if (arg == "-l" || arg == "--log-level") cliSettings["log_level"] = value;
            else if (arg == "--log-file") cliSettings["log_file"] = value;
            else if (arg == "--eviction-ms") cliSettings["eviction_ms"] = value;
            else if (arg == "--output") cliSettings["output"] = value;
            else if (arg == "--config") {
                for (const auto& [key, setting] : readConfigFile(value)) {
                    applySetting(options, key, setting);
                }
            } else {
                std::cerr << "Error: Unknown option " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
        for (const auto& [key, value] : cliSettings) {
            applySetting(options, key, value);
        }

        // Configure Logger
        Logger::instance().setLevel(options.logLevel);
        if (!options.logFile.empty()) {
            Logger::instance().enableFileLogging(options.logFile);
        }

        std::cout << "=== AutomFlowServer ===" << std::endl;
        std::cout << std::endl;

        // Register built-in node handlers
        engine::NodeHandlerRegistry registry;
        nodes::registerBuiltinNodes(registry);
        LOG_INFO("Registered " + std::to_string(registry.size()) + " node types");

        // Stockage des batches (optionnel)
        std::unique_ptr<storage::BatchStorage> batchStorage;
        if (!options.dbPath.empty()) {
            batchStorage = std::make_unique<storage::BatchStorage>(options.dbPath);
            LOG_INFO("Batch storage: " + options.dbPath);
        } else {
            LOG_WARN("Batch storage disabled, finished executions are forgotten after eviction");
        }

        // No browser backend is bundled: openBrowser nodes fail until a DriverFactory is provided
        EventHub hub;
        engine::ExecutionManager manager(options.manager, registry, nullptr, batchStorage.get());
        manager.setEventSink(hub.sink());
        RequestHandler handler(manager, registry);

        // Créer le contexte IO
        net::io_context ioc{1};

        // Créer et démarrer le serveur
        HttpServer server(ioc, options.address, options.port, handler, hub);
        server.run();

        // Gérer le signal d'arrêt
        shutdown_handler = [&]() {
            server.stop();
            ioc.stop();
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::cout << std::endl;
        std::cout << "Endpoints:" << std::endl;
        std::cout << "  GET  /api/health                      - Health check" << std::endl;
        std::cout << "  GET  /api/nodes                       - List node types" << std::endl;
        std::cout << "  GET  /api/events                      - Event stream (SSE)" << std::endl;
        std::cout << std::endl;
        std::cout << "  POST /api/execute                     - Start a single run" << std::endl;
        std::cout << "  GET  /api/execution/:id/status        - Execution status" << std::endl;
        std::cout << "  POST /api/execution/:id/stop          - Stop an execution" << std::endl;
        std::cout << "  POST /api/execution/:id/pause-control - continue | stop | skip | continueWithoutBreakpoint" << std::endl;
        std::cout << "  GET  /api/executions/active           - Running executions" << std::endl;
        std::cout << std::endl;
        std::cout << "  POST /api/batch/execute               - Start a batch" << std::endl;
        std::cout << "  GET  /api/batch/:id                   - Batch status" << std::endl;
        std::cout << "  GET  /api/batch/:id/executions        - Batch members" << std::endl;
        std::cout << "  POST /api/batch/:id/stop              - Stop a batch" << std::endl;
        std::cout << "  POST /api/batches/stop-all            - Stop every batch" << std::endl;
        std::cout << "  GET  /api/batches                     - List batches" << std::endl;
        std::cout << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << std::endl;

        // Lancer la boucle d'événements
        ioc.run();

        LOG_INFO("Shutting down...");
        manager.setEventSink(nullptr);
        manager.shutdown();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
