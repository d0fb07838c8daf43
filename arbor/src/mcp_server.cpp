// Arbor MCP Server
// Dependency-graph queries over the Model Context Protocol (stdio)
//
// Usage:
//   arbor_mcp [options]
//
// Options:
//   --load-timeout-ms N  Abort model loads after N ms (0 = never, default 60000)
//   --log-level LEVEL    error | warn | info | debug (default info)
//   --preload PATH       Load a model before serving; may be repeated
//   --name NAME          Server name reported by initialize

#include <arbor/config.hpp>
#include <arbor/mcp.hpp>
#include <arbor/version.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

void signal_handler(int sig) {
    (void)sig;
    // Graphs live only in memory; nothing to flush
    std::_Exit(0);
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --load-timeout-ms N  Abort model loads after N ms (0 = never, default 60000)\n"
              << "  --log-level LEVEL    error | warn | info | debug (default info)\n"
              << "  --preload PATH       Load a model before serving (repeatable)\n"
              << "  --name NAME          Server name reported by initialize\n"
              << "  --help               Show this help message\n"
              << "\n"
              << "Environment: ARBOR_LOAD_TIMEOUT_MS, ARBOR_LOG_LEVEL\n";
}

int main(int argc, char* argv[]) {
    arbor::ServerConfig config;
    std::string error_msg;

    if (!arbor::apply_environment(config, error_msg)) {
        std::cerr << "[arbor_mcp] Error: " << error_msg << "\n";
        return 1;
    }
    if (!arbor::apply_arguments(config, argc, argv, error_msg)) {
        std::cerr << error_msg << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    arbor::logging::set_level(config.log_level);

    arbor::CacheConfig cache_config;
    cache_config.load_timeout = config.load_timeout;
    arbor::ModelCache cache(arbor::load_graph_file, cache_config);

    for (const auto& path : config.preload) {
        try {
            std::string id = cache.load(path);
            arbor::logging::info("arbor_mcp", "Preloaded " + path + " as " + id);
        } catch (const arbor::Error& e) {
            std::cerr << "[arbor_mcp] Error: Failed to preload " << path << ": " << e.what() << "\n";
            return 1;
        }
    }

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);

    arbor::logging::info("arbor_mcp", std::string("v") + arbor::version::string() +
                         ", load timeout " + std::to_string(config.load_timeout.count()) + "ms");
    arbor::logging::info("arbor_mcp", "Listening on stdin...");

    arbor::MCPServer server(&cache, config.server_name);
    server.run();

    arbor::logging::info("arbor_mcp", "Shutdown complete");
    return 0;
}
