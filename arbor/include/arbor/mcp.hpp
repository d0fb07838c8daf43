#pragma once
// MCP Server: newline-delimited JSON-RPC 2.0 over a pair of streams
//
// One request per line, one response per line. stdout is reserved for
// responses; diagnostics go through arbor::logging (stderr).

#include "mcp/handler.hpp"
#include "log.hpp"
#include "model_cache.hpp"
#include <iostream>
#include <string>

namespace arbor {

class MCPServer {
public:
    MCPServer(ModelCache* cache, const std::string& name = "arbor")
        : handler_(cache, name) {}

    // Serves until EOF or shutdown. Returns the number of requests read.
    size_t run(std::istream& in = std::cin, std::ostream& out = std::cout) {
        size_t requests = 0;
        std::string line;

        while (std::getline(in, line)) {
            if (line.empty() || line == "\r") continue;
            requests++;

            std::string response = handler_.handle(line);
            if (!response.empty()) {
                out << response << "\n";
                out.flush();
            }
            if (handler_.shutdown_requested()) break;
        }

        logging::debug("mcp", "Served " + std::to_string(requests) + " request(s)");
        return requests;
    }

private:
    mcp::Handler handler_;
};

} // namespace arbor
