#pragma once

#include <embed_mcp/mcp/dispatcher.hpp>
#include <embed_mcp/mcp/query_log.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace embed_mcp {

struct SessionOptions {
    // Write replies to id-less requests. The dispatcher always builds one.
    bool reply_to_notifications = true;
};

// ---------------------------------------------------------------------------
// McpServer — MCP over stdin/stdout, one JSON-RPC message per line.
//
// Logs never go to `out`; stdout carries protocol traffic only.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(const Dispatcher& dispatcher,
              SessionOptions options = {},
              QueryLog* query_log = nullptr,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on `in`).
    void Run();

    // Process one raw line. Returns nullopt when nothing should be written.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    // Process one parsed message.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

private:
    const Dispatcher& dispatcher_;
    SessionOptions options_;
    QueryLog* query_log_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace embed_mcp
