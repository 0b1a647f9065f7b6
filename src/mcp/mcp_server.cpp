#include <embed_mcp/mcp/mcp_server.hpp>

#include <embed_mcp/core/log.hpp>

#include <string>

namespace embed_mcp {

McpServer::McpServer(const Dispatcher& dispatcher,
                     SessionOptions options,
                     QueryLog* query_log,
                     std::istream& in,
                     std::ostream& out)
    : dispatcher_(dispatcher), options_(options), query_log_(query_log),
      in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("stdio", "MCP server listening on stdin");
    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (response) {
            out_ << response->dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    }
    LogInfo("stdio", "stdin closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        LogWarn("stdio", std::string("Parse error: ") + e.what());
        return EncodeError(ErrorKind::ParseError, "Parse error", nullptr,
                           std::nullopt, dispatcher_.error_codes());
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    auto outcome = dispatcher_.DispatchJson(message);
    if (query_log_ != nullptr) {
        query_log_->Append(outcome.record);
    }

    if (outcome.record.notification && !options_.reply_to_notifications) {
        LogDebug("stdio", "Suppressed reply to notification " +
                          outcome.record.method);
        return std::nullopt;
    }
    return std::move(outcome.response);
}

} // namespace embed_mcp
