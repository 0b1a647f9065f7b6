#pragma once

#include <embed_mcp/core/log.hpp>
#include <embed_mcp/mcp/envelope.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace embed_mcp {

enum class TransportMode {
    Stdio,
    Http,
};

struct ServerConfig {
    std::string name = "embed-mcp";
    std::string version;  // empty: build version
    std::string instructions = "MCP Server initialized successfully";
};

struct TransportConfig {
    TransportMode mode = TransportMode::Stdio;
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    int threads = 8;
    std::optional<std::string> api_key;
    std::optional<std::string> api_key_env;  // env var name holding the key
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    std::optional<bool> color;  // nullopt: detect
    std::optional<std::string> file;
};

struct AppConfig {
    ServerConfig server;
    TransportConfig transport;
    LogConfig log;
    std::optional<std::string> query_log;
    bool reply_to_notifications = true;
    ErrorCodeStyle error_codes = ErrorCodeStyle::Symbolic;
};

} // namespace embed_mcp
