#pragma once

#include <embed_mcp/core/result.hpp>
#include <embed_mcp/mcp/dispatcher.hpp>
#include <embed_mcp/mcp/query_log.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace embed_mcp {

constexpr const char* kApiKeyHeader = "MCP-API-Key";

struct HttpTransportOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    int threads = 8;
    std::optional<std::string> api_key;  // no header check when unset
    bool reply_to_notifications = true;
};

// Transport-neutral reply, so routing can be tested without sockets.
struct HttpReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::map<std::string, std::string> headers;
};

// ---------------------------------------------------------------------------
// HttpTransport — serves the dispatcher over HTTP using cpp-httplib.
//
// Routes:
//   POST /mcp            JSON-RPC request -> response envelope
//   GET  /               welcome message
//   GET  /mcp/time       "time" result
//   GET  /mcp/tools/list "tools/list" result
//
// Each request runs on one of httplib's pool threads; the dispatcher is
// shared read-only between them. httplib stays out of this header (pimpl).
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(const Dispatcher& dispatcher,
                  HttpTransportOptions options,
                  QueryLog* query_log = nullptr);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;
    HttpTransport(HttpTransport&&) = delete;
    HttpTransport& operator=(HttpTransport&&) = delete;

    // Bind and serve until Stop() is called. Errors if the bind fails.
    [[nodiscard]] Result<void, Error> Listen();

    void Stop();

    // -- Routing (no I/O) ----------------------------------------------------

    [[nodiscard]] HttpReply HandlePost(
        const std::string& body,
        const std::optional<std::string>& api_key_header) const;

    [[nodiscard]] HttpReply HandleGet(const std::string& path) const;

private:
    struct Impl;

    const Dispatcher& dispatcher_;
    HttpTransportOptions options_;
    QueryLog* query_log_;
    std::unique_ptr<Impl> impl_;
};

} // namespace embed_mcp
