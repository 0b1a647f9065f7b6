#include <embed_mcp/mcp/http_transport.hpp>

#include <embed_mcp/core/log.hpp>

#include <httplib.h>

#include <nlohmann/json.hpp>

#include <string>

namespace embed_mcp {

namespace {

constexpr const char* kComponent = "http";

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpReply JsonReply(int status, const nlohmann::json& body) {
    HttpReply reply;
    reply.status = status;
    reply.body = Dump(body);
    return reply;
}

HttpReply Unauthorized(const std::string& detail) {
    auto reply = JsonReply(401, {{"detail", detail}});
    reply.headers["WWW-Authenticate"] = "Bearer";
    return reply;
}

void Apply(const HttpReply& reply, httplib::Response& res) {
    res.status = reply.status;
    for (const auto& [name, value] : reply.headers) {
        res.set_header(name, value);
    }
    if (!reply.body.empty()) {
        res.set_content(reply.body, reply.content_type);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — owns the httplib::Server.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    httplib::Server server;
};

HttpTransport::HttpTransport(const Dispatcher& dispatcher,
                             HttpTransportOptions options,
                             QueryLog* query_log)
    : dispatcher_(dispatcher),
      options_(std::move(options)),
      query_log_(query_log),
      impl_(std::make_unique<Impl>()) {
    auto& server = impl_->server;

    const auto threads = static_cast<size_t>(options_.threads > 0 ? options_.threads : 1);
    server.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    server.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<std::string> key;
        if (req.has_header(kApiKeyHeader)) {
            key = req.get_header_value(kApiKeyHeader);
        }
        Apply(HandlePost(req.body, key), res);
    });
    server.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        Apply(HandleGet(req.path), res);
    });
    server.Get("/mcp/time", [this](const httplib::Request& req, httplib::Response& res) {
        Apply(HandleGet(req.path), res);
    });
    server.Get("/mcp/tools/list", [this](const httplib::Request& req, httplib::Response& res) {
        Apply(HandleGet(req.path), res);
    });

    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug(kComponent, req.method + " " + req.path + " -> " +
                             std::to_string(res.status));
    });
}

HttpTransport::~HttpTransport() = default;

Result<void, Error> HttpTransport::Listen() {
    LogInfo(kComponent, "Listening on " + options_.host + ":" +
                        std::to_string(options_.port));
    if (!impl_->server.listen(options_.host, options_.port)) {
        return Result<void, Error>::Err(Error{
            "HttpTransport", "Failed to bind",
            options_.host + ":" + std::to_string(options_.port),
            ErrorCategory::Transport});
    }
    return Result<void, Error>::Ok();
}

void HttpTransport::Stop() {
    impl_->server.stop();
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------
HttpReply HttpTransport::HandlePost(
    const std::string& body,
    const std::optional<std::string>& api_key_header) const {
    if (options_.api_key.has_value()) {
        if (!api_key_header.has_value() || api_key_header->empty()) {
            LogWarn(kComponent, "Rejected request without API key");
            return Unauthorized("Missing API key. Please provide MCP-API-Key header.");
        }
        if (*api_key_header != *options_.api_key) {
            LogWarn(kComponent, "Rejected request with invalid API key");
            return Unauthorized("Invalid API key");
        }
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        LogWarn(kComponent, std::string("Parse error: ") + e.what());
        return JsonReply(200, EncodeError(ErrorKind::ParseError, "Parse error",
                                          nullptr, std::nullopt,
                                          dispatcher_.error_codes()));
    }

    auto outcome = dispatcher_.DispatchJson(message);
    if (query_log_ != nullptr) {
        query_log_->Append(outcome.record);
    }

    if (outcome.record.notification && !options_.reply_to_notifications) {
        HttpReply reply;
        reply.status = 204;
        return reply;
    }
    return JsonReply(200, outcome.response);
}

HttpReply HttpTransport::HandleGet(const std::string& path) const {
    if (path == "/") {
        return JsonReply(200, {{"message", "Welcome to the MCP Server!"}});
    }

    std::optional<Method> method;
    if (path == "/mcp/time") {
        method = Method::Time;
    } else if (path == "/mcp/tools/list") {
        method = Method::ToolsList;
    }
    if (!method.has_value()) {
        return JsonReply(404, {{"detail", "Not Found"}});
    }

    auto result = dispatcher_.Invoke(*method, NoParams{});
    if (result.IsErr()) {
        return JsonReply(500, {{"detail", result.Error().message}});
    }
    return JsonReply(200, result.Value());
}

} // namespace embed_mcp
