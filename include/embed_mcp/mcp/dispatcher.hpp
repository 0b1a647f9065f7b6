#pragma once

#include <embed_mcp/core/result.hpp>
#include <embed_mcp/mcp/capabilities.hpp>
#include <embed_mcp/mcp/envelope.hpp>
#include <embed_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace embed_mcp {

// ---------------------------------------------------------------------------
// Method — the closed set of protocol methods this server answers.
// ---------------------------------------------------------------------------
enum class Method {
    Initialize,
    NotificationsInitialized,
    Time,
    ToolsList,
    ToolsCall,
};

/// nullopt for anything outside the closed set.
std::optional<Method> ParseMethod(std::string_view name);
const char* MethodName(Method method);

using WallClock = std::function<std::chrono::system_clock::time_point()>;

// A method-level failure, answered with an error envelope.
struct MethodError {
    ErrorKind kind;
    std::string message;
    std::optional<nlohmann::json> data;
};

using MethodResult = Result<nlohmann::json, MethodError>;

struct DispatcherOptions {
    ServerInfo server;
    Capabilities capabilities;
    ErrorCodeStyle error_codes = ErrorCodeStyle::Symbolic;
    WallClock clock;  // system_clock::now when empty
};

// ---------------------------------------------------------------------------
// DispatchRecord — execution metadata for one dispatched request.
// Consumed by the logger and the query log.
// ---------------------------------------------------------------------------
struct DispatchRecord {
    std::string method;
    std::optional<std::string> tool_name;  // tools/call only
    nlohmann::json arguments;              // params, or tools/call arguments
    nlohmann::json id;
    bool notification = false;
    bool success = false;
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    nlohmann::json result;
    std::chrono::microseconds duration{0};
};

struct DispatchOutcome {
    nlohmann::json response;
    DispatchRecord record;
};

// ---------------------------------------------------------------------------
// Dispatcher — routes a request to a built-in method or a registered tool.
//
// Holds no per-request state: Dispatch is const and may run concurrently
// from any number of threads. Every failure, including exceptions thrown by
// tool handlers, comes back as an error envelope with the request id.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    explicit Dispatcher(const ToolRegistry& registry,
                        DispatcherOptions options = {});

    [[nodiscard]] DispatchOutcome Dispatch(const Request& request) const;

    // Decode + Dispatch. Malformed envelopes produce INVALID_REQUEST.
    [[nodiscard]] DispatchOutcome DispatchJson(const nlohmann::json& raw) const;

    // Run one method outside of an envelope (used by the GET routes).
    [[nodiscard]] MethodResult Invoke(Method method, const Params& params) const;

    [[nodiscard]] ErrorCodeStyle error_codes() const noexcept {
        return options_.error_codes;
    }

private:
    MethodResult HandleInitialize() const;
    MethodResult HandleInitialized() const;
    MethodResult HandleTime() const;
    MethodResult HandleToolsList() const;
    MethodResult HandleToolsCall(const Params& params,
                                 DispatchRecord& record) const;

    const ToolRegistry& registry_;
    DispatcherOptions options_;
};

/// The "time" result for a given instant.
nlohmann::json BuildTimeResult(std::chrono::system_clock::time_point now);

} // namespace embed_mcp
