#pragma once

#include <embed_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace embed_mcp {

constexpr const char* kJsonRpcVersion = "2.0";

// ---------------------------------------------------------------------------
// ErrorKind — symbolic JSON-RPC error codes.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    ParseError,      // body is not JSON
    InvalidRequest,  // malformed envelope
    MethodNotFound,
    InvalidParams,
    ToolNotFound,
    InternalError,
};

/// "PARSE_ERROR", "INVALID_REQUEST", "METHOD_NOT_FOUND", ...
const char* ErrorKindName(ErrorKind kind);

/// Numeric JSON-RPC 2.0 code (-32700, -32600, ...). ToolNotFound shares
/// -32602 with InvalidParams.
int ErrorKindCode(ErrorKind kind);

// How the "code" member of an error object is rendered on the wire.
enum class ErrorCodeStyle {
    Symbolic,
    Numeric,
};

// ---------------------------------------------------------------------------
// Params — sum type over the three shapes JSON-RPC allows.
// ---------------------------------------------------------------------------
struct NoParams {};
using Params = std::variant<NoParams, nlohmann::json::object_t,
                            nlohmann::json::array_t>;

[[nodiscard]] inline bool HasParams(const Params& p) {
    return !std::holds_alternative<NoParams>(p);
}

/// The params as a JSON value (null when absent).
nlohmann::json ParamsToJson(const Params& params);

// ---------------------------------------------------------------------------
// Request — a decoded JSON-RPC request envelope.
// ---------------------------------------------------------------------------
struct Request {
    std::string method;
    Params params;
    std::optional<nlohmann::json> id;  // nullopt: notification

    [[nodiscard]] bool IsNotification() const noexcept {
        return !id.has_value();
    }

    /// The id to echo in the response (null for notifications).
    [[nodiscard]] nlohmann::json ResponseId() const {
        return id.value_or(nlohmann::json(nullptr));
    }
};

// ---------------------------------------------------------------------------
// DecodeError — the envelope did not have the minimal request shape.
// ---------------------------------------------------------------------------
struct DecodeError {
    std::string message;
    nlohmann::json id;  // best-effort id for correlation, null if unreadable
};

/// Validate and decode a parsed JSON value into a Request.
Result<Request, DecodeError> Decode(const nlohmann::json& raw);

/// {"jsonrpc":"2.0","result":...,"id":...}
nlohmann::json EncodeSuccess(const nlohmann::json& result,
                             const nlohmann::json& id);

/// {"jsonrpc":"2.0","error":{"code","message","data"?},"id":...}
nlohmann::json EncodeError(ErrorKind kind,
                           std::string_view message,
                           const nlohmann::json& id,
                           const std::optional<nlohmann::json>& data = std::nullopt,
                           ErrorCodeStyle style = ErrorCodeStyle::Symbolic);

} // namespace embed_mcp
