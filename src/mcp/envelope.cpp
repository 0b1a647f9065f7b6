#include <embed_mcp/mcp/envelope.hpp>

namespace embed_mcp {

namespace {

using DecodeResult = Result<Request, DecodeError>;

DecodeResult Malformed(std::string message, nlohmann::json id = nullptr) {
    return DecodeResult::Err(DecodeError{std::move(message), std::move(id)});
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

} // anonymous namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:     return "PARSE_ERROR";
        case ErrorKind::InvalidRequest: return "INVALID_REQUEST";
        case ErrorKind::MethodNotFound: return "METHOD_NOT_FOUND";
        case ErrorKind::InvalidParams:  return "INVALID_PARAMS";
        case ErrorKind::ToolNotFound:   return "TOOL_NOT_FOUND";
        case ErrorKind::InternalError:  return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

int ErrorKindCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:     return -32700;
        case ErrorKind::InvalidRequest: return -32600;
        case ErrorKind::MethodNotFound: return -32601;
        case ErrorKind::InvalidParams:  return -32602;
        case ErrorKind::ToolNotFound:   return -32602;
        case ErrorKind::InternalError:  return -32603;
    }
    return -32603;
}

nlohmann::json ParamsToJson(const Params& params) {
    if (const auto* obj = std::get_if<nlohmann::json::object_t>(&params)) {
        return *obj;
    }
    if (const auto* arr = std::get_if<nlohmann::json::array_t>(&params)) {
        return *arr;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
Result<Request, DecodeError> Decode(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        return Malformed("Request must be a JSON object");
    }

    // Recover the id first so every later failure can still correlate.
    std::optional<nlohmann::json> id;
    if (auto it = raw.find("id"); it != raw.end()) {
        if (!IsValidId(*it)) {
            return Malformed("Request id must be a string, number or null");
        }
        id = *it;
    }
    const nlohmann::json reply_id = id.value_or(nlohmann::json(nullptr));

    if (auto it = raw.find("jsonrpc"); it != raw.end()) {
        if (!it->is_string() || it->get<std::string>() != kJsonRpcVersion) {
            return Malformed("Invalid JSON-RPC version", reply_id);
        }
    }

    auto method_it = raw.find("method");
    if (method_it == raw.end()) {
        return Malformed("Missing 'method'", reply_id);
    }
    if (!method_it->is_string()) {
        return Malformed("'method' must be a string", reply_id);
    }
    auto method = method_it->get<std::string>();
    if (method.empty()) {
        return Malformed("'method' must not be empty", reply_id);
    }

    Params params = NoParams{};
    if (auto it = raw.find("params"); it != raw.end()) {
        if (it->is_object()) {
            params = it->get<nlohmann::json::object_t>();
        } else if (it->is_array()) {
            params = it->get<nlohmann::json::array_t>();
        } else if (!it->is_null()) {
            return Malformed("'params' must be an object or an array", reply_id);
        }
    }

    return DecodeResult::Ok(Request{std::move(method), std::move(params), std::move(id)});
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------
nlohmann::json EncodeSuccess(const nlohmann::json& result,
                             const nlohmann::json& id) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"result", result},
        {"id", id}
    };
}

nlohmann::json EncodeError(ErrorKind kind,
                           std::string_view message,
                           const nlohmann::json& id,
                           const std::optional<nlohmann::json>& data,
                           ErrorCodeStyle style) {
    nlohmann::json error = {
        {"message", std::string(message)}
    };
    if (style == ErrorCodeStyle::Numeric) {
        error["code"] = ErrorKindCode(kind);
    } else {
        error["code"] = ErrorKindName(kind);
    }
    if (data.has_value()) {
        error["data"] = *data;
    }

    return {
        {"jsonrpc", kJsonRpcVersion},
        {"error", error},
        {"id", id}
    };
}

} // namespace embed_mcp
