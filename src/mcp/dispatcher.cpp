#include <embed_mcp/mcp/dispatcher.hpp>

#include <embed_mcp/core/log.hpp>

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace embed_mcp {

namespace {

constexpr const char* kComponent = "mcp";

MethodResult Fail(ErrorKind kind, std::string message) {
    return MethodResult::Err(MethodError{kind, std::move(message), std::nullopt});
}

std::tm ToUtc(std::time_t t) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    return utc;
}

} // anonymous namespace

std::optional<Method> ParseMethod(std::string_view name) {
    if (name == "initialize") return Method::Initialize;
    if (name == "notifications/initialized") return Method::NotificationsInitialized;
    if (name == "time") return Method::Time;
    if (name == "tools/list") return Method::ToolsList;
    if (name == "tools/call") return Method::ToolsCall;
    return std::nullopt;
}

const char* MethodName(Method method) {
    switch (method) {
        case Method::Initialize:               return "initialize";
        case Method::NotificationsInitialized: return "notifications/initialized";
        case Method::Time:                     return "time";
        case Method::ToolsList:                return "tools/list";
        case Method::ToolsCall:                return "tools/call";
    }
    return "";
}

// ---------------------------------------------------------------------------
// BuildTimeResult
// ---------------------------------------------------------------------------
nlohmann::json BuildTimeResult(std::chrono::system_clock::time_point now) {
    const auto micros = std::chrono::floor<std::chrono::microseconds>(
        now.time_since_epoch());
    const auto whole = std::chrono::floor<std::chrono::seconds>(micros);
    const auto fraction = (micros - whole).count();  // [0, 1e6)

    const auto utc = ToUtc(static_cast<std::time_t>(whole.count()));

    std::ostringstream iso;
    iso << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << fraction
        << "+00:00";

    std::ostringstream formatted;
    formatted << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << " UTC";

    const double timestamp = static_cast<double>(micros.count()) / 1e6;
    const auto unix_timestamp = static_cast<std::int64_t>(std::floor(timestamp));

    return {
        {"method", "time"},
        {"server_time", {
            {"iso_format", iso.str()},
            {"timestamp", timestamp},
            {"unix_timestamp", unix_timestamp},
            {"formatted", formatted.str()},
            {"timezone", "UTC"}
        }},
        {"message", "Time retrieved successfully"}
    };
}

// ---------------------------------------------------------------------------
// Dispatcher
// ---------------------------------------------------------------------------
Dispatcher::Dispatcher(const ToolRegistry& registry, DispatcherOptions options)
    : registry_(registry), options_(std::move(options)) {
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

DispatchOutcome Dispatcher::DispatchJson(const nlohmann::json& raw) const {
    auto decoded = Decode(raw);
    if (decoded.IsOk()) {
        return Dispatch(decoded.Value());
    }

    const auto& error = decoded.Error();
    LogWarn(kComponent, "Malformed request: " + error.message);

    DispatchRecord record;
    record.id = error.id;
    record.error_kind = ErrorKind::InvalidRequest;
    record.error_message = error.message;
    if (raw.is_object()) {
        if (auto it = raw.find("method"); it != raw.end() && it->is_string()) {
            record.method = it->get<std::string>();
        }
    }

    return DispatchOutcome{
        EncodeError(ErrorKind::InvalidRequest, error.message, error.id,
                    std::nullopt, options_.error_codes),
        std::move(record)};
}

DispatchOutcome Dispatcher::Dispatch(const Request& request) const {
    const auto started = std::chrono::steady_clock::now();

    DispatchRecord record;
    record.method = request.method;
    record.id = request.ResponseId();
    record.notification = request.IsNotification();
    record.arguments = ParamsToJson(request.params);

    LogInfo(kComponent, "Handling MCP request: " + request.method);

    MethodResult outcome = Fail(ErrorKind::InternalError, "not dispatched");
    try {
        auto method = ParseMethod(request.method);
        if (!method.has_value()) {
            outcome = Fail(ErrorKind::MethodNotFound,
                           "Method not found: " + request.method);
        } else if (*method == Method::ToolsCall) {
            outcome = HandleToolsCall(request.params, record);
        } else {
            outcome = Invoke(*method, request.params);
        }
    } catch (const std::exception& e) {
        LogError(kComponent, "Error handling MCP request " + request.method +
                             ": " + e.what());
        outcome = Fail(ErrorKind::InternalError,
                       std::string("Internal error: ") + e.what());
    } catch (...) {
        LogError(kComponent, "Error handling MCP request " + request.method +
                             ": unknown exception");
        outcome = Fail(ErrorKind::InternalError,
                       "Internal error: unknown exception");
    }

    record.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (outcome.IsOk()) {
        record.success = true;
        record.result = outcome.Value();
        return DispatchOutcome{
            EncodeSuccess(outcome.Value(), record.id), std::move(record)};
    }

    const auto& error = outcome.Error();
    record.error_kind = error.kind;
    record.error_message = error.message;
    if (error.kind != ErrorKind::InternalError) {
        LogWarn(kComponent, request.method + " failed: " + error.message);
    }
    return DispatchOutcome{
        EncodeError(error.kind, error.message, record.id, error.data,
                    options_.error_codes),
        std::move(record)};
}

MethodResult Dispatcher::Invoke(Method method, const Params& params) const {
    switch (method) {
        case Method::Initialize:
            return HandleInitialize();
        case Method::NotificationsInitialized:
            return HandleInitialized();
        case Method::Time:
            return HandleTime();
        case Method::ToolsList:
            return HandleToolsList();
        case Method::ToolsCall: {
            DispatchRecord scratch;
            return HandleToolsCall(params, scratch);
        }
    }
    return Fail(ErrorKind::MethodNotFound,
                std::string("Method not found: ") + MethodName(method));
}

MethodResult Dispatcher::HandleInitialize() const {
    return MethodResult::Ok(
        BuildInitializeResult(options_.server, options_.capabilities));
}

MethodResult Dispatcher::HandleInitialized() const {
    LogInfo(kComponent, "Client initialization completed");
    return MethodResult::Ok(nlohmann::json{
        {"status", "acknowledged"},
        {"message", "Server ready for requests"}
    });
}

MethodResult Dispatcher::HandleTime() const {
    return MethodResult::Ok(BuildTimeResult(options_.clock()));
}

MethodResult Dispatcher::HandleToolsList() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.List()) {
        tools.push_back(descriptor.ToJson());
    }
    return MethodResult::Ok(nlohmann::json{{"tools", std::move(tools)}});
}

MethodResult Dispatcher::HandleToolsCall(const Params& params,
                                         DispatchRecord& record) const {
    const auto* object = std::get_if<nlohmann::json::object_t>(&params);
    if (object == nullptr) {
        return Fail(ErrorKind::InvalidParams, "Invalid parameters for tools/call");
    }

    auto name_it = object->find("name");
    if (name_it == object->end() || !name_it->second.is_string() ||
        name_it->second.get<std::string>().empty()) {
        return Fail(ErrorKind::InvalidParams, "Tool name is required");
    }
    auto tool_name = name_it->second.get<std::string>();
    record.tool_name = tool_name;

    nlohmann::json arguments = nlohmann::json::object();
    if (auto args_it = object->find("arguments");
        args_it != object->end() && !args_it->second.is_null()) {
        if (!args_it->second.is_object()) {
            return Fail(ErrorKind::InvalidParams,
                        "Tool arguments must be an object");
        }
        arguments = args_it->second;
    }
    record.arguments = arguments;

    const auto* handler = registry_.Lookup(tool_name);
    if (handler == nullptr) {
        return Fail(ErrorKind::ToolNotFound, "Unknown tool: " + tool_name);
    }

    LogDebug(kComponent, "Calling tool " + tool_name + " with " + arguments.dump());
    return MethodResult::Ok((*handler)(arguments));
}

} // namespace embed_mcp
