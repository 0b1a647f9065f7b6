#include <embed_mcp/config/config_loader.hpp>
#include <embed_mcp/core/log.hpp>
#include <embed_mcp/core/terminal.hpp>
#include <embed_mcp/core/version.hpp>
#include <embed_mcp/mcp/builtin_tools.hpp>
#include <embed_mcp/mcp/dispatcher.hpp>
#include <embed_mcp/mcp/http_transport.hpp>
#include <embed_mcp/mcp/mcp_server.hpp>
#include <embed_mcp/mcp/query_log.hpp>
#include <embed_mcp/mcp/tool_registry.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

embed_mcp::HttpTransport* g_http_transport = nullptr;

void HandleStopSignal(int /*signal*/) {
    if (g_http_transport != nullptr) {
        g_http_transport->Stop();
    }
}

void PrintError(const embed_mcp::Error& error, bool json) {
    if (json) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "error: " << error.ToString() << "\n";
    }
}

// Load env defaults, the YAML file (if any), then CLI overrides.
embed_mcp::Result<embed_mcp::AppConfig, embed_mcp::Error> BuildConfig(
    const embed_mcp::CliOverrides& cli) {
    using namespace embed_mcp;

    auto config = DefaultsFromEnv();
    if (config.IsErr()) {
        return config;
    }
    if (cli.config_path.has_value()) {
        config = LoadFromYaml(*cli.config_path, config.Value());
        if (config.IsErr()) {
            return config;
        }
    }

    auto resolved = ResolveApiKeyEnv(MergeConfigs(config.Value(), cli));
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

embed_mcp::Result<void, embed_mcp::Error> InitLogging(
    const embed_mcp::LogConfig& log) {
    using namespace embed_mcp;

    if (log.file.has_value()) {
        auto file = std::make_unique<std::ofstream>(*log.file, std::ios::app);
        if (!file->is_open()) {
            return Result<void, Error>::Err(Error{
                "Logging", "Cannot open log file", *log.file, ErrorCategory::Io});
        }
        InitGlobalLogger(std::make_unique<OwningSink>(std::move(file), log.json),
                         log.level);
        return Result<void, Error>::Ok();
    }

    if (log.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log.level);
        return Result<void, Error>::Ok();
    }

    bool force_color = log.color.has_value() && *log.color;
    bool force_no_color = log.color.has_value() && !*log.color;
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(
                         ResolveLogColor(force_color, force_no_color)),
                     log.level);
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace embed_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error(), false);
        return cli.Error().ExitCode();
    }
    if (cli.Value().show_version) {
        std::cout << "embed-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config_result = BuildConfig(cli.Value());
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), cli.Value().log_json.value_or(false));
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = InitLogging(config.log);
    if (logging.IsErr()) {
        PrintError(logging.Error(), config.log.json);
        return logging.Error().ExitCode();
    }

    std::unique_ptr<QueryLog> query_log;
    if (config.query_log.has_value()) {
        auto opened = QueryLog::Open(*config.query_log);
        if (opened.IsErr()) {
            PrintError(opened.Error(), config.log.json);
            return opened.Error().ExitCode();
        }
        query_log = std::move(opened).Value();
    }

    // Tools are registered before any transport starts; the registry is
    // read-only from here on.
    ToolRegistry registry;
    RegisterBuiltinTools(registry);
    LogInfo("main", "Registered " + std::to_string(registry.Size()) + " tool(s)");

    DispatcherOptions dispatcher_options;
    dispatcher_options.server.name = config.server.name;
    dispatcher_options.server.version = config.server.version;
    dispatcher_options.server.instructions = config.server.instructions;
    dispatcher_options.error_codes = config.error_codes;
    Dispatcher dispatcher(registry, dispatcher_options);

    if (config.transport.mode == TransportMode::Stdio) {
        if (config.transport.api_key.has_value()) {
            LogWarn("main", "API key ignored: the stdio transport is not authenticated");
        }
        SessionOptions session;
        session.reply_to_notifications = config.reply_to_notifications;
        McpServer server(dispatcher, session, query_log.get());
        server.Run();
        return kExitSuccess;
    }

    HttpTransportOptions http;
    http.host = config.transport.host;
    http.port = config.transport.port;
    http.threads = config.transport.threads;
    http.api_key = config.transport.api_key;
    http.reply_to_notifications = config.reply_to_notifications;
    if (!http.api_key.has_value()) {
        LogWarn("main", "No API key configured; POST /mcp is unauthenticated");
    }

    HttpTransport transport(dispatcher, http, query_log.get());
    g_http_transport = &transport;
    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    auto served = transport.Listen();
    g_http_transport = nullptr;
    if (served.IsErr()) {
        LogError("main", served.Error().ToString());
        return served.Error().ExitCode();
    }
    LogInfo("main", "Application shutting down");
    return kExitSuccess;
}
