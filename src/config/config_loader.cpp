#include <embed_mcp/config/config_loader.hpp>

#include <embed_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace embed_mcp {

namespace {

std::string Lower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

Result<uint16_t, Error> ParsePort(const std::string& text, const std::string& source) {
    int value = 0;
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::exception&) {
        return Result<uint16_t, Error>::Err(
            Error::Config("Invalid port in " + source + ": '" + text + "'"));
    }
    if (value <= 0 || value > std::numeric_limits<uint16_t>::max()) {
        return Result<uint16_t, Error>::Err(
            Error::Config("Port out of range in " + source + ": " + text));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

// Apply the "server" section.
void ParseYamlServer(const YAML::Node& node, ServerConfig& server) {
    if (node["name"]) {
        server.name = node["name"].as<std::string>();
    }
    if (node["version"]) {
        server.version = node["version"].as<std::string>();
    }
    if (node["instructions"]) {
        server.instructions = node["instructions"].as<std::string>();
    }
}

Result<void, Error> ParseYamlTransport(const YAML::Node& node,
                                       TransportConfig& transport) {
    if (node["mode"]) {
        auto text = node["mode"].as<std::string>();
        auto mode = ParseTransportMode(text);
        if (!mode.has_value()) {
            return Result<void, Error>::Err(
                Error::Config("Unknown transport mode: '" + text + "'"));
        }
        transport.mode = *mode;
    }
    if (node["host"]) {
        transport.host = node["host"].as<std::string>();
    }
    if (node["port"]) {
        auto port = ParsePort(node["port"].as<std::string>(), "config file");
        if (port.IsErr()) {
            return Result<void, Error>::Err(port.Error());
        }
        transport.port = port.Value();
    }
    if (node["threads"]) {
        transport.threads = node["threads"].as<int>();
    }
    if (node["api_key"]) {
        transport.api_key = node["api_key"].as<std::string>();
    }
    if (node["api_key_env"]) {
        transport.api_key_env = node["api_key_env"].as<std::string>();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ParseYamlLog(const YAML::Node& node, LogConfig& log) {
    if (node["level"]) {
        auto text = node["level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level.has_value()) {
            return Result<void, Error>::Err(
                Error::Config("Unknown log level: '" + text + "'"));
        }
        log.level = *level;
    }
    if (node["json"]) {
        log.json = node["json"].as<bool>();
    }
    if (node["color"]) {
        log.color = node["color"].as<bool>();
    }
    if (node["file"]) {
        log.file = node["file"].as<std::string>();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::optional<TransportMode> ParseTransportMode(std::string_view text) {
    auto lower = Lower(text);
    if (lower == "stdio") return TransportMode::Stdio;
    if (lower == "http") return TransportMode::Http;
    return std::nullopt;
}

std::optional<ErrorCodeStyle> ParseErrorCodeStyle(std::string_view text) {
    auto lower = Lower(text);
    if (lower == "symbolic") return ErrorCodeStyle::Symbolic;
    if (lower == "numeric") return ErrorCodeStyle::Numeric;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// DefaultsFromEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> DefaultsFromEnv() {
    AppConfig config;
    if (const char* host = std::getenv("HOST"); host != nullptr && *host != '\0') {
        config.transport.host = host;
    }
    if (const char* port = std::getenv("PORT"); port != nullptr && *port != '\0') {
        auto parsed = ParsePort(port, "PORT environment variable");
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(parsed.Error());
        }
        config.transport.port = parsed.Value();
    }
    if (std::getenv("MCP_API_KEY") != nullptr) {
        config.transport.api_key_env = "MCP_API_KEY";
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      const AppConfig& base) {
    AppConfig config = base;
    try {
        auto root = YAML::LoadFile(std::string(file_path));

        if (root["server"]) {
            ParseYamlServer(root["server"], config.server);
        }
        if (root["transport"]) {
            auto parsed = ParseYamlTransport(root["transport"], config.transport);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(parsed.Error());
            }
        }
        if (root["log"]) {
            auto parsed = ParseYamlLog(root["log"], config.log);
            if (parsed.IsErr()) {
                return Result<AppConfig, Error>::Err(parsed.Error());
            }
        }
        if (root["query_log"]) {
            config.query_log = root["query_log"].as<std::string>();
        }
        if (root["reply_to_notifications"]) {
            config.reply_to_notifications = root["reply_to_notifications"].as<bool>();
        }
        if (root["error_codes"]) {
            auto text = root["error_codes"].as<std::string>();
            auto style = ParseErrorCodeStyle(text);
            if (!style.has_value()) {
                return Result<AppConfig, Error>::Err(
                    Error::Config("Unknown error_codes style: '" + text + "'"));
            }
            config.error_codes = *style;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            Error::Config("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("embed-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--transport")
        .help("Transport: stdio or http");
    program.add_argument("--host")
        .help("HTTP bind address");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--threads")
        .help("HTTP worker threads")
        .scan<'i', int>();
    program.add_argument("--api-key")
        .help("Require this MCP-API-Key header value");
    program.add_argument("--api-key-env")
        .help("Environment variable containing the API key");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--query-log")
        .help("Append one JSON line per request to this file");
    program.add_argument("--no-notification-replies")
        .help("Do not answer requests that carry no id")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--error-codes")
        .help("Error code style: symbolic or numeric");
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOverrides, Error>::Err(
            Error::Config("CLI parse error: " + std::string(e.what())));
    }

    CliOverrides cli;
    cli.show_version = program.get<bool>("--version");
    cli.config_path = program.present("--config");

    if (auto val = program.present("--transport")) {
        cli.mode = ParseTransportMode(*val);
        if (!cli.mode.has_value()) {
            return Result<CliOverrides, Error>::Err(
                Error::Config("Invalid --transport: '" + *val + "'"));
        }
    }
    cli.host = program.present("--host");
    if (auto val = program.present<int>("--port")) {
        auto port = ParsePort(std::to_string(*val), "--port");
        if (port.IsErr()) {
            return Result<CliOverrides, Error>::Err(port.Error());
        }
        cli.port = port.Value();
    }
    cli.threads = program.present<int>("--threads");
    cli.api_key = program.present("--api-key");
    cli.api_key_env = program.present("--api-key-env");

    if (auto val = program.present("--log-level")) {
        cli.log_level = ParseLogLevel(*val);
        if (!cli.log_level.has_value()) {
            return Result<CliOverrides, Error>::Err(
                Error::Config("Invalid --log-level: '" + *val + "'"));
        }
    }
    if (program.get<bool>("--log-json")) {
        cli.log_json = true;
    }
    if (program.get<bool>("--no-color")) {
        cli.color = false;
    } else if (program.get<bool>("--color")) {
        cli.color = true;
    }
    cli.log_file = program.present("--log-file");
    cli.query_log = program.present("--query-log");
    if (program.get<bool>("--no-notification-replies")) {
        cli.reply_to_notifications = false;
    }
    if (auto val = program.present("--error-codes")) {
        cli.error_codes = ParseErrorCodeStyle(*val);
        if (!cli.error_codes.has_value()) {
            return Result<CliOverrides, Error>::Err(
                Error::Config("Invalid --error-codes: '" + *val + "'"));
        }
    }

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli) {
    AppConfig merged = base;

    if (cli.mode) merged.transport.mode = *cli.mode;
    if (cli.host) merged.transport.host = *cli.host;
    if (cli.port) merged.transport.port = *cli.port;
    if (cli.threads) merged.transport.threads = *cli.threads;
    if (cli.api_key) merged.transport.api_key = *cli.api_key;
    if (cli.api_key_env) merged.transport.api_key_env = *cli.api_key_env;

    if (cli.log_level) merged.log.level = *cli.log_level;
    if (cli.log_json) merged.log.json = *cli.log_json;
    if (cli.color) merged.log.color = *cli.color;
    if (cli.log_file) merged.log.file = *cli.log_file;

    if (cli.query_log) merged.query_log = *cli.query_log;
    if (cli.reply_to_notifications) {
        merged.reply_to_notifications = *cli.reply_to_notifications;
    }
    if (cli.error_codes) merged.error_codes = *cli.error_codes;

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config) {
    auto& transport = config.transport;
    if (!transport.api_key.has_value() && transport.api_key_env.has_value()) {
        const auto& env_var = *transport.api_key_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                Error::Config("Environment variable '" + env_var +
                              "' not set (specified by api_key_env)"));
        }
        transport.api_key = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(Error::Config("server.name must not be empty"));
    }
    if (config.transport.mode == TransportMode::Http) {
        if (config.transport.host.empty()) {
            return Result<void, Error>::Err(
                Error::Config("Missing required field: transport.host"));
        }
        if (config.transport.port == 0) {
            return Result<void, Error>::Err(Error::Config("Invalid port: 0"));
        }
        if (config.transport.threads <= 0) {
            return Result<void, Error>::Err(
                Error::Config("transport.threads must be positive, got " +
                              std::to_string(config.transport.threads)));
        }
    }
    if (config.transport.api_key.has_value() && config.transport.api_key->empty()) {
        return Result<void, Error>::Err(Error::Config("API key must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace embed_mcp
