#pragma once

#include <embed_mcp/config/app_config.hpp>
#include <embed_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace embed_mcp {

// Defaults seeded from the environment: HOST and PORT for the HTTP
// transport; api_key_env becomes "MCP_API_KEY" when that variable exists.
Result<AppConfig, Error> DefaultsFromEnv();

// Parse a YAML config file on top of `base`.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      const AppConfig& base = AppConfig{});

// CLI arguments. Only flags that were given are set; MergeConfigs applies
// them over the file/env configuration.
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<TransportMode> mode;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<int> threads;
    std::optional<std::string> api_key;
    std::optional<std::string> api_key_env;
    std::optional<LogLevel> log_level;
    std::optional<bool> log_json;
    std::optional<bool> color;
    std::optional<std::string> log_file;
    std::optional<std::string> query_log;
    std::optional<bool> reply_to_notifications;
    std::optional<ErrorCodeStyle> error_codes;
    bool show_version = false;
};

Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply the flags that were set in `cli` over `base`.
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli);

// Resolve api_key_env: if api_key is unset and api_key_env is set, read the
// variable into api_key. Errors when the named variable does not exist.
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// "stdio" / "http"
std::optional<TransportMode> ParseTransportMode(std::string_view text);
// "symbolic" / "numeric"
std::optional<ErrorCodeStyle> ParseErrorCodeStyle(std::string_view text);

} // namespace embed_mcp
