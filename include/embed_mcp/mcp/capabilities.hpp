#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace embed_mcp {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

// Server identity reported by initialize.
struct ServerInfo {
    std::string name = "embed-mcp";
    std::string version;  // defaults to kVersion when empty
    std::string instructions = "MCP Server initialized successfully";
};

// Capability flags advertised to clients. Static for the process lifetime.
struct Capabilities {
    bool tools_list_changed = false;
    bool prompts_list_changed = false;
    bool resources_subscribe = false;
    bool resources_list_changed = false;
    bool logging = true;

    [[nodiscard]] nlohmann::json ToJson() const;
};

/// The full initialize result: protocolVersion, capabilities, serverInfo,
/// instructions.
nlohmann::json BuildInitializeResult(const ServerInfo& info,
                                     const Capabilities& caps);

} // namespace embed_mcp
