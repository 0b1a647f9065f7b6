#include <embed_mcp/mcp/capabilities.hpp>

#include <embed_mcp/core/version.hpp>

namespace embed_mcp {

nlohmann::json Capabilities::ToJson() const {
    nlohmann::json caps = {
        {"tools", {{"listChanged", tools_list_changed}}},
        {"prompts", {{"listChanged", prompts_list_changed}}},
        {"resources", {
            {"subscribe", resources_subscribe},
            {"listChanged", resources_list_changed}
        }}
    };
    if (logging) {
        caps["logging"] = nlohmann::json::object();
    }
    return caps;
}

nlohmann::json BuildInitializeResult(const ServerInfo& info,
                                     const Capabilities& caps) {
    return {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", caps.ToJson()},
        {"serverInfo", {
            {"name", info.name},
            {"version", info.version.empty() ? std::string(kVersion) : info.version}
        }},
        {"instructions", info.instructions}
    };
}

} // namespace embed_mcp
