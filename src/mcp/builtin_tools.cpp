#include <embed_mcp/mcp/builtin_tools.hpp>

#include <string>

namespace embed_mcp {

namespace {

nlohmann::json TextContent(const std::string& text) {
    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", text}}
        })}
    };
}

} // anonymous namespace

ToolDescriptor EchoToolDescriptor() {
    return ToolDescriptor{
        "echo",
        "Echoes back the provided message.",
        {{"type", "object"},
         {"properties", {
             {"message", {
                 {"type", "string"},
                 {"description", "Message to echo back"}
             }}
         }},
         {"required", nlohmann::json::array({"message"})}}
    };
}

nlohmann::json EchoTool(const nlohmann::json& arguments) {
    // A missing message echoes the empty string rather than failing.
    std::string message;
    if (arguments.is_object()) {
        auto it = arguments.find("message");
        if (it != arguments.end() && it->is_string()) {
            message = it->get<std::string>();
        }
    }
    return TextContent(message);
}

void RegisterBuiltinTools(ToolRegistry& registry) {
    registry.Register(EchoToolDescriptor(), EchoTool);
}

} // namespace embed_mcp
