#pragma once

#include <embed_mcp/mcp/tool_registry.hpp>

namespace embed_mcp {

// Descriptor and handler of the reference "echo" tool.
ToolDescriptor EchoToolDescriptor();
nlohmann::json EchoTool(const nlohmann::json& arguments);

// Register every built-in tool. Called once at startup, before the
// transport starts accepting requests.
void RegisterBuiltinTools(ToolRegistry& registry);

} // namespace embed_mcp
