#include <embed_mcp/mcp/tool_registry.hpp>

#include <embed_mcp/core/log.hpp>

namespace embed_mcp {

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

void ToolRegistry::Register(ToolDescriptor descriptor, ToolHandler handler) {
    auto it = entries_.find(descriptor.name);
    if (it != entries_.end()) {
        LogDebug("registry", "Replacing tool: " + descriptor.name);
        descriptors_[it->second.index] = std::move(descriptor);
        it->second.handler = std::move(handler);
        return;
    }

    auto name = descriptor.name;
    descriptors_.push_back(std::move(descriptor));
    entries_.emplace(std::move(name),
                     Entry{descriptors_.size() - 1, std::move(handler)});
}

const ToolHandler* ToolRegistry::Lookup(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second.handler;
}

} // namespace embed_mcp
