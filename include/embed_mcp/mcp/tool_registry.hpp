#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace embed_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor — discovery metadata for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const;
};

// A tool handler takes the call's "arguments" object and returns the
// tools/call result verbatim (typically {"content": [...]}).
// Handlers may throw; the dispatcher turns exceptions into INTERNAL_ERROR.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — name -> (descriptor, handler).
//
// Populated once during startup, then only read. Lookup and List are const
// and take no locks, so concurrent dispatch is safe as long as nobody calls
// Register after traffic starts.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Insert or overwrite. Re-registering a name replaces its descriptor and
    // handler in place; its position in List() does not change.
    void Register(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const ToolHandler* Lookup(const std::string& name) const;

    [[nodiscard]] const std::vector<ToolDescriptor>& List() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const {
        return Lookup(name) != nullptr;
    }

    [[nodiscard]] std::size_t Size() const noexcept {
        return descriptors_.size();
    }

private:
    struct Entry {
        std::size_t index;  // into descriptors_
        ToolHandler handler;
    };

    std::vector<ToolDescriptor> descriptors_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace embed_mcp
