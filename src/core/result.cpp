#include <embed_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace embed_mcp {

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:    return "config";
        case ErrorCategory::Io:        return "io";
        case ErrorCategory::Transport: return "transport";
        case ErrorCategory::Internal:  return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (" << *detail << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace embed_mcp
