#pragma once

#include <embed_mcp/core/result.hpp>
#include <embed_mcp/mcp/dispatcher.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string_view>

#include <nlohmann/json.hpp>

namespace embed_mcp {

// ---------------------------------------------------------------------------
// QueryLog — append-only JSON-lines record of dispatched requests.
//
// One line per request:
//   {"seq","created_at","method","tool_name","request_id","input",
//    "output","execution_time_ms","success","error_code","error_message"}
// Thread-safe; transports call Append from their worker threads.
// ---------------------------------------------------------------------------
class QueryLog {
public:
    explicit QueryLog(std::ostream& out);

    /// Open (append mode) a log file owned by the QueryLog.
    static Result<std::unique_ptr<QueryLog>, Error> Open(std::string_view path);

    void Append(const DispatchRecord& record);

    /// The JSON line written for a record (without the trailing newline).
    [[nodiscard]] static nlohmann::json ToJson(const DispatchRecord& record,
                                               std::uint64_t seq);

private:
    explicit QueryLog(std::unique_ptr<std::ostream> owned);

    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
    std::mutex mutex_;
    std::uint64_t next_seq_ = 1;
};

} // namespace embed_mcp
