#include <embed_mcp/mcp/query_log.hpp>

#include <embed_mcp/core/log.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>

namespace embed_mcp {

namespace {

std::string CreatedAtNow() {
    const auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // anonymous namespace

QueryLog::QueryLog(std::ostream& out) : out_(out) {}

QueryLog::QueryLog(std::unique_ptr<std::ostream> owned)
    : owned_(std::move(owned)), out_(*owned_) {}

Result<std::unique_ptr<QueryLog>, Error> QueryLog::Open(std::string_view path) {
    auto file = std::make_unique<std::ofstream>(std::string(path), std::ios::app);
    if (!file->is_open()) {
        return Result<std::unique_ptr<QueryLog>, Error>::Err(Error{
            "QueryLog", "Cannot open query log for writing",
            std::string(path), ErrorCategory::Io});
    }
    LogInfo("querylog", "Writing query log to " + std::string(path));
    return Result<std::unique_ptr<QueryLog>, Error>::Ok(
        std::unique_ptr<QueryLog>(new QueryLog(std::move(file))));
}

nlohmann::json QueryLog::ToJson(const DispatchRecord& record,
                                std::uint64_t seq) {
    nlohmann::json line = {
        {"seq", seq},
        {"created_at", CreatedAtNow()},
        {"method", record.method},
        {"tool_name", record.tool_name.has_value()
                          ? nlohmann::json(*record.tool_name)
                          : nlohmann::json(nullptr)},
        {"request_id", record.id},
        {"input", record.arguments},
        {"output", record.success ? record.result : nlohmann::json(nullptr)},
        {"execution_time_ms", record.duration.count() / 1000.0},
        {"success", record.success},
    };
    if (record.error_kind.has_value()) {
        line["error_code"] = ErrorKindName(*record.error_kind);
        line["error_message"] = record.error_message;
    } else {
        line["error_code"] = nullptr;
        line["error_message"] = nullptr;
    }
    return line;
}

void QueryLog::Append(const DispatchRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << ToJson(record, next_seq_++).dump(
                -1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
    if (!out_) {
        LogWarn("querylog", "Failed to write query log entry for " + record.method);
        out_.clear();
    }
}

} // namespace embed_mcp
