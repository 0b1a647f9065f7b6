#include <catch2/catch_test_macros.hpp>

#include <embed_mcp/mcp/envelope.hpp>

using namespace embed_mcp;

// ===========================================================================
// Decode
// ===========================================================================

TEST_CASE("Decode: full request with object params", "[mcp][envelope]") {
    auto raw = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"echo"},"id":7})");

    auto result = Decode(raw);
    REQUIRE(result.IsOk());
    const auto& req = result.Value();
    CHECK(req.method == "tools/call");
    CHECK_FALSE(req.IsNotification());
    CHECK(*req.id == 7);
    REQUIRE(std::holds_alternative<nlohmann::json::object_t>(req.params));
    CHECK(ParamsToJson(req.params) == nlohmann::json{{"name", "echo"}});
}

TEST_CASE("Decode: list params pass through unchanged", "[mcp][envelope]") {
    auto raw = nlohmann::json::parse(
        R"({"jsonrpc":"2.0","method":"time","params":[1,"two",{"three":3}],"id":"a"})");

    auto result = Decode(raw);
    REQUIRE(result.IsOk());
    REQUIRE(std::holds_alternative<nlohmann::json::array_t>(result.Value().params));
    CHECK(ParamsToJson(result.Value().params) == raw["params"]);
}

TEST_CASE("Decode: absent and null params decode as no params", "[mcp][envelope]") {
    auto absent = Decode(nlohmann::json{{"jsonrpc", "2.0"}, {"method", "time"}, {"id", 1}});
    REQUIRE(absent.IsOk());
    CHECK_FALSE(HasParams(absent.Value().params));

    auto null_params = Decode(nlohmann::json{
        {"jsonrpc", "2.0"}, {"method", "time"}, {"params", nullptr}, {"id", 1}});
    REQUIRE(null_params.IsOk());
    CHECK_FALSE(HasParams(null_params.Value().params));
    CHECK(ParamsToJson(null_params.Value().params).is_null());
}

TEST_CASE("Decode: missing id is a notification", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{
        {"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().IsNotification());
    CHECK(result.Value().ResponseId().is_null());
}

TEST_CASE("Decode: explicit null id is not a notification", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{
        {"jsonrpc", "2.0"}, {"method", "time"}, {"id", nullptr}});
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().IsNotification());
    CHECK(result.Value().ResponseId().is_null());
}

TEST_CASE("Decode: jsonrpc marker may be omitted", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{{"method", "time"}, {"id", 1}});
    CHECK(result.IsOk());
}

TEST_CASE("Decode: missing method is malformed and keeps the id", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{{"jsonrpc", "2.0"}, {"id", 42}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().id == 42);
    CHECK(result.Error().message.find("method") != std::string::npos);
}

TEST_CASE("Decode: non-string method is malformed", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{{"jsonrpc", "2.0"}, {"method", 5}, {"id", "x"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().id == "x");
}

TEST_CASE("Decode: empty method is malformed", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{{"jsonrpc", "2.0"}, {"method", ""}, {"id", 1}});
    CHECK(result.IsErr());
}

TEST_CASE("Decode: scalar params are malformed", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{
        {"jsonrpc", "2.0"}, {"method", "time"}, {"params", "oops"}, {"id", 1}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().id == 1);
}

TEST_CASE("Decode: wrong jsonrpc version is malformed", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{{"jsonrpc", "1.0"}, {"method", "time"}, {"id", 1}});
    CHECK(result.IsErr());
}

TEST_CASE("Decode: structured id is malformed with null id", "[mcp][envelope]") {
    auto result = Decode(nlohmann::json{
        {"jsonrpc", "2.0"}, {"method", "time"}, {"id", {{"nested", true}}}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().id.is_null());
}

TEST_CASE("Decode: non-object body is malformed", "[mcp][envelope]") {
    CHECK(Decode(nlohmann::json::array({1, 2})).IsErr());
    CHECK(Decode(nlohmann::json("initialize")).IsErr());
}

// ===========================================================================
// Encode
// ===========================================================================

TEST_CASE("EncodeSuccess: carries marker, result and id", "[mcp][envelope]") {
    auto env = EncodeSuccess({{"ok", true}}, "req-1");
    CHECK(env["jsonrpc"] == "2.0");
    CHECK(env["result"]["ok"] == true);
    CHECK(env["id"] == "req-1");
    CHECK_FALSE(env.contains("error"));
}

TEST_CASE("EncodeSuccess: null id is echoed as null", "[mcp][envelope]") {
    auto env = EncodeSuccess(nlohmann::json::object(), nullptr);
    REQUIRE(env.contains("id"));
    CHECK(env["id"].is_null());
}

TEST_CASE("EncodeSuccess: numeric result fields survive a text round trip", "[mcp][envelope]") {
    nlohmann::json result = {
        {"int", 1700000000},
        {"negative", -5},
        {"float", 1700000000.123456},
        {"text", "héllo"}
    };
    auto text = EncodeSuccess(result, 3).dump();
    auto parsed = nlohmann::json::parse(text);
    CHECK(parsed["result"] == result);
    CHECK(parsed["result"]["int"].is_number_integer());
    CHECK(parsed["result"]["float"].is_number_float());
}

TEST_CASE("EncodeError: symbolic code by default, data omitted", "[mcp][envelope]") {
    auto env = EncodeError(ErrorKind::MethodNotFound, "Method not found: x", 9);
    CHECK(env["jsonrpc"] == "2.0");
    CHECK(env["id"] == 9);
    CHECK(env["error"]["code"] == "METHOD_NOT_FOUND");
    CHECK(env["error"]["message"] == "Method not found: x");
    CHECK_FALSE(env["error"].contains("data"));
    CHECK_FALSE(env.contains("result"));
}

TEST_CASE("EncodeError: data and numeric code", "[mcp][envelope]") {
    auto env = EncodeError(ErrorKind::InvalidParams, "bad", "id",
                           nlohmann::json{{"field", "name"}},
                           ErrorCodeStyle::Numeric);
    CHECK(env["error"]["code"] == -32602);
    CHECK(env["error"]["data"]["field"] == "name");
}

TEST_CASE("ErrorKind: names and codes", "[mcp][envelope]") {
    CHECK(std::string(ErrorKindName(ErrorKind::ParseError)) == "PARSE_ERROR");
    CHECK(std::string(ErrorKindName(ErrorKind::InvalidRequest)) == "INVALID_REQUEST");
    CHECK(std::string(ErrorKindName(ErrorKind::ToolNotFound)) == "TOOL_NOT_FOUND");
    CHECK(std::string(ErrorKindName(ErrorKind::InternalError)) == "INTERNAL_ERROR");
    CHECK(ErrorKindCode(ErrorKind::ParseError) == -32700);
    CHECK(ErrorKindCode(ErrorKind::InvalidRequest) == -32600);
    CHECK(ErrorKindCode(ErrorKind::MethodNotFound) == -32601);
    CHECK(ErrorKindCode(ErrorKind::ToolNotFound) == -32602);
    CHECK(ErrorKindCode(ErrorKind::InternalError) == -32603);
}
