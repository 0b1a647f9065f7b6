#include <catch2/catch_test_macros.hpp>

#include <embed_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace embed_mcp;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(8000);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 8000);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("port out of range");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "port out of range");
}

TEST_CASE("Result: ValueOr", "[result]") {
    CHECK(Result<int, std::string>::Ok(1).ValueOr(0) == 1);
    CHECK(Result<int, std::string>::Err("x").ValueOr(7) == 7);
}

TEST_CASE("Result: AndThen chains and short-circuits", "[result]") {
    auto parse = [](const std::string& s) -> Result<int, std::string> {
        if (s.empty()) {
            return Result<int, std::string>::Err("empty");
        }
        return Result<int, std::string>::Ok(static_cast<int>(s.size()));
    };

    auto ok = Result<std::string, std::string>::Ok("abc").AndThen(parse);
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 3);

    auto inner_err = Result<std::string, std::string>::Ok("").AndThen(parse);
    REQUIRE(inner_err.IsErr());
    CHECK(inner_err.Error() == "empty");

    bool called = false;
    auto outer_err = Result<std::string, std::string>::Err("first").AndThen(
        [&called](const std::string& s) {
            called = true;
            return Result<int, std::string>::Ok(static_cast<int>(s.size()));
        });
    CHECK_FALSE(called);
    CHECK(outer_err.Error() == "first");
}

TEST_CASE("Result: Map transforms value and passes errors through", "[result]") {
    auto doubled = Result<int, std::string>::Ok(21).Map([](int v) { return v * 2; });
    CHECK(doubled.Value() == 42);

    auto text = Result<int, std::string>::Ok(5).Map(
        [](int v) { return std::to_string(v); });
    CHECK(text.Value() == "5");

    auto err = Result<int, std::string>::Err("bad").Map([](int v) { return v + 1; });
    CHECK(err.Error() == "bad");
}

TEST_CASE("Result: move-only type in Ok", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(3));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 3);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error::Config("bad"));
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "bad");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"Op", "msg", std::nullopt};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: Config factory", "[error]") {
    auto e = Error::Config("Invalid --port: 'abc'");
    CHECK(e.operation == "ConfigLoader");
    CHECK(e.category == ErrorCategory::Config);
    CHECK_FALSE(e.detail.has_value());
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Config}.ExitCode() == 2);
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Io}.ExitCode() == 3);
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Transport}.ExitCode() == 4);
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Internal}.ExitCode() == 99);
}

TEST_CASE("Error: CategoryName", "[error]") {
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Config}.CategoryName() == "config");
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Io}.CategoryName() == "io");
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Transport}.CategoryName() == "transport");
    CHECK(Error{"", "", std::nullopt, ErrorCategory::Internal}.CategoryName() == "internal");
}

TEST_CASE("Error: ToString with and without detail", "[error]") {
    Error with{"HttpTransport", "Failed to bind", std::string("0.0.0.0:8000"),
               ErrorCategory::Transport};
    CHECK(with.ToString() == "HttpTransport: Failed to bind (0.0.0.0:8000)");

    Error without{"ConfigLoader", "Missing server name", std::nullopt,
                  ErrorCategory::Config};
    CHECK(without.ToString() == "ConfigLoader: Missing server name");
}

TEST_CASE("Error: ToJson contains required fields", "[error]") {
    Error e{"QueryLog", "Cannot open query log for writing",
            std::string("/tmp/q.jsonl"), ErrorCategory::Io};
    auto parsed = nlohmann::json::parse(e.ToJson());
    const auto& body = parsed["error"];
    CHECK(body["category"] == "io");
    CHECK(body["operation"] == "QueryLog");
    CHECK(body["message"] == "Cannot open query log for writing");
    CHECK(body["detail"] == "/tmp/q.jsonl");
    CHECK(body["exit_code"] == 3);
}

TEST_CASE("Error: ToJson omits absent detail and escapes text", "[error]") {
    Error e{"Op", "line1\nline2 \"quoted\"", std::nullopt};
    auto json = e.ToJson();
    CHECK(json.find("\"detail\"") == std::string::npos);
    CHECK(json.find("\\n") != std::string::npos);
    CHECK(nlohmann::json::parse(json)["error"]["message"] == "line1\nline2 \"quoted\"");
}

TEST_CASE("Error: equality includes category and detail", "[error]") {
    Error a{"Op", "msg", std::nullopt, ErrorCategory::Io};
    Error b{"Op", "msg", std::nullopt, ErrorCategory::Io};
    Error c{"Op", "msg", std::nullopt, ErrorCategory::Transport};
    Error d{"Op", "msg", std::string("x"), ErrorCategory::Io};
    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);
}
