// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolbridge;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(jsonrpc::ids::CallTool, "tools/call", params);

    CHECK(request["id"] == 3);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("makeResult echoes string and numeric ids verbatim", "[jsonrpc]")
{
    auto const stringReply = jsonrpc::makeResult("abc", nlohmann::json { { "roots", nlohmann::json::array() } });
    CHECK(stringReply["id"] == "abc");
    CHECK(stringReply["result"]["roots"].is_array());

    auto const numericReply = jsonrpc::makeResult(7, nlohmann::json::object());
    CHECK(numericReply["id"] == 7);
}

TEST_CASE("makeErrorResponse carries code and message", "[jsonrpc]")
{
    auto const reply = jsonrpc::makeErrorResponse(5, jsonrpc::codes::MethodNotFound, "nope");
    CHECK(reply["id"] == 5);
    CHECK(reply["error"]["code"] == -32601);
    CHECK(reply["error"]["message"] == "nope");
    CHECK(!reply.contains("result"));
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->hasId(1));
    CHECK(!result->hasId(2));
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response with data", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "error",
          {
              { "code", -32000 },
              { "message", "Tool exploded" },
              { "data", { { "detail", 42 } } },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32000);
    CHECK(result->error->message == "Tool exploded");
    CHECK(result->error->data["detail"] == 42);
}

TEST_CASE("parseResponse tolerates error fields of the wrong type", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "error",
          {
              { "code", "E_BAD" },
              { "message", { { "text", "nested" } } },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == 0);
    CHECK(result->error->message == "Unknown error");
    CHECK(result->error->data.is_null());
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseMessage classifies requests, notifications and responses", "[jsonrpc]")
{
    SECTION("request with string id")
    {
        auto parsed = jsonrpc::parseMessage(
            nlohmann::json { { "jsonrpc", "2.0" }, { "id", "r-1" }, { "method", "roots/list" } });
        REQUIRE(parsed.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Request>(*parsed));
        auto const& request = std::get<jsonrpc::Request>(*parsed);
        CHECK(request.id == "r-1");
        CHECK(request.method == "roots/list");
    }

    SECTION("notification")
    {
        auto parsed = jsonrpc::parseMessage(
            nlohmann::json { { "jsonrpc", "2.0" }, { "method", "notifications/tools/list_changed" } });
        REQUIRE(parsed.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Notification>(*parsed));
        CHECK(std::get<jsonrpc::Notification>(*parsed).method == "notifications/tools/list_changed");
    }

    SECTION("response")
    {
        auto parsed =
            jsonrpc::parseMessage(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 2 }, { "result", nullptr } });
        REQUIRE(parsed.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Response>(*parsed));
        CHECK(std::get<jsonrpc::Response>(*parsed).hasId(2));
    }

    SECTION("request with an object id is rejected")
    {
        auto parsed = jsonrpc::parseMessage(
            nlohmann::json { { "jsonrpc", "2.0" }, { "id", nlohmann::json::object() }, { "method", "x" } });
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("toJson restores the wire form of a parsed message", "[jsonrpc]")
{
    auto const original = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 9 },
        { "method", "tools/call" },
        { "params", { { "name", "echo" } } },
    };

    auto parsed = jsonrpc::parseMessage(original);
    REQUIRE(parsed.has_value());
    CHECK(jsonrpc::toJson(*parsed) == original);
}
