// SPDX-License-Identifier: Apache-2.0
#include <toolbridge/Router.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <algorithm>
#include <fstream>

using namespace toolbridge;
using namespace std::chrono_literals;

namespace
{

struct RouterFixture
{
    test::RegistryFixture base;
    ToolInvoker invoker { base.registry };
    LocalToolRegistry localTools;
    AgentHost agent { base.store, base.binder, base.temp / "mcp_config.json" };
    Router router { RouterServices {
        .registry = base.registry,
        .invoker = invoker,
        .localTools = localTools,
        .agent = agent,
    } };

    RouterFixture() { base.addServer(test::fakeServer("fake", "normal")); }

    auto request(std::string_view action, nlohmann::json payload = nlohmann::json::object()) -> nlohmann::json
    {
        return router.handle(nlohmann::json { { "id", "req-1" }, { "action", action }, { "payload", std::move(payload) } });
    }
};

} // namespace

TEST_CASE("Router echoes id and action in every reply", "[router]")
{
    auto fixture = RouterFixture {};
    auto const reply = fixture.request("health");

    CHECK(reply["id"] == "req-1");
    CHECK(reply["type"] == "response");
    CHECK(reply["action"] == "health");
    CHECK(reply["payload"]["success"] == true);
}

TEST_CASE("Router reports unknown actions", "[router]")
{
    auto fixture = RouterFixture {};
    auto const reply = fixture.request("self_destruct");

    CHECK(reply["payload"]["success"] == false);
    CHECK(reply["payload"]["error"] == "Unknown action: self_destruct");
    CHECK(reply["payload"]["code"] == "InvalidArgument");
}

TEST_CASE("Router handleLine rejects malformed input", "[router]")
{
    auto fixture = RouterFixture {};

    for (auto const line: { std::string_view { "{ nope" }, std::string_view { "[1, 2]" } })
    {
        auto const reply = nlohmann::json::parse(fixture.router.handleLine(line));
        CHECK(reply["id"].is_null());
        CHECK(reply["type"] == "response");
        CHECK(reply["payload"]["success"] == false);
    }

    auto const ok = nlohmann::json::parse(fixture.router.handleLine(R"({"id": 7, "action": "health"})"));
    CHECK(ok["id"] == 7);
    CHECK(ok["payload"]["success"] == true);
}

TEST_CASE("Router health reports services and the active server", "[router]")
{
    auto fixture = RouterFixture {};

    auto const idle = fixture.request("health")["payload"]["data"];
    CHECK(idle["status"] == "healthy");
    CHECK(idle["services"]["local_tools"] == true);
    CHECK(idle["services"]["agent"] == false);
    CHECK(idle["active_server"].is_null());

    REQUIRE(fixture.base.registry.activateServer("fake").has_value());
    CHECK(fixture.request("health")["payload"]["data"]["active_server"] == "fake");
}

TEST_CASE("Router lists, activates and deactivates servers", "[router]")
{
    auto fixture = RouterFixture {};

    auto const listed = fixture.request("get_mcp_servers")["payload"];
    REQUIRE(listed["success"] == true);
    REQUIRE(listed["data"].size() == 1);
    CHECK(listed["data"][0]["name"] == "fake");
    CHECK(listed["data"][0]["active"] == false);

    auto const activated = fixture.request("activate_mcp_server", { { "server_name", "fake" }, { "session_id", "s1" } });
    REQUIRE(activated["payload"]["success"] == true);
    CHECK(activated["payload"]["data"]["active"] == "fake");
    CHECK(fixture.base.registry.activeProcess()->boundDirectory.filename() == "s1");
    CHECK(fixture.request("get_mcp_servers")["payload"]["data"][0]["active"] == true);

    auto const deactivated = fixture.request("deactivate_mcp_server");
    REQUIRE(deactivated["payload"]["success"] == true);
    CHECK(deactivated["payload"]["data"]["active"].is_null());
    CHECK(!fixture.base.registry.activeServer().has_value());
}

TEST_CASE("Router reports failed activations with their error code", "[router]")
{
    auto fixture = RouterFixture {};

    auto const missingName = fixture.request("activate_mcp_server")["payload"];
    CHECK(missingName["success"] == false);
    CHECK(missingName["code"] == "InvalidArgument");

    auto const unknown = fixture.request("activate_mcp_server", { { "server_name", "ghost" } })["payload"];
    CHECK(unknown["success"] == false);
    CHECK(unknown["error"] == "Server ghost not found");
}

TEST_CASE("Router runs tools on the active server", "[router]")
{
    auto fixture = RouterFixture {};

    auto const inactive = fixture.request("execute_mcp_tool", { { "tool_name", "echo" } })["payload"];
    CHECK(inactive["success"] == false);
    CHECK(inactive["code"] == "NoActiveServer");

    REQUIRE(fixture.request("activate_mcp_server", { { "server_name", "fake" } })["payload"]["success"] == true);

    auto const tools = fixture.request("list_mcp_tools")["payload"];
    REQUIRE(tools["success"] == true);
    CHECK(tools["data"].size() == 8);

    auto const echoed =
        fixture.request("execute_mcp_tool", { { "tool_name", "echo" }, { "params", { { "message", "hi" } } } })["payload"];
    REQUIRE(echoed["success"] == true);
    CHECK(echoed["data"]["text"] == "hi");
    CHECK(echoed["data"]["isError"] == false);

    auto const failed = fixture.request("execute_mcp_tool", { { "tool_name", "fail" } })["payload"];
    CHECK(failed["success"] == false);
    CHECK(failed["code"] == "ApplicationError");
    CHECK(failed["details"]["code"] == -32000);

    auto const noName = fixture.request("execute_mcp_tool")["payload"];
    CHECK(noName["success"] == false);
    CHECK(noName["code"] == "InvalidArgument");
}

TEST_CASE("Router runs local tools", "[router]")
{
    auto fixture = RouterFixture {};

    auto const parsed =
        fixture.request("mcp_tool_call", { { "tool", "json_parse" }, { "params", { { "data", "[1,2,3]" } } } })["payload"];
    REQUIRE(parsed["success"] == true);
    CHECK(parsed["data"] == nlohmann::json::array({ 1, 2, 3 }));

    auto const unknown = fixture.request("mcp_tool_call", { { "tool", "nope" } })["payload"];
    CHECK(unknown["success"] == false);
    CHECK(unknown["error"] == "Unknown MCP tool: nope");

    auto const noTool = fixture.request("mcp_tool_call")["payload"];
    CHECK(noTool["success"] == false);
}

TEST_CASE("Router replies with valid JSON for binary file contents", "[router]")
{
    auto fixture = RouterFixture {};
    auto const path = fixture.base.temp / "blob.bin";
    std::ofstream(path, std::ios::binary) << "\xff\xfe\x80";

    auto const request = nlohmann::json {
        { "id", 5 },
        { "action", "mcp_tool_call" },
        { "payload", { { "tool", "file_read" }, { "params", { { "path", path.string() } } } } },
    };
    auto const reply = nlohmann::json::parse(fixture.router.handleLine(request.dump()));

    CHECK(reply["id"] == 5);
    REQUIRE(reply["payload"]["success"] == true);
    REQUIRE(reply["payload"]["data"].is_string());
    CHECK(reply["payload"]["data"].get<std::string>().find("\xEF\xBF\xBD") != std::string::npos);
}

TEST_CASE("Router replies with valid JSON when a server writes garbled stderr", "[router]")
{
    auto fixture = RouterFixture {};
    fixture.base.addServer(test::fakeServer("garbled", "exit-garbled"));

    auto const request = nlohmann::json {
        { "id", 6 },
        { "action", "activate_mcp_server" },
        { "payload", { { "server_name", "garbled" } } },
    };
    auto const reply = nlohmann::json::parse(fixture.router.handleLine(request.dump()));

    CHECK(reply["id"] == 6);
    CHECK(reply["payload"]["success"] == false);
    CHECK(reply["payload"]["code"] == "SpawnFailed");
    CHECK(reply["payload"]["error"].get<std::string>().find("broken locale") != std::string::npos);
    CHECK(!fixture.base.registry.activeServer().has_value());
}

TEST_CASE("Router forwards intelligent tasks to the agent host", "[router]")
{
    auto fixture = RouterFixture {};

    auto const reply = fixture.request("run_intelligent_task", { { "task", "summarize" } })["payload"];
    REQUIRE(reply["success"] == true);
    CHECK(reply["data"]["fallback"] == true);

    auto const prepared = fixture.request("prepare_session", { { "session_id", "s1" } })["payload"];
    REQUIRE(prepared["success"] == true);
    CHECK(prepared["data"]["agent_available"] == false);

    auto const noTask = fixture.request("run_intelligent_task")["payload"];
    CHECK(noTask["success"] == false);
}

TEST_CASE("Router lists its actions", "[router]")
{
    auto fixture = RouterFixture {};
    auto const actions = fixture.router.actions();
    CHECK(actions.size() == 9);
    CHECK(std::ranges::is_sorted(actions));
}
