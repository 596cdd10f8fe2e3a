// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolInvoker.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <algorithm>
#include <optional>
#include <thread>

using namespace toolbridge;
using namespace std::chrono_literals;

namespace
{

auto echoArguments(std::string_view message) -> nlohmann::json
{
    return nlohmann::json { { "message", message } };
}

} // namespace

TEST_CASE("ToolInvoker without an active server fails", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    auto invoker = ToolInvoker(fixture.registry);

    auto const tools = invoker.listTools();
    REQUIRE(!tools.has_value());
    CHECK(tools.error().code == ErrorCode::NoActiveServer);

    auto const called = invoker.callTool("echo", echoArguments("hi"));
    REQUIRE(!called.has_value());
    CHECK(called.error().code == ErrorCode::NoActiveServer);
}

TEST_CASE("ToolInvoker lists the tools of the active server", "[invoker]")
{
    auto fixture = test::RegistryFixture {};

    SECTION("clean output")
    {
        fixture.addServer(test::fakeServer("fake", "normal"));
    }

    SECTION("noise on stdout")
    {
        fixture.addServer(test::fakeServer("fake", "noisy"));
    }

    REQUIRE(fixture.registry.activateServer("fake").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const tools = invoker.listTools();
    REQUIRE(tools.has_value());
    CHECK(tools->size() == 8);
    CHECK(std::ranges::none_of(*tools, [](const ToolDescriptor& tool) { return tool.name.empty(); }));

    auto const echo = std::ranges::find_if(*tools, [](const ToolDescriptor& tool) { return tool.name == "echo"; });
    REQUIRE(echo != tools->end());
    CHECK(echo->description == "Test tool echo");
    CHECK(echo->inputSchema["type"] == "object");
}

TEST_CASE("ToolInvoker calls a tool and collects its text", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const result = invoker.callTool("echo", echoArguments("hello from the test"));
    REQUIRE(result.has_value());
    CHECK(result->text == "hello from the test");
    CHECK(!result->isError);
    REQUIRE(result->content.is_array());
    CHECK(result->content[0]["type"] == "text");

    SECTION("calls on the same server are sequential and independent")
    {
        auto const again = invoker.callTool("echo", echoArguments("second"));
        REQUIRE(again.has_value());
        CHECK(again->text == "second");
    }

    SECTION("null arguments are sent as an empty object")
    {
        auto const empty = invoker.callTool("echo", nullptr);
        REQUIRE(empty.has_value());
        CHECK(empty->text.empty());
    }

    SECTION("tool-level failures are reported in the result")
    {
        auto const unknown = invoker.callTool("no-such-tool", nlohmann::json::object());
        REQUIRE(unknown.has_value());
        CHECK(unknown->isError);
        CHECK(unknown->text == "unknown tool no-such-tool");
    }
}

TEST_CASE("ToolInvoker surfaces provider errors with their payload", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const result = invoker.callTool("fail", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ApplicationError);
    CHECK(result.error().data["code"] == -32000);
    CHECK(result.error().data["message"] == "tool failed on purpose");
    CHECK(result.error().data["data"]["hint"] == "test");

    CHECK(fixture.registry.activeServer() == "fake");
}

TEST_CASE("ToolInvoker times out but keeps the server active", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake").has_value());

    auto impatient = ToolInvoker(fixture.registry, InvokerConfig { .listTimeout = 100ms, .callTimeout = 100ms });
    auto const start = std::chrono::steady_clock::now();
    auto const result = impatient.callTool("slow", nlohmann::json { { "ms", 300 } });
    auto const elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(elapsed >= 100ms);
    CHECK(elapsed < 2s);
    CHECK(fixture.registry.activeServer() == "fake");

    auto patient = ToolInvoker(fixture.registry);
    auto const echo = patient.callTool("echo", echoArguments("still here"));
    REQUIRE(echo.has_value());
    CHECK(echo->text == "still here");
}

TEST_CASE("ToolInvoker drops a server that dies during a call", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const result = invoker.callTool("crash", nlohmann::json::object());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportClosed);
    CHECK(!fixture.registry.activeServer().has_value());

    auto const next = invoker.listTools();
    REQUIRE(!next.has_value());
    CHECK(next.error().code == ErrorCode::NoActiveServer);
}

TEST_CASE("ToolInvoker fails a pending call when the server is deactivated", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake").has_value());
    auto const process = fixture.registry.activeProcess();
    REQUIRE(process);

    auto invoker = ToolInvoker(fixture.registry, InvokerConfig { .listTimeout = 10s, .callTimeout = 10s });
    auto pending = std::optional<Result<ToolCallResult>> {};
    auto elapsed = std::chrono::steady_clock::duration {};

    auto caller = std::thread([&] {
        auto const start = std::chrono::steady_clock::now();
        pending = invoker.callTool("slow", nlohmann::json { { "ms", 60000 } });
        elapsed = std::chrono::steady_clock::now() - start;
    });

    std::this_thread::sleep_for(200ms);
    fixture.registry.deactivate();
    caller.join();

    REQUIRE(pending.has_value());
    REQUIRE(!pending->has_value());
    CHECK(pending->error().code == ErrorCode::TransportClosed);
    CHECK(elapsed < 5s);
    CHECK(!fixture.registry.activeServer().has_value());
    CHECK(!process->child->isAlive());
}

TEST_CASE("ToolInvoker answers roots requests made during a call", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake", "s1").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const expected = fileUri(fixture.binder.resolve("s1").value());
    auto const result = invoker.callTool("ask_roots", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(result->text == expected);
}

TEST_CASE("ToolInvoker sees roots answered during the handshake", "[invoker]")
{
    auto fixture = test::RegistryFixture {};

    SECTION("requested before the initialize response")
    {
        fixture.addServer(test::fakeServer("fake", "roots-first"));
    }

    SECTION("requested after the initialize response")
    {
        fixture.addServer(test::fakeServer("fake", "roots-after-init"));
    }

    REQUIRE(fixture.registry.activateServer("fake", "s2").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const result = invoker.callTool("last_roots", nlohmann::json::object());
    REQUIRE(result.has_value());
    CHECK(result->text == fileUri(fixture.binder.resolve("s2").value()));
}

TEST_CASE("ToolInvoker reaches a session-scoped server launched with its directory", "[invoker]")
{
    auto fixture = test::RegistryFixture {};
    auto definition = test::fakeServer("scoped", "normal", true);
    definition.env = { { "TOOLBRIDGE_FAKE_TOKEN", "secret" } };
    fixture.addServer(definition);

    REQUIRE(fixture.registry.activateServer("scoped", "s3").has_value());
    auto invoker = ToolInvoker(fixture.registry);

    auto const argv = invoker.callTool("argv", nlohmann::json::object());
    REQUIRE(argv.has_value());
    CHECK(argv->text == "normal\n" + fixture.binder.resolve("s3").value().string());

    auto const env = invoker.callTool("env", nlohmann::json { { "name", "TOOLBRIDGE_FAKE_TOKEN" } });
    REQUIRE(env.has_value());
    CHECK(env->text == "secret");
}

TEST_CASE("parseToolCallResult joins text items and keeps the raw result", "[invoker]")
{
    auto const raw = nlohmann::json {
        { "content",
          nlohmann::json::array({
              { { "type", "text" }, { "text", "line one" } },
              { { "type", "image" }, { "data", "..." } },
              { { "type", "text" }, { "text", "line two" } },
          }) },
        { "isError", true },
    };

    auto const result = parseToolCallResult(raw);
    CHECK(result.text == "line one\nline two");
    CHECK(result.isError);
    CHECK(result.content.size() == 3);
    CHECK(result.raw == raw);

    auto const empty = parseToolCallResult(nlohmann::json::object());
    CHECK(empty.text.empty());
    CHECK(!empty.isError);
}

TEST_CASE("parseToolList skips entries without a name", "[invoker]")
{
    auto const tools = parseToolList(nlohmann::json {
        { "tools",
          nlohmann::json::array({
              { { "name", "a" } },
              { { "description", "nameless" } },
              { { "name", 42 } },
          }) },
    });

    REQUIRE(tools.size() == 1);
    CHECK(tools.front().name == "a");
    CHECK(tools.front().inputSchema.is_object());
    CHECK(parseToolList(nlohmann::json::object()).empty());
}
