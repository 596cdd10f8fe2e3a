// SPDX-License-Identifier: Apache-2.0
#include <mcp/ServerRegistry.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <algorithm>

using namespace toolbridge;
using namespace std::chrono_literals;

TEST_CASE("ServerRegistry activates an enabled server", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));

    auto const activated = fixture.registry.activateServer("fake");
    REQUIRE(activated.has_value());
    CHECK(fixture.registry.activeServer() == "fake");

    auto const process = fixture.registry.activeProcess();
    REQUIRE(process);
    CHECK(process->child->isAlive());
    CHECK(process->boundDirectory == fixture.binder.recordingsRoot());
    REQUIRE(process->roots.size() == 1);
    CHECK(process->roots.front().uri == fileUri(fixture.binder.recordingsRoot()));
}

TEST_CASE("ServerRegistry binds the requested session directory", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "roots-after-init"));

    REQUIRE(fixture.registry.activateServer("fake", "session-42").has_value());

    auto const process = fixture.registry.activeProcess();
    REQUIRE(process);
    CHECK(process->boundDirectory.filename() == "session-42");
    CHECK(std::filesystem::is_directory(process->boundDirectory));
}

TEST_CASE("ServerRegistry rejects unknown and disabled servers", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    auto disabled = test::fakeServer("off", "normal");
    disabled.enabled = false;
    fixture.addServer(disabled);

    auto const unknown = fixture.registry.activateServer("missing");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::InvalidArgument);

    auto const off = fixture.registry.activateServer("off");
    REQUIRE(!off.has_value());
    CHECK(off.error().code == ErrorCode::InvalidArgument);
    CHECK(off.error().message.find("not enabled") != std::string::npos);

    CHECK(!fixture.registry.activate("off"));
    CHECK(!fixture.registry.activeServer().has_value());
}

TEST_CASE("ServerRegistry keeps at most one server active", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("first", "normal"));
    fixture.addServer(test::fakeServer("second", "normal"));

    REQUIRE(fixture.registry.activateServer("first").has_value());
    auto const first = fixture.registry.activeProcess();
    REQUIRE(first);

    REQUIRE(fixture.registry.activateServer("second").has_value());
    CHECK(fixture.registry.activeServer() == "second");
    CHECK(!first->child->isAlive());
    CHECK(!first->transport->isConnected());

    auto const servers = fixture.registry.servers();
    CHECK(std::ranges::count_if(servers, [](const ServerInfo& info) { return info.active; }) == 1);
}

TEST_CASE("ServerRegistry failed activations leave no server active", "[registry]")
{
    auto fixture = test::RegistryFixture { 300ms };
    fixture.addServer(test::fakeServer("good", "normal"));
    fixture.addServer(test::fakeServer("silent", "silent"));
    fixture.addServer(test::fakeServer("broken", "exit-immediately"));
    fixture.addServer(test::fakeServer("rejecting", "init-error"));
    fixture.addServer(test::fakeServer("quitter", "exit-after-init"));

    REQUIRE(fixture.registry.activateServer("good").has_value());
    auto const previous = fixture.registry.activeProcess();

    SECTION("no initialize response")
    {
        auto const result = fixture.registry.activateServer("silent");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::HandshakeTimeout);
        CHECK(result.error().message.starts_with("Failed to activate server silent"));
    }

    SECTION("exits during startup")
    {
        auto const result = fixture.registry.activateServer("broken");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::SpawnFailed);
        CHECK(result.error().message.find("missing API key") != std::string::npos);
    }

    SECTION("initialize rejected")
    {
        auto const result = fixture.registry.activateServer("rejecting");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ApplicationError);
        CHECK(result.error().data["code"] == -32602);
    }

    SECTION("exits after initialize")
    {
        auto const result = fixture.registry.activateServer("quitter");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::TransportClosed);
    }

    CHECK(!fixture.registry.activeServer().has_value());
    CHECK(!fixture.registry.activeProcess());
    CHECK(!previous->child->isAlive());
}

TEST_CASE("ServerRegistry reports stderr of a server that exits before initialize", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("late", "exit-before-init"));

    auto const result = fixture.registry.activateServer("late");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportClosed);
    CHECK(result.error().message.find("config file is corrupt") != std::string::npos);
    CHECK(!fixture.registry.activeServer().has_value());
}

TEST_CASE("ServerRegistry rebinds the session-scoped server to a new session", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    auto definition = test::fakeServer("filesystem", "normal", true);
    definition.args = { "-y", "pkg" };
    fixture.addServer(definition);

    REQUIRE(fixture.registry.activateServer("filesystem", "S1").has_value());
    auto const first = fixture.registry.activeProcess();
    REQUIRE(first);
    CHECK(first->argv.back() == fixture.binder.resolve("S1").value().string());

    REQUIRE(fixture.registry.activateServer("filesystem", "S2").has_value());
    auto const second = fixture.registry.activeProcess();
    REQUIRE(second);
    CHECK(second != first);
    CHECK(!first->child->isAlive());
    CHECK(second->child->isAlive());
    CHECK(second->argv.back() == fixture.binder.resolve("S2").value().string());
    CHECK(second->boundDirectory == fixture.binder.resolve("S2").value());
}

TEST_CASE("ServerRegistry lists configured servers with their state", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("alpha", "normal"));
    auto beta = test::fakeServer("beta", "normal");
    beta.enabled = false;
    beta.icon = "🧪";
    fixture.addServer(beta);

    REQUIRE(fixture.registry.activateServer("alpha").has_value());

    auto const servers = fixture.registry.servers();
    REQUIRE(servers.size() == 2);
    CHECK(servers[0].name == "alpha");
    CHECK(servers[0].active);
    CHECK(servers[0].enabled);
    CHECK(servers[1].name == "beta");
    CHECK(!servers[1].active);
    CHECK(!servers[1].enabled);

    auto const json = toJson(servers[1]);
    CHECK(json["icon"] == "🧪");
    CHECK(json["description"] == "Fake provider");
}

TEST_CASE("ServerRegistry deactivate stops the active server", "[registry]")
{
    auto fixture = test::RegistryFixture {};
    fixture.addServer(test::fakeServer("fake", "normal"));
    REQUIRE(fixture.registry.activateServer("fake").has_value());
    auto const process = fixture.registry.activeProcess();

    fixture.registry.deactivate();
    CHECK(!fixture.registry.activeServer().has_value());
    CHECK(!process->child->isAlive());

    // Deactivating with nothing active is a no-op.
    fixture.registry.deactivate();
    CHECK(!fixture.registry.activeServer().has_value());
}
