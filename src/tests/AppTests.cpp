// SPDX-License-Identifier: Apache-2.0
#include <mcp/ServerRegistry.hpp>
#include <mcp/ServerStore.hpp>
#include <toolbridge/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

#include <sstream>

using namespace toolbridge;

namespace
{

auto testConfig(const test::TempDir& temp) -> AppConfig
{
    auto config = AppConfig {};
    config.paths.configDir = (temp / "config").string();
    config.paths.logsDir = (temp / "logs").string();
    config.paths.recordingsDir = (temp / "recordings").string();
    config.timeouts.spawnGraceMs = 100;
    config.timeouts.handshakeSettleMs = 50;
    REQUIRE(resolvePaths(config).has_value());
    return config;
}

auto readReplies(const std::string& output) -> std::vector<nlohmann::json>
{
    auto replies = std::vector<nlohmann::json> {};
    auto stream = std::istringstream(output);
    auto line = std::string {};
    while (std::getline(stream, line))
        replies.push_back(nlohmann::json::parse(line));
    return replies;
}

} // namespace

TEST_CASE("App initialize writes the log file and loads the servers", "[app]")
{
    auto const temp = test::TempDir {};
    auto app = App(testConfig(temp));
    REQUIRE(app.initialize().has_value());

    CHECK(app.store().find("filesystem").has_value());
    CHECK(std::filesystem::exists(logFilePath(app.config())));
    CHECK(!app.registry().activeServer().has_value());
}

TEST_CASE("App serve answers one line per request and stops the server at end of input", "[app]")
{
    auto const temp = test::TempDir {};
    auto app = App(testConfig(temp));
    REQUIRE(app.initialize().has_value());
    REQUIRE(app.store().add(test::fakeServer("fake", "normal")).has_value());

    auto input = std::istringstream(
        R"({"id": 1, "action": "activate_mcp_server", "payload": {"server_name": "fake"}})"
        "\n\n"
        R"({"id": 2, "action": "execute_mcp_tool", "payload": {"tool_name": "echo", "params": {"message": "ping"}}})"
        "\n"
        "not json\n");
    auto output = std::ostringstream {};

    CHECK(app.serve(input, output) == 0);

    auto const replies = readReplies(output.str());
    REQUIRE(replies.size() == 3);
    CHECK(replies[0]["id"] == 1);
    CHECK(replies[0]["payload"]["success"] == true);
    CHECK(replies[1]["id"] == 2);
    CHECK(replies[1]["payload"]["data"]["text"] == "ping");
    CHECK(replies[2]["payload"]["success"] == false);

    CHECK(!app.registry().activeServer().has_value());
}
