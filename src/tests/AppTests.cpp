// SPDX-License-Identifier: Apache-2.0
#include <agentmesh/App.hpp>
#include <store/LocalStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace agentmesh;

namespace
{

auto runDemo(App& app, DemoMode mode) -> Result<std::string>
{
    return app.runDemo(DemoOptions { .mode = mode, .query = "ping" });
}

} // namespace

TEST_CASE("demoModeFromString", "[app]")
{
    CHECK(demoModeFromString("sequential") == DemoMode::Sequential);
    CHECK(demoModeFromString("phased") == DemoMode::Phased);
    CHECK(demoModeFromString("chat") == DemoMode::Chat);
    CHECK(demoModeFromString("independent") == DemoMode::Independent);
    CHECK(!demoModeFromString("swarm").has_value());
}

TEST_CASE("App demo runs every collaboration pattern", "[app]")
{
    auto app = App(AppConfig {});
    REQUIRE(app.initialize().has_value());

    SECTION("sequential")
    {
        CHECK(runDemo(app, DemoMode::Sequential).value() == "[C] [B] [A] ping");
    }

    SECTION("phased")
    {
        CHECK(runDemo(app, DemoMode::Phased).value() == "[C] ping (4 messages seen)");
    }

    SECTION("chat")
    {
        CHECK(runDemo(app, DemoMode::Chat).value() == "[A] ping (1 messages seen)");
    }

    SECTION("independent")
    {
        CHECK(runDemo(app, DemoMode::Independent).value() == "[A] ping");
    }

    // Demo agents leave the registry when the demo is over.
    auto agents = std::ostringstream {};
    REQUIRE(app.listAgents(agents).has_value());
    CHECK(agents.str().empty());

    auto contexts = std::ostringstream {};
    REQUIRE(app.listContexts(contexts).has_value());
    CHECK(contexts.str().starts_with("demo-"));
}

TEST_CASE("App inspects and removes contexts", "[app]")
{
    auto store = std::make_shared<LocalStore>();
    auto app = App(AppConfig {}, store);
    REQUIRE(app.initialize().has_value());

    auto context = app.registry().getOrCreateContext("notes");
    REQUIRE(context.has_value());
    REQUIRE((*context)->addParticipant("alice").has_value());

    SECTION("inspect prints the snapshot")
    {
        auto out = std::ostringstream {};
        REQUIRE(app.inspectContext("notes", out).has_value());
        auto const snapshot = nlohmann::json::parse(out.str());
        CHECK(snapshot["name"] == "notes");
        CHECK(snapshot["participants"] == nlohmann::json { "alice" });
    }

    SECTION("remove deletes the context")
    {
        auto out = std::ostringstream {};
        REQUIRE(app.removeContext("notes", out).has_value());
        CHECK(out.str() == "Removed context notes\n");
        CHECK(!app.registry().doesContextExist("notes").value());
        CHECK(!store->exists("agentmesh:context:notes:participants").value());
    }

    SECTION("unknown contexts are reported")
    {
        auto out = std::ostringstream {};
        CHECK(app.inspectContext("missing", out).error().code == ErrorCode::NotFound);
        CHECK(app.removeContext("missing", out).error().code == ErrorCode::NotFound);
        CHECK(out.str().empty());
    }
}

TEST_CASE("App lists agents and tools", "[app]")
{
    auto app = App(AppConfig {}, std::make_shared<LocalStore>());
    REQUIRE(app.initialize().has_value());

    REQUIRE(app.registry().registerAgent("helper", "Helps").has_value());
    REQUIRE(app.registry()
                .registerTool(Tool { .name = "ask-helper", .description = "Asks the helper", .isAgentTool = true })
                .has_value());

    auto agents = std::ostringstream {};
    REQUIRE(app.listAgents(agents).has_value());
    CHECK(agents.str() == "helper: Helps\n");

    auto tools = std::ostringstream {};
    REQUIRE(app.listTools(tools).has_value());
    CHECK(tools.str() == "ask-helper (agent): Asks the helper\n");
}
