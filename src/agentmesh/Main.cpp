// SPDX-License-Identifier: Apache-2.0
#include <agentmesh/App.hpp>
#include <agentmesh/Config.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <iostream>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "agentmesh: shared registry and contexts for collaborating agents" };

    auto configPath = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to registry_config.json");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.require_subcommand(1);

    auto* agentsCmd = app.add_subcommand("agents", "List registered agents");
    auto* contextsCmd = app.add_subcommand("contexts", "List context names");
    auto* toolsCmd = app.add_subcommand("tools", "List registered tools");

    auto contextName = std::string {};
    auto* inspectCmd = app.add_subcommand("inspect", "Print a context snapshot as JSON");
    inspectCmd->add_option("context", contextName, "Context name")->required();
    auto* removeCmd = app.add_subcommand("remove-context", "Delete a context and its data");
    removeCmd->add_option("context", contextName, "Context name")->required();

    auto demoMode = std::string { "sequential" };
    auto demoOptions = agentmesh::DemoOptions {};
    auto demoLocal = false;
    auto* demoCmd = app.add_subcommand("demo", "Run echo agents through one collaboration pattern");
    demoCmd->add_option("--mode", demoMode, "Collaboration pattern")
        ->check(CLI::IsMember({ "sequential", "phased", "chat", "independent" }));
    demoCmd->add_option("--query", demoOptions.query, "Question sent by the demo client");
    demoCmd->add_flag("--local", demoLocal, "Use the in-memory store instead of the configured one");

    CLI11_PARSE(app, argc, argv);

    auto configResult = agentmesh::Result<agentmesh::AppConfig> {};
    if (demoCmd->parsed() && demoLocal)
        configResult = agentmesh::AppConfig {};
    else
        configResult = configPath.empty() ? agentmesh::loadConfig() : agentmesh::loadConfigFromFile(configPath);

    if (!configResult)
    {
        agentmesh::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;
    agentmesh::log::setLevel(verbose ? agentmesh::log::Level::Debug
                                     : agentmesh::log::levelFromString(config.logLevel));

    auto application = agentmesh::App(std::move(config));
    if (auto initResult = application.initialize(); !initResult)
    {
        agentmesh::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    auto result = agentmesh::VoidResult {};
    if (agentsCmd->parsed())
        result = application.listAgents(std::cout);
    else if (contextsCmd->parsed())
        result = application.listContexts(std::cout);
    else if (toolsCmd->parsed())
        result = application.listTools(std::cout);
    else if (inspectCmd->parsed())
        result = application.inspectContext(contextName, std::cout);
    else if (removeCmd->parsed())
        result = application.removeContext(contextName, std::cout);
    else if (demoCmd->parsed())
    {
        demoOptions.mode = agentmesh::demoModeFromString(demoMode).value_or(agentmesh::DemoMode::Sequential);
        auto answer = application.runDemo(demoOptions);
        if (answer)
            std::println("{}", *answer);
        else
            result = std::unexpected(answer.error());
    }

    if (!result)
    {
        agentmesh::log::error("{}", result.error());
        return 1;
    }
    return 0;
}
