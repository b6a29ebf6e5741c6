// SPDX-License-Identifier: Apache-2.0
#include "Tool.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace agentmesh
{

auto Tool::invoke(const nlohmann::json& parameters) const -> Result<std::string>
{
    if (!callback)
        return parameters.dump();

    auto result = callback(parameters);
    if (!result)
        return makeError(ErrorCode::ToolCallError, std::format("Tool {} failed: {}", name, result.error().message));
    return result;
}

auto Tool::toOpenAiFormat() const -> nlohmann::json
{
    return nlohmann::json {
        { "type", "function" },
        { "function",
          {
              { "name", name },
              { "description", description },
              { "parameters", parametersSchema },
          } },
    };
}

auto Tool::toDefinition() const -> ToolDefinition
{
    return ToolDefinition {
        .name = name,
        .description = description,
        .inputSchema = parametersSchema,
    };
}

auto toolToJson(const Tool& tool) -> nlohmann::json
{
    return nlohmann::json {
        { "name", tool.name },
        { "description", tool.description },
        { "parameters", tool.parametersSchema },
        { "is_agent_tool", tool.isAgentTool },
    };
}

auto toolFromJson(const nlohmann::json& value) -> Result<Tool>
{
    auto name = json::getString(value, "name");
    if (!name)
        return std::unexpected(name.error());

    auto tool = Tool {
        .name = std::move(*name),
        .description = json::getStringOr(value, "description", ""),
        .parametersSchema = nlohmann::json::object(),
        .isAgentTool = json::getBoolOr(value, "is_agent_tool", false),
        .callback = {},
    };
    if (value.contains("parameters") && value["parameters"].is_object())
        tool.parametersSchema = value["parameters"];
    return tool;
}

} // namespace agentmesh
