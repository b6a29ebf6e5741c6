// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace agentmesh
{

/// @brief Executes a tool with its named parameters and returns the textual result.
using ToolCallback = std::function<Result<std::string>(const nlohmann::json& parameters)>;

/// @brief A tool that agents can offer to an LLM.
///
/// Only the descriptor fields are persisted in the shared store. The callback lives in the
/// process that registered the tool.
struct Tool
{
    std::string name;
    std::string description;
    nlohmann::json parametersSchema = nlohmann::json::object();

    /// @brief True if invoking the tool delegates to another agent.
    bool isAgentTool = false;

    ToolCallback callback;

    /// @brief Invokes the tool.
    ///
    /// Without a callback the parameters are echoed back in their serialized form.
    /// @param parameters The named parameters as a JSON object.
    /// @return The tool output or the callback's error.
    [[nodiscard]] auto invoke(const nlohmann::json& parameters) const -> Result<std::string>;

    /// @brief Returns the OpenAI function-calling descriptor of this tool.
    [[nodiscard]] auto toOpenAiFormat() const -> nlohmann::json;

    [[nodiscard]] auto toDefinition() const -> ToolDefinition;
};

/// @brief Serializes the descriptor fields of a tool; the callback is not included.
[[nodiscard]] auto toolToJson(const Tool& tool) -> nlohmann::json;

/// @brief Restores a tool descriptor. The result has no callback.
[[nodiscard]] auto toolFromJson(const nlohmann::json& value) -> Result<Tool>;

} // namespace agentmesh
