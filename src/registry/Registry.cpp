// SPDX-License-Identifier: Apache-2.0
#include "Registry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace agentmesh
{

namespace
{

    auto decodeDescription(std::string_view name, std::string_view raw) -> Result<std::string>
    {
        auto value = json::parse(raw, ErrorCode::StoreError);
        if (!value)
            return std::unexpected(value.error());
        if (!value->is_string())
            return makeError(ErrorCode::StoreError, std::format("Description of agent {} is not a string", name));
        return value->get<std::string>();
    }

} // namespace

Registry::Registry(std::shared_ptr<SharedStore> store, std::string keyPrefix):
    _store(std::move(store)),
    _keyPrefix(std::move(keyPrefix)),
    _agentsKey(std::format("{}:agents", _keyPrefix)),
    _contextsKey(std::format("{}:contexts", _keyPrefix)),
    _toolsKey(std::format("{}:tools", _keyPrefix))
{
}

auto Registry::registerAgent(std::string_view name, std::string_view description) -> VoidResult
{
    auto conflict = false;
    auto const encoded = nlohmann::json(std::string(description)).dump();

    auto result = _store->mapUpdate(
        _agentsKey, name, [&](const std::optional<std::string>& current) -> std::optional<std::optional<std::string>> {
            conflict = current.has_value();
            if (conflict)
                return std::nullopt;
            return std::optional<std::optional<std::string>> { std::in_place, encoded };
        });

    if (!result)
        return result;
    if (conflict)
        return makeError(ErrorCode::NamingConflict, std::format("Agent {} is already registered", name));

    log::info("Registered agent {}", name);
    return {};
}

auto Registry::unregisterAgent(std::string_view name) -> VoidResult
{
    auto result = _store->mapDelete(_agentsKey, name);
    if (result)
        log::info("Unregistered agent {}", name);
    return result;
}

auto Registry::agentDescription(std::string_view name) const -> Result<std::optional<std::string>>
{
    auto raw = _store->mapGet(_agentsKey, name);
    if (!raw)
        return std::unexpected(raw.error());
    if (!*raw)
        return std::optional<std::string> {};
    return decodeDescription(name, **raw).transform([](std::string description) {
        return std::optional<std::string> { std::move(description) };
    });
}

auto Registry::agents() const -> Result<std::map<std::string, std::string>>
{
    auto entries = _store->mapGetAll(_agentsKey);
    if (!entries)
        return std::unexpected(entries.error());

    auto result = std::map<std::string, std::string> {};
    for (const auto& [name, raw]: *entries)
    {
        auto description = decodeDescription(name, raw);
        if (!description)
            return std::unexpected(description.error());
        result.emplace(name, std::move(*description));
    }
    return result;
}

auto Registry::agentNamesAndDescriptions() const -> Result<std::vector<std::string>>
{
    return agents().transform([](const std::map<std::string, std::string>& all) {
        auto lines = std::vector<std::string> {};
        lines.reserve(all.size());
        for (const auto& [name, description]: all)
            lines.push_back(std::format("{}: {}", name, description));
        return lines;
    });
}

auto Registry::getOrCreateContext(std::string_view name) -> Result<std::shared_ptr<Context>>
{
    if (name.empty())
        return makeError(ErrorCode::InvalidArgument, "Context name must not be empty");

    auto const header = nlohmann::json { { "name", std::string(name) } }.dump();
    auto created = false;
    auto registered = _store->mapUpdate(
        _contextsKey, name, [&](const std::optional<std::string>& current) -> std::optional<std::optional<std::string>> {
            created = !current.has_value();
            if (!created)
                return std::nullopt;
            return std::optional<std::optional<std::string>> { std::in_place, header };
        });
    if (!registered)
        return std::unexpected(registered.error());
    if (created)
        log::debug("Created context {}", name);

    auto lock = std::lock_guard(_mutex);
    if (auto it = _contexts.find(name); it != _contexts.end())
        return it->second;

    auto context = std::make_shared<Context>(std::string(name), _store, _keyPrefix);
    _contexts.emplace(std::string(name), context);
    return context;
}

auto Registry::doesContextExist(std::string_view name) const -> Result<bool>
{
    return _store->mapExists(_contextsKey, name);
}

auto Registry::contextNames() const -> Result<std::vector<std::string>>
{
    return _store->mapGetAll(_contextsKey).transform([](const std::map<std::string, std::string>& entries) {
        auto names = std::vector<std::string> {};
        names.reserve(entries.size());
        for (const auto& [name, _]: entries)
            names.push_back(name);
        return names;
    });
}

auto Registry::removeContext(std::string_view name) -> VoidResult
{
    auto handle = std::shared_ptr<Context> {};
    {
        auto lock = std::lock_guard(_mutex);
        if (auto it = _contexts.find(name); it != _contexts.end())
        {
            handle = it->second;
            _contexts.erase(it);
        }
    }
    if (!handle)
        handle = std::make_shared<Context>(std::string(name), _store, _keyPrefix);

    if (auto cleared = handle->clear(); !cleared)
        return cleared;
    if (auto removed = _store->mapDelete(_contextsKey, name); !removed)
        return removed;

    log::info("Removed context {}", name);
    return {};
}

auto Registry::registerTool(Tool tool) -> VoidResult
{
    if (tool.name.empty())
        return makeError(ErrorCode::InvalidArgument, "Tool name must not be empty");

    if (auto stored = _store->mapSet(_toolsKey, tool.name, toolToJson(tool).dump()); !stored)
        return stored;

    auto lock = std::lock_guard(_mutex);
    if (tool.callback)
        _callbacks.insert_or_assign(tool.name, std::move(tool.callback));
    else if (auto it = _callbacks.find(tool.name); it != _callbacks.end())
        _callbacks.erase(it);

    log::debug("Registered tool {}", tool.name);
    return {};
}

auto Registry::attachCallback(Tool tool) const -> Tool
{
    auto lock = std::lock_guard(_mutex);
    if (auto it = _callbacks.find(tool.name); it != _callbacks.end())
        tool.callback = it->second;
    return tool;
}

auto Registry::tool(std::string_view name) const -> Result<std::optional<Tool>>
{
    auto raw = _store->mapGet(_toolsKey, name);
    if (!raw)
        return std::unexpected(raw.error());
    if (!*raw)
        return std::optional<Tool> {};

    return json::parse(**raw, ErrorCode::StoreError).and_then(toolFromJson).transform([this](Tool found) {
        return std::optional<Tool> { attachCallback(std::move(found)) };
    });
}

auto Registry::tools() const -> Result<std::vector<Tool>>
{
    auto entries = _store->mapGetAll(_toolsKey);
    if (!entries)
        return std::unexpected(entries.error());

    auto result = std::vector<Tool> {};
    result.reserve(entries->size());
    for (const auto& [name, raw]: *entries)
    {
        auto found = json::parse(raw, ErrorCode::StoreError).and_then(toolFromJson);
        if (!found)
            return std::unexpected(found.error());
        result.push_back(attachCallback(std::move(*found)));
    }
    return result;
}

auto Registry::toolDefinitions() const -> Result<std::vector<ToolDefinition>>
{
    return tools().transform([](const std::vector<Tool>& all) {
        auto definitions = std::vector<ToolDefinition> {};
        definitions.reserve(all.size());
        for (const auto& entry: all)
            definitions.push_back(entry.toDefinition());
        return definitions;
    });
}

void Registry::shutdown()
{
    auto lock = std::lock_guard(_mutex);
    _contexts.clear();
    _callbacks.clear();
    log::debug("Registry shut down");
}

} // namespace agentmesh
