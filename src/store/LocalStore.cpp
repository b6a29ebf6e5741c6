// SPDX-License-Identifier: Apache-2.0
#include "LocalStore.hpp"

#include <algorithm>
#include <format>

namespace agentmesh
{

auto LocalStore::checkKind(std::string_view key, std::string_view kind) const -> VoidResult
{
    auto const heldAs = [&]() -> std::string_view {
        if (_values.contains(key))
            return "value";
        if (_lists.contains(key))
            return "list";
        if (_maps.contains(key))
            return "map";
        return kind;
    }();

    if (heldAs != kind)
        return makeError(ErrorCode::StoreError,
                         std::format("Key '{}' holds a {}, not a {}", key, heldAs, kind));
    return {};
}

auto LocalStore::get(std::string_view key) -> Result<std::optional<std::string>>
{
    if (auto kind = checkKind(key, "value"); !kind)
        return std::unexpected(kind.error());

    auto const it = _values.find(key);
    if (it == _values.end())
        return std::optional<std::string> {};
    return std::optional<std::string> { it->second };
}

auto LocalStore::set(std::string_view key, std::string_view value) -> VoidResult
{
    return checkKind(key, "value").transform([&] { _values.insert_or_assign(std::string(key), std::string(value)); });
}

auto LocalStore::exists(std::string_view key) -> Result<bool>
{
    return _values.contains(key) || _lists.contains(key) || _maps.contains(key);
}

auto LocalStore::remove(std::string_view key) -> VoidResult
{
    if (auto it = _values.find(key); it != _values.end())
        _values.erase(it);
    if (auto it = _lists.find(key); it != _lists.end())
        _lists.erase(it);
    if (auto it = _maps.find(key); it != _maps.end())
        _maps.erase(it);
    return {};
}

auto LocalStore::listAppend(std::string_view key, std::string_view value) -> VoidResult
{
    if (auto kind = checkKind(key, "list"); !kind)
        return kind;

    auto it = _lists.find(key);
    if (it == _lists.end())
        it = _lists.emplace(std::string(key), std::vector<std::string> {}).first;
    it->second.emplace_back(value);
    return {};
}

auto LocalStore::listRemove(std::string_view key, std::string_view value) -> VoidResult
{
    if (auto kind = checkKind(key, "list"); !kind)
        return kind;

    auto const it = _lists.find(key);
    if (it == _lists.end())
        return {};

    auto& items = it->second;
    if (auto pos = std::ranges::find(items, value); pos != items.end())
        items.erase(pos);
    if (items.empty())
        _lists.erase(it);
    return {};
}

auto LocalStore::listRange(std::string_view key) -> Result<std::vector<std::string>>
{
    if (auto kind = checkKind(key, "list"); !kind)
        return std::unexpected(kind.error());

    auto const it = _lists.find(key);
    if (it == _lists.end())
        return std::vector<std::string> {};
    return it->second;
}

auto LocalStore::listAppendUnique(std::string_view key, std::string_view value) -> Result<bool>
{
    if (auto kind = checkKind(key, "list"); !kind)
        return std::unexpected(kind.error());

    auto const it = _lists.find(key);
    if (it != _lists.end() && std::ranges::find(it->second, value) != it->second.end())
        return false;

    return listAppend(key, value).transform([] { return true; });
}

auto LocalStore::mapGet(std::string_view key, std::string_view field) -> Result<std::optional<std::string>>
{
    if (auto kind = checkKind(key, "map"); !kind)
        return std::unexpected(kind.error());

    auto const it = _maps.find(key);
    if (it == _maps.end())
        return std::optional<std::string> {};

    auto const fieldIt = it->second.find(field);
    if (fieldIt == it->second.end())
        return std::optional<std::string> {};
    return std::optional<std::string> { fieldIt->second };
}

auto LocalStore::mapSet(std::string_view key, std::string_view field, std::string_view value) -> VoidResult
{
    if (auto kind = checkKind(key, "map"); !kind)
        return kind;

    auto it = _maps.find(key);
    if (it == _maps.end())
        it = _maps.emplace(std::string(key), std::map<std::string, std::string, std::less<>> {}).first;
    it->second.insert_or_assign(std::string(field), std::string(value));
    return {};
}

auto LocalStore::mapDelete(std::string_view key, std::string_view field) -> VoidResult
{
    if (auto kind = checkKind(key, "map"); !kind)
        return kind;

    auto const it = _maps.find(key);
    if (it == _maps.end())
        return {};

    if (auto fieldIt = it->second.find(field); fieldIt != it->second.end())
        it->second.erase(fieldIt);
    if (it->second.empty())
        _maps.erase(it);
    return {};
}

auto LocalStore::mapExists(std::string_view key, std::string_view field) -> Result<bool>
{
    return mapGet(key, field).transform([](const std::optional<std::string>& value) { return value.has_value(); });
}

auto LocalStore::mapGetAll(std::string_view key) -> Result<std::map<std::string, std::string>>
{
    if (auto kind = checkKind(key, "map"); !kind)
        return std::unexpected(kind.error());

    auto const it = _maps.find(key);
    if (it == _maps.end())
        return std::map<std::string, std::string> {};
    return std::map<std::string, std::string>(it->second.begin(), it->second.end());
}

auto LocalStore::transact(std::span<const FieldRef> fields, const FieldUpdater& updater) -> VoidResult
{
    auto current = FieldValues {};
    current.reserve(fields.size());
    for (const auto& ref: fields)
    {
        auto value = mapGet(ref.key, ref.field);
        if (!value)
            return std::unexpected(value.error());
        current.push_back(std::move(*value));
    }

    auto next = updater(current);
    if (!next)
        return {};

    if (next->size() != fields.size())
        return makeError(ErrorCode::InvalidArgument, "Transaction updater returned the wrong number of values");

    // Every field is checked before the first write so a failing field leaves the others untouched.
    for (const auto& ref: fields)
        if (auto kind = checkKind(ref.key, "map"); !kind)
            return kind;

    for (auto i = size_t { 0 }; i < fields.size(); ++i)
    {
        auto const& ref = fields[i];
        auto const& value = (*next)[i];
        auto written = value ? mapSet(ref.key, ref.field, *value) : mapDelete(ref.key, ref.field);
        if (!written)
            return written;
    }
    return {};
}

} // namespace agentmesh
