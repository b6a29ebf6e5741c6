// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace agentmesh
{

/// @brief Names one field of one hash-valued key.
struct FieldRef
{
    std::string key;
    std::string field;
};

/// @brief Current (or new) values of the fields in a transaction; std::nullopt means absent.
using FieldValues = std::vector<std::optional<std::string>>;

/// @brief Computes new field values from the current ones.
///
/// Returning std::nullopt commits nothing. Otherwise the returned vector holds one entry per
/// field in the same order; std::nullopt deletes the field. The updater may run more than once
/// when a concurrent writer forces a retry, so it must not have side effects beyond its captures.
using FieldUpdater = std::function<std::optional<FieldValues>(const FieldValues& current)>;

/// @brief Key/value store shared by the Registry and every Context.
///
/// Values are opaque strings; callers serialize their own data. Plain keys, list keys and
/// hash keys live in one key space.
class SharedStore
{
  public:
    virtual ~SharedStore() = default;

    [[nodiscard]] virtual auto get(std::string_view key) -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto set(std::string_view key, std::string_view value) -> VoidResult = 0;
    [[nodiscard]] virtual auto exists(std::string_view key) -> Result<bool> = 0;

    /// @brief Deletes a key of any kind. Deleting an absent key succeeds.
    [[nodiscard]] virtual auto remove(std::string_view key) -> VoidResult = 0;

    [[nodiscard]] virtual auto listAppend(std::string_view key, std::string_view value) -> VoidResult = 0;

    /// @brief Removes the first occurrence of a value from a list; absent values are ignored.
    [[nodiscard]] virtual auto listRemove(std::string_view key, std::string_view value) -> VoidResult = 0;

    [[nodiscard]] virtual auto listRange(std::string_view key) -> Result<std::vector<std::string>> = 0;

    /// @brief Appends a value unless the list already contains it.
    /// @return true if the value was appended.
    [[nodiscard]] virtual auto listAppendUnique(std::string_view key, std::string_view value) -> Result<bool> = 0;

    [[nodiscard]] virtual auto mapGet(std::string_view key, std::string_view field)
        -> Result<std::optional<std::string>> = 0;
    [[nodiscard]] virtual auto mapSet(std::string_view key, std::string_view field, std::string_view value)
        -> VoidResult = 0;
    [[nodiscard]] virtual auto mapDelete(std::string_view key, std::string_view field) -> VoidResult = 0;
    [[nodiscard]] virtual auto mapExists(std::string_view key, std::string_view field) -> Result<bool> = 0;
    [[nodiscard]] virtual auto mapGetAll(std::string_view key) -> Result<std::map<std::string, std::string>> = 0;

    /// @brief Atomically reads, recomputes and writes a set of hash fields.
    ///
    /// This is the one optimistic read-modify-write primitive of the store; every compound
    /// mutation above this layer is expressed through it.
    /// @param fields The fields to read and (possibly) write.
    /// @param updater Computes the new values from the current ones.
    /// @return Success, or an error if the store failed or the retry bound was exhausted.
    [[nodiscard]] virtual auto transact(std::span<const FieldRef> fields, const FieldUpdater& updater)
        -> VoidResult = 0;

    /// @brief Single-field convenience over transact().
    [[nodiscard]] auto mapUpdate(std::string_view key,
                                 std::string_view field,
                                 const std::function<std::optional<std::optional<std::string>>(
                                     const std::optional<std::string>& current)>& updater) -> VoidResult
    {
        auto const fields = std::vector<FieldRef> { FieldRef { std::string(key), std::string(field) } };
        return transact(fields, [&updater](const FieldValues& current) -> std::optional<FieldValues> {
            auto next = updater(current.front());
            if (!next)
                return std::nullopt;
            return FieldValues { std::move(*next) };
        });
    }
};

} // namespace agentmesh
