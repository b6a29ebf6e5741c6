// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <store/SharedStore.hpp>

#include <map>
#include <string>
#include <vector>

namespace agentmesh
{

/// @brief SharedStore held in process memory.
///
/// Performs no locking: all access must come from one logical thread of control per
/// mutation (for instance the in-process broker's dispatch thread).
class LocalStore: public SharedStore
{
  public:
    [[nodiscard]] auto get(std::string_view key) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto set(std::string_view key, std::string_view value) -> VoidResult override;
    [[nodiscard]] auto exists(std::string_view key) -> Result<bool> override;
    [[nodiscard]] auto remove(std::string_view key) -> VoidResult override;

    [[nodiscard]] auto listAppend(std::string_view key, std::string_view value) -> VoidResult override;
    [[nodiscard]] auto listRemove(std::string_view key, std::string_view value) -> VoidResult override;
    [[nodiscard]] auto listRange(std::string_view key) -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto listAppendUnique(std::string_view key, std::string_view value) -> Result<bool> override;

    [[nodiscard]] auto mapGet(std::string_view key, std::string_view field)
        -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto mapSet(std::string_view key, std::string_view field, std::string_view value)
        -> VoidResult override;
    [[nodiscard]] auto mapDelete(std::string_view key, std::string_view field) -> VoidResult override;
    [[nodiscard]] auto mapExists(std::string_view key, std::string_view field) -> Result<bool> override;
    [[nodiscard]] auto mapGetAll(std::string_view key) -> Result<std::map<std::string, std::string>> override;

    [[nodiscard]] auto transact(std::span<const FieldRef> fields, const FieldUpdater& updater)
        -> VoidResult override;

  private:
    std::map<std::string, std::string, std::less<>> _values;
    std::map<std::string, std::vector<std::string>, std::less<>> _lists;
    std::map<std::string, std::map<std::string, std::string, std::less<>>, std::less<>> _maps;

    [[nodiscard]] auto checkKind(std::string_view key, std::string_view kind) const -> VoidResult;
};

} // namespace agentmesh
