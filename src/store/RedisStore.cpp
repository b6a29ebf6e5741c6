// SPDX-License-Identifier: Apache-2.0
#include "RedisStore.hpp"

#include <core/Log.hpp>

#include <sw/redis++/redis++.h>

#include <algorithm>
#include <format>
#include <iterator>
#include <type_traits>

namespace agentmesh
{

namespace
{

    auto toOptional(const sw::redis::OptionalString& value) -> std::optional<std::string>
    {
        if (value)
            return std::optional<std::string> { *value };
        return std::nullopt;
    }

    /// @brief Runs a Redis call, converting library exceptions into a StoreError.
    template <typename Fn>
    auto guarded(std::string_view operation, Fn&& fn) -> Result<std::invoke_result_t<Fn&>>
    {
        try
        {
            if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>)
            {
                fn();
                return {};
            }
            else
            {
                return fn();
            }
        }
        catch (const sw::redis::Error& e)
        {
            return makeError(ErrorCode::StoreError, std::format("Redis {} failed: {}", operation, e.what()));
        }
    }

} // namespace

struct RedisStore::Impl
{
    sw::redis::Redis redis;
    int maxCommitRetries = 0;

    Impl(const sw::redis::ConnectionOptions& connection,
         const sw::redis::ConnectionPoolOptions& pool,
         int maxRetries):
        redis(connection, pool), maxCommitRetries(maxRetries)
    {
    }

    /// @brief Runs one optimistic WATCH/MULTI/EXEC cycle, retrying on conflicting writes.
    ///
    /// The body reads through the watching connection and queues its writes on the
    /// transaction. It returns false when there is nothing to write, in which case the
    /// watch is released without a commit.
    template <typename Body>
    auto optimistic(const std::vector<std::string>& watched, std::string_view operation, Body&& body)
        -> VoidResult
    {
        auto outcome = guarded(operation, [&]() -> VoidResult {
            auto tx = redis.transaction(true, false);
            auto r = tx.redis();

            for (auto attempt = 1;; ++attempt)
            {
                try
                {
                    r.watch(watched.begin(), watched.end());

                    auto const shouldCommit = body(r, tx);
                    if (!shouldCommit)
                    {
                        r.unwatch();
                        return std::unexpected(shouldCommit.error());
                    }
                    if (!*shouldCommit)
                    {
                        r.unwatch();
                        return {};
                    }

                    tx.exec();
                    return {};
                }
                catch (const sw::redis::WatchError&)
                {
                    log::debug("{}: commit conflicted on attempt {}, retrying", operation, attempt);
                    if (maxCommitRetries > 0 && attempt >= maxCommitRetries)
                        return makeError(ErrorCode::ConflictError,
                                         std::format("{}: gave up after {} conflicting commits", operation, attempt));
                }
            }
        });

        if (!outcome)
            return std::unexpected(outcome.error());
        return *outcome;
    }
};

RedisStore::RedisStore(std::unique_ptr<Impl> impl): _impl(std::move(impl))
{
}

RedisStore::~RedisStore() = default;

auto RedisStore::connect(const StoreConfig& config) -> Result<std::unique_ptr<RedisStore>>
{
    auto connection = sw::redis::ConnectionOptions {};
    connection.host = config.redisHost;
    connection.port = config.redisPort;
    if (!config.redisUsername.empty())
        connection.user = config.redisUsername;
    if (!config.redisPassword.empty())
        connection.password = config.redisPassword;

    if (config.redisSsl)
    {
#ifdef AGENTMESH_REDIS_TLS
        connection.tls.enabled = true;
        connection.tls.cert = config.redisSslCertfile;
        connection.tls.key = config.redisSslKeyfile;
        connection.tls.cacert = config.redisSslCaCerts;
#else
        return makeError(ErrorCode::ConfigError,
                         "redis_ssl requested, but agentmesh was built without AGENTMESH_REDIS_TLS");
#endif
    }

    auto pool = sw::redis::ConnectionPoolOptions {};
    pool.size = static_cast<std::size_t>(config.redisPoolSize);

    auto impl = guarded("connect", [&] {
        auto created = std::make_unique<Impl>(connection, pool, config.maxCommitRetries);
        created->redis.ping();
        return created;
    });
    if (!impl)
        return std::unexpected(impl.error());

    log::info("Connected to Redis at {}:{}", config.redisHost, config.redisPort);
    return std::unique_ptr<RedisStore>(new RedisStore(std::move(*impl)));
}

auto RedisStore::get(std::string_view key) -> Result<std::optional<std::string>>
{
    return guarded("GET", [&] { return toOptional(_impl->redis.get(key)); });
}

auto RedisStore::set(std::string_view key, std::string_view value) -> VoidResult
{
    return guarded("SET", [&] { _impl->redis.set(key, value); });
}

auto RedisStore::exists(std::string_view key) -> Result<bool>
{
    return guarded("EXISTS", [&] { return _impl->redis.exists(key) > 0; });
}

auto RedisStore::remove(std::string_view key) -> VoidResult
{
    return guarded("DEL", [&] { _impl->redis.del(key); });
}

auto RedisStore::listAppend(std::string_view key, std::string_view value) -> VoidResult
{
    return guarded("RPUSH", [&] { _impl->redis.rpush(key, value); });
}

auto RedisStore::listRemove(std::string_view key, std::string_view value) -> VoidResult
{
    return guarded("LREM", [&] { _impl->redis.lrem(key, 1, value); });
}

auto RedisStore::listRange(std::string_view key) -> Result<std::vector<std::string>>
{
    return guarded("LRANGE", [&] {
        auto items = std::vector<std::string> {};
        _impl->redis.lrange(key, 0, -1, std::back_inserter(items));
        return items;
    });
}

auto RedisStore::listAppendUnique(std::string_view key, std::string_view value) -> Result<bool>
{
    auto appended = false;
    auto const watched = std::vector<std::string> { std::string(key) };

    auto result = _impl->optimistic(
        watched, "listAppendUnique", [&](sw::redis::Redis& r, sw::redis::Transaction& tx) -> Result<bool> {
            auto items = std::vector<std::string> {};
            r.lrange(key, 0, -1, std::back_inserter(items));
            appended = std::ranges::find(items, value) == items.end();
            if (appended)
                tx.rpush(key, value);
            return appended;
        });

    if (!result)
        return std::unexpected(result.error());
    return appended;
}

auto RedisStore::mapGet(std::string_view key, std::string_view field) -> Result<std::optional<std::string>>
{
    return guarded("HGET", [&] { return toOptional(_impl->redis.hget(key, field)); });
}

auto RedisStore::mapSet(std::string_view key, std::string_view field, std::string_view value) -> VoidResult
{
    return guarded("HSET", [&] { _impl->redis.hset(key, field, value); });
}

auto RedisStore::mapDelete(std::string_view key, std::string_view field) -> VoidResult
{
    return guarded("HDEL", [&] { _impl->redis.hdel(key, field); });
}

auto RedisStore::mapExists(std::string_view key, std::string_view field) -> Result<bool>
{
    return guarded("HEXISTS", [&] { return _impl->redis.hexists(key, field); });
}

auto RedisStore::mapGetAll(std::string_view key) -> Result<std::map<std::string, std::string>>
{
    return guarded("HGETALL", [&] {
        auto entries = std::map<std::string, std::string> {};
        _impl->redis.hgetall(key, std::inserter(entries, entries.end()));
        return entries;
    });
}

auto RedisStore::transact(std::span<const FieldRef> fields, const FieldUpdater& updater) -> VoidResult
{
    if (fields.empty())
        return {};

    auto watched = std::vector<std::string> {};
    for (const auto& ref: fields)
    {
        if (std::ranges::find(watched, ref.key) == watched.end())
            watched.push_back(ref.key);
    }

    return _impl->optimistic(
        watched, std::format("transact({})", fields.front().key),
        [&](sw::redis::Redis& r, sw::redis::Transaction& tx) -> Result<bool> {
            auto current = FieldValues {};
            current.reserve(fields.size());
            for (const auto& ref: fields)
                current.push_back(toOptional(r.hget(ref.key, ref.field)));

            auto next = updater(current);
            if (!next)
                return false;
            if (next->size() != fields.size())
                return makeError(ErrorCode::InvalidArgument,
                                 "Transaction updater returned the wrong number of values");

            for (auto i = size_t { 0 }; i < fields.size(); ++i)
            {
                auto const& value = (*next)[i];
                if (value)
                    tx.hset(fields[i].key, fields[i].field, *value);
                else
                    tx.hdel(fields[i].key, fields[i].field);
            }
            return true;
        });
}

} // namespace agentmesh
