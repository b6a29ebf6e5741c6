// SPDX-License-Identifier: Apache-2.0
#include "Message.hpp"

#include <cstdint>
#include <format>
#include <random>

namespace agentmesh
{

auto generateChatId() -> std::string
{
    thread_local auto engine = std::mt19937_64 { std::random_device {}() };
    auto distribution = std::uniform_int_distribution<std::uint64_t> {};
    return std::format("{:016x}{:016x}", distribution(engine), distribution(engine));
}

} // namespace agentmesh
