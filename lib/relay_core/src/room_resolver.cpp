/*
Module Name:
- room_resolver.cpp

Abstract:
- Two-tier project resolution and the startup room union.
*/

// C++ Standard Library
#include <utility>

// GSL
#include <gsl/gsl>

// Core
#include <rb/relay/room_resolver.hpp>

namespace relay_bot {

RoomResolver::RoomResolver(std::optional<std::string> default_room,
                           ProjectMap projects,
                           std::string global_secret)
    : default_room_{std::move(default_room)}
    , projects_{std::move(projects)}
    , global_secret_{std::move(global_secret)}
{
    Expects(!global_secret_.empty());
    for (const auto& entry : projects_)
        Expects(!entry.second.secret || !entry.second.secret->empty());
}

std::span<const std::string> RoomResolver::default_rooms() const noexcept
{
    if (default_room_)
        return {&*default_room_, 1};
    return {};
}

RoomConfigurationRef RoomResolver::resolve(std::string_view project_name) const noexcept
{
    // 1. Exact project match. A project with no rooms still keeps its secret override.
    if (auto itr = projects_.find(project_name); itr != projects_.end()) {
        const RoomConfiguration& cfg = itr->second;
        return RoomConfigurationRef{
            .rooms = cfg.rooms,
            .simple_rooms = cfg.simple_rooms,
            .secret = cfg.secret ? std::string_view{*cfg.secret} : std::string_view{global_secret_},
        };
    }

    // 2. Global default.
    return RoomConfigurationRef{
        .rooms = default_rooms(),
        .simple_rooms = {},
        .secret = global_secret_,
    };
}

std::unordered_set<std::string_view> RoomResolver::all_rooms() const
{
    std::unordered_set<std::string_view> out;
    for (const auto& [name, cfg] : projects_) {
        for (const auto& room : cfg.rooms)
            out.emplace(room);
        for (const auto& room : cfg.simple_rooms)
            out.emplace(room);
    }
    if (default_room_)
        out.insert(*default_room_);
    return out;
}

} // namespace relay_bot
