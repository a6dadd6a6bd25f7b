/*
Module Name:
- room_resolver.hpp

Abstract:
- Immutable project -> rooms/secret routing table for inbound webhook events.
- resolve() is total: unknown projects fall back to the default room and the global secret.
- Project keys match exactly (case sensitive) and are looked up through string_view
  without building a temporary std::string.
- Results borrow from the resolver and stay valid as long as it lives.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Core
#include <rb/utils/transparent_string_hash.hpp>

namespace relay_bot {

// Per-project routing entry as supplied by configuration.
struct RoomConfiguration {
    std::vector<std::string> rooms;        // full-detail notification targets
    std::vector<std::string> simple_rooms; // reduced-detail notification targets
    std::optional<std::string> secret;     // overrides the global secret
};

// Read view returned by RoomResolver::resolve(). Never owns its data.
struct RoomConfigurationRef {
    std::span<const std::string> rooms;
    std::span<const std::string> simple_rooms;
    std::string_view secret; // never empty
};

using ProjectMap = std::unordered_map<std::string,
                                      RoomConfiguration,
                                      rb::TransparentBasicStringHash<char>,
                                      rb::TransparentBasicStringEq<char>>;

// Routes project names to destination rooms and the secret that validates their events.
// Built once at startup; every member function is const and safe to call concurrently.
class RoomResolver
{
public:
    // Pre: !global_secret.empty(), and no project overrides the secret with an empty one.
    RoomResolver(std::optional<std::string> default_room,
                 ProjectMap projects,
                 std::string global_secret);

    // Resolution precedence:
    //   1. exact match on project_name -> its rooms, simple rooms and secret (override or global)
    //   2. otherwise                  -> [default room] or [], no simple rooms, global secret
    [[nodiscard]] RoomConfigurationRef resolve(std::string_view project_name) const noexcept;

    // Every room the bot may post into: all project rooms and simple rooms plus the default room.
    // Views point into the resolver. Iteration order is unspecified.
    [[nodiscard]] std::unordered_set<std::string_view> all_rooms() const;

    [[nodiscard]] const std::optional<std::string>& default_room() const noexcept
    {
        return default_room_;
    }

    [[nodiscard]] const std::string& global_secret() const noexcept
    {
        return global_secret_;
    }

    [[nodiscard]] std::size_t project_count() const noexcept
    {
        return projects_.size();
    }

private:
    [[nodiscard]] std::span<const std::string> default_rooms() const noexcept;

    std::optional<std::string> default_room_;
    ProjectMap projects_;
    std::string global_secret_;
};

} // namespace relay_bot
