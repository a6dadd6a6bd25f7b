#include <catch2/catch_test_macros.hpp>

#include "rb/relay/room_resolver.hpp"

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace relay_bot;

namespace {

std::vector<std::string> to_vector(std::span<const std::string> rooms) {
    return {rooms.begin(), rooms.end()};
}

std::vector<std::string_view> sorted_rooms(const RoomResolver& resolver) {
    auto set = resolver.all_rooms();
    std::vector<std::string_view> out{set.begin(), set.end()};
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

TEST_CASE("RoomResolver: configured project", "[relay][rooms]") {
    ProjectMap projects;
    projects.emplace("Proj", RoomConfiguration{.rooms = {"a", "b"}, .simple_rooms = {}, .secret = "s1"});
    RoomResolver resolver{"lobby", std::move(projects), "g"};

    SECTION("exact match returns project rooms and override secret") {
        auto ref = resolver.resolve("Proj");
        CHECK(to_vector(ref.rooms) == std::vector<std::string>{"a", "b"});
        CHECK(ref.simple_rooms.empty());
        CHECK(ref.secret == "s1");
    }

    SECTION("unknown project falls back to default room and global secret") {
        auto ref = resolver.resolve("Other");
        CHECK(to_vector(ref.rooms) == std::vector<std::string>{"lobby"});
        CHECK(ref.simple_rooms.empty());
        CHECK(ref.secret == "g");
    }

    SECTION("project names are case sensitive") {
        auto ref = resolver.resolve("proj");
        CHECK(to_vector(ref.rooms) == std::vector<std::string>{"lobby"});
        CHECK(ref.secret == "g");
    }

    SECTION("all rooms include the default room") {
        CHECK(sorted_rooms(resolver) == std::vector<std::string_view>{"a", "b", "lobby"});
    }
}

TEST_CASE("RoomResolver: no default room", "[relay][rooms]") {
    ProjectMap projects;
    projects.emplace("Proj", RoomConfiguration{.rooms = {"a"}, .simple_rooms = {"b"}, .secret = std::nullopt});
    RoomResolver resolver{std::nullopt, std::move(projects), "global"};

    SECTION("unknown project notifies nobody") {
        auto ref = resolver.resolve("Other");
        CHECK(ref.rooms.empty());
        CHECK(ref.simple_rooms.empty());
        CHECK(ref.secret == "global");
    }

    SECTION("project without override uses the global secret") {
        auto ref = resolver.resolve("Proj");
        CHECK(to_vector(ref.rooms) == std::vector<std::string>{"a"});
        CHECK(to_vector(ref.simple_rooms) == std::vector<std::string>{"b"});
        CHECK(ref.secret == "global");
    }

    SECTION("empty project name is just another unknown project") {
        auto ref = resolver.resolve("");
        CHECK(ref.rooms.empty());
        CHECK(ref.secret == "global");
    }
}

TEST_CASE("RoomResolver: silenced project keeps its secret", "[relay][rooms]") {
    ProjectMap projects;
    projects.emplace("Quiet", RoomConfiguration{.rooms = {}, .simple_rooms = {}, .secret = "s2"});
    RoomResolver resolver{"lobby", std::move(projects), "g"};

    auto ref = resolver.resolve("Quiet");
    CHECK(ref.rooms.empty());
    CHECK(ref.simple_rooms.empty());
    CHECK(ref.secret == "s2");
}

TEST_CASE("RoomResolver: all_rooms", "[relay][rooms]") {
    SECTION("default room only") {
        RoomResolver resolver{"room", {}, "g"};
        CHECK(sorted_rooms(resolver) == std::vector<std::string_view>{"room"});
    }

    SECTION("deduplicates overlapping projects and simple rooms") {
        ProjectMap projects;
        projects.emplace("Project", RoomConfiguration{.rooms = {"a", "b"}, .simple_rooms = {}, .secret = std::nullopt});
        projects.emplace("AnotherProject",
                         RoomConfiguration{.rooms = {"b", "c"}, .simple_rooms = {}, .secret = std::nullopt});
        projects.emplace("StupidProject",
                         RoomConfiguration{.rooms = {}, .simple_rooms = {"d", "a"}, .secret = std::nullopt});
        RoomResolver resolver{std::nullopt, std::move(projects), "g"};

        CHECK(sorted_rooms(resolver) == std::vector<std::string_view>{"a", "b", "c", "d"});
    }

    SECTION("default room already listed by a project appears once") {
        ProjectMap projects;
        projects.emplace("Proj", RoomConfiguration{.rooms = {"lobby"}, .simple_rooms = {}, .secret = std::nullopt});
        RoomResolver resolver{"lobby", std::move(projects), "g"};

        CHECK(sorted_rooms(resolver) == std::vector<std::string_view>{"lobby"});
    }

    SECTION("nothing configured yields an empty set") {
        RoomResolver resolver{std::nullopt, {}, "g"};
        CHECK(resolver.all_rooms().empty());
    }
}

TEST_CASE("RoomResolver: accessors", "[relay][rooms]") {
    ProjectMap projects;
    projects.emplace("A", RoomConfiguration{});
    projects.emplace("B", RoomConfiguration{});
    RoomResolver resolver{"lobby", std::move(projects), "g"};

    CHECK(resolver.project_count() == 2);
    REQUIRE(resolver.default_room().has_value());
    CHECK(*resolver.default_room() == "lobby");
    CHECK(resolver.global_secret() == "g");
}
