/*
Module Name:
- config.hpp

Abstract:
- Immutable configuration for the relay bot, loaded from PSDEVBOT_* environment variables
  or from a single TOML file.
- Owns the project room resolver and the username alias table built from that configuration.
- Fails fast with EnvError on invalid or missing configuration; there is no partial startup.
- Project and alias blobs are JSON with a strict schema (unknown fields are rejected).
*/
#pragma once

// C++ Standard Library
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Core
#include <rb/relay/room_resolver.hpp>
#include <rb/relay/username_aliases.hpp>
#include <rb/utils/url.hpp>

namespace env
{

    /// Configuration-loading failure. Prefer specific errors over generic runtime_error.
    class EnvError final : public std::runtime_error
    {
    public:
        explicit EnvError(const std::string& msg) noexcept;
    };

    /// Environment variable names.
    namespace vars
    {
        inline constexpr std::string_view kServer = "PSDEVBOT_SERVER";
        inline constexpr std::string_view kUser = "PSDEVBOT_USER";
        inline constexpr std::string_view kPassword = "PSDEVBOT_PASSWORD";
        inline constexpr std::string_view kSecret = "PSDEVBOT_SECRET";
        inline constexpr std::string_view kPort = "PSDEVBOT_PORT";
        inline constexpr std::string_view kRoom = "PSDEVBOT_ROOM";
        inline constexpr std::string_view kProjectConfiguration = "PSDEVBOT_PROJECT_CONFIGURATION";
        inline constexpr std::string_view kUsernameAliases = "PSDEVBOT_USERNAME_ALIASES";
        inline constexpr std::string_view kGithubApiUser = "PSDEVBOT_GITHUB_API_USER";
        inline constexpr std::string_view kGithubApiPassword = "PSDEVBOT_GITHUB_API_PASSWORD";
    } // namespace vars

    /// Webhook listener port when none is configured.
    inline constexpr std::uint16_t kDefaultPort = 3030;

    /// Chat server endpoint and bot identity.
    struct ServerConfig
    {
        rb::Url url; ///< ws:// or wss:// endpoint
        std::string user;
        std::string password;
    };

    /// GitHub API credentials, present only when both halves were configured.
    struct GithubCredentials
    {
        std::string user;
        std::string password;
    };

    /// Returns the value of an environment variable, or nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

    /// Immutable application configuration.
    class Config
    {
    public:
        /// Load from the process environment.
        static Config load();

        /// Load through lookup instead of the process environment.
        static Config from_environment(const EnvLookup& lookup);

        /// Load from the TOML file at path.
        /// Pre: !path.empty()
        static Config load_file(const std::filesystem::path& path);

        [[nodiscard]] const ServerConfig& server() const noexcept
        {
            return server_;
        }
        [[nodiscard]] std::uint16_t port() const noexcept
        {
            return port_;
        }
        [[nodiscard]] const std::optional<GithubCredentials>& github() const noexcept
        {
            return github_;
        }
        [[nodiscard]] const relay_bot::RoomResolver& rooms() const noexcept
        {
            return rooms_;
        }
        [[nodiscard]] const relay_bot::UsernameAliasTable& username_aliases() const noexcept
        {
            return username_aliases_;
        }

    private:
        static Config parse_config(const std::filesystem::path& path);

        // Store is immutable after construction so it can be shared across handlers without locks.
        Config(ServerConfig server,
               std::uint16_t port,
               std::optional<GithubCredentials> github,
               relay_bot::RoomResolver rooms,
               relay_bot::UsernameAliasTable username_aliases) noexcept
            :
            server_{ std::move(server) }, port_{ port }, github_{ std::move(github) },
            rooms_{ std::move(rooms) }, username_aliases_{ std::move(username_aliases) }
        {
        }

        ServerConfig server_;
        std::uint16_t port_;
        std::optional<GithubCredentials> github_;
        relay_bot::RoomResolver rooms_;
        relay_bot::UsernameAliasTable username_aliases_;
    };

    /// Parse the project room blob: { "<project>": { "rooms": [..], "simple_rooms": [..], "secret": ".." } }.
    /// Throws EnvError on malformed JSON, unknown fields, empty room names or empty secrets.
    relay_bot::ProjectMap parse_project_configuration(const std::string& json);

    /// Parse the alias blob: { "<username>": "<display name>" }. Throws EnvError on malformed input.
    relay_bot::UsernameAliasTable parse_username_aliases(const std::string& json);

    /// Parse a webhook listener port (1..65535). Throws EnvError otherwise.
    std::uint16_t parse_port(std::string_view text);

} // namespace env
