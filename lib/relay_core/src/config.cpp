// C++ Standard Library
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <map>
#include <utility>
#include <vector>

// Glaze
#include <glaze/json.hpp>

// TOML++
#include <toml++/toml.hpp>

// Project
#include <rb/relay/config.hpp>

namespace env
{

    namespace
    {
        // Strict schema: a typo in a project entry must not silently drop its secret.
        inline constexpr glz::opts kStrictJson{
            .null_terminated = true,
            .error_on_unknown_keys = true,
        };

        // Settings collected from either source before validation.
        struct RawSettings
        {
            std::optional<std::string> server;
            std::optional<std::string> user;
            std::optional<std::string> password;
            std::optional<std::string> secret;
            std::optional<std::string> port;
            std::optional<std::string> room;
            std::optional<relay_bot::ProjectMap> projects;
            relay_bot::UsernameAliasTable aliases;
            std::optional<std::string> github_user;
            std::optional<std::string> github_password;
        };

        // Empty values count as unset.
        std::optional<std::string> non_empty(std::optional<std::string> value)
        {
            if (value && value->empty())
                return std::nullopt;
            return value;
        }

        std::string require(std::optional<std::string> value, std::string_view name)
        {
            if (!value)
                throw EnvError("Missing required setting '" + std::string{ name } + "'");
            return std::move(*value);
        }

        void validate_project(const std::string& name, const relay_bot::RoomConfiguration& cfg)
        {
            auto check_rooms = [&](const std::vector<std::string>& rooms, std::string_view field) {
                for (const auto& room : rooms)
                {
                    if (room.empty())
                        throw EnvError("Project '" + name + "' lists an empty room in '" + std::string{ field } + "'");
                }
            };
            check_rooms(cfg.rooms, "rooms");
            check_rooms(cfg.simple_rooms, "simple_rooms");

            if (cfg.secret && cfg.secret->empty())
                throw EnvError("Project '" + name + "' has an empty secret");
        }

        // Validate collected settings and build the immutable pieces of Config.
        struct Assembled
        {
            ServerConfig server;
            std::uint16_t port;
            std::optional<GithubCredentials> github;
            relay_bot::RoomResolver rooms;
        };

        Assembled assemble(RawSettings& raw, std::string_view origin)
        {
            const auto server_str = require(non_empty(std::move(raw.server)), vars::kServer);
            auto url = rb::parse_url(server_str);
            if (!url || !url->is_websocket())
                throw EnvError("Invalid server URL '" + server_str + "' in " + std::string{ origin } +
                               " (expected ws:// or wss://)");

            ServerConfig server{
                .url = std::move(*url),
                .user = require(non_empty(std::move(raw.user)), vars::kUser),
                .password = require(non_empty(std::move(raw.password)), vars::kPassword),
            };
            auto secret = require(non_empty(std::move(raw.secret)), vars::kSecret);

            // Unset means the default; set but empty is an unparsable port.
            const std::uint16_t port = raw.port ? parse_port(*raw.port) : kDefaultPort;

            auto room = non_empty(std::move(raw.room));
            if (!room && !raw.projects)
                throw EnvError("At least one of " + std::string{ vars::kRoom } + " or " +
                               std::string{ vars::kProjectConfiguration } + " needs to be provided");

            std::optional<GithubCredentials> github;
            auto gh_user = non_empty(std::move(raw.github_user));
            auto gh_password = non_empty(std::move(raw.github_password));
            if (gh_user && gh_password)
                github = GithubCredentials{ .user = std::move(*gh_user), .password = std::move(*gh_password) };

            relay_bot::ProjectMap projects = raw.projects ? std::move(*raw.projects) : relay_bot::ProjectMap{};
            return Assembled{
                .server = std::move(server),
                .port = port,
                .github = std::move(github),
                .rooms = relay_bot::RoomResolver{ std::move(room), std::move(projects), std::move(secret) },
            };
        }

        // ---- TOML source ---------------------------------------------------------

        std::optional<std::string> toml_string(const toml::table& tbl,
                                               std::string_view key,
                                               const std::string& where)
        {
            const auto* node = tbl.get(key);
            if (!node)
                return std::nullopt;
            if (auto opt = node->value<std::string>())
                return opt;
            throw EnvError("Expected string for '" + std::string{ key } + "' in " + where);
        }

        std::vector<std::string> toml_string_array(const toml::table& tbl,
                                                   std::string_view key,
                                                   const std::string& where)
        {
            std::vector<std::string> out;
            const auto* node = tbl.get(key);
            if (!node)
                return out;

            const auto* arr = node->as_array();
            if (!arr)
                throw EnvError("Expected array of strings for '" + std::string{ key } + "' in " + where);

            out.reserve(arr->size());
            for (const auto& el : *arr)
            {
                auto value = el.value<std::string>();
                if (!value)
                    throw EnvError("Expected array of strings for '" + std::string{ key } + "' in " + where);
                out.push_back(std::move(*value));
            }
            return out;
        }

        relay_bot::ProjectMap toml_projects(const toml::table& projects, const std::string& path_str)
        {
            relay_bot::ProjectMap out;
            out.reserve(projects.size());

            for (const auto& [key, node] : projects)
            {
                std::string name{ key.str() };
                const auto where = "[projects." + name + "] of '" + path_str + "'";

                const auto* entry = node.as_table();
                if (!entry)
                    throw EnvError("Expected table for " + where);

                for (const auto& [field, value] : *entry)
                {
                    const auto f = field.str();
                    if (f != "rooms" && f != "simple_rooms" && f != "secret")
                        throw EnvError("Unknown field '" + std::string{ f } + "' in " + where);
                }

                relay_bot::RoomConfiguration cfg{
                    .rooms = toml_string_array(*entry, "rooms", where),
                    .simple_rooms = toml_string_array(*entry, "simple_rooms", where),
                    .secret = toml_string(*entry, "secret", where),
                };
                validate_project(name, cfg);
                out.emplace(std::move(name), std::move(cfg));
            }
            return out;
        }

        // toml::table keeps keys sorted; source positions restore document order so the
        // last spelling of a folded name wins, as it does for the JSON blob.
        relay_bot::UsernameAliasTable toml_aliases(const toml::table& aliases, const std::string& path_str)
        {
            struct Entry
            {
                toml::source_position at;
                std::string name;
                std::string display;
            };

            std::vector<Entry> entries;
            entries.reserve(aliases.size());
            for (const auto& [key, node] : aliases)
            {
                auto value = node.value<std::string>();
                if (!value)
                    throw EnvError("Expected string alias for '" + std::string{ key.str() } +
                                   "' in [username_aliases] of '" + path_str + "'");
                entries.push_back(Entry{ .at = node.source().begin, .name = std::string{ key.str() }, .display = std::move(*value) });
            }

            std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
                return a.at.line != b.at.line ? a.at.line < b.at.line : a.at.column < b.at.column;
            });

            relay_bot::UsernameAliasTable out;
            for (auto& entry : entries)
                out.insert(std::move(entry.name), std::move(entry.display));
            return out;
        }
    } // namespace

    EnvError::EnvError(const std::string& msg) noexcept :
        std::runtime_error{ msg }
    {
    }

    std::uint16_t parse_port(std::string_view text)
    {
        std::uint32_t value = 0;
        const auto* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), last, value);
        if (ec != std::errc{} || ptr != last || value == 0 || value > 65535)
            throw EnvError("Invalid port '" + std::string{ text } + "' (expected 1..65535)");
        return static_cast<std::uint16_t>(value);
    }

    relay_bot::ProjectMap parse_project_configuration(const std::string& json)
    {
        // Parsed through an ordered map first; the reflected RoomConfiguration keeps the schema strict.
        std::map<std::string, relay_bot::RoomConfiguration> parsed;
        if (glz::error_ctx ec = glz::read<kStrictJson>(parsed, json); ec)
        {
            throw EnvError(std::string{ vars::kProjectConfiguration } + " should be valid JSON: " +
                           glz::format_error(ec, json));
        }

        relay_bot::ProjectMap out;
        out.reserve(parsed.size());
        for (auto& [name, cfg] : parsed)
        {
            validate_project(name, cfg);
            out.emplace(name, std::move(cfg));
        }
        return out;
    }

    relay_bot::UsernameAliasTable parse_username_aliases(const std::string& json)
    {
        // Glaze reads a vector of pairs from a JSON object in document order, so a later
        // spelling of the same folded name overwrites an earlier one.
        std::vector<std::pair<std::string, std::string>> parsed;
        if (glz::error_ctx ec = glz::read<kStrictJson>(parsed, json); ec)
        {
            throw EnvError(std::string{ vars::kUsernameAliases } + " should be valid JSON: " +
                           glz::format_error(ec, json));
        }

        relay_bot::UsernameAliasTable out;
        for (auto& [name, display] : parsed)
            out.insert(std::move(name), std::move(display));
        return out;
    }

    Config Config::from_environment(const EnvLookup& lookup)
    {
        RawSettings raw{
            .server = lookup(vars::kServer),
            .user = lookup(vars::kUser),
            .password = lookup(vars::kPassword),
            .secret = lookup(vars::kSecret),
            .port = lookup(vars::kPort),
            .room = lookup(vars::kRoom),
            .projects = std::nullopt,
            .aliases = {},
            .github_user = lookup(vars::kGithubApiUser),
            .github_password = lookup(vars::kGithubApiPassword),
        };

        if (auto json = lookup(vars::kProjectConfiguration))
            raw.projects = parse_project_configuration(*json);
        if (auto json = lookup(vars::kUsernameAliases))
            raw.aliases = parse_username_aliases(*json);

        auto parts = assemble(raw, "environment");
        return Config(std::move(parts.server),
                      parts.port,
                      std::move(parts.github),
                      std::move(parts.rooms),
                      std::move(raw.aliases));
    }

    Config Config::load()
    {
        return from_environment([](std::string_view name) -> std::optional<std::string> {
            const std::string key{ name };
            if (const char* value = std::getenv(key.c_str()))
                return std::string{ value };
            return std::nullopt;
        });
    }

    // Read, validate and convert the TOML file at path.
    Config Config::parse_config(const std::filesystem::path& path)
    {
        const auto path_str = path.string();
        toml::table tbl;

        try
        {
            tbl = toml::parse_file(path_str);
        }
        catch (const toml::parse_error& e)
        {
            throw EnvError("TOML parse error in '" + path_str + "': " + std::string{ e.what() });
        }
        catch (const std::filesystem::filesystem_error& e)
        {
            throw EnvError("Cannot read config file '" + path_str + "': " + std::string{ e.what() });
        }

        const auto* server = tbl.get_as<toml::table>("server");
        if (!server)
            throw EnvError("Missing table [server] in '" + path_str + "'");

        // A misspelt table name would otherwise drop every project secret without a word.
        for (const auto& [key, node] : tbl)
        {
            const auto k = key.str();
            if (k != "server" && k != "projects" && k != "username_aliases" && k != "github")
                throw EnvError("Unknown table '" + std::string{ k } + "' in '" + path_str + "'");
        }

        const auto where = "[server] of '" + path_str + "'";

        // Keys the server table does not know are almost always typos of required ones.
        for (const auto& [key, node] : *server)
        {
            const auto k = key.str();
            if (k != "url" && k != "user" && k != "password" && k != "secret" && k != "port" && k != "room")
                throw EnvError("Unknown key '" + std::string{ k } + "' in " + where);
        }

        RawSettings raw{
            .server = toml_string(*server, "url", where),
            .user = toml_string(*server, "user", where),
            .password = toml_string(*server, "password", where),
            .secret = toml_string(*server, "secret", where),
            .port = std::nullopt,
            .room = toml_string(*server, "room", where),
            .projects = std::nullopt,
            .aliases = {},
            .github_user = std::nullopt,
            .github_password = std::nullopt,
        };

        if (const auto* port = server->get("port"))
        {
            auto value = port->value<std::int64_t>();
            if (!value)
                throw EnvError("Expected integer for 'port' in " + where);
            raw.port = std::to_string(*value);
        }

        if (const auto* node = tbl.get("projects"))
        {
            const auto* projects = node->as_table();
            if (!projects)
                throw EnvError("Expected table [projects] in '" + path_str + "'");
            raw.projects = toml_projects(*projects, path_str);
        }

        if (const auto* node = tbl.get("username_aliases"))
        {
            const auto* aliases = node->as_table();
            if (!aliases)
                throw EnvError("Expected table [username_aliases] in '" + path_str + "'");
            raw.aliases = toml_aliases(*aliases, path_str);
        }

        if (const auto* node = tbl.get("github"))
        {
            const auto* github = node->as_table();
            if (!github)
                throw EnvError("Expected table [github] in '" + path_str + "'");

            const auto gh_where = "[github] of '" + path_str + "'";
            raw.github_user = toml_string(*github, "user", gh_where);
            raw.github_password = toml_string(*github, "password", gh_where);
            if (!non_empty(raw.github_user) || !non_empty(raw.github_password))
                throw EnvError("Both 'user' and 'password' are required in " + gh_where);
        }

        auto parts = assemble(raw, "'" + path_str + "'");
        return Config(std::move(parts.server),
                      parts.port,
                      std::move(parts.github),
                      std::move(parts.rooms),
                      std::move(raw.aliases));
    }

    Config Config::load_file(const std::filesystem::path& path)
    {
        if (path.string().empty())
            throw EnvError("Config file path must not be empty");
        return parse_config(path);
    }

} // namespace env
