/*
Module: main.cpp

Purpose:
- Entry point that loads the relay configuration and answers routing queries against it.

Notes:
- Config comes from PSDEVBOT_* environment variables, or from the TOML file given with
  --config <path> (see env::Config). Fails fast with EnvError.
- Commands:
    rooms                         every room the bot joins, sorted (default)
    resolve <project>             rooms and simple rooms an event from project is sent to
    alias <username>              canonical display name for username
    verify <project> <signature>  check stdin against the project's webhook secret
- Secrets are never written to stdout or stderr.
*/

// C++ Standard Library
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Core
#include <rb/relay/config.hpp>
#include <rb/relay/webhook_signature.hpp>

namespace {

inline constexpr int kExitUsage = 2;

void print_usage(std::ostream& out)
{
    out << "usage: relay_bot [--config <file.toml>] [rooms | resolve <project> | alias <username> |"
           " verify <project> <signature>]\n"
           "  <signature> is the " << relay_bot::kSignatureHeader << " header value; the body is read from stdin\n";
}

void print_joined(std::ostream& out, std::string_view label, std::span<const std::string> rooms)
{
    out << label << ':';
    for (std::size_t i = 0; i < rooms.size(); ++i)
        out << (i == 0 ? " " : ",") << rooms[i];
    out << '\n';
}

int cmd_rooms(const env::Config& cfg)
{
    const auto set = cfg.rooms().all_rooms();
    std::vector<std::string_view> rooms{set.begin(), set.end()};
    std::sort(rooms.begin(), rooms.end());

    std::cerr << "[relay_bot] joining " << rooms.size() << " rooms on " << cfg.server().url.str() << '\n';
    for (auto room : rooms)
        std::cout << room << '\n';
    return EXIT_SUCCESS;
}

int cmd_resolve(const env::Config& cfg, std::string_view project)
{
    const auto target = cfg.rooms().resolve(project);
    print_joined(std::cout, "rooms", target.rooms);
    print_joined(std::cout, "simple_rooms", target.simple_rooms);
    return EXIT_SUCCESS;
}

int cmd_alias(const env::Config& cfg, std::string_view username)
{
    std::cout << cfg.username_aliases().get(username) << '\n';
    return EXIT_SUCCESS;
}

int cmd_verify(const env::Config& cfg, std::string_view project, std::string_view signature)
{
    const std::string body{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
    const auto target = cfg.rooms().resolve(project);

    if (!relay_bot::verify_signature(target.secret, body, signature)) {
        std::cerr << "[relay_bot] signature mismatch for project '" << project << "'\n";
        return EXIT_FAILURE;
    }
    std::cerr << "[relay_bot] signature ok for project '" << project << "'\n";
    return EXIT_SUCCESS;
}

} // unnamed namespace

int main(int argc, char* argv[])
{
    std::vector<std::string_view> args(argv + 1, argv + argc);
    std::optional<std::string> config_path;

    if (args.size() >= 2 && args[0] == "--config") {
        config_path = std::string{args[1]};
        args.erase(args.begin(), args.begin() + 2);
    }

    try
    {
        // Load immutable configuration; routing tables are read-only from here on.
        const auto cfg = config_path ? env::Config::load_file(*config_path) : env::Config::load();

        std::cerr << "[Config] " << cfg.rooms().project_count() << " projects, "
                  << cfg.username_aliases().size() << " username aliases, webhook port " << cfg.port()
                  << (cfg.github() ? ", GitHub API enabled" : "") << '\n';

        const std::string_view command = args.empty() ? std::string_view{"rooms"} : args[0];

        if (command == "rooms" && args.size() <= 1)
            return cmd_rooms(cfg);
        if (command == "resolve" && args.size() == 2)
            return cmd_resolve(cfg, args[1]);
        if (command == "alias" && args.size() == 2)
            return cmd_alias(cfg, args[1]);
        if (command == "verify" && args.size() == 3)
            return cmd_verify(cfg, args[1], args[2]);

        print_usage(std::cerr);
        return kExitUsage;
    }
    catch (const env::EnvError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal startup error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
