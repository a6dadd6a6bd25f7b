/*
Module Name:
- url.hpp

Abstract:
- Minimal absolute URL parser for the chat server endpoint.
- Rejects input without a scheme or host, and ports that are not 1..65535.
- Scheme is lowercased; host, path and query are kept verbatim.
- Query is stored with a leading '?' so target() can concatenate cheaply.
*/
#pragma once

// C++ Standard Library
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Core
#include <rb/utils/transparent_string_hash.hpp>

namespace rb
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::string port; // empty when the URL names none
        std::string path;
        std::string query; // includes leading '?' when present

        [[nodiscard]] bool is_websocket() const noexcept
        {
            return scheme == "ws" || scheme == "wss";
        }

        [[nodiscard]] std::string authority() const
        {
            std::string out = host;
            if (!port.empty())
            {
                out.push_back(':');
                out += port;
            }
            return out;
        }

        [[nodiscard]] std::string target() const
        {
            std::string out = path.empty() ? std::string{ "/" } : path;
            out += query; // query already has leading '?'
            return out;
        }

        [[nodiscard]] std::string origin() const
        {
            std::string out = scheme;
            out += "://";
            out += authority();
            return out;
        }

        [[nodiscard]] std::string str() const
        {
            return origin() + target();
        }
    };

    namespace detail
    {
        // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
        [[nodiscard]] inline bool valid_scheme(std::string_view s) noexcept
        {
            if (s.empty() || !((s.front() >= 'a' && s.front() <= 'z') || (s.front() >= 'A' && s.front() <= 'Z')))
                return false;
            return std::all_of(s.begin(), s.end(), [](char c) {
                return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                       c == '+' || c == '-' || c == '.';
            });
        }

        [[nodiscard]] inline bool valid_port(std::string_view s) noexcept
        {
            std::uint32_t value = 0;
            const auto* first = s.data();
            const auto* last = s.data() + s.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            return ec == std::errc{} && ptr == last && value >= 1 && value <= 65535;
        }
    } // namespace detail

    /// Parse an absolute URL ("scheme://host[:port][/path][?query]").
    /// Returns nullopt when the input is not absolute or its authority is malformed.
    [[nodiscard]] inline std::optional<Url> parse_url(std::string_view s)
    {
        Url u;

        auto pos = s.find("://");
        if (pos == std::string_view::npos || !detail::valid_scheme(s.substr(0, pos)))
            return std::nullopt;

        u.scheme.assign(s.substr(0, pos));
        std::transform(u.scheme.begin(), u.scheme.end(), u.scheme.begin(), detail::fold_ascii);
        s.remove_prefix(pos + 3);

        // authority ends at the first '/', '?' or end of input
        auto auth_end = s.find_first_of("/?");
        std::string_view auth = (auth_end == std::string_view::npos) ? s : s.substr(0, auth_end);
        s = (auth_end == std::string_view::npos) ? std::string_view{} : s.substr(auth_end);

        if (auth.find('@') != std::string_view::npos)
            return std::nullopt; // credentials belong in the config, not the endpoint

        // split host[:port] using last ':' (bracketed IPv6 keeps its colons)
        auto colon = auth.rfind(':');
        auto bracket = auth.rfind(']');
        if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket))
        {
            auto port = auth.substr(colon + 1);
            if (!detail::valid_port(port))
                return std::nullopt;
            u.host.assign(auth.substr(0, colon));
            u.port.assign(port);
        }
        else
        {
            u.host.assign(auth);
        }

        if (u.host.empty())
            return std::nullopt;

        // path and optional query (query kept with leading '?')
        auto q = s.find('?');
        if (q == std::string_view::npos)
        {
            u.path.assign(s);
        }
        else
        {
            u.path.assign(s.substr(0, q));
            u.query.assign(s.substr(q));
        }

        if (u.path.empty() || u.path.front() != '/')
        {
            u.path.insert(u.path.begin(), '/');
        }
        return u;
    }

} // namespace rb
