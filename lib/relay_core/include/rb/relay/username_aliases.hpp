/*
Module Name:
- username_aliases.hpp

Abstract:
- Case-insensitive map from chat usernames to canonical display names.
- Keys are compared with Unicode simple case folding: "Steve", "steve" and "STEVE" are one
  entry, as are "Élodie" and "élodie".
- Lookups hash the borrowed query with folding applied on the fly and compare with a
  folding equality, so get() never builds a lowercased copy.
- Filled once at startup, then read concurrently without locking.
*/
#pragma once

// C++ Standard Library
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

// Core
#include <rb/utils/attributes.hpp>
#include <rb/utils/transparent_string_hash.hpp>

namespace relay_bot {

class UsernameAliasTable
{
public:
    UsernameAliasTable() = default;

    // Canonical name for key, or key itself when no alias matches.
    // The result views either the table or the argument; it never allocates. When no alias
    // matches, the result dangles once the caller's key storage is gone, so do not pass a
    // temporary std::string and keep the result.
    [[nodiscard]] std::string_view get(std::string_view key RB_LIFETIMEBOUND) const noexcept;

    // Map key (under case folding) to value. A later key that folds the same replaces the value;
    // the stored key keeps the casing it was first inserted with.
    void insert(std::string key, std::string value);

    [[nodiscard]] std::size_t size() const noexcept
    {
        return map_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return map_.empty();
    }

private:
    std::unordered_map<std::string, std::string, rb::CaseFoldStringHash, rb::CaseFoldStringEq> map_;
};

} // namespace relay_bot
