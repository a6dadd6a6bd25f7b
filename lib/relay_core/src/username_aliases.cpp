// C++ Standard Library
#include <utility>

// Core
#include <rb/relay/username_aliases.hpp>

namespace relay_bot {

std::string_view UsernameAliasTable::get(std::string_view key RB_LIFETIMEBOUND) const noexcept
{
    // Heterogeneous find: hash and compare the view directly, no key is materialised.
    if (auto itr = map_.find(key); itr != map_.end())
        return itr->second;
    return key;
}

void UsernameAliasTable::insert(std::string key, std::string value)
{
    if (auto itr = map_.find(std::string_view{key}); itr != map_.end()) {
        itr->second = std::move(value);
        return;
    }
    map_.emplace(std::move(key), std::move(value));
}

} // namespace relay_bot
