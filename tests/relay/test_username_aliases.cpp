#include <catch2/catch_test_macros.hpp>

#include "rb/relay/username_aliases.hpp"

#include <string>
#include <string_view>

using namespace relay_bot;

TEST_CASE("UsernameAliasTable: case-insensitive lookup", "[relay][aliases]") {
    UsernameAliasTable aliases;
    aliases.insert("Steve", "Steve the Great");

    CHECK(aliases.get("steve") == "Steve the Great");
    CHECK(aliases.get("STEVE") == "Steve the Great");
    CHECK(aliases.get("Steve") == "Steve the Great");
    CHECK(aliases.get("sTeVe") == "Steve the Great");
    CHECK(aliases.get("stevie") == "stevie");
}

TEST_CASE("UsernameAliasTable: unknown names come back untouched", "[relay][aliases]") {
    UsernameAliasTable aliases;
    aliases.insert("A", "Awesome");

    SECTION("mapped") {
        CHECK(aliases.get("a") == "Awesome");
    }

    SECTION("casing preserved") {
        CHECK(aliases.get("MixedCase") == "MixedCase");
    }

    SECTION("same storage as the query") {
        const std::string query = "Nobody";
        std::string_view result = aliases.get(query);
        CHECK(result.data() == query.data());
        CHECK(result.size() == query.size());
    }

    SECTION("empty name") {
        CHECK(aliases.get("").empty());
    }

    SECTION("prefix of a key does not match") {
        CHECK(aliases.get("AA") == "AA");
    }
}

TEST_CASE("UsernameAliasTable: colliding folds overwrite", "[relay][aliases]") {
    UsernameAliasTable aliases;
    aliases.insert("Zarel", "first");
    aliases.insert("ZAREL", "second");
    aliases.insert("zarel", "third");

    CHECK(aliases.size() == 1);
    CHECK(aliases.get("Zarel") == "third");
    CHECK(aliases.get("zArEl") == "third");
}

TEST_CASE("UsernameAliasTable: distinct keys stay distinct", "[relay][aliases]") {
    UsernameAliasTable aliases;
    CHECK(aliases.empty());

    aliases.insert("alice", "Alice");
    aliases.insert("bob", "Bob");

    CHECK(aliases.size() == 2);
    CHECK(aliases.get("ALICE") == "Alice");
    CHECK(aliases.get("Bob") == "Bob");
    CHECK_FALSE(aliases.empty());
}

TEST_CASE("UsernameAliasTable: non-ASCII names fold case", "[relay][aliases]") {
    UsernameAliasTable aliases;
    aliases.insert("\xc3\x89lodie", "Elodie the Great");                  // Élodie
    aliases.insert("\xce\xa3\xce\xbf\xcf\x86\xce\xaf\xce\xb1", "Sofia");   // Σοφία
    aliases.insert("J\xc3\xb6rg", "Joerg");                               // Jörg

    CHECK(aliases.size() == 3);
    CHECK(aliases.get("\xc3\xa9lodie") == "Elodie the Great");             // élodie
    CHECK(aliases.get("\xc3\x89LODIE") == "Elodie the Great");             // ÉLODIE
    CHECK(aliases.get("\xcf\x83\xce\xbf\xcf\x86\xce\xaf\xce\xb1") == "Sofia");   // σοφία
    CHECK(aliases.get("J\xc3\x96RG") == "Joerg");                          // JÖRG
    CHECK(aliases.get("Elodie") == "Elodie");

    SECTION("colliding non-ASCII spellings share one entry") {
        aliases.insert("\xc3\xa9lodie", "Elodie");
        CHECK(aliases.size() == 3);
        CHECK(aliases.get("\xc3\x89lodie") == "Elodie");
    }
}

TEST_CASE("UsernameAliasTable: malformed UTF-8 only matches itself", "[relay][aliases]") {
    UsernameAliasTable aliases;
    aliases.insert("bad\xff", "Bad");

    CHECK(aliases.get("BAD\xff") == "Bad");
    CHECK(aliases.get("bad\xfe") == "bad\xfe");
}
