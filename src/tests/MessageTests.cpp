// SPDX-License-Identifier: Apache-2.0
#include <irc/Message.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tinyirc;

TEST_CASE("parseMessage splits prefix, command, params and trailing", "[message]")
{
    auto result = irc::parseMessage(":alice!al@example.org PRIVMSG #tinyirc :hello there");
    REQUIRE(result.has_value());

    CHECK(result->prefix == "alice!al@example.org");
    CHECK(result->command == "PRIVMSG");
    REQUIRE(result->params.size() == 1);
    CHECK(result->params[0] == "#tinyirc");
    REQUIRE(result->trailing.has_value());
    CHECK(*result->trailing == "hello there");
    CHECK(result->argumentCount() == 2);
    CHECK(result->lastArgument() == "hello there");
}

TEST_CASE("parseMessage handles lines without prefix", "[message]")
{
    auto result = irc::parseMessage("PING :abc123");
    REQUIRE(result.has_value());

    CHECK(result->prefix.empty());
    CHECK(result->command == "PING");
    CHECK(result->params.empty());
    CHECK(result->lastArgument() == "abc123");
}

TEST_CASE("parseMessage keeps middle params without trailing", "[message]")
{
    auto result = irc::parseMessage(":server 005 me CHANTYPES=# NICKLEN=30");
    REQUIRE(result.has_value());

    CHECK(result->command == "005");
    REQUIRE(result->params.size() == 3);
    CHECK(result->params[0] == "me");
    CHECK(result->params[2] == "NICKLEN=30");
    CHECK(!result->trailing.has_value());
    CHECK(result->argument(1) == "CHANTYPES=#");
    CHECK(!result->argument(3).has_value());
}

TEST_CASE("parseMessage upper-cases the command", "[message]")
{
    auto result = irc::parseMessage("ping server");
    REQUIRE(result.has_value());
    CHECK(result->command == "PING");
}

TEST_CASE("parseMessage keeps an empty trailing parameter", "[message]")
{
    auto result = irc::parseMessage(":srv NOTICE * :");
    REQUIRE(result.has_value());
    REQUIRE(result->trailing.has_value());
    CHECK(result->trailing->empty());
    CHECK(result->argumentCount() == 2);
}

TEST_CASE("parseMessage rejects empty and prefix-only lines", "[message]")
{
    SECTION("empty")
    {
        auto result = irc::parseMessage("");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("whitespace")
    {
        CHECK(!irc::parseMessage("   ").has_value());
    }

    SECTION("prefix only")
    {
        auto result = irc::parseMessage(":server.example.org");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("nickFromPrefix strips user and host", "[message]")
{
    CHECK(irc::nickFromPrefix("bob!~bob@host") == "bob");
    CHECK(irc::nickFromPrefix("bob@host") == "bob");
    CHECK(irc::nickFromPrefix("irc.server.org") == "irc.server.org");
}

TEST_CASE("iequals compares case-insensitively", "[message]")
{
    CHECK(irc::iequals("Tester", "tester"));
    CHECK(irc::iequals("#TinyIRC", "#tinyirc"));
    CHECK(!irc::iequals("tester", "tester2"));
    CHECK(!irc::iequals("abc", "abd"));
}

TEST_CASE("isChannelName recognizes channel prefixes", "[message]")
{
    CHECK(irc::isChannelName("#chan"));
    CHECK(irc::isChannelName("&local"));
    CHECK(!irc::isChannelName("bob"));
    CHECK(!irc::isChannelName(""));
}

TEST_CASE("Outbound builders produce protocol lines", "[message]")
{
    CHECK(irc::makeNick("tester") == "NICK tester");
    CHECK(irc::makeUser("tester", "Test User") == "USER tester 0 * :Test User");
    CHECK(irc::makeJoin("#chan") == "JOIN #chan");
    CHECK(irc::makePart("#chan") == "PART #chan");
    CHECK(irc::makePrivmsg("bob", "hi there") == "PRIVMSG bob :hi there");
    CHECK(irc::makeNotice("bob", "hey") == "NOTICE bob :hey");
    CHECK(irc::makePing("keepalive") == "PING keepalive");
    CHECK(irc::makePong("abc123") == "PONG :abc123");
    CHECK(irc::makeWhois("bob") == "WHOIS bob");
    CHECK(irc::makeAway("lunch") == "AWAY :lunch");
    CHECK(irc::makeAway(std::nullopt) == "AWAY");
    CHECK(irc::makeQuit("Bye") == "QUIT :Bye");
    CHECK(irc::makeVersion() == "VERSION");
}
