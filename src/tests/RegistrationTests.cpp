// SPDX-License-Identifier: Apache-2.0
#include <irc/Registration.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestUtils.hpp"

#include <atomic>

using namespace tinyirc;
using namespace std::chrono_literals;

TEST_CASE("Registrar announces NICK then USER", "[registration]")
{
    auto session = Session { "irc.example.org", 6667, "tester", "Test User" };
    auto registrar = Registrar { session };
    auto sent = test::SentLines {};
    auto const epoch = session.beginEpoch();

    REQUIRE(registrar.announce(epoch, sent.sender()).has_value());

    auto const lines = sent.lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "NICK tester");
    CHECK(lines[1] == "USER tester 0 * :Test User");
}

TEST_CASE("Registrar confirms a nick changed before registration", "[registration]")
{
    auto session = Session { "irc.example.org", 6667, "tester", "Test User", std::string("#chan") };
    auto registrar = Registrar { session };
    auto sent = test::SentLines {};
    auto const epoch = session.beginEpoch();
    session.requestHandle("other");

    CHECK(registrar.acknowledge(epoch, "other", sent.sender()));
    CHECK(session.handle() == "other");
    CHECK(session.confirmedHandle() == "other");
    CHECK(sent.count("JOIN #chan") == 1);
}

TEST_CASE("Registrar grace period ends early on shutdown", "[registration][thread]")
{
    auto session = Session { "irc.example.org", 6667, "tester", "Test User" };
    auto registrar = Registrar { session, 10s };
    auto sent = test::SentLines {};
    auto const epoch = session.beginEpoch();

    auto finished = std::atomic<bool> { false };
    auto abandoned = std::atomic<bool> { false };
    auto announcer = std::thread([&] {
        abandoned = !registrar.announce(epoch, sent.sender()).has_value();
        finished = true;
    });

    std::this_thread::sleep_for(50ms);
    CHECK(!finished.load());

    SECTION("shutdown requested")
    {
        session.requestShutdown();
    }
    SECTION("connection replaced")
    {
        (void) session.beginEpoch();
    }

    registrar.interrupt();
    CHECK(test::waitUntil([&] { return finished.load(); }));
    announcer.join();

    CHECK(abandoned.load());
    CHECK(sent.lines().empty());
}
