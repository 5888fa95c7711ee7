// SPDX-License-Identifier: Apache-2.0
#include <irc/IrcClient.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestUtils.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>

using namespace tinyirc;
using namespace std::chrono_literals;

namespace
{

/// @brief Server side of one scripted connection: lines to deliver and lines received.
struct ScriptedChannel
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbox;
    std::vector<std::string> sent;
    std::optional<std::string> failure;
    bool closed = false;

    void push(std::string line)
    {
        {
            auto const lock = std::lock_guard(mutex);
            inbox.push_back(std::move(line));
        }
        cv.notify_all();
    }

    void fail(std::string reason)
    {
        {
            auto const lock = std::lock_guard(mutex);
            failure = std::move(reason);
        }
        cv.notify_all();
    }

    auto sentLines() -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(mutex);
        return sent;
    }

    auto hasSent(std::string_view line) -> bool
    {
        auto const lock = std::lock_guard(mutex);
        return std::ranges::find(sent, line) != sent.end();
    }

    auto countSent(std::string_view line) -> std::size_t
    {
        auto const lock = std::lock_guard(mutex);
        return static_cast<std::size_t>(std::ranges::count(sent, line));
    }
};

/// @brief Transport backed by a ScriptedChannel instead of a socket.
class ScriptedTransport: public Transport
{
  public:
    explicit ScriptedTransport(std::shared_ptr<ScriptedChannel> channel): _channel(std::move(channel)) {}

    auto sendLine(std::string_view line) -> VoidResult override
    {
        auto const lock = std::lock_guard(_channel->mutex);
        if (_channel->closed || _channel->failure)
            return makeError(ErrorCode::TransportError, "Transport not connected");
        _channel->sent.emplace_back(line);
        return {};
    }

    auto readLine() -> Result<std::string> override
    {
        auto lock = std::unique_lock(_channel->mutex);
        _channel->cv.wait(lock, [this] {
            return _channel->closed || _channel->failure.has_value() || !_channel->inbox.empty();
        });
        if (_channel->failure)
            return makeError(ErrorCode::TransportError, *_channel->failure);
        if (_channel->closed)
            return makeError(ErrorCode::TransportError, "Transport closed");

        auto line = std::move(_channel->inbox.front());
        _channel->inbox.pop_front();
        return line;
    }

    void close() override
    {
        {
            auto const lock = std::lock_guard(_channel->mutex);
            _channel->closed = true;
        }
        _channel->cv.notify_all();
    }

    [[nodiscard]] auto isConnected() const -> bool override
    {
        auto const lock = std::lock_guard(_channel->mutex);
        return !_channel->closed && !_channel->failure;
    }

  private:
    std::shared_ptr<ScriptedChannel> _channel;
};

/// @brief Transport factory that records every connection it opens.
class ScriptedServer
{
  public:
    [[nodiscard]] auto factory() -> TransportFactory
    {
        return [this](std::string_view /*host*/, std::uint16_t /*port*/) -> Result<std::unique_ptr<Transport>> {
            auto const lock = std::lock_guard(_mutex);
            ++_attempts;
            if (_refusals > 0)
            {
                --_refusals;
                return makeError(ErrorCode::ConnectError, "Connection refused");
            }
            auto channel = std::make_shared<ScriptedChannel>();
            _channels.push_back(channel);
            return std::make_unique<ScriptedTransport>(std::move(channel));
        };
    }

    void refuseNext(int count)
    {
        auto const lock = std::lock_guard(_mutex);
        _refusals = count;
    }

    [[nodiscard]] auto attempts() const -> int
    {
        auto const lock = std::lock_guard(_mutex);
        return _attempts;
    }

    [[nodiscard]] auto connections() const -> std::size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return _channels.size();
    }

    [[nodiscard]] auto connection(std::size_t index) const -> std::shared_ptr<ScriptedChannel>
    {
        auto const lock = std::lock_guard(_mutex);
        return _channels.at(index);
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::shared_ptr<ScriptedChannel>> _channels;
    int _attempts = 0;
    int _refusals = 0;
};

auto testOptions() -> ClientOptions
{
    return ClientOptions {
        .host = "irc.example.org",
        .port = 6667,
        .nick = "tester",
        .realName = "Test User",
        .channel = std::string("#chan"),
        .keepaliveInterval = 10s,
        .reconnectDelay = 20ms,
    };
}

auto welcome() -> std::string
{
    return ":irc.example.org 001 tester :Welcome to the network";
}

} // namespace

TEST_CASE("IrcClient announces itself and joins after the welcome", "[client][registration]")
{
    auto server = ScriptedServer {};
    auto events = test::EventLog {};
    auto client = IrcClient(testOptions(), events.callback(), server.factory());

    REQUIRE(client.start().has_value());
    REQUIRE(server.connections() == 1);
    auto const connection = server.connection(0);

    CHECK(test::waitUntil([&] { return connection->sentLines().size() >= 2; }));
    auto const announced = connection->sentLines();
    CHECK(announced[0] == "NICK tester");
    CHECK(announced[1] == "USER tester 0 * :Test User");
    CHECK(client.session().isConnected());
    CHECK(!client.session().isRegistered());

    connection->push(welcome());

    CHECK(test::waitUntil([&] { return client.session().isRegistered(); }));
    CHECK(test::waitUntil([&] { return connection->hasSent("JOIN #chan"); }));
    CHECK(events.contains(DisplayKind::Status, "Registered as tester"));
}

TEST_CASE("IrcClient start twice is rejected", "[client]")
{
    auto server = ScriptedServer {};
    auto client = IrcClient(testOptions(), {}, server.factory());

    REQUIRE(client.start().has_value());
    auto const again = client.start();
    REQUIRE(!again.has_value());
    CHECK(server.attempts() == 1);
}

TEST_CASE("IrcClient answers server PING end to end", "[client]")
{
    auto server = ScriptedServer {};
    auto client = IrcClient(testOptions(), {}, server.factory());
    REQUIRE(client.start().has_value());
    auto const connection = server.connection(0);

    connection->push("PING :irc.example.org");

    CHECK(test::waitUntil([&] { return connection->hasSent("PONG :irc.example.org"); }));
}

TEST_CASE("IrcClient sends keepalive probes once registered", "[client][keepalive]")
{
    auto server = ScriptedServer {};
    auto options = testOptions();
    options.keepaliveInterval = 20ms;
    auto client = IrcClient(options, {}, server.factory());
    REQUIRE(client.start().has_value());
    auto const connection = server.connection(0);

    std::this_thread::sleep_for(60ms);
    CHECK(connection->countSent("PING keepalive") == 0);

    connection->push(welcome());

    CHECK(test::waitUntil([&] { return connection->hasSent("PING keepalive"); }));
    CHECK(test::waitUntil([&] { return client.session().lastKeepaliveAt().has_value(); }));
}

TEST_CASE("IrcClient reconnects exactly once after a read failure", "[client][reconnect]")
{
    auto server = ScriptedServer {};
    auto events = test::EventLog {};
    auto client = IrcClient(testOptions(), events.callback(), server.factory());
    REQUIRE(client.start().has_value());

    auto const first = server.connection(0);
    first->push(welcome());
    REQUIRE(test::waitUntil([&] { return client.session().isRegistered(); }));
    auto const firstEpoch = client.session().epoch();

    first->fail("Connection reset by peer");

    REQUIRE(test::waitUntil([&] { return server.connections() == 2; }));
    auto const second = server.connection(1);
    CHECK(test::waitUntil([&] { return second->hasSent("NICK tester"); }));
    CHECK(second->hasSent("USER tester 0 * :Test User"));
    CHECK(client.session().epoch() == firstEpoch + 1);
    CHECK(!client.session().isRegistered());

    second->push(welcome());
    CHECK(test::waitUntil([&] { return second->hasSent("JOIN #chan"); }));
    CHECK(client.session().isRegistered());

    std::this_thread::sleep_for(100ms);
    CHECK(server.connections() == 2);
    CHECK(client.reconnectAttempts() == 1);
    CHECK(events.contains(DisplayKind::Status, "Disconnected: Connection reset by peer"));
    CHECK(first->countSent("JOIN #chan") == 1);
}

TEST_CASE("IrcClient rejects sends bound to a connection that has been replaced", "[client][reconnect]")
{
    auto server = ScriptedServer {};
    auto client = IrcClient(testOptions(), {}, server.factory());
    REQUIRE(client.start().has_value());

    auto const first = server.connection(0);
    auto const firstEpoch = client.session().epoch();
    REQUIRE(client.sendOnEpoch(firstEpoch, "PRIVMSG #chan :before").has_value());
    CHECK(first->hasSent("PRIVMSG #chan :before"));

    first->fail("Connection reset by peer");
    REQUIRE(test::waitUntil([&] { return server.connections() == 2; }));
    auto const second = server.connection(1);
    REQUIRE(test::waitUntil([&] { return second->hasSent("USER tester 0 * :Test User"); }));
    auto const sentBefore = second->sentLines().size();

    auto const stale = client.sendOnEpoch(firstEpoch, "PRIVMSG #chan :stale");
    REQUIRE(!stale.has_value());
    CHECK(stale.error().code == ErrorCode::TransportError);
    CHECK(stale.error().message.find("no longer current") != std::string::npos);

    CHECK(second->sentLines().size() == sentBefore);
    CHECK(!second->hasSent("PRIVMSG #chan :stale"));
    CHECK(!first->hasSent("PRIVMSG #chan :stale"));

    CHECK(client.sendOnEpoch(client.session().epoch(), "PRIVMSG #chan :current").has_value());
    CHECK(second->hasSent("PRIVMSG #chan :current"));
}

TEST_CASE("IrcClient quit during the registration grace period returns promptly", "[client][registration]")
{
    auto server = ScriptedServer {};
    auto options = testOptions();
    options.registrationDelay = 10s;
    auto client = IrcClient(options, {}, server.factory());

    // start() announces on the calling thread, so run it aside and quit from here.
    auto starting = std::thread([&] { (void) client.start(); });
    REQUIRE(test::waitUntil([&] { return server.connections() == 1; }));

    auto const before = std::chrono::steady_clock::now();
    client.shutdown();
    starting.join();

    CHECK(std::chrono::steady_clock::now() - before < 2s);
    CHECK(!server.connection(0)->hasSent("NICK tester"));
}

TEST_CASE("IrcClient quit during the reconnect delay prevents the reconnect", "[client][reconnect]")
{
    auto server = ScriptedServer {};
    auto options = testOptions();
    options.reconnectDelay = 300ms;
    auto events = test::EventLog {};
    auto client = IrcClient(options, events.callback(), server.factory());
    REQUIRE(client.start().has_value());

    server.connection(0)->fail("Connection reset by peer");
    REQUIRE(test::waitUntil([&] { return client.isReconnectPending(); }));

    CHECK(client.handleInput("/quit") == CommandOutcome::Quit);
    CHECK(!client.isReconnectPending());

    std::this_thread::sleep_for(500ms);
    CHECK(client.reconnectAttempts() == 0);
    CHECK(server.connections() == 1);
    CHECK(client.session().shutdownRequested());
    CHECK(events.contains(DisplayKind::Status, "Client stopped."));
}

TEST_CASE("IrcClient quit while connected sends QUIT and does not reconnect", "[client]")
{
    auto server = ScriptedServer {};
    auto client = IrcClient(testOptions(), {}, server.factory());
    REQUIRE(client.start().has_value());
    auto const connection = server.connection(0);

    CHECK(client.handleInput("/quit see you") == CommandOutcome::Quit);

    CHECK(connection->hasSent("QUIT :see you"));
    CHECK(!client.session().isConnected());
    std::this_thread::sleep_for(100ms);
    CHECK(server.connections() == 1);
    CHECK(client.reconnectAttempts() == 0);
}

TEST_CASE("IrcClient retries when the initial connect fails", "[client][reconnect]")
{
    auto server = ScriptedServer {};
    server.refuseNext(2);
    auto events = test::EventLog {};
    auto client = IrcClient(testOptions(), events.callback(), server.factory());

    REQUIRE(client.start().has_value());
    CHECK(events.contains(DisplayKind::Status, "Connection failed: Connection refused"));

    REQUIRE(test::waitUntil([&] { return server.connections() == 1; }));
    CHECK(server.attempts() == 3);
    CHECK(test::waitUntil([&] { return server.connection(0)->hasSent("NICK tester"); }));
    CHECK(client.session().isConnected());
}

TEST_CASE("IrcClient routes operator input to the current connection", "[client]")
{
    auto server = ScriptedServer {};
    auto events = test::EventLog {};
    auto client = IrcClient(testOptions(), events.callback(), server.factory());
    REQUIRE(client.start().has_value());
    auto const connection = server.connection(0);

    CHECK(client.handleInput("hello everyone") == CommandOutcome::Continue);
    CHECK(connection->hasSent("PRIVMSG #chan :hello everyone"));

    connection->push(":bob!~bob@host PRIVMSG tester :psst");
    CHECK(test::waitUntil([&] { return client.session().currentPeer() == std::optional<std::string>("bob"); }));

    client.handleInput("hi bob");
    CHECK(connection->hasSent("PRIVMSG bob :hi bob"));
}

TEST_CASE("IrcClient reports sends while disconnected", "[client]")
{
    auto server = ScriptedServer {};
    server.refuseNext(1000);
    auto options = testOptions();
    options.reconnectDelay = 10s;
    auto events = test::EventLog {};
    auto client = IrcClient(options, events.callback(), server.factory());
    REQUIRE(client.start().has_value());

    CHECK(!client.sendLine("PING x").has_value());

    client.handleInput("hello");
    CHECK(events.contains(DisplayKind::Error, "Send failed: Not connected"));
}
