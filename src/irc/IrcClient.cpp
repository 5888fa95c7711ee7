// SPDX-License-Identifier: Apache-2.0
#include "IrcClient.hpp"

#include <core/Log.hpp>
#include <irc/KeepaliveMonitor.hpp>
#include <irc/LineDispatcher.hpp>
#include <irc/Message.hpp>
#include <irc/ReconnectSupervisor.hpp>
#include <irc/Registration.hpp>
#include <irc/TcpTransport.hpp>

#include <format>
#include <mutex>
#include <thread>

namespace tinyirc
{

namespace
{

    /// @brief The task set of one connection: transport, reader and keepalive.
    struct Epoch
    {
        EpochId id = 0;
        std::shared_ptr<Transport> transport;
        std::unique_ptr<KeepaliveMonitor> keepalive;
        std::jthread reader;
    };

} // namespace

struct IrcClient::Impl
{
    ClientOptions options;
    DisplayCallback display;
    TransportFactory factory;

    Session session;
    CtcpResponder ctcp;
    Registrar registrar;
    LineDispatcher dispatcher;
    CommandDispatcher commands;
    ReconnectSupervisor supervisor;

    std::mutex epochMutex;
    std::unique_ptr<Epoch> epoch;
    bool started = false;

    Impl(ClientOptions opts, DisplayCallback displayCallback, TransportFactory transportFactory):
        options(std::move(opts)),
        display(std::move(displayCallback)),
        factory(transportFactory ? std::move(transportFactory) : TransportFactory(&TcpTransport::connect)),
        session(options.host, options.port, options.nick, options.realName, options.channel),
        ctcp(options.ctcp),
        registrar(session, options.registrationDelay),
        dispatcher(session, registrar, ctcp, options.keepaliveToken, display),
        commands(
            session, [this](std::string_view line) { return sendCurrent(line); }, display, options.commands),
        supervisor(options.reconnectDelay)
    {
    }

    void status(std::string text) const
    {
        log::info("{}", text);
        if (display)
            display(DisplayEvent { .kind = DisplayKind::Status, .target = {}, .sender = {}, .text = std::move(text) });
    }

    /// @brief Opens a transport and installs it as a new epoch.
    auto connect() -> VoidResult
    {
        tearDown();

        status(std::format("Connecting to {}:{}...", options.host, options.port));
        auto opened = factory(options.host, options.port);
        if (!opened)
        {
            status(std::format("Connection failed: {}", opened.error().message));
            return std::unexpected(opened.error());
        }

        auto transport = std::shared_ptr<Transport>(std::move(*opened));
        auto id = EpochId {};
        {
            auto const lock = std::lock_guard(epochMutex);
            if (session.shutdownRequested())
            {
                transport->close();
                return makeError(ErrorCode::TransportError, "Shutdown requested");
            }

            id = session.beginEpoch();
            auto next = std::make_unique<Epoch>();
            next->id = id;
            next->transport = transport;
            next->keepalive =
                std::make_unique<KeepaliveMonitor>(options.keepaliveInterval, [this, id] { probe(id); });
            next->reader = std::jthread(
                [this, id, transport](const std::stop_token& token) { readLoop(token, id, transport); });
            next->keepalive->start();
            epoch = std::move(next);
        }

        status(std::format("Connected to {}:{}", options.host, options.port));

        if (auto announced = registrar.announce(id, senderFor(id)); !announced)
            log::warning("Registration not sent: {}", announced.error().message);
        return {};
    }

    /// @brief Detaches the current epoch, then stops its keepalive, closes its transport and joins its reader.
    void tearDown()
    {
        auto old = std::unique_ptr<Epoch> {};
        {
            auto const lock = std::lock_guard(epochMutex);
            old = std::move(epoch);
            if (old)
                session.endEpoch(old->id);
        }
        registrar.interrupt();

        if (!old)
            return;

        old->keepalive->stop();
        old->transport->close();
        old->reader.request_stop();
        if (old->reader.joinable())
            old->reader.join();
        log::debug("Epoch {} torn down", old->id);
    }

    void readLoop(const std::stop_token& token, EpochId id, const std::shared_ptr<Transport>& transport)
    {
        auto const send = senderFor(id);
        while (!token.stop_requested())
        {
            auto line = transport->readLine();
            if (!line)
            {
                onConnectionLost(id, line.error());
                return;
            }
            dispatcher.dispatch(id, *line, send);
        }
    }

    void onConnectionLost(EpochId id, const Error& error)
    {
        // A torn-down epoch has already been ended; its reader just exits.
        if (!session.endEpoch(id))
            return;

        status(std::format("Disconnected: {}", error.message));
        if (session.shutdownRequested())
            return;

        scheduleReconnect();
    }

    void scheduleReconnect()
    {
        if (session.shutdownRequested())
            return;

        if (supervisor.schedule([this] { reconnect(); }))
        {
            auto const seconds = std::chrono::duration<double>(supervisor.delay()).count();
            status(std::format("Reconnecting in {}s", seconds));
        }
    }

    void reconnect()
    {
        if (session.shutdownRequested())
            return;

        status("Reconnecting...");
        if (auto result = connect(); !result && !session.shutdownRequested())
            scheduleReconnect();
    }

    void probe(EpochId id)
    {
        auto const state = session.snapshot();
        if (state.epoch != id || !state.connected || !state.registered)
            return;

        if (auto result = sendOnEpoch(id, irc::makePing(options.keepaliveToken)); !result)
        {
            log::debug("Keepalive not sent: {}", result.error().message);
            return;
        }
        session.recordKeepalive();
    }

    auto senderFor(EpochId id) -> LineSender
    {
        return [this, id](std::string_view line) { return sendOnEpoch(id, line); };
    }

    auto sendOnEpoch(EpochId id, std::string_view line) -> VoidResult
    {
        auto transport = std::shared_ptr<Transport> {};
        {
            auto const lock = std::lock_guard(epochMutex);
            if (!epoch || epoch->id != id || !session.isCurrentEpoch(id))
                return makeError(ErrorCode::TransportError, std::format("Connection {} is no longer current", id));
            transport = epoch->transport;
        }
        return transport->sendLine(line);
    }

    auto sendCurrent(std::string_view line) -> VoidResult
    {
        auto transport = std::shared_ptr<Transport> {};
        {
            auto const lock = std::lock_guard(epochMutex);
            if (!epoch || !session.isCurrentEpoch(epoch->id))
                return makeError(ErrorCode::TransportError, "Not connected");
            transport = epoch->transport;
        }
        return transport->sendLine(line);
    }
};

IrcClient::IrcClient(ClientOptions options, DisplayCallback display, TransportFactory factory):
    _impl(std::make_unique<Impl>(std::move(options), std::move(display), std::move(factory)))
{
}

IrcClient::~IrcClient()
{
    _impl->session.requestShutdown();
    _impl->registrar.interrupt();
    _impl->supervisor.shutdown();
    _impl->tearDown();
}

auto IrcClient::start() -> VoidResult
{
    if (_impl->started)
        return makeError(ErrorCode::InvalidArgument, "Client already started");
    if (_impl->session.shutdownRequested())
        return makeError(ErrorCode::InvalidArgument, "Client has been shut down");

    _impl->started = true;
    if (auto result = _impl->connect(); !result)
        _impl->scheduleReconnect();
    return {};
}

auto IrcClient::handleInput(std::string_view input) -> CommandOutcome
{
    auto const outcome = _impl->commands.execute(input);
    if (outcome == CommandOutcome::Quit)
        shutdown();
    return outcome;
}

auto IrcClient::sendLine(std::string_view line) -> VoidResult
{
    return _impl->sendCurrent(line);
}

auto IrcClient::sendOnEpoch(EpochId epoch, std::string_view line) -> VoidResult
{
    return _impl->sendOnEpoch(epoch, line);
}

void IrcClient::shutdown()
{
    _impl->session.requestShutdown();
    _impl->registrar.interrupt();
    _impl->supervisor.cancel();
    _impl->tearDown();
    _impl->status("Client stopped.");
}

auto IrcClient::session() -> Session&
{
    return _impl->session;
}

auto IrcClient::session() const -> const Session&
{
    return _impl->session;
}

auto IrcClient::isReconnectPending() const -> bool
{
    return _impl->supervisor.isPending();
}

auto IrcClient::reconnectAttempts() const -> std::size_t
{
    return _impl->supervisor.attemptsStarted();
}

} // namespace tinyirc
