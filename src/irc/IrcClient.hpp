// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <irc/CommandDispatcher.hpp>
#include <irc/Ctcp.hpp>
#include <irc/Display.hpp>
#include <irc/Session.hpp>
#include <irc/Transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tinyirc
{

/// @brief Everything the client needs to connect and behave.
struct ClientOptions
{
    std::string host;
    std::uint16_t port = 6667;
    std::string nick;
    std::string realName;
    std::optional<std::string> channel;

    std::chrono::milliseconds keepaliveInterval = std::chrono::seconds { 60 };
    std::chrono::milliseconds reconnectDelay = std::chrono::seconds { 5 };
    std::chrono::milliseconds registrationDelay = std::chrono::milliseconds { 0 };
    std::string keepaliveToken = "keepalive";

    CtcpConfig ctcp;
    CommandOptions commands;
};

/// @brief A persistent IRC connection with keepalive and automatic reconnection.
///
/// Each successful connect starts a new epoch consisting of a transport, a
/// reader thread and a keepalive monitor. When the reader observes a failure
/// the epoch ends and a single delayed reconnect is scheduled, unless the
/// operator has quit. Operator input is handled on the caller's thread.
class IrcClient
{
  public:
    /// @param options Connection, identity and behaviour settings.
    /// @param display Receives user-visible events from any client thread.
    /// @param factory Opens transports; defaults to plain TCP.
    IrcClient(ClientOptions options, DisplayCallback display, TransportFactory factory = {});
    ~IrcClient();

    IrcClient(const IrcClient&) = delete;
    IrcClient& operator=(const IrcClient&) = delete;

    /// @brief Connects and registers. A failed connect is reported and retried later.
    /// @return An error only if the client was already started or shut down.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Executes one line of operator input.
    /// @return CommandOutcome::Quit once the operator has quit; the client is then shut down.
    auto handleInput(std::string_view input) -> CommandOutcome;

    /// @brief Sends a raw line on the current connection.
    [[nodiscard]] auto sendLine(std::string_view line) -> VoidResult;

    /// @brief Sends a raw line only while @p epoch is still the current connection.
    /// @return A TransportError once @p epoch has ended, without touching any transport.
    [[nodiscard]] auto sendOnEpoch(EpochId epoch, std::string_view line) -> VoidResult;

    /// @brief Marks the shutdown as operator-initiated, cancels reconnects and closes the connection.
    void shutdown();

    [[nodiscard]] auto session() -> Session&;
    [[nodiscard]] auto session() const -> const Session&;

    /// @brief Returns true while a reconnect attempt is waiting for its delay.
    [[nodiscard]] auto isReconnectPending() const -> bool;

    /// @brief Number of reconnect attempts that have been started so far.
    [[nodiscard]] auto reconnectAttempts() const -> std::size_t;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace tinyirc
