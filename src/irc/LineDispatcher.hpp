// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <irc/Ctcp.hpp>
#include <irc/Display.hpp>
#include <irc/Message.hpp>
#include <irc/Registration.hpp>
#include <irc/Session.hpp>

#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief Routes inbound server lines: liveness, registration, messages and CTCP.
///
/// Called from the reader thread of an epoch. Replies go through the send path
/// of that epoch, so a stale reader can never write to a newer connection.
/// Malformed lines are dropped and logged at debug level.
class LineDispatcher
{
  public:
    /// @param session The shared session state.
    /// @param registrar Recognizes the welcome reply.
    /// @param ctcp Produces replies to CTCP queries.
    /// @param keepaliveToken The token our own keepalive probes carry.
    /// @param display Receives user-visible events.
    LineDispatcher(Session& session,
                   const Registrar& registrar,
                   const CtcpResponder& ctcp,
                   std::string keepaliveToken,
                   DisplayCallback display);

    /// @brief Handles one inbound line.
    /// @param epoch The epoch whose reader received the line.
    /// @param line The line without its terminator.
    /// @param send The send path of that epoch.
    void dispatch(EpochId epoch, std::string_view line, const LineSender& send);

  private:
    Session& _session;
    const Registrar& _registrar;
    const CtcpResponder& _ctcp;
    std::string _keepaliveToken;
    DisplayCallback _display;

    void handlePing(const irc::Message& message, const LineSender& send);
    void handlePong(const irc::Message& message, std::string_view line);
    void handleWelcome(EpochId epoch, const irc::Message& message, std::string_view line, const LineSender& send);
    void handlePrivmsg(const irc::Message& message, const LineSender& send);
    void handleNotice(const irc::Message& message);
    void handleNick(const irc::Message& message);
    void handleNicknameInUse(const irc::Message& message);
    void handleCtcpQuery(std::string_view sender, std::string_view body, const LineSender& send);

    void show(DisplayKind kind, std::string target, std::string sender, std::string text) const;
};

} // namespace tinyirc
