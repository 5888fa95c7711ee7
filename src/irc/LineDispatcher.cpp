// SPDX-License-Identifier: Apache-2.0
#include "LineDispatcher.hpp"

#include <core/Log.hpp>

#include <format>

namespace tinyirc
{

namespace
{

    constexpr auto NumericWelcome = std::string_view { "001" };
    constexpr auto NumericNicknameInUse = std::string_view { "433" };

} // namespace

LineDispatcher::LineDispatcher(Session& session,
                               const Registrar& registrar,
                               const CtcpResponder& ctcp,
                               std::string keepaliveToken,
                               DisplayCallback display):
    _session(session),
    _registrar(registrar),
    _ctcp(ctcp),
    _keepaliveToken(std::move(keepaliveToken)),
    _display(std::move(display))
{
}

void LineDispatcher::dispatch(EpochId epoch, std::string_view line, const LineSender& send)
{
    auto parsed = irc::parseMessage(line);
    if (!parsed)
    {
        log::debug("Dropping line: {}", parsed.error().message);
        return;
    }

    auto const& message = *parsed;

    if (message.command == "PING")
        handlePing(message, send);
    else if (message.command == "PONG")
        handlePong(message, line);
    else if (message.command == NumericWelcome)
        handleWelcome(epoch, message, line, send);
    else if (message.command == "PRIVMSG")
        handlePrivmsg(message, send);
    else if (message.command == "NOTICE")
        handleNotice(message);
    else if (message.command == "NICK")
        handleNick(message);
    else if (message.command == NumericNicknameInUse)
        handleNicknameInUse(message);
    else if (message.command == "ERROR")
        show(DisplayKind::Error, {}, {}, std::format("Server error: {}", message.lastArgument().value_or("")));
    else
        show(DisplayKind::ServerLine, {}, message.prefix, std::string(line));
}

void LineDispatcher::handlePing(const irc::Message& message, const LineSender& send)
{
    auto const argument = message.lastArgument();
    if (!argument)
    {
        log::debug("Dropping PING without argument");
        return;
    }

    if (auto result = send(irc::makePong(*argument)); !result)
        log::warning("Failed to answer PING: {}", result.error().message);
}

void LineDispatcher::handlePong(const irc::Message& message, std::string_view line)
{
    if (auto const argument = message.lastArgument(); argument && *argument == _keepaliveToken)
    {
        _session.recordKeepalive();
        log::trace("Keepalive acknowledged");
        return;
    }

    show(DisplayKind::ServerLine, {}, message.prefix, std::string(line));
}

void LineDispatcher::handleWelcome(EpochId epoch,
                                   const irc::Message& message,
                                   std::string_view line,
                                   const LineSender& send)
{
    auto const target = message.argument(0);
    if (!target)
    {
        log::debug("Dropping welcome without target");
        return;
    }

    show(DisplayKind::ServerLine, {}, message.prefix, std::string(line));

    if (_registrar.acknowledge(epoch, *target, send))
        show(DisplayKind::Status, {}, {}, std::format("Registered as {}", *target));
}

void LineDispatcher::handlePrivmsg(const irc::Message& message, const LineSender& send)
{
    if (message.prefix.empty() || message.argumentCount() < 2)
    {
        log::debug("Dropping malformed PRIVMSG");
        return;
    }

    auto const sender = irc::nickFromPrefix(message.prefix);
    auto const target = *message.argument(0);
    auto const body = *message.lastArgument();

    if (ctcp::isCtcp(body))
    {
        handleCtcpQuery(sender, body, send);
        return;
    }

    if (_session.isOwnNick(target))
    {
        _session.setPeer(std::string(sender));
        show(DisplayKind::PrivateMessage, std::string(target), std::string(sender), std::string(body));
    }
    else
    {
        show(DisplayKind::ChannelMessage, std::string(target), std::string(sender), std::string(body));
    }
}

void LineDispatcher::handleCtcpQuery(std::string_view sender, std::string_view body, const LineSender& send)
{
    auto const payload = ctcp::parse(body);
    if (!payload)
    {
        log::debug("Dropping empty CTCP query from {}", sender);
        return;
    }

    auto const reply = _ctcp.reply(*payload);
    if (!reply)
    {
        log::debug("No reply for CTCP {} from {}", payload->tag, sender);
        return;
    }

    log::info("CTCP {} from {}", payload->tag, sender);
    if (auto result = send(irc::makeNotice(sender, ctcp::wrap(*reply))); !result)
        log::warning("Failed to answer CTCP {}: {}", payload->tag, result.error().message);
}

void LineDispatcher::handleNotice(const irc::Message& message)
{
    if (message.argumentCount() < 2)
    {
        log::debug("Dropping malformed NOTICE");
        return;
    }

    auto const sender = std::string(irc::nickFromPrefix(message.prefix));
    auto const target = std::string(*message.argument(0));
    auto const body = *message.lastArgument();

    // CTCP replies arrive as notices; they are shown but never answered.
    if (auto const payload = ctcp::parse(body); payload)
    {
        auto text = payload->argument ? std::format("{} {}", payload->tag, *payload->argument) : payload->tag;
        show(DisplayKind::CtcpReply, target, sender, std::move(text));
        return;
    }

    show(DisplayKind::Notice, target, sender, std::string(body));
}

void LineDispatcher::handleNick(const irc::Message& message)
{
    auto const newNick = message.lastArgument();
    if (message.prefix.empty() || !newNick)
    {
        log::debug("Dropping malformed NICK");
        return;
    }

    // Only the confirmed handle identifies us; an unconfirmed /nick does not.
    auto const oldNick = irc::nickFromPrefix(message.prefix);
    if (irc::iequals(oldNick, _session.confirmedHandle()))
    {
        _session.setHandle(std::string(*newNick));
        show(DisplayKind::Status, {}, {}, std::format("You are now known as {}", *newNick));
        return;
    }

    show(DisplayKind::Info, {}, std::string(oldNick), std::format("{} is now known as {}", oldNick, *newNick));
}

void LineDispatcher::handleNicknameInUse(const irc::Message& message)
{
    auto const nick = message.argument(1).value_or("?");
    if (auto const dropped = _session.revertHandle(); dropped)
        log::info("Nickname {} refused, back to {}", *dropped, _session.handle());

    show(DisplayKind::Error, {}, {}, std::format("Nickname {} is already in use", nick));
}

void LineDispatcher::show(DisplayKind kind, std::string target, std::string sender, std::string text) const
{
    if (!_display)
        return;

    _display(DisplayEvent {
        .kind = kind,
        .target = std::move(target),
        .sender = std::move(sender),
        .text = std::move(text),
    });
}

} // namespace tinyirc
