// SPDX-License-Identifier: Apache-2.0
#include "CommandDispatcher.hpp"

#include <core/Log.hpp>
#include <irc/Ctcp.hpp>
#include <irc/Message.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <utility>

namespace tinyirc
{

namespace
{

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    /// @brief Splits off the first word: "bob hello there" -> {"bob", "hello there"}.
    ///
    /// Only the single separator after the word is consumed; the remainder is kept verbatim.
    auto splitWord(std::string_view text) -> std::pair<std::string_view, std::string_view>
    {
        auto const first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos)
            return {};
        text.remove_prefix(first);

        auto const separator = text.find_first_of(" \t");
        if (separator == std::string_view::npos)
            return { text, {} };
        return { text.substr(0, separator), text.substr(separator + 1) };
    }

    auto usage(std::string_view text) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::UserInputError, std::format("Usage: {}", text));
    }

    auto yesNo(bool value) -> std::string_view
    {
        return value ? "yes" : "no";
    }

} // namespace

CommandDispatcher::CommandDispatcher(Session& session,
                                     LineSender send,
                                     DisplayCallback display,
                                     CommandOptions options):
    _session(session), _send(std::move(send)), _display(std::move(display)), _options(std::move(options))
{
}

auto CommandDispatcher::parseCommand(std::string_view input) -> std::optional<ParsedCommand>
{
    if (input.empty() || input.front() != CommandMarker)
        return std::nullopt;

    auto const [name, arguments] = splitWord(input.substr(1));
    auto command = ParsedCommand { .name = std::string(name), .arguments = std::string(arguments) };
    std::ranges::transform(command.name, command.name.begin(), [](char ch) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    });
    return command;
}

auto CommandDispatcher::execute(std::string_view input) -> CommandOutcome
{
    if (trim(input).empty())
        return CommandOutcome::Continue;

    auto outcome = CommandOutcome::Continue;
    auto const command = parseCommand(input);
    auto const result = command ? runCommand(*command, outcome) : sendText(input);
    if (!result)
    {
        log::debug("Input rejected: {}", result.error());
        show(DisplayKind::Error, {}, result.error().message);
    }
    return outcome;
}

auto CommandDispatcher::runCommand(const ParsedCommand& command, CommandOutcome& outcome) -> VoidResult
{
    auto const& name = command.name;
    auto const& args = command.arguments;

    if (name == "join")
        return join(args);
    if (name == "part")
        return part();
    if (name == "msg")
        return msg(args);
    if (name == "query")
        return query(args);
    if (name == "whois")
        return whois(args);
    if (name == "nick")
        return nick(args);
    if (name == "raw")
        return raw(args);
    if (name == "away")
        return away(args);
    if (name == "back")
        return back();
    if (name == "version")
        return send(irc::makeVersion());
    if (name == "ctcp")
        return ctcpRequest(args);
    if (name == "status")
    {
        status();
        return {};
    }
    if (name == "quit")
    {
        outcome = CommandOutcome::Quit;
        return quit(args);
    }

    return makeError(ErrorCode::UserInputError, std::format("Unknown command: {}{}", CommandMarker, name));
}

auto CommandDispatcher::sendText(std::string_view text) -> VoidResult
{
    auto const target = _session.activeTarget();
    if (!target)
        return makeError(ErrorCode::UserInputError, "No active target.");
    return sendMessage(*target, text);
}

auto CommandDispatcher::sendMessage(std::string_view target, std::string_view text) -> VoidResult
{
    return send(irc::makePrivmsg(target, text)).and_then([&]() -> VoidResult {
        show(DisplayKind::Outgoing, std::string(target), std::string(text));
        return {};
    });
}

auto CommandDispatcher::send(std::string_view line) -> VoidResult
{
    auto result = _send(line);
    if (!result)
        return makeError(result.error().code, std::format("Send failed: {}", result.error().message));
    return {};
}

auto CommandDispatcher::join(std::string_view arguments) -> VoidResult
{
    auto const [channel, rest] = splitWord(arguments);
    if (channel.empty())
        return usage("/join <#channel>");

    _session.setChannel(std::string(channel));
    return send(irc::makeJoin(channel));
}

auto CommandDispatcher::part() -> VoidResult
{
    auto const channel = _session.currentChannel();
    if (!channel)
        return makeError(ErrorCode::UserInputError, "Not in a channel.");

    _session.clearChannel();
    return send(irc::makePart(*channel));
}

auto CommandDispatcher::msg(std::string_view arguments) -> VoidResult
{
    auto const [target, text] = splitWord(arguments);
    if (target.empty() || trim(text).empty())
        return usage("/msg <target> <message>");

    return sendMessage(target, text);
}

auto CommandDispatcher::query(std::string_view arguments) -> VoidResult
{
    auto const [peer, rest] = splitWord(arguments);
    if (peer.empty())
        return usage("/query <nick>");

    _session.setPeer(std::string(peer));
    show(DisplayKind::Info, std::string(peer), std::format("Private chat with {}", peer));
    return {};
}

auto CommandDispatcher::whois(std::string_view arguments) -> VoidResult
{
    auto const [target, rest] = splitWord(arguments);
    if (target.empty())
        return usage("/whois <nick>");

    return send(irc::makeWhois(target));
}

auto CommandDispatcher::nick(std::string_view arguments) -> VoidResult
{
    auto const [newNick, rest] = splitWord(arguments);
    if (newNick.empty())
        return usage("/nick <newnick>");

    // Adopted right away; the server's NICK echo confirms it, a 433 reverts it.
    _session.requestHandle(std::string(newNick));
    return send(irc::makeNick(newNick));
}

auto CommandDispatcher::raw(std::string_view arguments) -> VoidResult
{
    if (trim(arguments).empty())
        return usage("/raw <line>");

    return send(arguments);
}

auto CommandDispatcher::away(std::string_view arguments) -> VoidResult
{
    auto const reason = trim(arguments);
    auto const text = reason.empty() ? std::string_view(_options.awayMessage) : reason;
    return send(irc::makeAway(text)).and_then([this]() -> VoidResult {
        _session.setAway(true);
        return {};
    });
}

auto CommandDispatcher::back() -> VoidResult
{
    return send(irc::makeAway(std::nullopt)).and_then([this]() -> VoidResult {
        _session.setAway(false);
        return {};
    });
}

auto CommandDispatcher::ctcpRequest(std::string_view arguments) -> VoidResult
{
    auto const [target, request] = splitWord(arguments);
    auto const [tag, rest] = splitWord(request);
    if (target.empty() || tag.empty())
        return usage("/ctcp <nick> <tag> [argument]");

    auto const argument = trim(rest);
    auto const optionalArgument = argument.empty() ? std::nullopt : std::optional<std::string_view>(argument);
    return send(irc::makePrivmsg(target, ctcp::encode(tag, optionalArgument)));
}

auto CommandDispatcher::quit(std::string_view arguments) -> VoidResult
{
    _session.requestShutdown();

    auto const reason = trim(arguments);
    auto const text = reason.empty() ? std::string_view(_options.quitMessage) : reason;
    if (auto result = _send(irc::makeQuit(text)); !result)
        log::debug("QUIT not delivered: {}", result.error().message);
    return {};
}

void CommandDispatcher::status()
{
    auto const state = _session.snapshot();

    auto target = std::string("none");
    if (state.currentPeer)
        target = std::format("{} (query)", *state.currentPeer);
    else if (state.currentChannel)
        target = std::format("{} (channel)", *state.currentChannel);

    auto keepalive = std::string("never");
    if (state.lastKeepaliveAt)
    {
        auto const age = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now()
                                                                          - *state.lastKeepaliveAt);
        keepalive = std::format("{}s ago", age.count());
    }

    show(DisplayKind::Info,
         {},
         std::format("{} on {}:{} | connected: {} | registered: {} | away: {} | target: {} | keepalive: {}",
                     state.handle,
                     state.serverHost,
                     state.serverPort,
                     yesNo(state.connected),
                     yesNo(state.registered),
                     yesNo(state.away),
                     target,
                     keepalive));
}

void CommandDispatcher::show(DisplayKind kind, std::string target, std::string text) const
{
    if (!_display)
        return;

    _display(DisplayEvent {
        .kind = kind,
        .target = std::move(target),
        .sender = _session.handle(),
        .text = std::move(text),
    });
}

} // namespace tinyirc
