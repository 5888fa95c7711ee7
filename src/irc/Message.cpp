// SPDX-License-Identifier: Apache-2.0
#include "Message.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace tinyirc::irc
{

namespace
{

    auto skipSpaces(std::string_view text, std::size_t pos) -> std::size_t
    {
        while (pos < text.size() && text[pos] == ' ')
            ++pos;
        return pos;
    }

    auto toLowerAscii(char ch) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

} // namespace

auto parseMessage(std::string_view line) -> Result<Message>
{
    auto message = Message {};
    auto pos = skipSpaces(line, 0);

    if (pos >= line.size())
        return makeError(ErrorCode::ProtocolError, "Empty line");

    if (line[pos] == ':')
    {
        auto const end = line.find(' ', pos);
        if (end == std::string_view::npos)
            return makeError(ErrorCode::ProtocolError, std::format("Line has no command: {}", line));
        message.prefix = std::string(line.substr(pos + 1, end - pos - 1));
        pos = skipSpaces(line, end);
    }

    auto const commandEnd = std::min(line.find(' ', pos), line.size());
    message.command = toUpper(line.substr(pos, commandEnd - pos));
    if (message.command.empty())
        return makeError(ErrorCode::ProtocolError, std::format("Line has no command: {}", line));

    pos = commandEnd;
    while (true)
    {
        pos = skipSpaces(line, pos);
        if (pos >= line.size())
            break;

        if (line[pos] == ':')
        {
            message.trailing = std::string(line.substr(pos + 1));
            break;
        }

        auto const end = std::min(line.find(' ', pos), line.size());
        message.params.emplace_back(line.substr(pos, end - pos));
        pos = end;
    }

    return message;
}

auto nickFromPrefix(std::string_view prefix) -> std::string_view
{
    return prefix.substr(0, prefix.find_first_of("!@"));
}

auto iequals(std::string_view a, std::string_view b) -> bool
{
    return std::ranges::equal(a, b, [](char x, char y) { return toLowerAscii(x) == toLowerAscii(y); });
}

auto toUpper(std::string_view text) -> std::string
{
    auto result = std::string(text);
    std::ranges::transform(
        result, result.begin(), [](char ch) { return static_cast<char>(std::toupper(static_cast<unsigned char>(ch))); });
    return result;
}

auto isChannelName(std::string_view target) -> bool
{
    return !target.empty() && std::string_view("#&+!").find(target.front()) != std::string_view::npos;
}

auto makeNick(std::string_view nick) -> std::string
{
    return std::format("NICK {}", nick);
}

auto makeUser(std::string_view user, std::string_view realName) -> std::string
{
    return std::format("USER {} 0 * :{}", user, realName);
}

auto makeJoin(std::string_view channel) -> std::string
{
    return std::format("JOIN {}", channel);
}

auto makePart(std::string_view channel) -> std::string
{
    return std::format("PART {}", channel);
}

auto makePrivmsg(std::string_view target, std::string_view text) -> std::string
{
    return std::format("PRIVMSG {} :{}", target, text);
}

auto makeNotice(std::string_view target, std::string_view text) -> std::string
{
    return std::format("NOTICE {} :{}", target, text);
}

auto makePing(std::string_view token) -> std::string
{
    return std::format("PING {}", token);
}

auto makePong(std::string_view argument) -> std::string
{
    return std::format("PONG :{}", argument);
}

auto makeWhois(std::string_view nick) -> std::string
{
    return std::format("WHOIS {}", nick);
}

auto makeAway(std::optional<std::string_view> text) -> std::string
{
    if (!text)
        return "AWAY";
    return std::format("AWAY :{}", *text);
}

auto makeQuit(std::string_view text) -> std::string
{
    return std::format("QUIT :{}", text);
}

auto makeVersion() -> std::string
{
    return "VERSION";
}

} // namespace tinyirc::irc
