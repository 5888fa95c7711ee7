// SPDX-License-Identifier: Apache-2.0
#include "Ctcp.hpp"

#include <irc/Message.hpp>

#include <array>
#include <ctime>
#include <format>

namespace tinyirc
{

namespace ctcp
{

    auto isCtcp(std::string_view body) -> bool
    {
        return body.size() >= 2 && body.front() == Delimiter && body.back() == Delimiter;
    }

    auto parse(std::string_view body) -> std::optional<CtcpPayload>
    {
        if (!isCtcp(body))
            return std::nullopt;

        auto const inner = body.substr(1, body.size() - 2);
        auto const space = inner.find(' ');
        auto payload = CtcpPayload { .tag = irc::toUpper(inner.substr(0, space)), .argument = std::nullopt };
        if (payload.tag.empty())
            return std::nullopt;

        if (space != std::string_view::npos)
        {
            auto argument = inner.substr(space + 1);
            auto const first = argument.find_first_not_of(' ');
            if (first != std::string_view::npos)
                payload.argument = std::string(argument.substr(first));
        }
        return payload;
    }

    auto wrap(std::string_view payload) -> std::string
    {
        return std::format("{}{}{}", Delimiter, payload, Delimiter);
    }

    auto encode(std::string_view tag, std::optional<std::string_view> argument) -> std::string
    {
        if (!argument || argument->empty())
            return wrap(irc::toUpper(tag));
        return wrap(std::format("{} {}", irc::toUpper(tag), *argument));
    }

    auto formatLocalTime(std::chrono::system_clock::time_point when) -> std::string
    {
        auto const seconds = std::chrono::system_clock::to_time_t(when);
        auto local = std::tm {};
        localtime_r(&seconds, &local);

        auto buffer = std::array<char, 64> {};
        auto const length = std::strftime(buffer.data(), buffer.size(), "%a %b %d %H:%M:%S %Y", &local);
        return std::string(buffer.data(), length);
    }

} // namespace ctcp

CtcpResponder::CtcpResponder(CtcpConfig config, Clock clock):
    _config(std::move(config)), _clock(std::move(clock))
{
}

auto CtcpResponder::reply(const CtcpPayload& request) const -> std::optional<std::string>
{
    if (request.tag == "VERSION")
        return std::format("VERSION {}", _config.version);

    if (request.tag == "PING")
    {
        if (!request.argument)
            return std::nullopt;
        return std::format("PING {}", *request.argument);
    }

    if (request.tag == "TIME")
        return std::format("TIME {}", ctcp::formatLocalTime(_clock()));

    if (request.tag == "FINGER")
        return std::format("FINGER {}", _config.finger);

    if (request.tag == "CLIENTINFO")
        return std::format("CLIENTINFO {}", supportedTags());

    return std::nullopt;
}

auto CtcpResponder::supportedTags() -> std::string_view
{
    return "VERSION PING TIME FINGER CLIENTINFO";
}

} // namespace tinyirc
