// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief What a display event represents, so the console can style it.
enum class DisplayKind
{
    Status,         ///< Connection lifecycle: connecting, connected, registered, lost, reconnecting.
    PrivateMessage, ///< PRIVMSG addressed to our handle.
    ChannelMessage, ///< PRIVMSG addressed to a channel (or any other target).
    Notice,
    CtcpReply,  ///< CTCP reply received from another client.
    Outgoing,   ///< Echo of a message we sent.
    ServerLine, ///< Any other server line, shown verbatim.
    Info,       ///< Local information, e.g. the /status report.
    Error,      ///< Operator mistakes and failed sends.
};

/// @brief One user-visible event produced by the client.
struct DisplayEvent
{
    DisplayKind kind = DisplayKind::Info;
    std::string target;
    std::string sender;
    std::string text;
};

/// @brief Receives display events. May be invoked from the reader, supervisor or input thread.
using DisplayCallback = std::function<void(const DisplayEvent& event)>;

/// @brief Sends one protocol line through the guarded send path.
using LineSender = std::function<VoidResult(std::string_view line)>;

} // namespace tinyirc
