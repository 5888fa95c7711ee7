// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinyirc::irc
{

/// @brief A parsed inbound protocol line: `[:prefix] COMMAND params... [:trailing]`.
struct Message
{
    std::string prefix;
    std::string command; ///< Upper-cased command or three-digit numeric.
    std::vector<std::string> params;
    std::optional<std::string> trailing;

    /// @brief Number of arguments, counting the trailing parameter.
    [[nodiscard]] auto argumentCount() const -> std::size_t
    {
        return params.size() + (trailing ? 1 : 0);
    }

    /// @brief Returns the argument at @p index, where the trailing parameter follows the params.
    [[nodiscard]] auto argument(std::size_t index) const -> std::optional<std::string_view>
    {
        if (index < params.size())
            return params[index];
        if (index == params.size() && trailing)
            return *trailing;
        return std::nullopt;
    }

    /// @brief Returns the last argument (the trailing parameter if present).
    [[nodiscard]] auto lastArgument() const -> std::optional<std::string_view>
    {
        if (trailing)
            return *trailing;
        if (!params.empty())
            return params.back();
        return std::nullopt;
    }
};

/// @brief Parses a single protocol line (without its CRLF terminator).
/// @return The parsed message, or a ProtocolError for empty or prefix-only lines.
[[nodiscard]] auto parseMessage(std::string_view line) -> Result<Message>;

/// @brief Extracts the nickname from a `nick!user@host` prefix.
[[nodiscard]] auto nickFromPrefix(std::string_view prefix) -> std::string_view;

/// @brief Case-insensitive comparison of nicknames and channel names.
[[nodiscard]] auto iequals(std::string_view a, std::string_view b) -> bool;

/// @brief Returns an ASCII upper-cased copy of @p text.
[[nodiscard]] auto toUpper(std::string_view text) -> std::string;

/// @brief Returns true if @p target names a channel rather than a user.
[[nodiscard]] auto isChannelName(std::string_view target) -> bool;

/// @name Outbound command builders
/// @{
[[nodiscard]] auto makeNick(std::string_view nick) -> std::string;
[[nodiscard]] auto makeUser(std::string_view user, std::string_view realName) -> std::string;
[[nodiscard]] auto makeJoin(std::string_view channel) -> std::string;
[[nodiscard]] auto makePart(std::string_view channel) -> std::string;
[[nodiscard]] auto makePrivmsg(std::string_view target, std::string_view text) -> std::string;
[[nodiscard]] auto makeNotice(std::string_view target, std::string_view text) -> std::string;
[[nodiscard]] auto makePing(std::string_view token) -> std::string;
[[nodiscard]] auto makePong(std::string_view argument) -> std::string;
[[nodiscard]] auto makeWhois(std::string_view nick) -> std::string;
[[nodiscard]] auto makeAway(std::optional<std::string_view> text) -> std::string;
[[nodiscard]] auto makeQuit(std::string_view text) -> std::string;
[[nodiscard]] auto makeVersion() -> std::string;
/// @}

} // namespace tinyirc::irc
