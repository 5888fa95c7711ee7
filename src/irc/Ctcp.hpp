// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief A CTCP request or reply carried inside a PRIVMSG/NOTICE body.
struct CtcpPayload
{
    std::string tag; ///< Upper-cased, e.g. "VERSION".
    std::optional<std::string> argument;
};

namespace ctcp
{

    /// @brief Byte that wraps a CTCP payload at both ends of a message body.
    constexpr auto Delimiter = '\x01';

    /// @brief Returns true if @p body is wrapped in CTCP delimiters.
    [[nodiscard]] auto isCtcp(std::string_view body) -> bool;

    /// @brief Decomposes a wrapped body into tag and optional argument.
    /// @return The payload, or std::nullopt if the body is not wrapped or has no tag.
    [[nodiscard]] auto parse(std::string_view body) -> std::optional<CtcpPayload>;

    /// @brief Wraps @p payload in CTCP delimiters.
    [[nodiscard]] auto wrap(std::string_view payload) -> std::string;

    /// @brief Builds a wrapped CTCP body from a tag and optional argument.
    [[nodiscard]] auto encode(std::string_view tag, std::optional<std::string_view> argument = std::nullopt)
        -> std::string;

    /// @brief Formats a point in time as local time, e.g. "Mon Oct 19 18:02:11 2026".
    [[nodiscard]] auto formatLocalTime(std::chrono::system_clock::time_point when) -> std::string;

} // namespace ctcp

/// @brief Static texts the responder reports about this client.
struct CtcpConfig
{
    std::string version = "tinyirc 1.8";
    std::string finger = "tinyirc terminal client";
};

/// @brief Produces scripted replies to CTCP queries.
class CtcpResponder
{
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit CtcpResponder(CtcpConfig config, Clock clock = std::chrono::system_clock::now);

    /// @brief Computes the reply for a query.
    /// @param request The decoded query.
    /// @return The unwrapped reply payload, or std::nullopt if the query gets no reply.
    [[nodiscard]] auto reply(const CtcpPayload& request) const -> std::optional<std::string>;

    /// @brief Space-separated list of the tags this responder answers.
    [[nodiscard]] static auto supportedTags() -> std::string_view;

  private:
    CtcpConfig _config;
    Clock _clock;
};

} // namespace tinyirc
