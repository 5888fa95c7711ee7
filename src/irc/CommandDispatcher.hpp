// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <irc/Display.hpp>
#include <irc/Session.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief Whether the input loop should continue after a command.
enum class CommandOutcome
{
    Continue,
    Quit,
};

/// @brief A command line split into its lower-cased name and the unparsed remainder.
struct ParsedCommand
{
    std::string name;
    std::string arguments;
};

/// @brief Texts used by commands whose argument is optional.
struct CommandOptions
{
    std::string quitMessage = "Bye";
    std::string awayMessage = "Away";
};

/// @brief Character that introduces a command in operator input.
constexpr auto CommandMarker = '/';

/// @brief Turns operator input into protocol actions.
///
/// Input starting with the command marker is a command; anything else is sent
/// as a message to the active target. Operator mistakes are reported through
/// the display callback and never reach the network.
class CommandDispatcher
{
  public:
    CommandDispatcher(Session& session, LineSender send, DisplayCallback display, CommandOptions options = {});

    /// @brief Executes one line of operator input.
    /// @return CommandOutcome::Quit after the quit command, otherwise Continue.
    auto execute(std::string_view input) -> CommandOutcome;

    /// @brief Splits a command line ("/join #chan") into name and arguments.
    /// @return The parsed command, or std::nullopt if @p input is not a command.
    [[nodiscard]] static auto parseCommand(std::string_view input) -> std::optional<ParsedCommand>;

  private:
    Session& _session;
    LineSender _send;
    DisplayCallback _display;
    CommandOptions _options;

    [[nodiscard]] auto runCommand(const ParsedCommand& command, CommandOutcome& outcome) -> VoidResult;
    [[nodiscard]] auto sendText(std::string_view text) -> VoidResult;
    [[nodiscard]] auto sendMessage(std::string_view target, std::string_view text) -> VoidResult;
    [[nodiscard]] auto send(std::string_view line) -> VoidResult;

    [[nodiscard]] auto join(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto part() -> VoidResult;
    [[nodiscard]] auto msg(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto query(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto whois(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto nick(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto raw(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto away(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto back() -> VoidResult;
    [[nodiscard]] auto ctcpRequest(std::string_view arguments) -> VoidResult;
    [[nodiscard]] auto quit(std::string_view arguments) -> VoidResult;
    void status();

    void show(DisplayKind kind, std::string target, std::string text) const;
};

} // namespace tinyirc
