// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <irc/Display.hpp>
#include <tinyirc/Config.hpp>

#include <iosfwd>
#include <memory>
#include <string>

namespace tinyirc
{

/// @brief Renders a display event as one console line.
[[nodiscard]] auto formatDisplayEvent(const DisplayEvent& event) -> std::string;

/// @brief Console front end: wires the client to stdin/stdout.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Validates the configuration and starts the connection.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Reads operator input until quit or end of input.
    /// @param input The stream to read commands from.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tinyirc
