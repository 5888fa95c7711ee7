// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <irc/CommandDispatcher.hpp>
#include <irc/Ctcp.hpp>
#include <irc/IrcClient.hpp>

#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief Server section.
struct ServerConfig
{
    std::string host;
    int port = 6667;
};

/// @brief Identity section.
struct IdentityConfig
{
    std::string nick;
    std::string realName;

    /// @brief Channel joined after registration. Empty for none.
    std::string channel;
};

/// @brief Connection lifecycle section.
struct ConnectionConfig
{
    int keepaliveIntervalSec = 60;
    int reconnectDelaySec = 5;

    /// @brief Optional wait between connecting and sending NICK/USER.
    int registrationDelayMs = 0;

    std::string keepaliveToken = "keepalive";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    ServerConfig server;
    IdentityConfig identity;
    ConnectionConfig connection;
    CtcpConfig ctcp;
    CommandOptions messages;
    std::string logLevel = "info";
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; defaults are returned.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Checks that the configuration is complete enough to connect.
/// @return Success or a ConfigError naming the first offending field.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Converts a validated configuration into client options.
[[nodiscard]] auto toClientOptions(const AppConfig& config) -> ClientOptions;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace tinyirc
