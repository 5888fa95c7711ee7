// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <irc/Message.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace tinyirc
{

auto defaultConfigDir() -> std::string
{
#if defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/tinyirc";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/tinyirc";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/tinyirc";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file is not a JSON object: {}", path));

    auto config = AppConfig {};

    // Server section
    if (root.contains("server"))
    {
        auto const& server = root["server"];
        config.server.host = json::getStringOr(server, "host", "");
        config.server.port = json::getIntOr(server, "port", 6667);
    }

    // Identity section
    if (root.contains("identity"))
    {
        auto const& identity = root["identity"];
        config.identity.nick = json::getStringOr(identity, "nick", "");
        config.identity.realName = json::getStringOr(identity, "realName", "");
        config.identity.channel = json::getStringOr(identity, "channel", "");
    }

    // Connection section
    if (root.contains("connection"))
    {
        auto const& connection = root["connection"];
        config.connection.keepaliveIntervalSec = json::getIntOr(connection, "keepaliveIntervalSec", 60);
        config.connection.reconnectDelaySec = json::getIntOr(connection, "reconnectDelaySec", 5);
        config.connection.registrationDelayMs = json::getIntOr(connection, "registrationDelayMs", 0);
        config.connection.keepaliveToken = json::getStringOr(connection, "keepaliveToken", "keepalive");
    }

    // CTCP section
    if (root.contains("ctcp"))
    {
        auto const& ctcp = root["ctcp"];
        config.ctcp.version = json::getStringOr(ctcp, "version", config.ctcp.version);
        config.ctcp.finger = json::getStringOr(ctcp, "finger", config.ctcp.finger);
    }

    // Messages section
    if (root.contains("messages"))
    {
        auto const& messages = root["messages"];
        config.messages.quitMessage = json::getStringOr(messages, "quit", config.messages.quitMessage);
        config.messages.awayMessage = json::getStringOr(messages, "away", config.messages.awayMessage);
    }

    config.logLevel = json::getStringOr(root, "logLevel", "info");
    return config;
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    if (config.server.host.empty())
        return makeError(ErrorCode::ConfigError, "Server host must not be empty");
    if (config.server.port < 1 || config.server.port > 65535)
        return makeError(ErrorCode::ConfigError, std::format("Invalid port: {}", config.server.port));
    if (config.identity.nick.empty())
        return makeError(ErrorCode::ConfigError, "Nick must not be empty");
    if (config.identity.nick.find_first_of(" \r\n") != std::string::npos)
        return makeError(ErrorCode::ConfigError, std::format("Invalid nick: '{}'", config.identity.nick));
    if (config.identity.realName.empty())
        return makeError(ErrorCode::ConfigError, "Real name must not be empty");
    if (!config.identity.channel.empty() && !irc::isChannelName(config.identity.channel))
        return makeError(ErrorCode::ConfigError, std::format("Not a channel name: '{}'", config.identity.channel));
    if (config.connection.keepaliveIntervalSec <= 0)
        return makeError(ErrorCode::ConfigError, "connection.keepaliveIntervalSec must be positive");
    if (config.connection.reconnectDelaySec < 0)
        return makeError(ErrorCode::ConfigError, "connection.reconnectDelaySec must not be negative");
    if (config.connection.registrationDelayMs < 0)
        return makeError(ErrorCode::ConfigError, "connection.registrationDelayMs must not be negative");
    if (config.connection.keepaliveToken.empty()
        || config.connection.keepaliveToken.find_first_of(" \r\n") != std::string::npos)
        return makeError(ErrorCode::ConfigError, "connection.keepaliveToken must be a single word");
    if (!log::levelFromString(config.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", config.logLevel));
    return {};
}

auto toClientOptions(const AppConfig& config) -> ClientOptions
{
    return ClientOptions {
        .host = config.server.host,
        .port = static_cast<std::uint16_t>(config.server.port),
        .nick = config.identity.nick,
        .realName = config.identity.realName,
        .channel = config.identity.channel.empty() ? std::nullopt : std::optional(config.identity.channel),
        .keepaliveInterval = std::chrono::seconds { config.connection.keepaliveIntervalSec },
        .reconnectDelay = std::chrono::seconds { config.connection.reconnectDelaySec },
        .registrationDelay = std::chrono::milliseconds { config.connection.registrationDelayMs },
        .keepaliveToken = config.connection.keepaliveToken,
        .ctcp = config.ctcp,
        .commands = config.messages,
    };
}

} // namespace tinyirc
