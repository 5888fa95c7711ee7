// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <tinyirc/App.hpp>
#include <tinyirc/Config.hpp>

#include <CLI/CLI.hpp>

#include <iostream>

int main(int argc, char** argv)
{
    auto app = CLI::App { "tinyirc - a small terminal IRC client" };

    auto server = std::string {};
    auto port = 0;
    auto nick = std::string {};
    auto realName = std::string {};
    auto channel = std::string {};
    auto configPath = std::string {};
    auto verbose = 0;

    app.add_option("server", server, "IRC server host name");
    app.add_option("port", port, "IRC server port")->check(CLI::Range(1, 65535));
    app.add_option("nick", nick, "Nickname");
    app.add_option("realname", realName, "Real name sent during registration");
    app.add_option("channel", channel, "Channel to join after registration");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging (repeat for wire trace)");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? tinyirc::loadConfig() : tinyirc::loadConfigFromFile(configPath);
    if (!configResult)
    {
        tinyirc::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!server.empty())
        config.server.host = server;
    if (port > 0)
        config.server.port = port;
    if (!nick.empty())
        config.identity.nick = nick;
    if (!realName.empty())
        config.identity.realName = realName;
    if (!channel.empty())
        config.identity.channel = channel;
    if (verbose == 1)
        config.logLevel = "debug";
    else if (verbose > 1)
        config.logLevel = "trace";

    auto application = tinyirc::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        tinyirc::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(std::cin);
}
