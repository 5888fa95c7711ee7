// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <core/Log.hpp>
#include <irc/IrcClient.hpp>

#include <cstdio>
#include <format>
#include <istream>
#include <mutex>
#include <print>
#include <string>
#include <string_view>

namespace tinyirc
{

auto formatDisplayEvent(const DisplayEvent& event) -> std::string
{
    switch (event.kind)
    {
        case DisplayKind::Status: return std::format("*** {}", event.text);
        case DisplayKind::PrivateMessage: return std::format("[PM] <{}> {}", event.sender, event.text);
        case DisplayKind::ChannelMessage: return std::format("[{}] <{}> {}", event.target, event.sender, event.text);
        case DisplayKind::Notice:
            if (event.sender.empty())
                return std::format("-!- {}", event.text);
            return std::format("-{}- {}", event.sender, event.text);
        case DisplayKind::CtcpReply: return std::format("[CTCP {}] {}", event.sender, event.text);
        case DisplayKind::Outgoing: return std::format("[to {}] {}", event.target, event.text);
        case DisplayKind::ServerLine: return std::format("< {}", event.text);
        case DisplayKind::Info: return event.text;
        case DisplayKind::Error: return std::format("! {}", event.text);
    }
    return event.text;
}

struct App::Impl
{
    AppConfig config;
    std::mutex consoleMutex;
    std::unique_ptr<IrcClient> client;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    void print(const DisplayEvent& event)
    {
        auto const line = formatDisplayEvent(event);
        auto const lock = std::lock_guard(consoleMutex);
        std::println("{}", line);
        std::fflush(stdout);
    }

    /// @brief Writes a log line to stderr without tearing a display line on stdout.
    void printLog(log::Level level, std::string_view message)
    {
        auto const lock = std::lock_guard(consoleMutex);
        std::println(stderr, "[{}] {}", levelName(level), message);
    }

    static auto levelName(log::Level level) -> std::string_view
    {
        switch (level)
        {
            case log::Level::Error: return "error";
            case log::Level::Warning: return "warn";
            case log::Level::Info: return "info";
            case log::Level::Debug: return "debug";
            case log::Level::Trace: return "trace";
        }
        return "?";
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    if (_impl->client)
    {
        _impl->client.reset();
        log::setCallback({});
    }
}

auto App::initialize() -> VoidResult
{
    auto validated = validateConfig(_impl->config);
    if (!validated)
        return validated;

    if (auto const level = log::levelFromString(_impl->config.logLevel); level)
        log::setLevel(*level);

    log::setCallback([this](log::Level level, std::string_view message) { _impl->printLog(level, message); });
    _impl->client = std::make_unique<IrcClient>(toClientOptions(_impl->config),
                                                [this](const DisplayEvent& event) { _impl->print(event); });
    return _impl->client->start();
}

auto App::run(std::istream& input) -> int
{
    if (!_impl->client)
    {
        log::error("App::run() called before initialize()");
        return 1;
    }

    auto line = std::string {};
    while (std::getline(input, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (_impl->client->handleInput(line) == CommandOutcome::Quit)
            return 0;
    }

    log::debug("End of input, quitting");
    _impl->client->handleInput(std::format("{}quit", CommandMarker));
    return 0;
}

} // namespace tinyirc
