// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <irc/Display.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tinyirc::test
{

/// @brief Polls @p predicate until it holds or @p timeout expires.
template <typename Predicate>
auto waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds { 2 }) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds { 5 });
    }
    return predicate();
}

/// @brief Records sent lines; hands out a LineSender that appends to it.
class SentLines
{
  public:
    [[nodiscard]] auto sender() -> LineSender
    {
        return [this](std::string_view line) -> VoidResult {
            auto const lock = std::lock_guard(_mutex);
            if (_failing)
                return makeError(ErrorCode::TransportError, "Transport not connected");
            _lines.emplace_back(line);
            return {};
        };
    }

    void setFailing(bool failing)
    {
        auto const lock = std::lock_guard(_mutex);
        _failing = failing;
    }

    [[nodiscard]] auto lines() const -> std::vector<std::string>
    {
        auto const lock = std::lock_guard(_mutex);
        return _lines;
    }

    [[nodiscard]] auto count(std::string_view line) const -> std::size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return static_cast<std::size_t>(std::ranges::count(_lines, line));
    }

    void clear()
    {
        auto const lock = std::lock_guard(_mutex);
        _lines.clear();
    }

  private:
    mutable std::mutex _mutex;
    std::vector<std::string> _lines;
    bool _failing = false;
};

/// @brief Records display events; hands out a DisplayCallback that appends to it.
class EventLog
{
  public:
    [[nodiscard]] auto callback() -> DisplayCallback
    {
        return [this](const DisplayEvent& event) {
            auto const lock = std::lock_guard(_mutex);
            _events.push_back(event);
        };
    }

    [[nodiscard]] auto events() const -> std::vector<DisplayEvent>
    {
        auto const lock = std::lock_guard(_mutex);
        return _events;
    }

    [[nodiscard]] auto countOf(DisplayKind kind) const -> std::size_t
    {
        auto const lock = std::lock_guard(_mutex);
        return static_cast<std::size_t>(
            std::ranges::count_if(_events, [kind](const DisplayEvent& e) { return e.kind == kind; }));
    }

    [[nodiscard]] auto contains(DisplayKind kind, std::string_view text) const -> bool
    {
        auto const lock = std::lock_guard(_mutex);
        return std::ranges::any_of(_events, [&](const DisplayEvent& e) {
            return e.kind == kind && e.text.find(text) != std::string::npos;
        });
    }

    void clear()
    {
        auto const lock = std::lock_guard(_mutex);
        _events.clear();
    }

  private:
    mutable std::mutex _mutex;
    std::vector<DisplayEvent> _events;
};

} // namespace tinyirc::test
