// SPDX-License-Identifier: Apache-2.0
#include "ReconnectSupervisor.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace tinyirc
{

struct ReconnectSupervisor::Impl
{
    std::chrono::milliseconds delay;

    std::jthread worker;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    Attempt pending;
    std::chrono::steady_clock::time_point deadline;
    std::size_t started = 0;
    bool shutdownRequested = false;

    /// @brief Worker thread function that waits for and runs armed attempts.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto attempt = Attempt {};
            {
                auto lock = std::unique_lock(mutex);
                cv.wait(lock, stopToken, [this] { return pending != nullptr || shutdownRequested; });
                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                // Sleep out the delay unless the attempt is cancelled or replaced meanwhile.
                auto const armedDeadline = deadline;
                auto const cancelled = cv.wait_until(lock, stopToken, armedDeadline, [this, armedDeadline] {
                    return pending == nullptr || deadline != armedDeadline || shutdownRequested;
                });
                if (stopToken.stop_requested() || shutdownRequested)
                    return;
                if (cancelled)
                    continue;

                attempt = std::move(pending);
                pending = nullptr;
                ++started;
            }

            log::debug("Running reconnect attempt");
            attempt();
        }
    }
};

ReconnectSupervisor::ReconnectSupervisor(std::chrono::milliseconds delay): _impl(std::make_unique<Impl>())
{
    _impl->delay = delay;
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

ReconnectSupervisor::~ReconnectSupervisor()
{
    shutdown();
}

auto ReconnectSupervisor::schedule(Attempt attempt) -> bool
{
    auto const lock = std::lock_guard(_impl->mutex);
    if (_impl->shutdownRequested || _impl->pending)
        return false;

    _impl->pending = std::move(attempt);
    _impl->deadline = std::chrono::steady_clock::now() + _impl->delay;
    _impl->cv.notify_all();
    log::debug("Reconnect scheduled in {}ms", _impl->delay.count());
    return true;
}

auto ReconnectSupervisor::cancel() -> bool
{
    auto const lock = std::lock_guard(_impl->mutex);
    if (!_impl->pending)
        return false;

    _impl->pending = nullptr;
    _impl->cv.notify_all();
    log::debug("Pending reconnect cancelled");
    return true;
}

auto ReconnectSupervisor::isPending() const -> bool
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->pending != nullptr;
}

auto ReconnectSupervisor::attemptsStarted() const -> std::size_t
{
    auto const lock = std::lock_guard(_impl->mutex);
    return _impl->started;
}

auto ReconnectSupervisor::delay() const -> std::chrono::milliseconds
{
    return _impl->delay;
}

void ReconnectSupervisor::shutdown()
{
    {
        auto const lock = std::lock_guard(_impl->mutex);
        _impl->shutdownRequested = true;
        _impl->pending = nullptr;
    }
    _impl->cv.notify_all();

    if (_impl->worker.joinable())
    {
        _impl->worker.request_stop();
        _impl->worker.join();
    }
}

} // namespace tinyirc
