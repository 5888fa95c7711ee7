// SPDX-License-Identifier: Apache-2.0
#include "KeepaliveMonitor.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace tinyirc
{

struct KeepaliveMonitor::Impl
{
    std::chrono::milliseconds interval;
    Probe probe;

    std::jthread worker;
    std::mutex mutex;
    std::condition_variable_any cv;

    /// @brief Worker thread function: sleeps one interval, probes, repeats.
    /// @param stopToken The stop token for cooperative cancellation.
    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            {
                auto lock = std::unique_lock(mutex);
                cv.wait_for(lock, stopToken, interval, [] { return false; });
            }

            if (stopToken.stop_requested())
                return;

            probe();
        }
    }
};

KeepaliveMonitor::KeepaliveMonitor(std::chrono::milliseconds interval, Probe probe):
    _impl(std::make_unique<Impl>())
{
    _impl->interval = interval;
    _impl->probe = std::move(probe);
}

KeepaliveMonitor::~KeepaliveMonitor()
{
    stop();
}

void KeepaliveMonitor::start()
{
    if (_impl->worker.joinable())
        return;

    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
    log::debug("Keepalive monitor started ({}ms interval)", _impl->interval.count());
}

void KeepaliveMonitor::stop()
{
    if (!_impl->worker.joinable())
        return;

    _impl->worker.request_stop();
    _impl->worker.join();
    log::debug("Keepalive monitor stopped");
}

auto KeepaliveMonitor::isRunning() const -> bool
{
    return _impl->worker.joinable();
}

} // namespace tinyirc
