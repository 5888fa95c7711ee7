// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace tinyirc
{

/// @brief Invokes a probe callback at a fixed interval on a background thread.
///
/// One monitor is created per connection epoch. The callback decides whether a
/// probe is actually sent (registered, epoch still current), so the monitor
/// itself only keeps time. Stopping is cooperative and joins the thread.
class KeepaliveMonitor
{
  public:
    using Probe = std::function<void()>;

    KeepaliveMonitor(std::chrono::milliseconds interval, Probe probe);
    ~KeepaliveMonitor();

    KeepaliveMonitor(const KeepaliveMonitor&) = delete;
    KeepaliveMonitor& operator=(const KeepaliveMonitor&) = delete;

    /// @brief Starts waiting for the first tick. Has no effect if already running.
    void start();

    /// @brief Stops the timer and joins the thread. Must not be called from the probe.
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace tinyirc
