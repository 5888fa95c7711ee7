// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace tinyirc
{

/// @brief Runs at most one delayed reconnect attempt at a time.
///
/// A single worker thread waits for an armed attempt, sleeps the configured
/// delay, and runs the attempt unless it was cancelled in the meantime. The
/// attempt itself may schedule the next one.
class ReconnectSupervisor
{
  public:
    using Attempt = std::function<void()>;

    explicit ReconnectSupervisor(std::chrono::milliseconds delay);
    ~ReconnectSupervisor();

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    /// @brief Arms a reconnect attempt to run after the delay.
    /// @return False if an attempt is already pending or the supervisor is shut down.
    auto schedule(Attempt attempt) -> bool;

    /// @brief Disarms the pending attempt, if any.
    /// @return True if an attempt was pending and will not run.
    auto cancel() -> bool;

    /// @brief Returns true while an attempt is armed and waiting for its delay.
    [[nodiscard]] auto isPending() const -> bool;

    /// @brief Number of attempts that have been started.
    [[nodiscard]] auto attemptsStarted() const -> std::size_t;

    [[nodiscard]] auto delay() const -> std::chrono::milliseconds;

    /// @brief Cancels any pending attempt and joins the worker thread.
    ///
    /// Waits for an attempt that is already running. Must not be called from an attempt.
    void shutdown();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace tinyirc
