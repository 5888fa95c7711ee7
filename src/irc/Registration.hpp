// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <irc/Display.hpp>
#include <irc/Session.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string_view>

namespace tinyirc
{

/// @brief Drives the NICK/USER handshake and recognizes the server's welcome.
class Registrar
{
  public:
    /// @param session The shared session state.
    /// @param gracePeriod Optional wait before the announcement. Zero disables it.
    explicit Registrar(Session& session, std::chrono::milliseconds gracePeriod = std::chrono::milliseconds { 0 });

    /// @brief Announces our identity on a freshly established connection.
    ///
    /// The grace period ends early once shutdown is requested or @p epoch is no
    /// longer current; nothing is sent then.
    /// @param epoch The epoch that was just established.
    /// @param send The send path of the new epoch.
    /// @return Success, the first send error, or a TransportError if abandoned.
    [[nodiscard]] auto announce(EpochId epoch, const LineSender& send) const -> VoidResult;

    /// @brief Wakes an announcement waiting out its grace period so it rechecks the session.
    void interrupt() const;

    /// @brief Handles a welcome (001) reply.
    ///
    /// Registers @p epoch if @p target matches our current or confirmed handle,
    /// then joins the current channel, if any. Repeated welcomes within one epoch are ignored.
    /// @return True if this call completed registration.
    auto acknowledge(EpochId epoch, std::string_view target, const LineSender& send) const -> bool;

  private:
    Session& _session;
    std::chrono::milliseconds _gracePeriod;
    mutable std::mutex _waitMutex;
    mutable std::condition_variable _wakeup;
};

} // namespace tinyirc
