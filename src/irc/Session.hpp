// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief Identifies one lifetime of a transport connection.
///
/// Zero means "no connection has been established yet".
using EpochId = std::uint64_t;

/// @brief Consistent copy of the session state, taken under a single lock.
struct SessionSnapshot
{
    std::string serverHost;
    std::uint16_t serverPort = 0;
    std::string handle;
    std::string displayName;
    std::optional<std::string> currentChannel;
    std::optional<std::string> currentPeer;
    bool connected = false;
    bool registered = false;
    bool away = false;
    bool shutdownRequested = false;
    EpochId epoch = 0;
    std::optional<std::chrono::steady_clock::time_point> lastKeepaliveAt;
};

/// @brief State shared by the reader, keepalive, reconnect and input loops.
///
/// Every accessor takes the session mutex, so no caller ever observes a torn
/// update of the target or the lifecycle flags.
class Session
{
  public:
    Session(std::string serverHost,
            std::uint16_t serverPort,
            std::string handle,
            std::string displayName,
            std::optional<std::string> initialChannel = std::nullopt);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] auto serverHost() const -> const std::string& { return _serverHost; }
    [[nodiscard]] auto serverPort() const -> std::uint16_t { return _serverPort; }
    [[nodiscard]] auto displayName() const -> const std::string& { return _displayName; }

    /// @brief Our nickname, including a /nick change the server has not confirmed yet.
    [[nodiscard]] auto handle() const -> std::string;

    /// @brief Adopts @p handle as confirmed by the server.
    void setHandle(std::string handle);

    /// @brief The last nickname the server has confirmed for us.
    [[nodiscard]] auto confirmedHandle() const -> std::string;

    /// @brief Switches the handle to @p handle ahead of the server's confirmation.
    void requestHandle(std::string handle);

    /// @brief Falls back to the confirmed handle, e.g. after the server refused a change.
    /// @return The dropped unconfirmed handle, if there was one.
    auto revertHandle() -> std::optional<std::string>;

    /// @brief Returns true if @p nick is our handle or our confirmed handle (ASCII case-insensitive).
    [[nodiscard]] auto isOwnNick(std::string_view nick) const -> bool;

    [[nodiscard]] auto currentChannel() const -> std::optional<std::string>;
    [[nodiscard]] auto currentPeer() const -> std::optional<std::string>;

    /// @brief Makes @p channel the active target and clears the peer.
    void setChannel(std::string channel);

    /// @brief Makes @p peer the active target and clears the channel.
    void setPeer(std::string peer);

    void clearChannel();

    /// @brief The peer if set, otherwise the channel.
    [[nodiscard]] auto activeTarget() const -> std::optional<std::string>;

    /// @brief Starts a new connection epoch: connected, not yet registered.
    /// @return The id of the new epoch.
    [[nodiscard]] auto beginEpoch() -> EpochId;

    /// @brief Ends @p epoch if it is the current connected epoch.
    /// @return True if the epoch was current and is now ended.
    auto endEpoch(EpochId epoch) -> bool;

    /// @brief Returns true if @p epoch is current and still connected.
    [[nodiscard]] auto isCurrentEpoch(EpochId epoch) const -> bool;

    [[nodiscard]] auto epoch() const -> EpochId;

    /// @brief Marks @p epoch as registered.
    /// @return False if the epoch is stale or already registered.
    auto markRegistered(EpochId epoch) -> bool;

    [[nodiscard]] auto isConnected() const -> bool;
    [[nodiscard]] auto isRegistered() const -> bool;

    void requestShutdown();
    [[nodiscard]] auto shutdownRequested() const -> bool;

    void setAway(bool away);
    [[nodiscard]] auto isAway() const -> bool;

    void recordKeepalive(std::chrono::steady_clock::time_point when = std::chrono::steady_clock::now());
    [[nodiscard]] auto lastKeepaliveAt() const -> std::optional<std::chrono::steady_clock::time_point>;

    [[nodiscard]] auto snapshot() const -> SessionSnapshot;

  private:
    std::string const _serverHost;
    std::uint16_t const _serverPort;
    std::string const _displayName;

    mutable std::mutex _mutex;
    std::string _handle;
    std::string _confirmedHandle;
    std::optional<std::string> _currentChannel;
    std::optional<std::string> _currentPeer;
    EpochId _epoch = 0;
    bool _connected = false;
    bool _registered = false;
    bool _shutdownRequested = false;
    bool _away = false;
    std::optional<std::chrono::steady_clock::time_point> _lastKeepaliveAt;
};

} // namespace tinyirc
