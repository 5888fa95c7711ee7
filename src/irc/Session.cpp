// SPDX-License-Identifier: Apache-2.0
#include "Session.hpp"

#include <irc/Message.hpp>

#include <utility>

namespace tinyirc
{

Session::Session(std::string serverHost,
                 std::uint16_t serverPort,
                 std::string handle,
                 std::string displayName,
                 std::optional<std::string> initialChannel):
    _serverHost(std::move(serverHost)),
    _serverPort(serverPort),
    _displayName(std::move(displayName)),
    _handle(handle),
    _confirmedHandle(std::move(handle)),
    _currentChannel(std::move(initialChannel))
{
}

auto Session::handle() const -> std::string
{
    auto const lock = std::lock_guard(_mutex);
    return _handle;
}

void Session::setHandle(std::string handle)
{
    auto const lock = std::lock_guard(_mutex);
    _confirmedHandle = handle;
    _handle = std::move(handle);
}

auto Session::confirmedHandle() const -> std::string
{
    auto const lock = std::lock_guard(_mutex);
    return _confirmedHandle;
}

void Session::requestHandle(std::string handle)
{
    auto const lock = std::lock_guard(_mutex);
    _handle = std::move(handle);
}

auto Session::revertHandle() -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    if (_handle == _confirmedHandle)
        return std::nullopt;
    return std::exchange(_handle, _confirmedHandle);
}

auto Session::isOwnNick(std::string_view nick) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return irc::iequals(nick, _handle) || irc::iequals(nick, _confirmedHandle);
}

auto Session::currentChannel() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    return _currentChannel;
}

auto Session::currentPeer() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    return _currentPeer;
}

void Session::setChannel(std::string channel)
{
    auto const lock = std::lock_guard(_mutex);
    _currentChannel = std::move(channel);
    _currentPeer.reset();
}

void Session::setPeer(std::string peer)
{
    auto const lock = std::lock_guard(_mutex);
    _currentPeer = std::move(peer);
    _currentChannel.reset();
}

void Session::clearChannel()
{
    auto const lock = std::lock_guard(_mutex);
    _currentChannel.reset();
}

auto Session::activeTarget() const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    if (_currentPeer)
        return _currentPeer;
    return _currentChannel;
}

auto Session::beginEpoch() -> EpochId
{
    auto const lock = std::lock_guard(_mutex);
    ++_epoch;
    _connected = true;
    _registered = false;
    _away = false;
    return _epoch;
}

auto Session::endEpoch(EpochId epoch) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (epoch != _epoch || !_connected)
        return false;
    _connected = false;
    _registered = false;
    return true;
}

auto Session::isCurrentEpoch(EpochId epoch) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return epoch == _epoch && _connected;
}

auto Session::epoch() const -> EpochId
{
    auto const lock = std::lock_guard(_mutex);
    return _epoch;
}

auto Session::markRegistered(EpochId epoch) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    if (epoch != _epoch || !_connected || _registered)
        return false;
    _registered = true;
    return true;
}

auto Session::isConnected() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _connected;
}

auto Session::isRegistered() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _registered;
}

void Session::requestShutdown()
{
    auto const lock = std::lock_guard(_mutex);
    _shutdownRequested = true;
}

auto Session::shutdownRequested() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _shutdownRequested;
}

void Session::setAway(bool away)
{
    auto const lock = std::lock_guard(_mutex);
    _away = away;
}

auto Session::isAway() const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return _away;
}

void Session::recordKeepalive(std::chrono::steady_clock::time_point when)
{
    auto const lock = std::lock_guard(_mutex);
    _lastKeepaliveAt = when;
}

auto Session::lastKeepaliveAt() const -> std::optional<std::chrono::steady_clock::time_point>
{
    auto const lock = std::lock_guard(_mutex);
    return _lastKeepaliveAt;
}

auto Session::snapshot() const -> SessionSnapshot
{
    auto const lock = std::lock_guard(_mutex);
    return SessionSnapshot {
        .serverHost = _serverHost,
        .serverPort = _serverPort,
        .handle = _handle,
        .displayName = _displayName,
        .currentChannel = _currentChannel,
        .currentPeer = _currentPeer,
        .connected = _connected,
        .registered = _registered,
        .away = _away,
        .shutdownRequested = _shutdownRequested,
        .epoch = _epoch,
        .lastKeepaliveAt = _lastKeepaliveAt,
    };
}

} // namespace tinyirc
