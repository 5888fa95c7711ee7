// SPDX-License-Identifier: Apache-2.0
#include "Registration.hpp"

#include <core/Log.hpp>
#include <irc/Message.hpp>

#include <format>

namespace tinyirc
{

Registrar::Registrar(Session& session, std::chrono::milliseconds gracePeriod):
    _session(session), _gracePeriod(gracePeriod)
{
}

auto Registrar::announce(EpochId epoch, const LineSender& send) const -> VoidResult
{
    if (_gracePeriod.count() > 0)
    {
        log::debug("Waiting {}ms before registration", _gracePeriod.count());
        auto lock = std::unique_lock(_waitMutex);
        auto const abandoned = _wakeup.wait_for(lock, _gracePeriod, [&] {
            return _session.shutdownRequested() || !_session.isCurrentEpoch(epoch);
        });
        if (abandoned)
            return makeError(ErrorCode::TransportError,
                             std::format("Registration on connection {} abandoned", epoch));
    }

    auto const handle = _session.handle();
    log::info("Registering as {} ({})", handle, _session.displayName());

    return send(irc::makeNick(handle)).and_then([&]() {
        return send(irc::makeUser(handle, _session.displayName()));
    });
}

void Registrar::interrupt() const
{
    {
        auto const lock = std::lock_guard(_waitMutex);
    }
    _wakeup.notify_all();
}

auto Registrar::acknowledge(EpochId epoch, std::string_view target, const LineSender& send) const -> bool
{
    if (!_session.isOwnNick(target))
    {
        log::debug("Ignoring welcome for '{}'", target);
        return false;
    }

    if (!_session.markRegistered(epoch))
        return false;

    // The welcome names the nick the server registered us under.
    if (auto handle = _session.handle(); irc::iequals(target, handle))
        _session.setHandle(std::move(handle));
    else
        _session.revertHandle();

    log::info("Registered as {}", target);

    if (auto const channel = _session.currentChannel(); channel)
    {
        if (auto result = send(irc::makeJoin(*channel)); !result)
            log::warning("Failed to join {}: {}", *channel, result.error().message);
    }
    return true;
}

} // namespace tinyirc
