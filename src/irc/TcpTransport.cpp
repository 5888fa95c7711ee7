// SPDX-License-Identifier: Apache-2.0
#include "TcpTransport.hpp"

#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>

#include <sys/socket.h>
#include <sys/types.h>

#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>

namespace tinyirc
{

namespace
{

    /// @brief Longest line accepted before it is force-split.
    constexpr auto MaxLineLength = std::size_t { 8192 };

    constexpr auto LineTerminator = std::string_view { "\r\n" };

} // namespace

struct TcpTransport::Impl
{
    int socket = -1;
    std::atomic<bool> connected = false;
    std::mutex sendMutex;
    std::mutex closeMutex; // never held across a blocking call
    std::string readBuffer;

    ~Impl()
    {
        if (socket >= 0)
            ::close(socket);
    }
};

TcpTransport::TcpTransport(): _impl(std::make_unique<Impl>())
{
}

TcpTransport::~TcpTransport()
{
    close();
}

auto TcpTransport::connect(std::string_view host, std::uint16_t port) -> Result<std::unique_ptr<Transport>>
{
    auto transport = std::make_unique<TcpTransport>();
    auto result = transport->open(host, port);
    if (!result)
        return std::unexpected(result.error());
    return transport;
}

auto TcpTransport::open(std::string_view host, std::uint16_t port) -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::ConnectError, "Transport already connected");

    auto hints = addrinfo {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    auto const hostStr = std::string(host);
    auto const portStr = std::to_string(port);

    addrinfo* addresses = nullptr;
    auto const rc = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &addresses);
    if (rc != 0)
        return makeError(ErrorCode::ConnectError,
                         std::format("Cannot resolve '{}': {}", host, ::gai_strerror(rc)));

    auto lastError = 0;
    auto fd = -1;
    for (auto* ai = addresses; ai != nullptr; ai = ai->ai_next)
    {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0)
        {
            lastError = errno;
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
            break;

        lastError = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(addresses);

    if (fd < 0)
        return makeError(ErrorCode::ConnectError,
                         std::format("Cannot connect to {}:{}: {}", host, port, std::strerror(lastError)));

    auto const keepAlive = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepAlive, sizeof(keepAlive)) != 0)
        log::debug("SO_KEEPALIVE not available: {}", std::strerror(errno));

    _impl->socket = fd;
    _impl->readBuffer.clear();
    _impl->connected = true;
    log::debug("TCP connection established to {}:{}", host, port);
    return {};
}

auto TcpTransport::sendLine(std::string_view line) -> VoidResult
{
    if (line.find_first_of("\r\n") != std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, "Line must not contain CR or LF");

    auto const lock = std::lock_guard(_impl->sendMutex);

    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto data = std::string(line);
    data += LineTerminator;

    auto offset = std::size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::send(_impl->socket, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("Send failed: {}", std::strerror(errno)));
        }
        offset += static_cast<std::size_t>(written);
    }

    log::trace("> {}", line);
    return {};
}

auto TcpTransport::readLine() -> Result<std::string>
{
    while (true)
    {
        if (!_impl->connected)
            return makeError(ErrorCode::TransportError, "Transport not connected");

        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            log::trace("< {}", line);
            return line;
        }

        if (_impl->readBuffer.size() >= MaxLineLength)
        {
            auto line = _impl->readBuffer.substr(0, MaxLineLength);
            _impl->readBuffer.erase(0, MaxLineLength);
            log::debug("Splitting overlong line ({} bytes)", MaxLineLength);
            return line;
        }

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::recv(_impl->socket, buf.data(), buf.size(), 0);
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead == 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Connection closed by server");
        }
        if (bytesRead < 0)
        {
            auto const reason = std::string(std::strerror(errno));
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("Read failed: {}", reason));
        }
        _impl->readBuffer.append(buf.data(), static_cast<std::size_t>(bytesRead));
    }
}

void TcpTransport::close()
{
    // Must not wait for sendMutex: a sender may be blocked in send() on a peer that stopped reading.
    auto const lock = std::lock_guard(_impl->closeMutex);

    if (_impl->socket < 0 || !_impl->connected.exchange(false))
        return;

    // Wakes a reader blocked in recv() and a writer blocked in send().
    // The descriptor itself stays open until destruction.
    ::shutdown(_impl->socket, SHUT_RDWR);
    log::debug("TCP transport closed");
}

auto TcpTransport::isConnected() const -> bool
{
    return _impl->connected;
}

} // namespace tinyirc
