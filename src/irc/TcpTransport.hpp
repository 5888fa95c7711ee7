// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <irc/Transport.hpp>

#include <memory>
#include <string>

namespace tinyirc
{

/// @brief Transport that talks to an IRC server over a plain TCP socket.
///
/// Sends are serialized by an internal mutex so that lines written from
/// different threads never interleave.
class TcpTransport: public Transport
{
  public:
    TcpTransport();
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /// @brief Resolves the host and opens a connection.
    /// @param host Host name or address.
    /// @param port TCP port.
    /// @return A connected transport or a ConnectError.
    [[nodiscard]] static auto connect(std::string_view host, std::uint16_t port)
        -> Result<std::unique_ptr<Transport>>;

    /// @brief Opens a connection on this instance.
    /// @return Success or a ConnectError.
    [[nodiscard]] auto open(std::string_view host, std::uint16_t port) -> VoidResult;

    [[nodiscard]] auto sendLine(std::string_view line) -> VoidResult override;
    [[nodiscard]] auto readLine() -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tinyirc
