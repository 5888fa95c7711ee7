// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief Abstract interface for a line-oriented connection to an IRC server.
///
/// readLine() is called from exactly one thread; sendLine() and close() may be
/// called from any thread.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends one protocol line. The CRLF terminator is appended by the transport.
    /// @param line The line to send, without terminator.
    /// @return Success or an error; never throws.
    [[nodiscard]] virtual auto sendLine(std::string_view line) -> VoidResult = 0;

    /// @brief Receives one protocol line (blocking), without its terminator.
    /// @return The received line, or a TransportError on end of stream or read failure.
    [[nodiscard]] virtual auto readLine() -> Result<std::string> = 0;

    /// @brief Closes the connection and unblocks a pending readLine().
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

/// @brief Creates a connected transport for the given server.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(std::string_view host, std::uint16_t port)>;

} // namespace tinyirc
