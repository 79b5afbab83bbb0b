#pragma once

#include <cstdint>
#include <string_view>

namespace wsproto {

/// Lifetime of one WebSocket connection, server side
enum class ConnectionState : std::uint8_t
{
    Connecting,      ///< waiting for / answering the upgrade request
    Open,            ///< frames flow both ways
    ClosingSent,     ///< we sent a close, waiting for the peer's
    ClosingReceived, ///< peer sent a close, we are echoing it
    Closed           ///< transport released
};

constexpr std::string_view
to_string(ConnectionState s) noexcept
{
    switch (s) {
        case ConnectionState::Connecting:
            return "Connecting";
        case ConnectionState::Open:
            return "Open";
        case ConnectionState::ClosingSent:
            return "ClosingSent";
        case ConnectionState::ClosingReceived:
            return "ClosingReceived";
        case ConnectionState::Closed:
            return "Closed";
    }
    return "???";
}

} // namespace wsproto
