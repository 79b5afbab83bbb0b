#pragma once

#include "close_code.hpp"
#include "connection_state.hpp"
#include "frame.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace wsproto {

/// What the session has to do after a control frame arrived
struct control_action
{
    enum class Kind : std::uint8_t
    {
        None,          ///< nothing, e.g. a ping while closing
        SendPong,      ///< write a pong carrying payload
        PongReceived,  ///< tell the application, payload is the pong's
        EchoClose,     ///< write reply as close frame, then drop the transport
        CloseComplete, ///< our close was answered, drop the transport
        Fail           ///< malformed close frame, fail with fail_code
    };

    Kind kind = Kind::None;
    std::vector<std::uint8_t> payload;
    close_info peer;  ///< what the peer sent (1005 if no code)
    close_info reply; ///< what to echo
    CloseCode fail_code = CloseCode::ProtocolError;
};

/// Result of decoding a close frame payload
struct close_payload
{
    enum class Status : std::uint8_t
    {
        Ok,
        Empty,        ///< no status code at all
        Truncated,    ///< a single byte
        InvalidCode,  ///< code not allowed on the wire
        InvalidReason ///< reason is not UTF-8
    };

    Status status = Status::Empty;
    close_info info;
};

/// Split a close frame payload into code and reason
close_payload parse_close_payload(std::span<std::uint8_t const>);

/*! \class  control_handler
 *  \brief  Interprets ping, pong and close frames. Holds no state of its
 *          own: the decision depends only on the frame and the connection
 *          state passed in.
 */
class control_handler
{
public:
    static control_action handle(frame const&, ConnectionState);

private:
    static control_action on_ping(frame const&, ConnectionState);
    static control_action on_pong(frame const&);
    static control_action on_close(frame const&, ConnectionState);
};

} // namespace wsproto
