#pragma once

#include "http_request.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wsproto {

/// fixed GUID appended to Sec-WebSocket-Key (RFC 6455 section 1.3)
static constexpr std::string_view MagicGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

/// the only protocol version this server speaks
static constexpr std::string_view SupportedVersion = "13";

/// Picks one of the sub-protocols a client offered, or none. The engine
/// only passes the choice through to the response.
using subprotocol_selector
        = std::function<std::optional<std::string>(std::vector<std::string_view> const&)>;

/// 101 Switching Protocols
struct handshake_accept
{
    header_map headers;
};

/// 4xx, sent before the transport is closed
struct handshake_reject
{
    std::uint16_t status = 400;
    std::string reason;
    header_map headers;
};

/*! \class  handshake_result
 *  \brief  Outcome of negotiate(): exactly one of accept or reject.
 */
class handshake_result
{
public:
    handshake_result(handshake_accept);
    handshake_result(handshake_reject);

    bool accepted() const noexcept;
    std::uint16_t status() const noexcept;

    /// only valid if accepted()
    handshake_accept const& accept() const;

    /// only valid if !accepted()
    handshake_reject const& reject() const;

    /// Status line and header fields, terminated by an empty line
    std::string to_http_response() const;

private:
    std::variant<handshake_accept, handshake_reject> result_;
};

/// base64(SHA1(key + MagicGuid))
std::string compute_accept_key(std::string_view sec_websocket_key);

/// Validate an upgrade request and build the response. Pure: no I/O and no
/// connection state is touched.
handshake_result negotiate(http_request const&, subprotocol_selector const& selector = {});

/// Rejection for a request that could not be parsed at all
handshake_result make_rejection(std::uint16_t status, std::string reason);

/// Standard reason phrase for the status codes this server sends
std::string_view reason_phrase(std::uint16_t status) noexcept;

} // namespace wsproto
