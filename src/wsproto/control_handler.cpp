#include "control_handler.hpp"
#include "frame_fmt.hpp"
#include "session_fmt.hpp"
#include "util/utf8.hpp"
#include <spdlog/spdlog.h>

namespace wsproto {

close_payload
parse_close_payload(std::span<std::uint8_t const> payload)
{
    close_payload rv;

    if (payload.empty()) {
        rv.status = close_payload::Status::Empty;
        rv.info.code = to_underlying(CloseCode::NoStatus);
        return rv;
    }
    if (payload.size() == 1) {
        rv.status = close_payload::Status::Truncated;
        return rv;
    }

    rv.info.code = static_cast<std::uint16_t>((payload[0] << 8) | payload[1]);
    rv.info.reason.assign(reinterpret_cast<char const*>(payload.data()) + 2, payload.size() - 2);

    if (!is_valid_wire_close_code(rv.info.code)) {
        rv.status = close_payload::Status::InvalidCode;
    } else if (!is_valid_utf8(rv.info.reason)) {
        rv.status = close_payload::Status::InvalidReason;
    } else {
        rv.status = close_payload::Status::Ok;
    }
    return rv;
}

control_action
control_handler::handle(frame const& f, ConnectionState state)
{
    switch (f.op_code()) {
        case OpCode::Ping:
            return on_ping(f, state);
        case OpCode::Pong:
            return on_pong(f);
        case OpCode::Close:
            return on_close(f, state);
        case OpCode::Continuation:
        case OpCode::Text:
        case OpCode::Binary:
            break;
    }

    SPDLOG_ERROR("data frame {} passed to the control handler", f.op_code());
    control_action action;
    action.kind = control_action::Kind::Fail;
    action.fail_code = CloseCode::InternalError;
    return action;
}

control_action
control_handler::on_ping(frame const& f, ConnectionState state)
{
    control_action action;
    if (state != ConnectionState::Open) {
        SPDLOG_DEBUG("ignoring ping in state {}", state);
        return action;
    }

    auto const payload = f.payload();
    action.kind = control_action::Kind::SendPong;
    action.payload.assign(payload.begin(), payload.end());
    return action;
}

control_action
control_handler::on_pong(frame const& f)
{
    auto const payload = f.payload();
    control_action action;
    action.kind = control_action::Kind::PongReceived;
    action.payload.assign(payload.begin(), payload.end());
    return action;
}

control_action
control_handler::on_close(frame const& f, ConnectionState state)
{
    control_action action;

    close_payload parsed = parse_close_payload(f.payload());
    switch (parsed.status) {
        case close_payload::Status::Ok:
        case close_payload::Status::Empty:
            break;
        case close_payload::Status::Truncated:
        case close_payload::Status::InvalidCode:
            SPDLOG_DEBUG("malformed close frame: {} payload bytes, code {}", f.payload_len(),
                    parsed.info.code);
            action.kind = control_action::Kind::Fail;
            action.fail_code = CloseCode::ProtocolError;
            return action;
        case close_payload::Status::InvalidReason:
            SPDLOG_DEBUG("close frame reason is not valid UTF-8");
            action.kind = control_action::Kind::Fail;
            action.fail_code = CloseCode::InvalidPayload;
            return action;
    }

    action.peer = parsed.info;

    switch (state) {
        case ConnectionState::Open:
            action.kind = control_action::Kind::EchoClose;
            if (parsed.status == close_payload::Status::Ok) {
                action.reply = parsed.info;
            } else {
                action.reply = close_info{to_underlying(CloseCode::Normal), {}};
            }
            break;

        case ConnectionState::ClosingSent:
            action.kind = control_action::Kind::CloseComplete;
            break;

        case ConnectionState::Connecting:
        case ConnectionState::ClosingReceived:
        case ConnectionState::Closed:
            SPDLOG_DEBUG("ignoring close frame in state {}", state);
            break;
    }
    return action;
}

} // namespace wsproto
