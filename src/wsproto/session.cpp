#include "session.hpp"
#include "control_handler.hpp"
#include "frame_fmt.hpp"
#include "session_fmt.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace wsproto {

namespace {

std::string_view
as_chars(std::span<std::uint8_t const> data) noexcept
{
    return {reinterpret_cast<char const*>(data.data()), data.size()};
}

std::span<std::uint8_t const>
as_bytes(std::string_view data) noexcept
{
    return {reinterpret_cast<std::uint8_t const*>(data.data()), data.size()};
}

/// what to tell the application about a failure with close code \p code
ErrorKind
error_kind_for(CloseCode code) noexcept
{
    switch (code) {
        case CloseCode::InvalidPayload:
            return ErrorKind::InvalidPayload;
        case CloseCode::MessageTooBig:
            return ErrorKind::PayloadTooLarge;
        case CloseCode::InternalError:
            return ErrorKind::InternalError;
        default:
            return ErrorKind::ProtocolViolation;
    }
}

} // namespace

session::session(std::unique_ptr<transport> t, std::shared_ptr<session_handler> handler,
        session_config config)
        : transport_(std::move(t))
        , handler_(std::move(handler))
        , config_(std::move(config))
        , buf_(config_.read_buffer_size)
        , reassembler_(config_.max_message_size)
{
    if (!transport_) {
        throw std::invalid_argument("session needs a transport");
    }
    if (!handler_) {
        handler_ = std::make_shared<session_handler>();
    }
    if (config_.read_buffer_size == 0) {
        throw std::invalid_argument("read_buffer_size must not be 0");
    }
}

session::~session() noexcept
{
    transport_->close();
}

void
session::run()
{
    if (started_) {
        throw std::logic_error("session::run() called twice");
    }
    started_ = true;

    try {
        if (do_handshake()) {
            read_loop();
        }
    } catch (std::exception const& e) {
        SPDLOG_ERROR("{}: {}", peer(), e.what());
        fail(CloseCode::InternalError, ErrorKind::InternalError, "internal error");
    }
    finish();
}

bool
session::send_text(std::string_view text)
{
    frame_generator gen;
    gen.text(text);
    return send_if_open(gen);
}

bool
session::send_binary(std::span<std::uint8_t const> data)
{
    frame_generator gen;
    gen.binary(data);
    return send_if_open(gen);
}

bool
session::ping(std::span<std::uint8_t const> payload)
{
    frame_generator gen;
    gen.ping(payload);
    return send_if_open(gen);
}

bool
session::close(std::uint16_t code, std::string_view reason)
{
    if (!is_valid_wire_close_code(code)) {
        throw std::invalid_argument("close code " + std::to_string(code) + " may not be sent");
    }
    frame_generator gen;
    gen.close(code, reason);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (state_.load() != ConnectionState::Open) {
        return false;
    }
    SPDLOG_DEBUG("{}: closing with {}", peer(), code);
    close_deadline_.store(std::chrono::steady_clock::now() + config_.close_timeout);
    set_state(ConnectionState::ClosingSent);
    return write_locked(gen.data());
}

void
session::shutdown()
{
    shutdown_requested_.store(true);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() == ConnectionState::Open) {
            frame_generator gen;
            gen.close(CloseCode::GoingAway, "server shutting down");
            write_locked(gen.data());
        }
        set_state(ConnectionState::Closed);
    }
    transport_->close();
}

ConnectionState
session::state() const noexcept
{
    return state_.load();
}

std::string const&
session::peer() const noexcept
{
    return transport_->peer();
}

http_request const&
session::request() const noexcept
{
    return request_;
}

std::optional<std::string> const&
session::subprotocol() const noexcept
{
    return subprotocol_;
}

/**********************************************************************/

bool
session::do_handshake()
{
    using std::chrono::steady_clock;

    auto const deadline = steady_clock::now() + config_.handshake_timeout;
    http_request req;
    std::size_t consumed = 0;

    for (;;) {
        HttpParseResult const rv = parse_http_request(as_chars(buf_.readable()), req, consumed);
        if (rv == HttpParseResult::Success) {
            break;
        }
        if (rv == HttpParseResult::Invalid) {
            return reject_handshake(make_rejection(400, "malformed upgrade request"));
        }
        if (buf_.bytes_unread() >= config_.max_handshake_size) {
            return reject_handshake(make_rejection(431, "request head too large"));
        }

        std::chrono::milliseconds timeout{0};
        if (config_.handshake_timeout.count() > 0) {
            timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - steady_clock::now());
            if (timeout.count() <= 0) {
                timeout = std::chrono::milliseconds{1};
            }
        }

        if (buf_.bytes_left() == 0) {
            buf_.reserve(buf_.bytes_unread() + config_.read_buffer_size);
        }

        read_result const res = transport_->read(buf_.writable(), timeout);
        switch (res.status) {
            case ReadStatus::Ok:
                buf_.bytes_written(res.nbytes);
                break;
            case ReadStatus::Timeout:
                if (steady_clock::now() < deadline) {
                    break;
                }
                SPDLOG_INFO("{}: no upgrade request within {}ms", peer(),
                        config_.handshake_timeout.count());
                {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    set_state(ConnectionState::Closed);
                }
                handler_->on_error(*this, ErrorKind::Timeout);
                transport_->close();
                return false;
            case ReadStatus::Closed:
            case ReadStatus::Error:
                on_transport_closed(res.status);
                return false;
        }
    }

    if (consumed > config_.max_handshake_size) {
        return reject_handshake(make_rejection(431, "request head too large"));
    }
    buf_.bytes_read(consumed);
    request_ = std::move(req);

    handshake_result const result = negotiate(request_, config_.select_subprotocol);
    if (!result.accepted()) {
        return reject_handshake(result);
    }

    if (auto proto = result.accept().headers.find("Sec-WebSocket-Protocol"); proto) {
        subprotocol_ = std::string(*proto);
    }

    std::string const response = result.to_http_response();
    bool written = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() != ConnectionState::Connecting) {
            return false; // shut down meanwhile
        }
        written = write_locked(as_bytes(response));
        set_state(written ? ConnectionState::Open : ConnectionState::Closed);
    }
    if (!written) {
        handler_->on_error(*this, ErrorKind::TransportError);
        return false;
    }

    SPDLOG_INFO("{}: connection upgraded, path [{}]", peer(), request_.path);
    opened_ = true;
    handler_->on_open(*this);
    return true;
}

bool
session::reject_handshake(handshake_result const& result)
{
    SPDLOG_INFO("{}: rejecting upgrade with {} ({})", peer(), result.status(),
            result.reject().reason);

    std::string const response = result.to_http_response();
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() == ConnectionState::Connecting) {
            write_locked(as_bytes(response));
        }
        set_state(ConnectionState::Closed);
    }
    handler_->on_error(*this, ErrorKind::HandshakeRejected);
    transport_->close();
    return false;
}

void
session::read_loop()
{
    while (state_.load() != ConnectionState::Closed) {
        // bytes that arrived together with the request head come first
        if (!process_buffer()) {
            return;
        }

        if (buf_.bytes_left() < config_.read_buffer_size) {
            buf_.reserve(buf_.bytes_unread() + config_.read_buffer_size);
        }

        read_result const res = transport_->read(buf_.writable(), read_timeout());
        switch (res.status) {
            case ReadStatus::Ok:
                SPDLOG_TRACE("{}: read {} bytes", peer(), res.nbytes);
                buf_.bytes_written(res.nbytes);
                awaiting_pong_ = false;
                break;
            case ReadStatus::Timeout:
                if (!on_read_timeout()) {
                    return;
                }
                break;
            case ReadStatus::Closed:
            case ReadStatus::Error:
                on_transport_closed(res.status);
                return;
        }
    }
}

bool
session::process_buffer()
{
    while (buf_.bytes_unread() > 0) {
        if (state_.load() == ConnectionState::Closed) {
            return false;
        }

        ParseResult const rv = frame_.parse_from_buffer(buf_.readable(), config_.max_message_size);
        switch (rv) {
            case ParseResult::NeedMoreData:
                return true;
            case ParseResult::InvalidFrame:
                SPDLOG_DEBUG("{}: invalid frame: {}", peer(), frame_.error());
                fail(CloseCode::ProtocolError, ErrorKind::ProtocolViolation, "invalid frame");
                return false;
            case ParseResult::PayloadTooBig:
                SPDLOG_DEBUG("{}: {} frame of {} bytes exceeds the limit", peer(),
                        frame_.op_code(), frame_.payload_len());
                fail(CloseCode::MessageTooBig, ErrorKind::PayloadTooLarge, "message too big");
                return false;
            case ParseResult::Success:
                break;
        }

        buf_.bytes_read(frame_.total_size());

        if (!frame_.masked()) {
            SPDLOG_DEBUG("{}: unmasked {} frame", peer(), frame_.op_code());
            fail(CloseCode::ProtocolError, ErrorKind::ProtocolViolation, "frame not masked");
            return false;
        }

        SPDLOG_TRACE("{}: {} frame, fin={}, {} bytes", peer(), frame_.op_code(), frame_.fin(),
                frame_.payload_len());

        if (!on_frame(frame_)) {
            return false;
        }
    }
    return state_.load() != ConnectionState::Closed;
}

bool
session::on_frame(frame const& f)
{
    if (is_control(f.op_code())) {
        return on_control_frame(f);
    }

    if (ConnectionState const s = state_.load(); s != ConnectionState::Open) {
        SPDLOG_DEBUG("{}: discarding {} frame in state {}", peer(), f.op_code(), s);
        return true;
    }

    ReassemblyResult const rv = reassembler_.feed(f);
    switch (rv) {
        case ReassemblyResult::Incomplete:
            return true;
        case ReassemblyResult::Complete: {
            message const& msg = reassembler_.current();
            SPDLOG_DEBUG("{}: {} message, {} bytes", peer(), msg.type, msg.payload.size());
            handler_->on_message(*this, msg.type, msg.payload);
            return true;
        }
        case ReassemblyResult::ProtocolError:
            fail(CloseCode::ProtocolError, ErrorKind::ProtocolViolation, "unexpected frame");
            return false;
        case ReassemblyResult::InvalidPayload:
            fail(CloseCode::InvalidPayload, ErrorKind::InvalidPayload, "invalid UTF-8");
            return false;
        case ReassemblyResult::MessageTooBig:
            fail(CloseCode::MessageTooBig, ErrorKind::PayloadTooLarge, "message too big");
            return false;
    }
    return true;
}

bool
session::on_control_frame(frame const& f)
{
    control_action action = control_handler::handle(f, state_.load());

    switch (action.kind) {
        case control_action::Kind::None:
            return true;

        case control_action::Kind::SendPong: {
            frame_generator gen;
            gen.pong(action.payload);
            send_if_open(gen);
            return true;
        }

        case control_action::Kind::PongReceived:
            awaiting_pong_ = false;
            handler_->on_pong(*this, action.payload);
            return true;

        case control_action::Kind::EchoClose:
        case control_action::Kind::CloseComplete: {
            SPDLOG_DEBUG("{}: close frame from peer: {} [{}]", peer(), action.peer.code,
                    action.peer.reason);
            close_result_ = action.peer;
            {
                std::lock_guard<std::mutex> lock(write_mutex_);
                // a local close() may have raced with the peer's close frame
                if (state_.load() == ConnectionState::Open) {
                    set_state(ConnectionState::ClosingReceived);
                    frame_generator gen;
                    gen.close(action.reply.code, action.reply.reason);
                    write_locked(gen.data());
                }
                set_state(ConnectionState::Closed);
            }
            transport_->close();
            return false;
        }

        case control_action::Kind::Fail:
            fail(action.fail_code, error_kind_for(action.fail_code), "invalid close frame");
            return false;
    }
    return true;
}

bool
session::on_read_timeout()
{
    switch (state_.load()) {
        case ConnectionState::Open: {
            if (awaiting_pong_) {
                SPDLOG_INFO("{}: no reply to ping within {}ms", peer(),
                        config_.pong_timeout.count());
                fail(CloseCode::GoingAway, ErrorKind::Timeout, "ping timeout");
                return false;
            }
            SPDLOG_DEBUG("{}: idle for {}ms, sending ping", peer(), config_.idle_timeout.count());
            frame_generator gen;
            gen.ping();
            awaiting_pong_ = send_if_open(gen);
            return true;
        }

        case ConnectionState::ClosingSent:
            if (config_.close_timeout.count() == 0
                    || std::chrono::steady_clock::now() < close_deadline_.load()) {
                return true;
            }
            SPDLOG_INFO("{}: no close frame within {}ms", peer(), config_.close_timeout.count());
            {
                std::lock_guard<std::mutex> lock(write_mutex_);
                set_state(ConnectionState::Closed);
            }
            close_result_ = close_info{to_underlying(CloseCode::Abnormal), {}};
            handler_->on_error(*this, ErrorKind::Timeout);
            transport_->close();
            return false;

        case ConnectionState::Connecting:
        case ConnectionState::ClosingReceived:
        case ConnectionState::Closed:
            break;
    }
    return false;
}

void
session::on_transport_closed(ReadStatus status)
{
    bool const closed_locally = [this] {
        std::lock_guard<std::mutex> lock(write_mutex_);
        bool const was_closed = state_.load() == ConnectionState::Closed;
        set_state(ConnectionState::Closed);
        return was_closed;
    }();
    if (closed_locally) {
        return;
    }

    if (status == ReadStatus::Error || write_failed_.load()) {
        SPDLOG_INFO("{}: transport error", peer());
        handler_->on_error(*this, ErrorKind::TransportError);
    } else {
        SPDLOG_DEBUG("{}: peer closed the connection without a close frame", peer());
    }
    close_result_ = close_info{to_underlying(CloseCode::Abnormal), {}};
    transport_->close();
}

void
session::fail(CloseCode code, ErrorKind kind, std::string_view reason)
{
    SPDLOG_INFO("{}: failing connection with {} ({}): {}", peer(), to_underlying(code), code,
            reason);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (state_.load() == ConnectionState::Open) {
            frame_generator gen;
            gen.close(code, reason);
            write_locked(gen.data());
        }
        set_state(ConnectionState::Closed);
    }
    close_result_ = close_info{to_underlying(code), std::string(reason)};
    handler_->on_error(*this, kind);
    transport_->close();
}

void
session::finish()
{
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        set_state(ConnectionState::Closed);
    }
    transport_->close();

    if (!opened_) {
        return;
    }

    close_info info{to_underlying(CloseCode::Abnormal), {}};
    if (close_result_) {
        info = *close_result_;
    } else if (shutdown_requested_.load()) {
        info = close_info{to_underlying(CloseCode::GoingAway), "server shutting down"};
    }

    SPDLOG_INFO("{}: connection closed: {} [{}]", peer(), info.code, info.reason);
    handler_->on_close(*this, info.code, info.reason);
}

bool
session::write_locked(std::span<std::uint8_t const> data)
{
    if (transport_->write(data)) {
        return true;
    }
    SPDLOG_WARN("{}: write of {} bytes failed", peer(), data.size());
    write_failed_.store(true);
    transport_->close();
    return false;
}

bool
session::send_if_open(frame_generator const& gen)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (state_.load() != ConnectionState::Open) {
        return false;
    }
    return write_locked(gen.data());
}

void
session::set_state(ConnectionState s)
{
    ConnectionState const prev = state_.exchange(s);
    if (prev != s) {
        SPDLOG_DEBUG("{}: {} -> {}", peer(), prev, s);
    }
}

std::chrono::milliseconds
session::read_timeout() const noexcept
{
    if (state_.load() == ConnectionState::ClosingSent) {
        if (config_.close_timeout.count() == 0) {
            return std::chrono::milliseconds{0};
        }
        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                close_deadline_.load() - std::chrono::steady_clock::now());
        return std::max(remaining, std::chrono::milliseconds{1});
    }
    return awaiting_pong_ ? config_.pong_timeout : config_.idle_timeout;
}

} // namespace wsproto
