#pragma once

#include "close_code.hpp"
#include "connection_state.hpp"
#include "frame.hpp"
#include "frame_generator.hpp"
#include "handshake.hpp"
#include "http_request.hpp"
#include "message_reassembler.hpp"
#include "transport.hpp"
#include "util/byte_buffer.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace wsproto {

/// Per-connection limits and timeouts. Shared read-only by all sessions.
struct session_config
{
    static constexpr std::uint64_t DefaultMaxMessageSize = 16 * 1024 * 1024;
    static constexpr std::size_t DefaultReadBufferSize = 64 * 1024;
    static constexpr std::size_t DefaultMaxHandshakeSize = 8 * 1024;
    static constexpr std::chrono::milliseconds DefaultHandshakeTimeout{5'000};
    static constexpr std::chrono::milliseconds DefaultIdleTimeout{30'000};
    static constexpr std::chrono::milliseconds DefaultPongTimeout{10'000};
    static constexpr std::chrono::milliseconds DefaultCloseTimeout{5'000};

    std::uint64_t max_message_size = DefaultMaxMessageSize; ///< 1009 above this
    std::size_t read_buffer_size = DefaultReadBufferSize;   ///< bytes per read() call
    std::size_t max_handshake_size = DefaultMaxHandshakeSize;
    std::chrono::milliseconds handshake_timeout = DefaultHandshakeTimeout;
    std::chrono::milliseconds idle_timeout = DefaultIdleTimeout; ///< quiet time before a ping, 0 = never
    std::chrono::milliseconds pong_timeout = DefaultPongTimeout; ///< quiet time after the ping before 1001
    std::chrono::milliseconds close_timeout = DefaultCloseTimeout;
    subprotocol_selector select_subprotocol;
};

enum class ErrorKind : std::uint8_t
{
    HandshakeRejected,
    ProtocolViolation,
    InvalidPayload,
    PayloadTooLarge,
    TransportError,
    Timeout,
    InternalError
};

class session;

/*! \class  session_handler
 *  \brief  Application callbacks. They are invoked on the session's own
 *          worker thread, one at a time; calling back into the session
 *          (send_text(), close(), ...) from inside a callback is fine.
 */
class session_handler
{
public:
    virtual ~session_handler() = default;

    /// handshake accepted, the connection is Open
    virtual void on_open(session&) {}

    /// a complete text or binary message
    virtual void on_message(session&, MessageType, std::span<std::uint8_t const>) {}

    /// a pong arrived, solicited or not
    virtual void on_pong(session&, std::span<std::uint8_t const>) {}

    /// called once after an opened connection reaches Closed
    virtual void on_close(session&, std::uint16_t /*code*/, std::string_view /*reason*/) {}

    virtual void on_error(session&, ErrorKind) {}
};

/*! \class  session
 *  \brief  One server-side WebSocket connection: upgrade handshake, frame
 *          decoding, message reassembly, control frames and the closing
 *          handshake.
 *
 *  run() drives the connection on the calling (worker) thread until it is
 *  Closed. The send and close functions may be called from any thread;
 *  outgoing frames are written one at a time in call order.
 */
class session
{
public:
    session(std::unique_ptr<transport>, std::shared_ptr<session_handler>, session_config config);
    ~session() noexcept;

    // no copies/moves
    session(session const&) = delete;
    session(session&&) = delete;
    session& operator=(session const&) = delete;
    session& operator=(session&&) = delete;

    /// Serve the connection until it is Closed. Call once.
    /// \throws std::logic_error on a second call
    void run();

    /// Send a complete message.
    /// \return \c false if the connection is not Open or the write failed
    bool send_text(std::string_view);
    bool send_binary(std::span<std::uint8_t const>);

    /// \throws std::invalid_argument if the payload exceeds 125 bytes
    bool ping(std::span<std::uint8_t const> payload = {});

    /// Start the closing handshake. The peer has close_timeout to answer.
    /// \return \c false if the connection was not Open
    /// \throws std::invalid_argument if \p code may not be sent or \p reason
    ///         exceeds 123 bytes
    bool close(std::uint16_t code = to_underlying(CloseCode::Normal), std::string_view reason = "");

    /// Close with 1001 if Open and drop the transport without waiting. Used
    /// on server shutdown; safe to call repeatedly and from any thread.
    void shutdown();

    ConnectionState state() const noexcept;
    std::string const& peer() const noexcept;

    /// the upgrade request, meaningful once on_open has been called
    http_request const& request() const noexcept;

    /// sub-protocol chosen during the handshake, if any
    std::optional<std::string> const& subprotocol() const noexcept;

private:
    bool do_handshake();
    bool reject_handshake(handshake_result const&);
    void read_loop();
    bool process_buffer();
    bool on_frame(frame const&);
    bool on_control_frame(frame const&);
    bool on_read_timeout();
    void on_transport_closed(ReadStatus);

    /// send close frame with \p code if Open, then drop the transport
    void fail(CloseCode code, ErrorKind kind, std::string_view reason);

    /// make sure we are Closed and tell the application
    void finish();

    /// Caller holds write_mutex_. A failed write closes the transport.
    bool write_locked(std::span<std::uint8_t const>);

    /// write \p gen if the connection is Open
    bool send_if_open(frame_generator const& gen);

    /// caller holds write_mutex_
    void set_state(ConnectionState);

    std::chrono::milliseconds read_timeout() const noexcept;

private:
    std::unique_ptr<transport> transport_;
    std::shared_ptr<session_handler> handler_;
    session_config const config_;

    std::atomic<ConnectionState> state_{ConnectionState::Connecting};
    std::mutex write_mutex_; ///< serializes frames on the wire and guards Open transitions

    byte_buffer buf_;
    frame frame_;
    message_reassembler reassembler_;
    http_request request_;
    std::optional<std::string> subprotocol_;

    // owned by the worker thread
    bool started_ = false;
    bool opened_ = false;
    bool awaiting_pong_ = false;
    std::optional<close_info> close_result_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> write_failed_{false};
    std::atomic<std::chrono::steady_clock::time_point> close_deadline_{};
};

} // namespace wsproto
