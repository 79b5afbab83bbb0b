#include "scripted_transport.hpp"
#include "test_helpers.hpp"
#include "wsproto/session.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


namespace wsproto::test {
namespace {

using namespace std::chrono_literals;

/// Records every callback
class recording_handler : public session_handler
{
public:
    struct closed_event
    {
        std::uint16_t code = 0;
        std::string reason;
    };

    void
    on_open(session& s) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++opened;
        if (on_open_hook) {
            on_open_hook(s);
        }
    }

    void
    on_message(session& s, MessageType type, std::span<std::uint8_t const> payload) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages.push_back({type, as_str(payload)});
        }
        if (echo) {
            if (type == MessageType::Text) {
                s.send_text(as_str(payload));
            } else {
                s.send_binary(payload);
            }
        }
    }

    void
    on_pong(session&, std::span<std::uint8_t const> payload) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pongs.push_back(as_str(payload));
    }

    void
    on_close(session&, std::uint16_t code, std::string_view reason) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closes.push_back({code, std::string(reason)});
    }

    void
    on_error(session&, ErrorKind kind) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        errors.push_back(kind);
    }

    std::mutex mutex_;
    int opened = 0;
    bool echo = false;
    std::function<void(session&)> on_open_hook;
    std::vector<std::pair<MessageType, std::string>> messages;
    std::vector<std::string> pongs;
    std::vector<closed_event> closes;
    std::vector<ErrorKind> errors;
};

/// short timeouts so the timeout paths run quickly
session_config
test_config()
{
    session_config config;
    config.handshake_timeout = 2s;
    config.idle_timeout = 0ms;
    config.pong_timeout = 0ms;
    config.close_timeout = 2s;
    return config;
}

struct fixture
{
    explicit fixture(session_config config = test_config())
    {
        auto t = std::make_unique<scripted_transport>();
        transport = t.get();
        handler = std::make_shared<recording_handler>();
        sess = std::make_unique<session>(std::move(t), handler, std::move(config));
    }

    std::vector<server_frame>
    frames() const
    {
        return parse_server_frames(transport->written_frames());
    }

    /// poll until the server wrote at least \p n frames
    bool
    wait_for_frames(std::size_t n) const
    {
        auto const deadline = std::chrono::steady_clock::now() + 5s;
        while (frames().size() < n) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(1ms);
        }
        return true;
    }

    void
    wait_until_open() const
    {
        while (sess->state() == ConnectionState::Connecting) {
            std::this_thread::sleep_for(1ms);
        }
    }

    scripted_transport* transport = nullptr;
    std::shared_ptr<recording_handler> handler;
    std::unique_ptr<session> sess;
};

} // namespace


TEST_CASE("session handshake", "[session]")
{
    SECTION("accepted upgrade opens the connection")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        fx.transport->push(client_close(1000));
        fx.sess->run();

        std::string const http = fx.transport->written_http();
        REQUIRE(http.starts_with("HTTP/1.1 101 Switching Protocols\r\n"));
        REQUIRE(http.contains("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"));
        REQUIRE(http.ends_with("\r\n\r\n"));
        REQUIRE(fx.handler->opened == 1);
        REQUIRE(fx.sess->request().path == "/chat");
        REQUIRE(fx.sess->state() == ConnectionState::Closed);
    }

    SECTION("request head split over many reads")
    {
        fixture fx;
        fx.transport->set_max_read(3);
        fx.transport->push(upgrade_request());
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.handler->opened == 1);
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1000);
    }

    SECTION("frames in the same read as the request head are kept")
    {
        fixture fx;
        std::string input = upgrade_request();
        auto const text = client_frame(OpCode::Text, "early");
        auto const close = client_close(1000);
        input.append(text.begin(), text.end());
        input.append(close.begin(), close.end());
        fx.transport->push(input);
        fx.sess->run();

        REQUIRE(fx.handler->opened == 1);
        REQUIRE(fx.handler->messages.size() == 1);
        REQUIRE(fx.handler->messages[0].second == "early");
    }

    SECTION("missing key is rejected with 400")
    {
        fixture fx;
        fx.transport->push("GET / HTTP/1.1\r\n"
                           "Host: x\r\n"
                           "Upgrade: websocket\r\n"
                           "Connection: Upgrade\r\n"
                           "Sec-WebSocket-Version: 13\r\n"
                           "\r\n");
        fx.sess->run();

        REQUIRE(fx.transport->written_http().starts_with("HTTP/1.1 400 Bad Request\r\n"));
        REQUIRE(fx.handler->opened == 0);
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::HandshakeRejected});
        REQUIRE(fx.handler->closes.empty());
        REQUIRE(fx.transport->closed());
        REQUIRE(fx.sess->state() == ConnectionState::Closed);
    }

    SECTION("unsupported version is rejected with 426")
    {
        fixture fx;
        fx.transport->push(upgrade_request("", "dGhlIHNhbXBsZSBub25jZQ==", "8"));
        fx.sess->run();

        std::string const http = fx.transport->written_http();
        REQUIRE(http.starts_with("HTTP/1.1 426 Upgrade Required\r\n"));
        REQUIRE(http.contains("Sec-WebSocket-Version: 13\r\n"));
        REQUIRE(fx.handler->opened == 0);
    }

    SECTION("garbage request is rejected with 400")
    {
        fixture fx;
        fx.transport->push("HELLO\r\n\r\n");
        fx.sess->run();

        REQUIRE(fx.transport->written_http().starts_with("HTTP/1.1 400 "));
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::HandshakeRejected});
    }

    SECTION("oversized request head is rejected with 431")
    {
        session_config config = test_config();
        config.max_handshake_size = 128;
        fixture fx(config);
        fx.transport->push(upgrade_request("X-Padding: " + std::string(200, 'a') + "\r\n"));
        fx.sess->run();

        REQUIRE(fx.transport->written_http().starts_with("HTTP/1.1 431 "));
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::HandshakeRejected});
    }

    SECTION("no request within the handshake timeout")
    {
        session_config config = test_config();
        config.handshake_timeout = 20ms;
        fixture fx(config);
        fx.transport->push("GET / HTTP/1.1\r\n");
        fx.sess->run();

        REQUIRE(fx.transport->written().empty());
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::Timeout});
        REQUIRE(fx.handler->closes.empty());
    }

    SECTION("sub-protocol chosen by the selector")
    {
        session_config config = test_config();
        config.select_subprotocol
                = [](std::vector<std::string_view> const& offered) -> std::optional<std::string> {
            for (auto p : offered) {
                if (p == "chat") {
                    return std::string(p);
                }
            }
            return std::nullopt;
        };
        fixture fx(config);
        fx.transport->push(upgrade_request("Sec-WebSocket-Protocol: superchat, chat\r\n"));
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.transport->written_http().contains("Sec-WebSocket-Protocol: chat\r\n"));
        REQUIRE(fx.sess->subprotocol() == "chat");
    }

    SECTION("peer disconnects during the handshake")
    {
        fixture fx;
        fx.transport->push("GET / HTTP/1.1\r\n");
        fx.transport->push_eof();
        fx.sess->run();

        REQUIRE(fx.transport->written().empty());
        REQUIRE(fx.handler->opened == 0);
        REQUIRE(fx.handler->closes.empty());
    }

    SECTION("run twice")
    {
        fixture fx;
        fx.transport->push_eof();
        fx.sess->run();
        REQUIRE_THROWS_AS(fx.sess->run(), std::logic_error);
    }
}

TEST_CASE("session messages", "[session]")
{
    fixture fx;
    fx.handler->echo = true;
    fx.transport->push(upgrade_request());

    SECTION("single frame text and binary")
    {
        std::vector<std::uint8_t> const bin{0x00, 0xff, 0x10};
        fx.transport->push(client_frame(OpCode::Text, "hello"));
        fx.transport->push(client_frame(OpCode::Binary, bin));
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.handler->messages.size() == 2);
        REQUIRE(fx.handler->messages[0].first == MessageType::Text);
        REQUIRE(fx.handler->messages[0].second == "hello");
        REQUIRE(fx.handler->messages[1].first == MessageType::Binary);
        REQUIRE(fx.handler->messages[1].second == as_str(bin));

        auto const frames = fx.frames();
        REQUIRE(frames.size() == 3);
        REQUIRE(frames[0].op_code == OpCode::Text);
        REQUIRE_FALSE(frames[0].masked);
        REQUIRE(frames[0].text() == "hello");
        REQUIRE(frames[1].op_code == OpCode::Binary);
        REQUIRE(frames[2].op_code == OpCode::Close);
        REQUIRE(frames[2].close_code() == 1000);
    }

    SECTION("fragmented text with a ping in between")
    {
        fx.transport->push(client_frame(OpCode::Text, "Hel", false));
        fx.transport->push(client_frame(OpCode::Ping, "p"));
        fx.transport->push(client_frame(OpCode::Continuation, "lo, ", false));
        fx.transport->push(client_frame(OpCode::Continuation, "World", true));
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.handler->messages.size() == 1);
        REQUIRE(fx.handler->messages[0].second == "Hello, World");

        auto const frames = fx.frames();
        auto const pongs = std::count_if(frames.begin(), frames.end(),
                [](server_frame const& f) { return f.op_code == OpCode::Pong; });
        REQUIRE(pongs == 1);
        REQUIRE(frames[0].op_code == OpCode::Pong);
        REQUIRE(frames[0].text() == "p");
        REQUIRE(frames[1].text() == "Hello, World");
    }

    SECTION("frames split across reads")
    {
        fx.transport->set_max_read(1);
        fx.transport->push(client_frame(OpCode::Text, std::string(300, 'x')));
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.handler->messages.size() == 1);
        REQUIRE(fx.handler->messages[0].second == std::string(300, 'x'));
    }

    SECTION("large message grows the read buffer")
    {
        std::string const big(200'000, 'z');
        fx.transport->push(client_frame(OpCode::Binary, big));
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.handler->messages.size() == 1);
        REQUIRE(fx.handler->messages[0].second.size() == big.size());
    }

    SECTION("unsolicited pong reaches the application")
    {
        fx.transport->push(client_frame(OpCode::Pong, "beat"));
        fx.transport->push(client_close(1000));
        fx.sess->run();

        REQUIRE(fx.handler->pongs == std::vector<std::string>{"beat"});
        REQUIRE(fx.frames().size() == 1); // only the close echo
    }
}

TEST_CASE("session protocol errors", "[session]")
{
    auto run_with = [](fixture& fx, std::vector<std::uint8_t> const& bad) {
        fx.transport->push(upgrade_request());
        fx.transport->push(bad);
        fx.transport->push(client_frame(OpCode::Text, "after"));
        fx.sess->run();
    };

    auto require_failed_with = [](fixture& fx, std::uint16_t code, ErrorKind kind) {
        auto const frames = fx.frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].op_code == OpCode::Close);
        REQUIRE(frames[0].close_code() == code);
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{kind});
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == code);
        REQUIRE(fx.sess->state() == ConnectionState::Closed);
        REQUIRE(fx.transport->closed());
    };

    SECTION("unmasked client frame")
    {
        fixture fx;
        run_with(fx, raw_client_frame(0x81, to_bytes("hi"), /*masked=*/false));
        REQUIRE(fx.handler->messages.empty());
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("reserved bits")
    {
        fixture fx;
        run_with(fx, raw_client_frame(0xc1, to_bytes("hi")));
        REQUIRE(fx.handler->messages.empty());
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("reserved opcode")
    {
        fixture fx;
        run_with(fx, raw_client_frame(0x83, to_bytes("hi")));
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("control frame too long")
    {
        fixture fx;
        run_with(fx, raw_client_frame(0x89, to_bytes(std::string(126, 'p'))));
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("fragmented control frame")
    {
        fixture fx;
        run_with(fx, raw_client_frame(0x09, to_bytes("p")));
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("continuation without a started message")
    {
        fixture fx;
        run_with(fx, client_frame(OpCode::Continuation, "x", true));
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("new message while a fragmented one is in progress")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        fx.transport->push(client_frame(OpCode::Text, "a", false));
        fx.transport->push(client_frame(OpCode::Binary, "b", true));
        fx.sess->run();
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("invalid UTF-8 in a text message")
    {
        fixture fx;
        std::vector<std::uint8_t> const bad{0xce, 0xba, 0xe1, 0xbd, 0xb9, 0xcf, 0x83, 0xce,
                0xbc, 0xce, 0xb5, 0xed, 0xa0, 0x80};
        run_with(fx, client_frame(OpCode::Text, bad));
        REQUIRE(fx.handler->messages.empty());
        require_failed_with(fx, 1007, ErrorKind::InvalidPayload);
    }

    SECTION("message over the size limit")
    {
        session_config config = test_config();
        config.max_message_size = 16;
        fixture fx(config);
        fx.transport->push(upgrade_request());
        fx.transport->push(client_frame(OpCode::Text, "0123456789", false));
        fx.transport->push(client_frame(OpCode::Continuation, "0123456789", true));
        fx.sess->run();
        REQUIRE(fx.handler->messages.empty());
        require_failed_with(fx, 1009, ErrorKind::PayloadTooLarge);
    }

    SECTION("single frame over the size limit")
    {
        session_config config = test_config();
        config.max_message_size = 16;
        fixture fx(config);
        run_with(fx, client_frame(OpCode::Binary, std::string(17, 'b')));
        require_failed_with(fx, 1009, ErrorKind::PayloadTooLarge);
    }

    SECTION("close frame with one byte of payload")
    {
        fixture fx;
        run_with(fx, client_frame(OpCode::Close, std::vector<std::uint8_t>{0x03}));
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("close frame with a code that may not be sent")
    {
        fixture fx;
        run_with(fx, client_close(1005));
        require_failed_with(fx, 1002, ErrorKind::ProtocolViolation);
    }

    SECTION("close frame with an invalid UTF-8 reason")
    {
        fixture fx;
        std::vector<std::uint8_t> payload{0x03, 0xe8, 0xff, 0xfe};
        run_with(fx, client_frame(OpCode::Close, payload));
        require_failed_with(fx, 1007, ErrorKind::InvalidPayload);
    }
}

TEST_CASE("session closing handshake", "[session]")
{
    SECTION("peer initiated close is echoed")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        fx.transport->push(client_close(1001, "bye"));
        fx.transport->push(client_frame(OpCode::Text, "ignored"));
        fx.sess->run();

        auto const frames = fx.frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].close_code() == 1001);
        REQUIRE(frames[0].text().substr(2) == "bye");
        REQUIRE(fx.handler->messages.empty());
        REQUIRE(fx.handler->errors.empty());
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1001);
        REQUIRE(fx.handler->closes[0].reason == "bye");
        REQUIRE(fx.transport->closed());
    }

    SECTION("empty close is answered with 1000 and reported as 1005")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        fx.transport->push(client_frame(OpCode::Close, ""));
        fx.sess->run();

        auto const frames = fx.frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].close_code() == 1000);
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1005);
    }

    SECTION("server initiated close")
    {
        fixture fx;
        fx.handler->on_open_hook = [](session& s) {
            REQUIRE(s.close(4000, "done"));
            REQUIRE(s.state() == ConnectionState::ClosingSent);
            REQUIRE_FALSE(s.send_text("too late"));
            REQUIRE_FALSE(s.close());
        };
        fx.transport->push(upgrade_request());
        fx.transport->push(client_frame(OpCode::Text, "discarded"));
        fx.transport->push(client_close(4000));
        fx.sess->run();

        auto const frames = fx.frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].close_code() == 4000);
        REQUIRE(fx.handler->messages.empty());
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 4000);
        REQUIRE(fx.handler->errors.empty());
    }

    SECTION("close code that may not be sent")
    {
        fixture fx;
        REQUIRE_THROWS_AS(fx.sess->close(1006), std::invalid_argument);
        REQUIRE_THROWS_AS(fx.sess->close(1000, std::string(124, 'r')), std::invalid_argument);
    }

    SECTION("peer never answers our close")
    {
        session_config config = test_config();
        config.close_timeout = 30ms;
        fixture fx(config);
        fx.handler->on_open_hook = [](session& s) { s.close(); };
        fx.transport->push(upgrade_request());
        fx.sess->run();

        REQUIRE(fx.frames().size() == 1);
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::Timeout});
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1006);
    }

    SECTION("peer drops the connection without a close frame")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        fx.transport->push_eof();
        fx.sess->run();

        REQUIRE(fx.frames().empty());
        REQUIRE(fx.handler->errors.empty());
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1006);
    }

    SECTION("transport error")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        fx.transport->push_error();
        fx.sess->run();

        REQUIRE(fx.frames().empty());
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::TransportError});
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1006);
    }

    SECTION("shutdown from another thread")
    {
        fixture fx;
        fx.transport->push(upgrade_request());
        std::jthread worker([&fx] { fx.sess->run(); });

        fx.wait_until_open();
        REQUIRE(fx.sess->state() == ConnectionState::Open);
        fx.sess->shutdown();
        worker.join();

        auto const frames = fx.frames();
        REQUIRE(frames.size() == 1);
        REQUIRE(frames[0].close_code() == 1001);
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1001);
        REQUIRE(fx.sess->state() == ConnectionState::Closed);
    }
}

TEST_CASE("session keepalive", "[session]")
{
    SECTION("idle connection is pinged, then closed with 1001")
    {
        session_config config = test_config();
        config.idle_timeout = 20ms;
        config.pong_timeout = 20ms;
        fixture fx(config);
        fx.transport->push(upgrade_request());
        fx.sess->run();

        auto const frames = fx.frames();
        REQUIRE(frames.size() == 2);
        REQUIRE(frames[0].op_code == OpCode::Ping);
        REQUIRE(frames[1].op_code == OpCode::Close);
        REQUIRE(frames[1].close_code() == 1001);
        REQUIRE(fx.handler->errors == std::vector<ErrorKind>{ErrorKind::Timeout});
        REQUIRE(fx.handler->closes.size() == 1);
        REQUIRE(fx.handler->closes[0].code == 1001);
    }

    SECTION("pong keeps the connection open")
    {
        session_config config = test_config();
        config.idle_timeout = 20ms;
        config.pong_timeout = 2s;
        fixture fx(config);
        fx.transport->push(upgrade_request());
        std::jthread worker([&fx] { fx.sess->run(); });

        REQUIRE(fx.wait_for_frames(1));
        REQUIRE(fx.frames()[0].op_code == OpCode::Ping);

        fx.transport->push(client_frame(OpCode::Pong, ""));
        fx.transport->push(client_close(1000));
        worker.join();

        REQUIRE(fx.handler->pongs.size() == 1);
        REQUIRE(fx.handler->errors.empty());
        REQUIRE(fx.handler->closes.at(0).code == 1000);
    }
}

TEST_CASE("session concurrent senders", "[session]")
{
    fixture fx;
    fx.transport->push(upgrade_request());
    std::jthread worker([&fx] { fx.sess->run(); });

    fx.wait_until_open();
    REQUIRE(fx.sess->state() == ConnectionState::Open);

    std::vector<std::jthread> senders;
    for (int i = 0; i < 4; ++i) {
        senders.emplace_back([&fx, i] {
            std::string const msg = "sender " + std::to_string(i);
            for (int n = 0; n < 200; ++n) {
                if (!fx.sess->send_text(msg)) {
                    break;
                }
            }
        });
    }
    std::this_thread::sleep_for(1ms);
    REQUIRE(fx.sess->close(1000, "enough"));
    senders.clear();

    fx.transport->push(client_close(1000));
    worker.join();

    auto const frames = fx.frames();
    REQUIRE_FALSE(frames.empty());
    REQUIRE(frames.back().op_code == OpCode::Close);
    for (std::size_t i = 0; i + 1 < frames.size(); ++i) {
        REQUIRE(frames[i].op_code == OpCode::Text);
        REQUIRE(frames[i].text().starts_with("sender "));
    }
}

} // namespace wsproto::test
