#pragma once

#include "wsproto/frame.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wsproto::test {

static constexpr masking_key_type TestMaskingKey = {0x37, 0xfa, 0x21, 0x3d};

/// view the bytes of a string or vector as uint8_t
template <typename T = std::uint8_t const>
std::span<T>
as_uint8_span(auto& str)
{
    return std::span<T>(reinterpret_cast<T*>(str.data()), str.size());
}

inline std::string
as_str(std::span<std::uint8_t const> sp)
{
    return std::string(reinterpret_cast<char const*>(sp.data()), sp.size());
}

inline std::vector<std::uint8_t>
to_bytes(std::string_view s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

/// Build a frame the way a client would: masked, minimal length. \p byte1
/// is written as given so tests can set reserved bits and opcodes.
inline std::vector<std::uint8_t>
raw_client_frame(std::uint8_t byte1, std::span<std::uint8_t const> payload, bool masked = true,
        masking_key_type const& key = TestMaskingKey)
{
    std::vector<std::uint8_t> out;
    out.push_back(byte1);

    std::uint8_t const mask_bit = masked ? 0x80 : 0x00;
    std::uint64_t const len = payload.size();
    if (len <= MaxPayloadLen7) {
        out.push_back(mask_bit | static_cast<std::uint8_t>(len));
    } else if (len <= MaxPayloadLen16) {
        out.push_back(mask_bit | 126);
        out.push_back(static_cast<std::uint8_t>(len >> 8));
        out.push_back(static_cast<std::uint8_t>(len));
    } else {
        out.push_back(mask_bit | 127);
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<std::uint8_t>(len >> shift));
        }
    }

    std::size_t const payload_pos = out.size() + (masked ? key.size() : 0);
    if (masked) {
        out.insert(out.end(), key.begin(), key.end());
    }
    out.insert(out.end(), payload.begin(), payload.end());
    if (masked) {
        apply_mask(std::span<std::uint8_t>(out).subspan(payload_pos), key);
    }
    return out;
}

inline std::vector<std::uint8_t>
client_frame(OpCode op, std::span<std::uint8_t const> payload, bool fin = true)
{
    std::uint8_t const byte1 = (fin ? 0x80 : 0x00) | static_cast<std::uint8_t>(op);
    return raw_client_frame(byte1, payload);
}

inline std::vector<std::uint8_t>
client_frame(OpCode op, std::string_view payload, bool fin = true)
{
    return client_frame(op, to_bytes(payload), fin);
}

/// A decoded client frame, as the session would see it
inline frame
parsed_frame(OpCode op, std::string_view payload, bool fin = true)
{
    frame f;
    f.parse_from_buffer(client_frame(op, payload, fin));
    return f;
}

inline std::vector<std::uint8_t>
client_close(std::uint16_t code, std::string_view reason = "")
{
    std::vector<std::uint8_t> payload{
            static_cast<std::uint8_t>(code >> 8), static_cast<std::uint8_t>(code)};
    payload.insert(payload.end(), reason.begin(), reason.end());
    return client_frame(OpCode::Close, payload);
}

inline std::string
upgrade_request(std::string_view extra_headers = "",
        std::string_view key = "dGhlIHNhbXBsZSBub25jZQ==", std::string_view version = "13")
{
    std::string req = "GET /chat HTTP/1.1\r\n"
                      "Host: server.example.com\r\n"
                      "Upgrade: websocket\r\n"
                      "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: ";
    req += key;
    req += "\r\n";
    req += "Sec-WebSocket-Version: ";
    req += version;
    req += "\r\n";
    req += extra_headers;
    req += "\r\n";
    return req;
}

/// One frame written by the server
struct server_frame
{
    OpCode op_code = OpCode::Continuation;
    bool fin = false;
    bool masked = false;
    std::vector<std::uint8_t> payload;

    std::uint16_t
    close_code() const
    {
        return payload.size() < 2 ? 0 : static_cast<std::uint16_t>((payload[0] << 8) | payload[1]);
    }

    std::string_view
    text() const
    {
        return std::string_view(reinterpret_cast<char const*>(payload.data()), payload.size());
    }
};

/// Decode everything after the HTTP response head. Stops at a partial frame.
inline std::vector<server_frame>
parse_server_frames(std::span<std::uint8_t const> data)
{
    std::vector<server_frame> frames;
    frame f;
    while (!data.empty() && f.parse_from_buffer(data) == ParseResult::Success) {
        auto const payload = f.payload();
        frames.push_back(server_frame{
                f.op_code(), f.fin(), f.masked(), {payload.begin(), payload.end()}});
        data = data.subspan(f.total_size());
    }
    return frames;
}

} // namespace wsproto::test
