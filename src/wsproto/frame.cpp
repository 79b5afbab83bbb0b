#include "frame.hpp"
#include <bit>     // std::byteswap, std::endian
#include <cstring> // std::memcpy
#include <stdexcept>

namespace wsproto {

std::optional<OpCode>
to_op_code(std::uint8_t raw) noexcept
{
    switch (raw) {
        case 0x0:
            return OpCode::Continuation;
        case 0x1:
            return OpCode::Text;
        case 0x2:
            return OpCode::Binary;
        case 0x8:
            return OpCode::Close;
        case 0x9:
            return OpCode::Ping;
        case 0xa:
            return OpCode::Pong;
        default:
            return std::nullopt; // 0x3-0x7 and 0xb-0xf are reserved
    }
}

bool
is_control(OpCode op) noexcept
{
    switch (op) {
        case OpCode::Close:
        case OpCode::Ping:
        case OpCode::Pong:
            return true;
        case OpCode::Continuation:
        case OpCode::Text:
        case OpCode::Binary:
            return false;
    }
    return false;
}

/**********************************************************************/

bool
basic_websocket_header::fin() const noexcept
{
    return byte1 & 0b1000'0000;
}

bool
basic_websocket_header::rsv1() const noexcept
{
    return byte1 & 0b0100'0000;
}

bool
basic_websocket_header::rsv2() const noexcept
{
    return byte1 & 0b0010'0000;
}

bool
basic_websocket_header::rsv3() const noexcept
{
    return byte1 & 0b0001'0000;
}

std::uint8_t
basic_websocket_header::raw_op_code() const noexcept
{
    return byte1 & 0b0000'1111;
}

bool
basic_websocket_header::masked() const noexcept
{
    return byte2 & 0b1000'0000;
}

std::uint8_t
basic_websocket_header::payload_len_indicator() const noexcept
{
    return byte2 & 0b0111'1111;
}

/**********************************************************************/

void
frame::reset() noexcept
{
    fin_ = false;
    rsv1_ = rsv2_ = rsv3_ = false;
    op_code_ = OpCode::Continuation;
    masked_ = false;
    payload_len_ = 0;
    masking_key_.fill(0);
    header_size_ = 0;
    valid_ = false;
    error_ = FrameError::None;
    payload_data_.clear();
}

ParseResult
frame::parse_from_buffer(std::span<std::uint8_t const> data, std::uint64_t max_payload)
{
    return parse_from_buffer(data.data(), data.size(), max_payload);
}

ParseResult
frame::parse_from_buffer(std::uint8_t const* data, std::size_t avail, std::uint64_t max_payload)
{
    reset();

    if (avail < MinFrameHeaderSize) {
        return ParseResult::NeedMoreData;
    }

    // parse basic header
    basic_websocket_header header;
    std::memcpy(&header, data, sizeof(header));

    fin_ = header.fin();
    rsv1_ = header.rsv1();
    rsv2_ = header.rsv2();
    rsv3_ = header.rsv3();
    masked_ = header.masked();

    std::optional<OpCode> const op_code = to_op_code(header.raw_op_code());
    if (!op_code) {
        error_ = FrameError::ReservedOpCode;
        return ParseResult::InvalidFrame;
    }
    op_code_ = *op_code;

    std::uint8_t const payload_indicator = header.payload_len_indicator();
    header_size_ = MinFrameHeaderSize;

    // parse extended payload length
    if (payload_indicator <= MaxPayloadLen7) {
        payload_len_ = payload_indicator;
    } else if (payload_indicator == 126) {
        if (avail < header_size_ + 2) {
            return ParseResult::NeedMoreData;
        }
        payload_len_ = read_be16(data + header_size_);
        header_size_ += 2;

        if (payload_len_ <= MaxPayloadLen7) {
            error_ = FrameError::NonMinimalLength;
            return ParseResult::InvalidFrame;
        }
    } else { // payload_indicator == 127
        if (avail < header_size_ + 8) {
            return ParseResult::NeedMoreData;
        }
        payload_len_ = read_be64(data + header_size_);
        header_size_ += 8;

        // MSB must be 0 (no payloads > 2^63-1)
        if (payload_len_ & 0x8000'0000'0000'0000ull) {
            error_ = FrameError::LengthHighBit;
            return ParseResult::InvalidFrame;
        }
        if (payload_len_ <= MaxPayloadLen16) {
            error_ = FrameError::NonMinimalLength;
            return ParseResult::InvalidFrame;
        }
    }

    if (!validate_header()) {
        return ParseResult::InvalidFrame;
    }

    if (payload_len_ > max_payload) {
        return ParseResult::PayloadTooBig;
    }

    // parse masking key if present
    if (masked_) {
        if (avail < header_size_ + masking_key_.size()) {
            return ParseResult::NeedMoreData;
        }
        std::memcpy(masking_key_.data(), data + header_size_, masking_key_.size());
        header_size_ += masking_key_.size();
    }

    // check if we have complete frame
    if (avail - header_size_ < payload_len_) {
        return ParseResult::NeedMoreData;
    }

    // extract and store payload data, unmasked
    payload_data_.assign(data + header_size_, data + header_size_ + payload_len_);
    if (masked_) {
        apply_mask(payload_data_, masking_key_);
    }

    valid_ = true;
    return ParseResult::Success;
}

bool
frame::validate_header() noexcept
{
    // RSV1-3 must be 0 unless extensions are negotiated, and none are
    if (rsv1_ || rsv2_ || rsv3_) {
        error_ = FrameError::ReservedBits;
        return false;
    }

    if (is_control(op_code_)) {
        if (!fin_) {
            error_ = FrameError::FragmentedControl;
            return false;
        }
        if (payload_len_ > MaxControlPayloadSize) {
            error_ = FrameError::ControlTooLong;
            return false;
        }
    }
    return true;
}

bool
frame::fin() const noexcept
{
    return fin_;
}

bool
frame::rsv1() const noexcept
{
    return rsv1_;
}

bool
frame::rsv2() const noexcept
{
    return rsv2_;
}

bool
frame::rsv3() const noexcept
{
    return rsv3_;
}

OpCode
frame::op_code() const noexcept
{
    return op_code_;
}

bool
frame::masked() const noexcept
{
    return masked_;
}

std::uint64_t
frame::payload_len() const noexcept
{
    return payload_len_;
}

std::size_t
frame::header_size() const noexcept
{
    return header_size_;
}

bool
frame::valid() const noexcept
{
    return valid_;
}

FrameError
frame::error() const noexcept
{
    return error_;
}

masking_key_type const&
frame::masking_key() const noexcept
{
    return masking_key_;
}

std::uint64_t
frame::total_size() const noexcept
{
    return header_size_ + payload_len_;
}

std::span<std::uint8_t const>
frame::payload() const noexcept
{
    return std::span<std::uint8_t const>(payload_data_);
}

std::string_view
frame::payload_text() const noexcept
{
    return std::string_view(reinterpret_cast<char const*>(payload_data_.data()), payload_data_.size());
}

std::uint16_t
frame::read_be16(std::uint8_t const* data) noexcept
{
    std::uint16_t value;
    std::memcpy(&value, data, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(value);
    }
    return value;
}

std::uint64_t
frame::read_be64(std::uint8_t const* data) noexcept
{
    std::uint64_t value;
    std::memcpy(&value, data, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(value);
    }
    return value;
}

/**********************************************************************/

void
apply_mask(std::span<std::uint8_t> data, masking_key_type const& key, std::size_t offset) noexcept
{
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] ^= key[(offset + i) % 4];
    }
}

std::size_t
encoded_header_size(std::uint64_t payload_len) noexcept
{
    if (payload_len <= MaxPayloadLen7) {
        return MinFrameHeaderSize;
    }
    if (payload_len <= MaxPayloadLen16) {
        return MinFrameHeaderSize + 2;
    }
    return MinFrameHeaderSize + 8;
}

std::vector<std::uint8_t>
encode_frame(OpCode opcode, bool fin, std::span<std::uint8_t const> payload)
{
    if (is_control(opcode)) {
        if (payload.size() > MaxControlPayloadSize) {
            throw std::invalid_argument("control frame payload cannot exceed 125 bytes");
        }
        if (!fin) {
            throw std::invalid_argument("control frames cannot be fragmented");
        }
    }

    std::uint64_t const payload_len = payload.size();
    std::size_t const header_size = encoded_header_size(payload_len);

    std::vector<std::uint8_t> out;
    out.reserve(header_size + payload.size());

    // byte 1: FIN + RSV (always 0) + OpCode
    out.push_back((fin ? 0x80 : 0x00) | static_cast<std::uint8_t>(opcode));

    // byte 2: MASK (never set by a server) + payload length
    if (payload_len <= MaxPayloadLen7) {
        out.push_back(static_cast<std::uint8_t>(payload_len));
    } else if (payload_len <= MaxPayloadLen16) {
        out.push_back(126);
        out.push_back(static_cast<std::uint8_t>(payload_len >> 8));
        out.push_back(static_cast<std::uint8_t>(payload_len));
    } else {
        out.push_back(127);
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<std::uint8_t>(payload_len >> shift));
        }
    }

    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

} // namespace wsproto
