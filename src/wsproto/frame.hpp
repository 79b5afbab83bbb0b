#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace wsproto {

/// min number of bytes needed to read a frame's basic header
static constexpr std::size_t MinFrameHeaderSize = 2;

/// max number of bytes in a frame header (2 basic + 8 extended + 4 mask)
static constexpr std::size_t MaxFrameHeaderSize = 14;

/// max payload of a close, ping or pong frame
static constexpr std::size_t MaxControlPayloadSize = 125;

/// payload sizes above this need the 16-bit, then the 64-bit length form
static constexpr std::uint64_t MaxPayloadLen7 = 125;
static constexpr std::uint64_t MaxPayloadLen16 = 65535;

enum class OpCode : std::uint8_t
{
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xa
};

enum class ParseResult
{
    Success,
    NeedMoreData,
    InvalidFrame,
    PayloadTooBig
};

/// Why a frame was rejected with ParseResult::InvalidFrame
enum class FrameError : std::uint8_t
{
    None,
    ReservedBits,      ///< rsv1-3 set without a negotiated extension
    ReservedOpCode,    ///< 0x3-0x7, 0xb-0xf
    FragmentedControl, ///< control frame with fin == 0
    ControlTooLong,    ///< control frame payload > 125 bytes
    NonMinimalLength,  ///< extended length used for a length that fits a shorter form
    LengthHighBit      ///< 64-bit length with the most significant bit set
};

using masking_key_type = std::array<std::uint8_t, 4>;

/// \return the opcode for a raw 4-bit value, \c std::nullopt for reserved values
std::optional<OpCode> to_op_code(std::uint8_t) noexcept;

/// \return \c true for close, ping and pong
bool is_control(OpCode) noexcept;

/// Represents the basic 2-byte WebSocket frame header
struct basic_websocket_header
{
    std::uint8_t byte1 = 0; // FIN, RSV1-3, OpCode
    std::uint8_t byte2 = 0; // MASK, payload length (7 bits)

    bool fin() const noexcept;
    bool rsv1() const noexcept;
    bool rsv2() const noexcept;
    bool rsv3() const noexcept;
    std::uint8_t raw_op_code() const noexcept;
    bool masked() const noexcept;
    std::uint8_t payload_len_indicator() const noexcept;
} __attribute__((packed));

/// One decoded WebSocket frame. The payload is stored unmasked.
class frame
{
private:
    bool fin_ = false;
    bool rsv1_ = false;
    bool rsv2_ = false;
    bool rsv3_ = false;
    OpCode op_code_ = OpCode::Continuation;
    bool masked_ = false;
    std::uint64_t payload_len_ = 0;
    masking_key_type masking_key_{};
    std::size_t header_size_ = 0;
    bool valid_ = false;
    FrameError error_ = FrameError::None;
    std::vector<std::uint8_t> payload_data_;

public:
    frame() = default;

    /// reset frame to initial state
    void reset() noexcept;

public:
    /// Parse one frame from the start of a buffer. Never blocks: when the
    /// buffer holds only part of a frame the caller appends more bytes and
    /// calls again.
    /// \param max_payload frames announcing a larger payload are refused
    ///        before their payload is buffered
    /// \return ParseResult::Success with total_size() bytes consumed
    ParseResult parse_from_buffer(std::uint8_t const*, std::size_t,
            std::uint64_t max_payload = std::numeric_limits<std::uint64_t>::max());

    ParseResult parse_from_buffer(std::span<std::uint8_t const>,
            std::uint64_t max_payload = std::numeric_limits<std::uint64_t>::max());

public:
    bool fin() const noexcept;
    bool rsv1() const noexcept;
    bool rsv2() const noexcept;
    bool rsv3() const noexcept;
    OpCode op_code() const noexcept;
    bool masked() const noexcept;
    std::uint64_t payload_len() const noexcept;
    std::size_t header_size() const noexcept;
    bool valid() const noexcept;
    FrameError error() const noexcept;
    masking_key_type const& masking_key() const noexcept;

    /// total frame size (header + payload)
    std::uint64_t total_size() const noexcept;

    /// payload data, already unmasked
    std::span<std::uint8_t const> payload() const noexcept;

    /// payload viewed as characters, no UTF-8 check
    std::string_view payload_text() const noexcept;

private:
    /// rsv bits and control frame constraints, checked once the length is known
    bool validate_header() noexcept;

    static std::uint16_t read_be16(std::uint8_t const*) noexcept;
    static std::uint64_t read_be64(std::uint8_t const*) noexcept;
};

/// XOR \p data with \p key, starting at key index \p offset % 4.
/// Applying it twice with the same key restores the input.
void apply_mask(std::span<std::uint8_t> data, masking_key_type const& key,
        std::size_t offset = 0) noexcept;

/// Size of the header encode_frame() writes for an unmasked payload
std::size_t encoded_header_size(std::uint64_t payload_len) noexcept;

/// Encode one unmasked frame with the minimal length form and rsv bits clear.
/// \throws std::invalid_argument for a control frame whose payload exceeds
///         125 bytes or which is not final
std::vector<std::uint8_t> encode_frame(
        OpCode, bool fin, std::span<std::uint8_t const> payload);

} // namespace wsproto
