#include "frame_generator.hpp"
#include <stdexcept>

namespace wsproto {

frame_generator&
frame_generator::text(std::string_view text, bool fin)
{
    std::span<std::uint8_t const> payload(
            reinterpret_cast<std::uint8_t const*>(text.data()), text.size());
    build_frame(OpCode::Text, payload, fin);
    return *this;
}

frame_generator&
frame_generator::binary(std::span<std::uint8_t const> data, bool fin)
{
    build_frame(OpCode::Binary, data, fin);
    return *this;
}

frame_generator&
frame_generator::continuation(std::span<std::uint8_t const> data, bool fin)
{
    build_frame(OpCode::Continuation, data, fin);
    return *this;
}

frame_generator&
frame_generator::ping(std::span<std::uint8_t const> payload)
{
    build_frame(OpCode::Ping, payload, true);
    return *this;
}

frame_generator&
frame_generator::pong(std::span<std::uint8_t const> payload)
{
    build_frame(OpCode::Pong, payload, true);
    return *this;
}

frame_generator&
frame_generator::close(CloseCode code, std::string_view reason)
{
    return close(to_underlying(code), reason);
}

frame_generator&
frame_generator::close(std::uint16_t code, std::string_view reason)
{
    if (reason.size() + 2 > MaxControlPayloadSize) {
        throw std::invalid_argument("close payload (code + reason) cannot exceed 125 bytes");
    }

    // close code (big-endian) followed by the reason
    std::vector<std::uint8_t> close_payload;
    close_payload.reserve(2 + reason.size());
    close_payload.push_back(static_cast<std::uint8_t>(code >> 8));
    close_payload.push_back(static_cast<std::uint8_t>(code));
    close_payload.insert(close_payload.end(), reason.begin(), reason.end());

    build_frame(OpCode::Close, close_payload, true);
    return *this;
}

std::span<std::uint8_t const>
frame_generator::data() const noexcept
{
    return std::span<std::uint8_t const>(frame_data_);
}

std::size_t
frame_generator::size() const noexcept
{
    return frame_data_.size();
}

frame_generator&
frame_generator::reset() noexcept
{
    frame_data_.clear();
    return *this;
}

std::vector<std::uint8_t>
frame_generator::take_data() noexcept
{
    return std::move(frame_data_);
}

void
frame_generator::build_frame(OpCode opcode, std::span<std::uint8_t const> payload, bool fin)
{
    frame_data_ = encode_frame(opcode, fin, payload);
}

} // namespace wsproto
