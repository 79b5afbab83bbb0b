#pragma once

#include "close_code.hpp"
#include "frame.hpp"
#include <span>
#include <string_view>
#include <vector>

namespace wsproto {

/*! \class  frame_generator
 *  \brief  Builds one outgoing server frame at a time. Server frames are
 *          never masked.
 *
 *  \code
 *  auto out = frame_generator{}.pong(ping_payload);
 *  transport.write(out.data());
 *  \endcode
 */
class frame_generator
{
private:
    std::vector<std::uint8_t> frame_data_;

public:
    frame_generator() = default;

    /// Create a ping frame
    /// \param payload Optional payload (max 125 bytes)
    /// \throws std::invalid_argument if the payload is too long
    frame_generator& ping(std::span<std::uint8_t const> payload = {});

    /// Create a pong frame, normally echoing a ping's payload
    /// \throws std::invalid_argument if the payload is too long
    frame_generator& pong(std::span<std::uint8_t const> payload = {});

    /// Create a close frame carrying \p code and \p reason
    /// \throws std::invalid_argument if code and reason exceed 125 bytes
    frame_generator& close(std::uint16_t code, std::string_view reason = "");
    frame_generator& close(CloseCode code = CloseCode::Normal, std::string_view reason = "");

    /// Create a text frame
    /// \param fin Whether this is the final fragment (default: true)
    frame_generator& text(std::string_view text, bool fin = true);

    /// Create a binary frame
    frame_generator& binary(std::span<std::uint8_t const> data, bool fin = true);

    /// Create a continuation frame
    frame_generator& continuation(std::span<std::uint8_t const> data, bool fin = false);

    /// Get the generated frame data ready for transmission
    std::span<std::uint8_t const> data() const noexcept;

    std::size_t size() const noexcept;

    /// Clear the generator to build a new frame
    frame_generator& reset() noexcept;

    /// Move the frame data out
    std::vector<std::uint8_t> take_data() noexcept;

private:
    void build_frame(OpCode opcode, std::span<std::uint8_t const> payload, bool fin);
};

} // namespace wsproto
