#pragma once

#include "frame.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace wsproto {

enum class MessageType : std::uint8_t
{
    Text,
    Binary
};

/// An application message built from one or more data frames
struct message
{
    MessageType type = MessageType::Binary;
    std::vector<std::uint8_t> payload;
    bool complete = false;

    std::string_view
    text() const noexcept
    {
        return std::string_view(reinterpret_cast<char const*>(payload.data()), payload.size());
    }
};

enum class ReassemblyResult
{
    Incomplete,     ///< fragment stored, more to come
    Complete,       ///< message() is ready
    ProtocolError,  ///< bad continuation sequence, close with 1002
    InvalidPayload, ///< text message is not UTF-8, close with 1007
    MessageTooBig   ///< accumulated size over the limit, close with 1009
};

/*! \class  message_reassembler
 *  \brief  Joins data frames into messages. Control frames are handled
 *          elsewhere and never passed here, so they cannot disturb a
 *          message in progress.
 */
class message_reassembler
{
public:
    enum class State : std::uint8_t
    {
        Idle,
        Accumulating
    };

    explicit message_reassembler(std::uint64_t max_message_size) noexcept;

    /// Feed one data frame (text, binary or continuation)
    ReassemblyResult feed(frame const&);

    /// The completed message after feed() returned Complete. Moving out of
    /// it is allowed; the next feed() starts over.
    message& current() noexcept;

    State state() const noexcept;

    /// number of payload bytes held for the message in progress
    std::size_t buffered() const noexcept;

    /// fragments seen for the message in progress
    std::size_t fragments() const noexcept;

    void reset() noexcept;

private:
    ReassemblyResult append(std::span<std::uint8_t const>);
    ReassemblyResult finish();

private:
    std::uint64_t max_message_size_;
    State state_ = State::Idle;
    message msg_;
    std::size_t fragments_ = 0;
};

} // namespace wsproto
