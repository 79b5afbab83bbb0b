#include "message_reassembler.hpp"
#include "frame_fmt.hpp"
#include "util/utf8.hpp"
#include <spdlog/spdlog.h>

namespace wsproto {

message_reassembler::message_reassembler(std::uint64_t max_message_size) noexcept
        : max_message_size_(max_message_size)
{
    // empty
}

ReassemblyResult
message_reassembler::feed(frame const& f)
{
    // a delivered message is dropped once the next frame arrives
    if (msg_.complete) {
        reset();
    }

    switch (f.op_code()) {
        case OpCode::Text:
        case OpCode::Binary: {
            if (state_ == State::Accumulating) {
                SPDLOG_DEBUG("received {} frame while a fragmented message is in progress",
                        f.op_code());
                return ReassemblyResult::ProtocolError;
            }

            msg_.type = f.op_code() == OpCode::Text ? MessageType::Text : MessageType::Binary;
            msg_.payload.clear();
            fragments_ = 0;

            if (ReassemblyResult r = append(f.payload()); r != ReassemblyResult::Incomplete) {
                return r;
            }
            if (f.fin()) {
                return finish();
            }

            state_ = State::Accumulating;
            SPDLOG_DEBUG("starting fragmented {} message", f.op_code());
            return ReassemblyResult::Incomplete;
        }

        case OpCode::Continuation: {
            if (state_ != State::Accumulating) {
                SPDLOG_DEBUG("received continuation frame without prior fragmented message");
                return ReassemblyResult::ProtocolError;
            }

            if (ReassemblyResult r = append(f.payload()); r != ReassemblyResult::Incomplete) {
                return r;
            }
            SPDLOG_TRACE("accumulated fragment: {} bytes this frame, {} bytes total",
                    f.payload_len(), msg_.payload.size());

            if (f.fin()) {
                return finish();
            }
            return ReassemblyResult::Incomplete;
        }

        case OpCode::Close:
        case OpCode::Ping:
        case OpCode::Pong:
            break;
    }

    SPDLOG_ERROR("control frame {} passed to the reassembler", f.op_code());
    return ReassemblyResult::ProtocolError;
}

ReassemblyResult
message_reassembler::append(std::span<std::uint8_t const> payload)
{
    if (msg_.payload.size() + payload.size() > max_message_size_) {
        SPDLOG_DEBUG("message exceeds {} bytes", max_message_size_);
        return ReassemblyResult::MessageTooBig;
    }
    msg_.payload.insert(msg_.payload.end(), payload.begin(), payload.end());
    ++fragments_;
    return ReassemblyResult::Incomplete;
}

ReassemblyResult
message_reassembler::finish()
{
    state_ = State::Idle;

    if (msg_.type == MessageType::Text && !is_valid_utf8(msg_.payload)) {
        SPDLOG_DEBUG("text message of {} bytes is not valid UTF-8", msg_.payload.size());
        return ReassemblyResult::InvalidPayload;
    }

    msg_.complete = true;
    return ReassemblyResult::Complete;
}

message&
message_reassembler::current() noexcept
{
    return msg_;
}

message_reassembler::State
message_reassembler::state() const noexcept
{
    return state_;
}

std::size_t
message_reassembler::buffered() const noexcept
{
    return msg_.payload.size();
}

std::size_t
message_reassembler::fragments() const noexcept
{
    return fragments_;
}

void
message_reassembler::reset() noexcept
{
    state_ = State::Idle;
    msg_.payload.clear();
    msg_.complete = false;
    fragments_ = 0;
}

} // namespace wsproto
