#pragma once

#include "connection_state.hpp"
#include "message_reassembler.hpp"
#include "session.hpp"
#include <spdlog/fmt/fmt.h>
#include <string_view>

namespace wsproto {

constexpr std::string_view
to_string(ErrorKind k) noexcept
{
    switch (k) {
        case ErrorKind::HandshakeRejected:
            return "HandshakeRejected";
        case ErrorKind::ProtocolViolation:
            return "ProtocolViolation";
        case ErrorKind::InvalidPayload:
            return "InvalidPayload";
        case ErrorKind::PayloadTooLarge:
            return "PayloadTooLarge";
        case ErrorKind::TransportError:
            return "TransportError";
        case ErrorKind::Timeout:
            return "Timeout";
        case ErrorKind::InternalError:
            return "InternalError";
    }
    return "???";
}

constexpr std::string_view
to_string(MessageType t) noexcept
{
    switch (t) {
        case MessageType::Text:
            return "Text";
        case MessageType::Binary:
            return "Binary";
    }
    return "???";
}

constexpr std::string_view
to_string(ReassemblyResult r) noexcept
{
    switch (r) {
        case ReassemblyResult::Incomplete:
            return "Incomplete";
        case ReassemblyResult::Complete:
            return "Complete";
        case ReassemblyResult::ProtocolError:
            return "ProtocolError";
        case ReassemblyResult::InvalidPayload:
            return "InvalidPayload";
        case ReassemblyResult::MessageTooBig:
            return "MessageTooBig";
    }
    return "???";
}

} // namespace wsproto


template <>
struct fmt::formatter<wsproto::ConnectionState> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::ConnectionState s, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(s), ctx);
    }
};

template <>
struct fmt::formatter<wsproto::ErrorKind> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::ErrorKind k, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(k), ctx);
    }
};

template <>
struct fmt::formatter<wsproto::MessageType> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::MessageType t, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(t), ctx);
    }
};

template <>
struct fmt::formatter<wsproto::ReassemblyResult> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::ReassemblyResult r, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(r), ctx);
    }
};
