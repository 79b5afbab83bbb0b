#pragma once

#include "close_code.hpp"
#include "frame.hpp"
#include <spdlog/fmt/fmt.h>
#include <string_view>

namespace wsproto {

constexpr std::string_view
to_string(OpCode o) noexcept
{
    switch (o) {
        case OpCode::Continuation:
            return "Continuation";
        case OpCode::Text:
            return "Text";
        case OpCode::Binary:
            return "Binary";
        case OpCode::Close:
            return "Close";
        case OpCode::Ping:
            return "Ping";
        case OpCode::Pong:
            return "Pong";
    }
    return "???";
}

constexpr std::string_view
to_string(ParseResult r) noexcept
{
    switch (r) {
        case ParseResult::Success:
            return "Success";
        case ParseResult::NeedMoreData:
            return "NeedMoreData";
        case ParseResult::InvalidFrame:
            return "InvalidFrame";
        case ParseResult::PayloadTooBig:
            return "PayloadTooBig";
    }
    return "???";
}

constexpr std::string_view
to_string(FrameError e) noexcept
{
    switch (e) {
        case FrameError::None:
            return "None";
        case FrameError::ReservedBits:
            return "ReservedBits";
        case FrameError::ReservedOpCode:
            return "ReservedOpCode";
        case FrameError::FragmentedControl:
            return "FragmentedControl";
        case FrameError::ControlTooLong:
            return "ControlTooLong";
        case FrameError::NonMinimalLength:
            return "NonMinimalLength";
        case FrameError::LengthHighBit:
            return "LengthHighBit";
    }
    return "???";
}

} // namespace wsproto


// formatters used by the SPDLOG_* macros

template <>
struct fmt::formatter<wsproto::OpCode> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::OpCode o, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(o), ctx);
    }
};

template <>
struct fmt::formatter<wsproto::ParseResult> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::ParseResult r, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(r), ctx);
    }
};

template <>
struct fmt::formatter<wsproto::FrameError> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::FrameError e, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(e), ctx);
    }
};

template <>
struct fmt::formatter<wsproto::CloseCode> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto
    format(wsproto::CloseCode c, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(wsproto::to_string(c), ctx);
    }
};
