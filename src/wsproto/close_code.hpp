#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace wsproto {

/// Close status codes (RFC 6455 section 7.4.1 and the IANA registry)
enum class CloseCode : std::uint16_t
{
    Normal = 1000,
    GoingAway = 1001,
    ProtocolError = 1002,
    UnsupportedData = 1003,
    NoStatus = 1005,       ///< never sent, reported when the peer gave no code
    Abnormal = 1006,       ///< never sent, reported when the transport dropped
    InvalidPayload = 1007, ///< e.g. non UTF-8 text
    PolicyViolation = 1008,
    MessageTooBig = 1009,
    MandatoryExtension = 1010,
    InternalError = 1011,
    ServiceRestart = 1012,
    TryAgainLater = 1013,
    BadGateway = 1014
};

/// Code and reason of a close frame, sent or received
struct close_info
{
    std::uint16_t code = static_cast<std::uint16_t>(CloseCode::Normal);
    std::string reason;
};

constexpr std::uint16_t
to_underlying(CloseCode c) noexcept
{
    return static_cast<std::uint16_t>(c);
}

/// \return \c true if \p code may appear in a close frame on the wire
constexpr bool
is_valid_wire_close_code(std::uint16_t code) noexcept
{
    return (code >= 1000 && code <= 1003) || (code >= 1007 && code <= 1014)
            || (code >= 3000 && code <= 4999);
}

constexpr std::string_view
to_string(CloseCode c) noexcept
{
    switch (c) {
        case CloseCode::Normal:
            return "Normal";
        case CloseCode::GoingAway:
            return "GoingAway";
        case CloseCode::ProtocolError:
            return "ProtocolError";
        case CloseCode::UnsupportedData:
            return "UnsupportedData";
        case CloseCode::NoStatus:
            return "NoStatus";
        case CloseCode::Abnormal:
            return "Abnormal";
        case CloseCode::InvalidPayload:
            return "InvalidPayload";
        case CloseCode::PolicyViolation:
            return "PolicyViolation";
        case CloseCode::MessageTooBig:
            return "MessageTooBig";
        case CloseCode::MandatoryExtension:
            return "MandatoryExtension";
        case CloseCode::InternalError:
            return "InternalError";
        case CloseCode::ServiceRestart:
            return "ServiceRestart";
        case CloseCode::TryAgainLater:
            return "TryAgainLater";
        case CloseCode::BadGateway:
            return "BadGateway";
    }
    return "???";
}

} // namespace wsproto
