#pragma once

#include "wsproto/session.hpp"
#include <atomic>
#include <cstdint>
#include <span>
#include <string_view>

namespace wsproto {

/*! \class  echo_handler
 *  \brief  Sends every text and binary message back to its sender.
 */
class echo_handler : public session_handler
{
public:
    void on_open(session&) override;
    void on_message(session&, MessageType, std::span<std::uint8_t const>) override;
    void on_close(session&, std::uint16_t code, std::string_view reason) override;
    void on_error(session&, ErrorKind) override;

    /// messages echoed by this handler
    std::uint64_t echoed() const noexcept;

private:
    std::atomic<std::uint64_t> echoed_{0};
};

} // namespace wsproto
