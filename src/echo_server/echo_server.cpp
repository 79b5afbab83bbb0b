#include "echo_server.hpp"
#include "wsproto/session_fmt.hpp"
#include <spdlog/spdlog.h>

namespace wsproto {

void
echo_handler::on_open(session& s)
{
    SPDLOG_INFO("{}: echo session open, path [{}]", s.peer(), s.request().path);
}

void
echo_handler::on_message(session& s, MessageType type, std::span<std::uint8_t const> payload)
{
    bool sent = false;
    switch (type) {
        case MessageType::Text:
            sent = s.send_text(std::string_view(
                    reinterpret_cast<char const*>(payload.data()), payload.size()));
            break;
        case MessageType::Binary:
            sent = s.send_binary(payload);
            break;
    }

    if (!sent) {
        SPDLOG_DEBUG("{}: {} message of {} bytes not echoed, state {}", s.peer(), type,
                payload.size(), s.state());
        return;
    }
    ++echoed_;
}

void
echo_handler::on_close(session& s, std::uint16_t code, std::string_view reason)
{
    SPDLOG_INFO("{}: echo session closed with {} [{}] after {} messages", s.peer(), code, reason,
            echoed_.load());
}

void
echo_handler::on_error(session& s, ErrorKind kind)
{
    SPDLOG_WARN("{}: {}", s.peer(), kind);
}

std::uint64_t
echo_handler::echoed() const noexcept
{
    return echoed_.load();
}

} // namespace wsproto
