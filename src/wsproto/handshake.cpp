#include "handshake.hpp"
#include "util/base64_codec.hpp"
#include "util/sha1.hpp"
#include "util/str_utils.hpp"
#include <spdlog/spdlog.h>

namespace wsproto {

namespace {
    static constexpr std::size_t KeySize = 16; ///< decoded Sec-WebSocket-Key length

    handshake_result
    reject_with(std::uint16_t status, std::string reason)
    {
        SPDLOG_DEBUG("rejecting upgrade: {} {}", status, reason);
        return handshake_reject{status, std::move(reason), {}};
    }
} // namespace

handshake_result::handshake_result(handshake_accept a)
        : result_(std::move(a))
{
    // empty
}

handshake_result::handshake_result(handshake_reject r)
        : result_(std::move(r))
{
    // empty
}

bool
handshake_result::accepted() const noexcept
{
    return std::holds_alternative<handshake_accept>(result_);
}

std::uint16_t
handshake_result::status() const noexcept
{
    if (accepted()) {
        return 101;
    }
    return std::get<handshake_reject>(result_).status;
}

handshake_accept const&
handshake_result::accept() const
{
    return std::get<handshake_accept>(result_);
}

handshake_reject const&
handshake_result::reject() const
{
    return std::get<handshake_reject>(result_);
}

std::string
handshake_result::to_http_response() const
{
    std::string response = "HTTP/1.1 ";
    response += std::to_string(status());
    response += ' ';
    response += reason_phrase(status());
    response += "\r\n";

    auto append_headers = [&response](header_map const& headers) {
        for (auto const& [name, value] : headers) {
            response += name;
            response += ": ";
            response += value;
            response += "\r\n";
        }
    };

    if (accepted()) {
        append_headers(accept().headers);
    } else {
        auto const& r = reject();
        append_headers(r.headers);
        response += "Content-Type: text/plain\r\n";
        response += "Content-Length: " + std::to_string(r.reason.size()) + "\r\n";
        response += "Connection: close\r\n";
        response += "\r\n";
        response += r.reason;
        return response;
    }

    response += "\r\n";
    return response;
}

std::string
compute_accept_key(std::string_view key)
{
    auto const digest = sha1{}.update(key).update(MagicGuid).finish();
    return base64_codec::encode(digest);
}

handshake_result
make_rejection(std::uint16_t status, std::string reason)
{
    return reject_with(status, std::move(reason));
}

handshake_result
negotiate(http_request const& req, subprotocol_selector const& selector)
{
    // Upgrade
    {
        auto val = req.headers.find("Upgrade");
        if (!val) {
            return reject_with(400, "missing Upgrade header");
        }
        if (!iequals(trim(*val), "websocket")) {
            return reject_with(400, "Upgrade header must be 'websocket'");
        }
    }

    // Connection
    {
        auto val = req.headers.find("Connection");
        if (!val) {
            return reject_with(400, "missing Connection header");
        }
        if (!contains_token(*val, "Upgrade")) {
            return reject_with(400, "Connection header must contain 'Upgrade'");
        }
    }

    // Sec-WebSocket-Version
    {
        auto val = req.headers.find("Sec-WebSocket-Version");
        if (!val || *val != SupportedVersion) {
            handshake_reject r{426, "unsupported Sec-WebSocket-Version", {}};
            r.headers.set("Sec-WebSocket-Version", SupportedVersion);
            SPDLOG_DEBUG("rejecting upgrade: version [{}]", val.value_or(""));
            return r;
        }
    }

    // Sec-WebSocket-Key
    std::string_view key;
    {
        auto val = req.headers.find("Sec-WebSocket-Key");
        if (!val) {
            return reject_with(400, "missing Sec-WebSocket-Key header");
        }
        key = *val;
        auto decoded = from_base64(key);
        if (!decoded || decoded->size() != KeySize) {
            return reject_with(400, "Sec-WebSocket-Key must be 16 bytes of base64");
        }
    }

    handshake_accept accept;
    accept.headers.set("Upgrade", "websocket");
    accept.headers.set("Connection", "Upgrade");
    accept.headers.set("Sec-WebSocket-Accept", compute_accept_key(key));

    if (selector) {
        if (auto offered = req.headers.find("Sec-WebSocket-Protocol"); offered) {
            if (auto chosen = selector(split_list(*offered)); chosen) {
                accept.headers.set("Sec-WebSocket-Protocol", *chosen);
            }
        }
    }

    return accept;
}

std::string_view
reason_phrase(std::uint16_t status) noexcept
{
    switch (status) {
        case 101:
            return "Switching Protocols";
        case 400:
            return "Bad Request";
        case 403:
            return "Forbidden";
        case 405:
            return "Method Not Allowed";
        case 426:
            return "Upgrade Required";
        case 431:
            return "Request Header Fields Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

} // namespace wsproto
