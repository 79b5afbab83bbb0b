#include "http_request.hpp"
#include "util/str_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm> // std::find_if, std::any_of

namespace wsproto {

namespace {
    static constexpr std::string_view Crlf = "\r\n";
    static constexpr std::string_view HeadTerminator = "\r\n\r\n";

    /// RFC 7230 token characters, enough to reject garbage field names
    bool
    is_token(std::string_view s) noexcept
    {
        static constexpr std::string_view Separators = "()<>@,;:\\\"/[]?={} \t";
        if (s.empty()) {
            return false;
        }
        return std::none_of(s.begin(), s.end(), [](char c) {
            auto const u = static_cast<unsigned char>(c);
            return u <= 0x20 || u >= 0x7f || Separators.find(c) != std::string_view::npos;
        });
    }
} // namespace

void
header_map::add(std::string_view name, std::string_view value)
{
    if (auto itr = lookup(name); itr != fields_.end()) {
        itr->second += ", ";
        itr->second += value;
        return;
    }
    fields_.emplace_back(std::string(name), std::string(value));
}

void
header_map::set(std::string_view name, std::string_view value)
{
    if (auto itr = lookup(name); itr != fields_.end()) {
        itr->second = value;
        return;
    }
    fields_.emplace_back(std::string(name), std::string(value));
}

std::vector<header_map::value_type>::iterator
header_map::lookup(std::string_view name) noexcept
{
    return std::find_if(fields_.begin(), fields_.end(),
            [name](value_type const& f) { return iequals(f.first, name); });
}

std::optional<std::string_view>
header_map::find(std::string_view name) const noexcept
{
    auto itr = std::find_if(fields_.begin(), fields_.end(),
            [name](value_type const& f) { return iequals(f.first, name); });
    if (itr == fields_.end()) {
        return std::nullopt;
    }
    return std::string_view(itr->second);
}

bool
header_map::contains(std::string_view name) const noexcept
{
    return find(name).has_value();
}

std::size_t
header_map::size() const noexcept
{
    return fields_.size();
}

bool
header_map::empty() const noexcept
{
    return fields_.empty();
}

header_map::const_iterator
header_map::begin() const noexcept
{
    return fields_.begin();
}

header_map::const_iterator
header_map::end() const noexcept
{
    return fields_.end();
}

/**********************************************************************/

HttpParseResult
parse_http_request(std::string_view data, http_request& out, std::size_t& consumed)
{
    std::size_t const head_end = data.find(HeadTerminator);
    if (head_end == std::string_view::npos) {
        return HttpParseResult::NeedMoreData;
    }
    consumed = head_end + HeadTerminator.size();

    std::string_view head = data.substr(0, head_end + Crlf.size());

    // request line: method SP request-target SP HTTP-version
    std::size_t const line_end = head.find(Crlf);
    std::string_view const request_line = head.substr(0, line_end);
    head.remove_prefix(line_end + Crlf.size());

    std::size_t const sp1 = request_line.find(' ');
    std::size_t const sp2 = request_line.rfind(' ');
    if (sp1 == std::string_view::npos || sp1 == sp2) {
        SPDLOG_DEBUG("malformed request line: [{}]", request_line);
        return HttpParseResult::Invalid;
    }

    std::string_view const method = request_line.substr(0, sp1);
    std::string_view const path = trim(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
    std::string_view const version = request_line.substr(sp2 + 1);

    if (!is_token(method) || path.empty() || path.find(' ') != std::string_view::npos) {
        SPDLOG_DEBUG("malformed request line: [{}]", request_line);
        return HttpParseResult::Invalid;
    }
    if (version != "HTTP/1.1") {
        SPDLOG_DEBUG("unsupported version: [{}]", version);
        return HttpParseResult::Invalid;
    }

    out.method = method;
    out.path = path;
    out.version = version;
    out.headers = header_map{};

    // header fields: name ":" OWS value OWS
    while (!head.empty()) {
        std::size_t const eol = head.find(Crlf);
        std::string_view const line = head.substr(0, eol);
        head.remove_prefix(eol + Crlf.size());

        std::size_t const colon = line.find(':');
        if (colon == std::string_view::npos) {
            SPDLOG_DEBUG("header line without colon: [{}]", line);
            return HttpParseResult::Invalid;
        }

        std::string_view const name = line.substr(0, colon);
        if (!is_token(name)) {
            SPDLOG_DEBUG("invalid header name: [{}]", name);
            return HttpParseResult::Invalid;
        }
        out.headers.add(name, trim(line.substr(colon + 1)));
    }

    return HttpParseResult::Success;
}

} // namespace wsproto
