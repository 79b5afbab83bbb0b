#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wsproto {

/*! \class  header_map
 *  \brief  HTTP header fields in arrival order. Field names compare
 *          case-insensitively (RFC 7230 section 3.2); a repeated field is
 *          folded into one comma-separated value.
 */
class header_map
{
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    /// Add a field, appending to an existing one with the same name
    void add(std::string_view name, std::string_view value);

    /// Add a field, replacing an existing one with the same name
    void set(std::string_view name, std::string_view value);

    std::optional<std::string_view> find(std::string_view name) const noexcept;
    bool contains(std::string_view name) const noexcept;

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

private:
    std::vector<value_type>::iterator lookup(std::string_view name) noexcept;

private:
    std::vector<value_type> fields_;
};

/// An HTTP/1.1 request head. Immutable once parsed.
struct http_request
{
    std::string method;
    std::string path;
    std::string version;
    header_map headers;
};

enum class HttpParseResult
{
    Success,
    NeedMoreData,
    Invalid
};

/// Parse an HTTP request head (request line and header fields up to the
/// empty line). Only \c HTTP/1.1 is accepted.
/// \param consumed set to the length of the head including the final CRLFCRLF
HttpParseResult parse_http_request(std::string_view data, http_request& out, std::size_t& consumed);

} // namespace wsproto
