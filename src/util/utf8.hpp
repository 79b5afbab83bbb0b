#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace wsproto {

/// Validate UTF-8 per RFC 3629: no overlong forms, no surrogates
/// (U+D800..U+DFFF), nothing above U+10FFFF.
bool is_valid_utf8(std::span<std::uint8_t const>) noexcept;
bool is_valid_utf8(std::string_view) noexcept;

} // namespace wsproto
