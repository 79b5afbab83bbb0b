#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wsproto {

/// Strip leading and trailing spaces and horizontal tabs (HTTP OWS)
std::string_view trim(std::string_view) noexcept;

std::string to_lower(std::string_view);

/// ASCII case-insensitive comparison
bool iequals(std::string_view, std::string_view) noexcept;

/// Split a comma-separated header value into trimmed, non-empty tokens
std::vector<std::string_view> split_list(std::string_view);

/// \return \c true if the comma-separated list contains \p token (case-insensitive)
bool contains_token(std::string_view list, std::string_view token);

} // namespace wsproto
