#include "str_utils.hpp"
#include <algorithm> // std::equal, std::transform
#include <cctype>    // std::tolower

namespace wsproto {

namespace {
    bool
    is_ows(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }

    char
    lower(char c) noexcept
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
} // namespace

std::string_view
trim(std::string_view s) noexcept
{
    while (!s.empty() && is_ows(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ows(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::string
to_lower(std::string_view str)
{
    std::string rv(str);
    std::transform(rv.begin(), rv.end(), rv.begin(), lower);
    return rv;
}

bool
iequals(std::string_view a, std::string_view b) noexcept
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) { return lower(x) == lower(y); });
}

std::vector<std::string_view>
split_list(std::string_view list)
{
    std::vector<std::string_view> tokens;

    while (!list.empty()) {
        std::size_t const comma = list.find(',');
        std::string_view const token = trim(list.substr(0, comma));
        if (!token.empty()) {
            tokens.push_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return tokens;
}

bool
contains_token(std::string_view list, std::string_view token)
{
    auto const tokens = split_list(list);
    return std::any_of(tokens.begin(), tokens.end(),
            [token](std::string_view t) { return iequals(t, token); });
}

} // namespace wsproto
