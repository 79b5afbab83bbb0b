#include "utf8.hpp"

namespace wsproto {

bool
is_valid_utf8(std::string_view s) noexcept
{
    return is_valid_utf8(std::span<std::uint8_t const>(
            reinterpret_cast<std::uint8_t const*>(s.data()), s.size()));
}

bool
is_valid_utf8(std::span<std::uint8_t const> data) noexcept
{
    std::size_t i = 0;
    std::size_t const n = data.size();

    while (i < n) {
        std::uint8_t const c = data[i];

        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint8_t lo = 0x80; // allowed range of the second byte
        std::uint8_t hi = 0xBF;

        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0; // overlong
        } else if (c == 0xED) {
            len = 3;
            hi = 0x9F; // surrogates
        } else if (c >= 0xE1 && c <= 0xEF) {
            len = 3;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90; // overlong
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F; // > U+10FFFF
        } else {
            return false; // 0x80..0xC1, 0xF5..0xFF
        }

        if (i + len > n) {
            return false;
        }
        if (data[i + 1] < lo || data[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k < len; ++k) {
            if ((data[i + k] & 0xC0) != 0x80) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

} // namespace wsproto
