#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wsproto {

/*! \class  base64_codec
 *  \brief  RFC 4648 base64 with the standard alphabet and '=' padding.
 *          Decoding is strict: anything that is not canonical padded
 *          base64 is rejected rather than skipped over.
 */
class base64_codec
{
private:
    static constexpr std::array<char, 64> encode_table
            = {'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P', 'Q',
                    'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f', 'g',
                    'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w',
                    'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

    static constexpr std::array<std::int8_t, 256> decode_table = []() {
        std::array<std::int8_t, 256> table{};
        for (auto& v : table) {
            v = -1;
        }
        for (int i = 0; i < 64; ++i) {
            table[static_cast<unsigned char>(encode_table[i])] = static_cast<std::int8_t>(i);
        }
        return table;
    }();

public:
    /// Encode raw bytes
    static std::string encode(std::span<std::uint8_t const>);

    /// Encode the bytes of a string
    static std::string encode(std::string_view);

    /// Decode a padded base64 string
    /// \return \c std::nullopt if the input is not valid base64
    static std::optional<std::vector<std::uint8_t>> decode(std::string_view);
};

// convenience functions
std::string to_base64(std::string_view);
std::optional<std::vector<std::uint8_t>> from_base64(std::string_view);

} // namespace wsproto
