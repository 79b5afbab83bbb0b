#include "base64_codec.hpp"

namespace wsproto {

std::string
to_base64(std::string_view input)
{
    return base64_codec::encode(input);
}

std::optional<std::vector<std::uint8_t>>
from_base64(std::string_view input)
{
    return base64_codec::decode(input);
}

std::string
base64_codec::encode(std::string_view input)
{
    return encode(std::span<std::uint8_t const>(
            reinterpret_cast<std::uint8_t const*>(input.data()), input.size()));
}

std::string
base64_codec::encode(std::span<std::uint8_t const> data)
{
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;

    // process 3-byte chunks
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t const chunk = (static_cast<std::uint32_t>(data[i]) << 16)
                | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                | static_cast<std::uint32_t>(data[i + 2]);

        result += encode_table[(chunk >> 18) & 0x3F];
        result += encode_table[(chunk >> 12) & 0x3F];
        result += encode_table[(chunk >> 6) & 0x3F];
        result += encode_table[chunk & 0x3F];
    }

    // handle remaining bytes
    std::size_t const rest = data.size() - i;
    if (rest == 1) {
        std::uint32_t const chunk = static_cast<std::uint32_t>(data[i]) << 16;
        result += encode_table[(chunk >> 18) & 0x3F];
        result += encode_table[(chunk >> 12) & 0x3F];
        result += "==";
    } else if (rest == 2) {
        std::uint32_t const chunk = (static_cast<std::uint32_t>(data[i]) << 16)
                | (static_cast<std::uint32_t>(data[i + 1]) << 8);
        result += encode_table[(chunk >> 18) & 0x3F];
        result += encode_table[(chunk >> 12) & 0x3F];
        result += encode_table[(chunk >> 6) & 0x3F];
        result += '=';
    }

    return result;
}

std::optional<std::vector<std::uint8_t>>
base64_codec::decode(std::string_view input)
{
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (!input.empty() && input.back() == '=') {
        ++padding;
        if (input[input.size() - 2] == '=') {
            ++padding;
        }
    }

    std::vector<std::uint8_t> result;
    result.reserve((input.size() / 4) * 3 - padding);

    std::uint32_t chunk = 0;
    int chunk_bits = 0;

    std::string_view const body = input.substr(0, input.size() - padding);
    for (char const c : body) {
        std::int8_t const value = decode_table[static_cast<unsigned char>(c)];
        if (value == -1) {
            return std::nullopt; // invalid character, includes '=' in the middle
        }

        chunk = (chunk << 6) | static_cast<std::uint32_t>(value);
        chunk_bits += 6;

        if (chunk_bits >= 8) {
            chunk_bits -= 8;
            result.push_back(static_cast<std::uint8_t>((chunk >> chunk_bits) & 0xFF));
        }
    }

    // the bits dropped by padding must be zero in canonical encoding
    if ((chunk & ((1u << chunk_bits) - 1)) != 0) {
        return std::nullopt;
    }

    return result;
}

} // namespace wsproto
