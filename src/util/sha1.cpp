#include "sha1.hpp"
#include <algorithm> // std::min
#include <bit>       // std::rotl
#include <cstring>   // std::memcpy, std::memset

namespace wsproto {

namespace {
    constexpr std::array<std::uint32_t, 5> InitialState
            = {0x67452301, 0xEFCDAB89, 0x98BADCFE, 0x10325476, 0xC3D2E1F0};
} // namespace

sha1::sha1() noexcept
{
    reset();
}

void
sha1::reset() noexcept
{
    state_ = InitialState;
    block_len_ = 0;
    total_len_ = 0;
}

sha1&
sha1::update(std::string_view input) noexcept
{
    return update(std::span<std::uint8_t const>(
            reinterpret_cast<std::uint8_t const*>(input.data()), input.size()));
}

sha1&
sha1::update(std::span<std::uint8_t const> input) noexcept
{
    total_len_ += input.size();

    std::size_t pos = 0;

    // top up a partially filled block first
    if (block_len_ > 0) {
        std::size_t const n = std::min(BlockSize - block_len_, input.size());
        std::memcpy(block_.data() + block_len_, input.data(), n);
        block_len_ += n;
        pos += n;
        if (block_len_ < BlockSize) {
            return *this;
        }
        process_block(block_.data());
        block_len_ = 0;
    }

    // whole blocks straight from the input
    for (; pos + BlockSize <= input.size(); pos += BlockSize) {
        process_block(input.data() + pos);
    }

    // stash the tail
    block_len_ = input.size() - pos;
    if (block_len_ > 0) {
        std::memcpy(block_.data(), input.data() + pos, block_len_);
    }
    return *this;
}

sha1::digest_type
sha1::finish() noexcept
{
    std::uint64_t const bit_len = total_len_ * 8;

    block_[block_len_++] = 0x80;
    if (block_len_ > BlockSize - 8) {
        std::memset(block_.data() + block_len_, 0, BlockSize - block_len_);
        process_block(block_.data());
        block_len_ = 0;
    }
    std::memset(block_.data() + block_len_, 0, BlockSize - 8 - block_len_);

    // message length in bits, big-endian
    for (std::size_t i = 0; i < 8; ++i) {
        block_[BlockSize - 8 + i] = static_cast<std::uint8_t>(bit_len >> (8 * (7 - i)));
    }
    process_block(block_.data());

    digest_type digest;
    for (std::size_t i = 0; i < state_.size(); ++i) {
        digest[i * 4 + 0] = static_cast<std::uint8_t>(state_[i] >> 24);
        digest[i * 4 + 1] = static_cast<std::uint8_t>(state_[i] >> 16);
        digest[i * 4 + 2] = static_cast<std::uint8_t>(state_[i] >> 8);
        digest[i * 4 + 3] = static_cast<std::uint8_t>(state_[i]);
    }

    reset();
    return digest;
}

void
sha1::process_block(std::uint8_t const* chunk) noexcept
{
    std::array<std::uint32_t, 80> w;

    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = (static_cast<std::uint32_t>(chunk[i * 4 + 0]) << 24)
                | (static_cast<std::uint32_t>(chunk[i * 4 + 1]) << 16)
                | (static_cast<std::uint32_t>(chunk[i * 4 + 2]) << 8)
                | static_cast<std::uint32_t>(chunk[i * 4 + 3]);
    }
    for (std::size_t i = 16; i < 80; ++i) {
        w[i] = std::rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);
    }

    std::uint32_t a = state_[0];
    std::uint32_t b = state_[1];
    std::uint32_t c = state_[2];
    std::uint32_t d = state_[3];
    std::uint32_t e = state_[4];

    for (std::size_t i = 0; i < 80; ++i) {
        std::uint32_t f;
        std::uint32_t k;

        if (i < 20) {
            f = (b & c) | (~b & d);
            k = 0x5A827999;
        } else if (i < 40) {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1;
        } else if (i < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDC;
        } else {
            f = b ^ c ^ d;
            k = 0xCA62C1D6;
        }

        std::uint32_t const temp = std::rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = std::rotl(b, 30);
        b = a;
        a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

sha1::digest_type
sha1::hash(std::string_view input)
{
    return sha1{}.update(input).finish();
}

std::string
sha1::hash_hex(std::string_view input)
{
    static constexpr char Hex[] = "0123456789abcdef";

    auto const digest = hash(input);
    std::string out;
    out.reserve(DigestSize * 2);
    for (std::uint8_t const byte : digest) {
        out += Hex[byte >> 4];
        out += Hex[byte & 0x0f];
    }
    return out;
}

} // namespace wsproto
