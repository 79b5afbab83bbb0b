#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace wsproto {

/*! \class  sha1
 *  \brief  Incremental SHA-1 (FIPS 180-4). Only used to derive the
 *          Sec-WebSocket-Accept value, which is why nothing stronger
 *          is needed.
 */
class sha1
{
public:
    static constexpr std::size_t DigestSize = 20;
    static constexpr std::size_t BlockSize = 64;
    using digest_type = std::array<std::uint8_t, DigestSize>;

    sha1() noexcept;

    /// Feed more input. May be called any number of times before finish().
    sha1& update(std::span<std::uint8_t const>) noexcept;
    sha1& update(std::string_view) noexcept;

    /// Apply padding and return the digest. The object is reset afterwards.
    digest_type finish() noexcept;

    /// One-shot helpers
    static digest_type hash(std::string_view);
    static std::string hash_hex(std::string_view);

private:
    void process_block(std::uint8_t const*) noexcept;
    void reset() noexcept;

private:
    std::array<std::uint32_t, 5> state_{};
    std::array<std::uint8_t, BlockSize> block_{};
    std::size_t block_len_ = 0;
    std::uint64_t total_len_ = 0; ///< bytes consumed so far
};

} // namespace wsproto
