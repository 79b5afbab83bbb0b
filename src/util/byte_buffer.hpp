#pragma once

#include <cstdint>
#include <memory>
#include <span>

namespace wsproto {

/*! \class  byte_buffer
 *  \brief  Contiguous receive buffer with a read cursor and a write
 *          cursor. Unread bytes always sit in one block so a decoder can
 *          look at them in place. The buffer starts at its initial
 *          capacity and only grows on request.
 *
 *  Layout:  [ consumed | unread | free ]
 *             0      rpos     wpos     capacity
 */
class byte_buffer
{
public:
    explicit byte_buffer(std::size_t capacity);
    ~byte_buffer() noexcept = default;

    // prevent copy operations
    byte_buffer(byte_buffer const&) = delete;
    byte_buffer& operator=(byte_buffer const&) = delete;

    // enable move operations
    byte_buffer(byte_buffer&&) noexcept;
    byte_buffer& operator=(byte_buffer&&) noexcept;

    std::uint8_t const* read_ptr() const noexcept;
    std::uint8_t* write_ptr() noexcept;

    /// unread bytes
    std::span<std::uint8_t const> readable() const noexcept;

    /// free space after the write cursor
    std::span<std::uint8_t> writable() noexcept;

    void bytes_read(std::size_t) noexcept;
    void bytes_written(std::size_t) noexcept;

    /// Copy \p data in after the unread bytes, compacting or growing as needed
    void append(std::span<std::uint8_t const> data);

    /// Move unread bytes to the front of the buffer.
    /// \return number of unread bytes
    std::size_t shift() noexcept;

    /// Make sure at least \p total unread+free bytes fit without moving the
    /// read cursor again; compacts first and reallocates only if that is not
    /// enough.
    void reserve(std::size_t total);

    void clear() noexcept;

    std::size_t capacity() const noexcept;
    std::size_t bytes_unread() const noexcept;
    std::size_t bytes_left() const noexcept;

private:
    std::unique_ptr<std::uint8_t[]> buf_;
    std::size_t capacity_ = 0;
    std::size_t rpos_ = 0;
    std::size_t wpos_ = 0;
};

} // namespace wsproto
