#include "byte_buffer.hpp"
#include <cstring> // std::memcpy, std::memmove
#include <utility> // std::exchange

namespace wsproto {

byte_buffer::byte_buffer(std::size_t capacity)
        : buf_(std::make_unique<std::uint8_t[]>(capacity))
        , capacity_(capacity)
{
    // empty
}

byte_buffer::byte_buffer(byte_buffer&& rhs) noexcept
        : buf_(std::move(rhs.buf_))
        , capacity_(std::exchange(rhs.capacity_, 0))
        , rpos_(std::exchange(rhs.rpos_, 0))
        , wpos_(std::exchange(rhs.wpos_, 0))
{
    // empty
}

byte_buffer&
byte_buffer::operator=(byte_buffer&& rhs) noexcept
{
    if (this != &rhs) {
        buf_ = std::move(rhs.buf_);
        capacity_ = std::exchange(rhs.capacity_, 0);
        rpos_ = std::exchange(rhs.rpos_, 0);
        wpos_ = std::exchange(rhs.wpos_, 0);
    }
    return *this;
}

std::uint8_t const*
byte_buffer::read_ptr() const noexcept
{
    return buf_.get() + rpos_;
}

std::uint8_t*
byte_buffer::write_ptr() noexcept
{
    return buf_.get() + wpos_;
}

std::span<std::uint8_t const>
byte_buffer::readable() const noexcept
{
    return {read_ptr(), bytes_unread()};
}

std::span<std::uint8_t>
byte_buffer::writable() noexcept
{
    return {write_ptr(), bytes_left()};
}

void
byte_buffer::bytes_read(std::size_t nbytes) noexcept
{
    rpos_ += nbytes;

    // cheap reset when everything has been consumed
    if (rpos_ == wpos_) {
        rpos_ = wpos_ = 0;
    }
}

void
byte_buffer::bytes_written(std::size_t nbytes) noexcept
{
    wpos_ += nbytes;
}

void
byte_buffer::append(std::span<std::uint8_t const> data)
{
    if (data.empty()) {
        return;
    }
    if (bytes_left() < data.size()) {
        reserve(bytes_unread() + data.size());
    }
    std::memcpy(write_ptr(), data.data(), data.size());
    bytes_written(data.size());
}

std::size_t
byte_buffer::shift() noexcept
{
    std::size_t const unread = bytes_unread();

    if (unread == 0) {
        rpos_ = wpos_ = 0;
        return 0;
    }

    if (rpos_ != 0) {
        std::memmove(buf_.get(), read_ptr(), unread);
        rpos_ = 0;
        wpos_ = unread;
    }
    return unread;
}

void
byte_buffer::reserve(std::size_t total)
{
    if (capacity_ - rpos_ >= total) {
        return;
    }

    shift();
    if (capacity_ >= total) {
        return;
    }

    std::size_t new_capacity = capacity_ == 0 ? total : capacity_;
    while (new_capacity < total) {
        new_capacity *= 2;
    }

    auto grown = std::make_unique<std::uint8_t[]>(new_capacity);
    if (wpos_ > 0) {
        std::memcpy(grown.get(), buf_.get(), wpos_);
    }
    buf_ = std::move(grown);
    capacity_ = new_capacity;
}

void
byte_buffer::clear() noexcept
{
    rpos_ = wpos_ = 0;
}

std::size_t
byte_buffer::capacity() const noexcept
{
    return capacity_;
}

std::size_t
byte_buffer::bytes_unread() const noexcept
{
    return wpos_ - rpos_;
}

std::size_t
byte_buffer::bytes_left() const noexcept
{
    return capacity_ - wpos_;
}

} // namespace wsproto
