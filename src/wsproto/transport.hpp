#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>

namespace wsproto {

enum class ReadStatus : std::uint8_t
{
    Ok,      ///< nbytes > 0 were read
    Timeout, ///< nothing arrived within the timeout
    Closed,  ///< peer closed, or close() was called
    Error    ///< the channel is broken
};

struct read_result
{
    ReadStatus status = ReadStatus::Error;
    std::size_t nbytes = 0;
};

/*! \class  transport
 *  \brief  Ordered, reliable byte stream underneath one session. A
 *          session reads from one thread; writes are serialized by the
 *          session. close() may be called from any thread.
 */
class transport
{
public:
    virtual ~transport() = default;

    /// Block until some bytes arrive, \p timeout expires or the transport is
    /// closed. A zero timeout waits forever.
    virtual read_result read(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) = 0;

    /// Write all of \p data.
    /// \return \c false on error
    virtual bool write(std::span<std::uint8_t const> data) = 0;

    /// Shut the stream down in both directions, waking a blocked read().
    /// Only the first call has an effect.
    virtual void close() noexcept = 0;

    /// remote endpoint, for log messages
    virtual std::string const& peer() const noexcept = 0;
};

/*! \class  socket_transport
 *  \brief  transport over a connected TCP socket. close() shuts the
 *          socket down; the descriptor itself is released by the
 *          destructor so a concurrent read never sees a recycled fd.
 */
class socket_transport final : public transport
{
public:
    socket_transport(int sockfd, std::string peer);
    ~socket_transport() noexcept override;

    // no copies/moves
    socket_transport(socket_transport const&) = delete;
    socket_transport(socket_transport&&) = delete;
    socket_transport& operator=(socket_transport const&) = delete;
    socket_transport& operator=(socket_transport&&) = delete;

    read_result read(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout) override;
    bool write(std::span<std::uint8_t const> data) override;
    void close() noexcept override;
    std::string const& peer() const noexcept override;

private:
    int sockfd_ = -1;
    std::string peer_;
    std::atomic<bool> closed_{false};
};

} // namespace wsproto
