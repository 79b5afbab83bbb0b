#include "transport.hpp"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <sys/socket.h> // ::recv, ::send, ::shutdown
#include <unistd.h>     // ::close
#include <cerrno>
#include <cstring> // std::strerror

namespace wsproto {

socket_transport::socket_transport(int sockfd, std::string peer)
        : sockfd_(sockfd)
        , peer_(std::move(peer))
{
    // empty
}

socket_transport::~socket_transport() noexcept
{
    close();
    if (sockfd_ != -1) {
        ::close(sockfd_);
    }
}

read_result
socket_transport::read(std::span<std::uint8_t> buf, std::chrono::milliseconds timeout)
{
    if (closed_.load()) {
        return {ReadStatus::Closed, 0};
    }

    pollfd pfd{};
    pfd.fd = sockfd_;
    pfd.events = POLLIN;

    int const timeout_msecs = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;

    for (;;) {
        int const rv = ::poll(&pfd, 1, timeout_msecs);
        if (rv == -1) {
            if (errno == EINTR) {
                continue;
            }
            SPDLOG_ERROR("{}: poll: {} {}", peer_, std::strerror(errno), errno);
            return {ReadStatus::Error, 0};
        }
        if (rv == 0) {
            return {ReadStatus::Timeout, 0};
        }
        break;
    }

    for (;;) {
        ssize_t const nbytes = ::recv(sockfd_, buf.data(), buf.size(), /*flags=*/0);
        if (nbytes > 0) {
            return {ReadStatus::Ok, static_cast<std::size_t>(nbytes)};
        }
        if (nbytes == 0) {
            return {ReadStatus::Closed, 0};
        }
        if (errno == EINTR) {
            continue;
        }
        if (closed_.load()) {
            return {ReadStatus::Closed, 0};
        }
        SPDLOG_ERROR("{}: recv: {} {}", peer_, std::strerror(errno), errno);
        return {ReadStatus::Error, 0};
    }
}

bool
socket_transport::write(std::span<std::uint8_t const> data)
{
    while (!data.empty()) {
        if (closed_.load()) {
            return false;
        }
        ssize_t const nbytes = ::send(sockfd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (nbytes == -1) {
            if (errno == EINTR) {
                continue;
            }
            SPDLOG_ERROR("{}: send: {} {}", peer_, std::strerror(errno), errno);
            return false;
        }
        data = data.subspan(static_cast<std::size_t>(nbytes));
    }
    return true;
}

void
socket_transport::close() noexcept
{
    if (closed_.exchange(true)) {
        return;
    }
    if (int rv = ::shutdown(sockfd_, SHUT_RDWR); rv == -1 && errno != ENOTCONN) {
        SPDLOG_WARN("{}: shutdown: {} {}", peer_, std::strerror(errno), errno);
    }
}

std::string const&
socket_transport::peer() const noexcept
{
    return peer_;
}

} // namespace wsproto
