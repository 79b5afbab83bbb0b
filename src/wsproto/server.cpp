#include "server.hpp"
#include "transport.hpp"
#include <arpa/inet.h> // ::inet_ntop
#include <fcntl.h>     // ::fcntl
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h> // ::setsockopt
#include <sys/types.h>
#include <unistd.h> // ::close
#include <cerrno>
#include <cstring> // std::strerror
#include <iterator>
#include <stdexcept>

namespace wsproto {
namespace {

/// "address:port" of a connected peer
std::string
to_peer_string(sockaddr_storage const& addr)
{
    char host[INET6_ADDRSTRLEN] = {};
    std::uint16_t port = 0;

    if (addr.ss_family == AF_INET) {
        auto const* in = reinterpret_cast<sockaddr_in const*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
        return std::string(host) + ":" + std::to_string(port);
    }
    if (addr.ss_family == AF_INET6) {
        auto const* in6 = reinterpret_cast<sockaddr_in6 const*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
        return "[" + std::string(host) + "]:" + std::to_string(port);
    }
    return "unknown";
}

std::uint16_t
bound_port(int sockfd)
{
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (int rv = ::getsockname(sockfd, reinterpret_cast<sockaddr*>(&addr), &len); rv == -1) {
        throw std::runtime_error(std::string("getsockname: ") + std::strerror(errno));
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6 const*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<sockaddr_in const*>(&addr)->sin_port);
}

} // namespace


server::server(server_config config, handler_factory factory)
        : config_(std::move(config))
        , factory_(std::move(factory))
{
    if (!factory_) {
        throw std::invalid_argument("server needs a handler factory");
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;     // ipv4 or ipv6
    hints.ai_socktype = SOCK_STREAM; // tcp
    hints.ai_flags = AI_PASSIVE;     // wildcard ip if no host given

    // get local address
    addrinfo* result = nullptr;
    char const* host = config_.host.empty() ? nullptr : config_.host.c_str();
    if (int rv = ::getaddrinfo(host, std::to_string(config_.port).c_str(), &hints, &result);
            rv != 0) {
        throw std::runtime_error(std::string("getaddrinfo: ") + ::gai_strerror(rv));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> const addr(result, &::freeaddrinfo);

    // any failure below leaves no descriptor behind
    auto fail = [this](char const* what) {
        std::string msg = std::string(what) + ": " + std::strerror(errno);
        if (sockfd_ != -1) {
            ::close(sockfd_);
            sockfd_ = -1;
        }
        throw std::runtime_error(msg);
    };

    // get socket
    sockfd_ = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (sockfd_ == -1) {
        fail("socket");
    }

    // allow for socket reuse
    int const yes = 1;
    if (int rv = ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)); rv == -1) {
        fail("setsockopt (SO_REUSEADDR)");
    }
    if (int rv = ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes)); rv == -1) {
        fail("setsockopt (SO_REUSEPORT)");
    }

    // bind
    if (int rv = ::bind(sockfd_, addr->ai_addr, addr->ai_addrlen); rv == -1) {
        fail("bind");
    }

    // set socket as non-blocking, run() polls it
    if (int rv = ::fcntl(sockfd_, F_SETFL, O_NONBLOCK); rv == -1) {
        fail("fcntl (O_NONBLOCK)");
    }

    // start listening so connections queue up before run() is entered
    if (int rv = ::listen(sockfd_, config_.listen_backlog); rv == -1) {
        fail("listen");
    }

    try {
        port_ = bound_port(sockfd_);
    } catch (std::runtime_error const&) {
        ::close(sockfd_);
        sockfd_ = -1;
        throw;
    }
}

server::~server() noexcept
{
    stop();
    shutdown_workers();
    if (sockfd_ != -1) {
        ::close(sockfd_);
    }
}

bool
server::run()
{
    SPDLOG_INFO("listening on port {}", port_);

    pollfd pfd{};
    pfd.fd = sockfd_;
    pfd.events = POLLIN;

    bool ok = true;
    while (!stopping_.load()) {
        int const rv = ::poll(&pfd, 1, PollTimeoutMsecs);
        if (rv == -1) {
            if (errno == EINTR) {
                continue;
            }
            SPDLOG_CRITICAL("error: poll: {} {}", std::strerror(errno), errno);
            ok = false;
            break;
        }

        prune_workers();

        if (rv > 0 && !on_incoming_connection()) {
            ok = false;
            break;
        }
    }

    SPDLOG_INFO("shutting down, {} active sessions", active_sessions());
    shutdown_workers();
    return ok;
}

void
server::stop() noexcept
{
    stopping_.store(true);
}

std::uint16_t
server::port() const noexcept
{
    return port_;
}

std::size_t
server::active_sessions() const
{
    std::lock_guard<std::mutex> lock(workers_mutex_);
    std::size_t n = 0;
    for (worker const& w : workers_) {
        if (!w.done->load()) {
            ++n;
        }
    }
    return n;
}

bool
server::on_incoming_connection()
{
    for (;;) {
        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int const fd = ::accept(sockfd_, reinterpret_cast<sockaddr*>(&addr), &len);
        if (fd == -1) {
            switch (errno) {
                case EAGAIN:
                case ECONNABORTED:
                case EINTR:
                case EPROTO:
                    return true;
                case EMFILE:
                case ENFILE:
                case ENOBUFS:
                case ENOMEM:
                    SPDLOG_ERROR("error: accept: {} {}", std::strerror(errno), errno);
                    return true;
                default:
                    SPDLOG_CRITICAL("error: accept: {} {}", std::strerror(errno), errno);
                    return false;
            }
        }

        std::string peer = to_peer_string(addr);
        SPDLOG_INFO("{}: new connection", peer);

        std::shared_ptr<session> sess;
        try {
            auto t = std::make_unique<socket_transport>(fd, std::move(peer));
            sess = std::make_shared<session>(std::move(t), factory_(), config_.session);
        } catch (std::exception const& e) {
            SPDLOG_ERROR("error: cannot create session: {}", e.what());
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::jthread thread([sess, done] {
            try {
                sess->run();
            } catch (std::exception const& e) {
                SPDLOG_ERROR("{}: session ended with exception: {}", sess->peer(), e.what());
            }
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(worker{std::move(sess), std::move(done), std::move(thread)});
    }
}

void
server::prune_workers()
{
    std::list<worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto itr = workers_.begin(); itr != workers_.end();) {
            auto next = std::next(itr);
            if (itr->done->load()) {
                finished.splice(finished.end(), workers_, itr);
            }
            itr = next;
        }
    }
    // jthread destructors join outside the lock
}

void
server::shutdown_workers()
{
    std::list<worker> all;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        all.swap(workers_);
    }

    for (worker& w : all) {
        try {
            w.sess->shutdown();
        } catch (std::exception const& e) {
            SPDLOG_ERROR("{}: shutdown failed: {}", w.sess->peer(), e.what());
        }
    }
    // jthread destructors join
}

} // namespace wsproto
