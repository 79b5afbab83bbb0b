#pragma once

#include "session.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace wsproto {

struct server_config
{
    static constexpr std::uint16_t DefaultPort = 8000;
    static constexpr int DefaultListenBacklog = 10;

    std::string host;                 ///< address to bind, empty for all interfaces
    std::uint16_t port = DefaultPort; ///< 0 picks an ephemeral port, see server::port()
    int listen_backlog = DefaultListenBacklog;
    session_config session;
};

/// Creates the application handler for each accepted connection
using handler_factory = std::function<std::shared_ptr<session_handler>()>;

/*! \class  server
 *  \brief  Accepts TCP connections and runs one session per connection on
 *          its own worker thread.
 */
class server
{
public:
    /// Bind the listening socket.
    /// \throws std::runtime_error if the address cannot be bound
    server(server_config config, handler_factory factory);
    ~server() noexcept;

    // no copies/moves
    server(server const&) = delete;
    server(server&&) = delete;
    server& operator=(server const&) = delete;
    server& operator=(server&&) = delete;

    /// Accept connections until stop() is called. All sessions are shut
    /// down and joined before returning.
    /// \return \c false on error
    bool run();

    /// Make run() return. Callable from any thread, including a signal
    /// watcher or a session callback.
    void stop() noexcept;

    /// the bound port, useful when the configured port was 0
    std::uint16_t port() const noexcept;

    /// sessions whose worker has not finished yet
    std::size_t active_sessions() const;

private:
    struct worker
    {
        std::shared_ptr<session> sess;
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    /// \return \c false on a fatal accept error
    bool on_incoming_connection();

    /// join workers whose session has ended
    void prune_workers();

    /// shut down every session and join all workers
    void shutdown_workers();

private:
    static constexpr int PollTimeoutMsecs = 100; ///< how often run() checks for stop()

private:
    server_config const config_;
    handler_factory factory_;
    int sockfd_ = -1;                 ///< listening socket
    std::uint16_t port_ = 0;          ///< bound port
    std::atomic<bool> stopping_{false};

    mutable std::mutex workers_mutex_;
    std::list<worker> workers_;
};

} // namespace wsproto
