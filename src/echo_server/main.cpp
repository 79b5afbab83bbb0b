#include "echo_server.hpp"
#include "wsproto/server.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib> // EXIT_FAILURE, EXIT_SUCCESS
#include <memory>
#include <string>
#include <string_view>

namespace {

wsproto::server* running_server = nullptr;

extern "C" void
on_signal(int)
{
    if (running_server != nullptr) {
        running_server->stop();
    }
}

void
usage(char const* prog)
{
    SPDLOG_ERROR("usage: {} [-v] [port [max_message_size]]", prog);
}

} // namespace

int
main(int argc, char* argv[])
{
    spdlog::set_level(spdlog::level::info);

    // [2025-07-17 11:10:13.674784] [info] [main.cpp:14] message
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%^%l%$] [%s:%#] %v");

    wsproto::server_config config;

    int pos = 0;
    for (int i = 1; i < argc; ++i) {
        std::string_view const arg = argv[i];
        if (arg == "-v") {
            spdlog::set_level(spdlog::level::debug);
            continue;
        }
        try {
            if (pos == 0) {
                int const port = std::stoi(std::string(arg));
                if (port < 0 || port > 65535) {
                    usage(argv[0]);
                    return EXIT_FAILURE;
                }
                config.port = static_cast<std::uint16_t>(port);
            } else if (pos == 1) {
                config.session.max_message_size = std::stoull(std::string(arg));
            } else {
                usage(argv[0]);
                return EXIT_FAILURE;
            }
        } catch (std::exception const&) {
            usage(argv[0]);
            return EXIT_FAILURE;
        }
        ++pos;
    }

    try {
        wsproto::server server(config, [] { return std::make_shared<wsproto::echo_handler>(); });

        running_server = &server;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        bool const ok = server.run();
        running_server = nullptr;
        if (!ok) {
            SPDLOG_CRITICAL("error: server shutdown with an error");
            return EXIT_FAILURE;
        }
    } catch (std::exception const& e) {
        SPDLOG_CRITICAL("error: exception: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
