#include "http2socks/bridge.hpp"
#include "http2socks/config.hpp"
#include "http2socks/log.hpp"

#include <cstdlib>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    using namespace http2socks;

    if (const char* env_level = std::getenv("HTTP2SOCKS_LOG")) {
        if (auto level = log::parse_level(env_level)) {
            log::set_level(*level);
        } else {
            std::println(stderr, "Ignoring HTTP2SOCKS_LOG={}: expected error, warn, info or debug", env_level);
        }
    }

    auto cmd = parse_arguments(argc, argv);
    if (!cmd) {
        std::println(stderr, "{}\n{}", cmd.error(), usage());
        return 1;
    }
    if (cmd->show_help) {
        std::println("{}", usage());
        return 0;
    }
    if (cmd->log_level) {
        log::set_level(*cmd->log_level);
    }

    try {
        asio::io_context io_context(1); // bridge work is serialized on one strand anyway

        Bridge bridge(io_context, cmd->config);
        auto handle = bridge.start();

        // Signal handling: first signal drains, the io_context returns once the
        // bridge has no work left.
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int signal_number) {
            if (!ec) {
                log::info("Received signal {}", signal_number);
                handle.shutdown.trigger();
            }
        });

        io_context.run();
    } catch (const std::system_error& e) {
        log::error("{}", e.what());
        return 1;
    } catch (std::exception& e) {
        std::println(stderr, "Exception: {}", e.what());
        return 1;
    }

    return 0;
}
