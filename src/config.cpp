#include "http2socks/config.hpp"

#include <charconv>
#include <format>

namespace http2socks {

namespace {

std::expected<Duration, std::string> parse_seconds(std::string_view option, std::string_view text) {
    long seconds = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    if (ec != std::errc{} || ptr != text.data() + text.size() || seconds < 0) {
        return std::unexpected(std::format("{}: expected a non-negative number of seconds, got '{}'", option, text));
    }
    // Duration counts nanoseconds.
    constexpr auto max_seconds = std::chrono::duration_cast<std::chrono::seconds>(Duration::max()).count();
    if (seconds > max_seconds) {
        return std::unexpected(std::format("{}: {} seconds is out of range (at most {})", option, text, max_seconds));
    }
    return std::chrono::seconds(seconds);
}

} // namespace

std::expected<HostPort, std::string> parse_host_port(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon != std::string_view::npos && text.substr(colon + 1) == "0") {
        if (auto parsed = split_host_port(text.substr(0, colon), uint16_t{0})) {
            return *parsed;
        }
    } else if (auto parsed = split_host_port(text)) {
        return *parsed;
    }
    return std::unexpected(std::format("invalid address '{}', expected HOST:PORT", text));
}

std::string usage() {
    return "Usage: http2socks_bridge [options]\n"
           "  -l, --listen HOST:PORT         listen address (default 127.0.0.1:8118)\n"
           "  -s, --socks HOST:PORT          SOCKS5 proxy (default 127.0.0.1:9050)\n"
           "  -t, --timeout SECONDS          per-connection timeout (default none)\n"
           "      --handshake-timeout SECS   request/SOCKS handshake timeout (default 30, 0 = off)\n"
           "      --idle-timeout SECS        relay idle timeout (default 300, 0 = off)\n"
           "      --drain-timeout SECS       shutdown grace period (default 10)\n"
           "  -v, --verbose                  debug logging\n"
           "  -q, --quiet                    errors only\n"
           "  -h, --help                     show this help\n"
           "Environment: HTTP2SOCKS_LOG=error|warn|info|debug sets the default log level.";
}

std::expected<CommandLine, std::string> parse_arguments(int argc, const char* const argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto value = [&]() -> std::expected<std::string_view, std::string> {
            if (i + 1 >= argc) {
                return std::unexpected(std::format("{}: missing value", arg));
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            cmd.show_help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.log_level = log::Level::DEBUG;
        } else if (arg == "-q" || arg == "--quiet") {
            cmd.log_level = log::Level::ERROR;
        } else if (arg == "-l" || arg == "--listen" || arg == "-s" || arg == "--socks") {
            auto text = value();
            if (!text) {
                return std::unexpected(text.error());
            }
            auto address = parse_host_port(*text);
            if (!address) {
                return std::unexpected(std::format("{}: {}", arg, address.error()));
            }
            if (arg == "-l" || arg == "--listen") {
                cmd.config.listen = *address;
            } else if (address->port == 0) {
                return std::unexpected(std::format("{}: SOCKS proxy port must not be 0", arg));
            } else {
                cmd.config.socks_proxy = *address;
            }
        } else if (arg == "-t" || arg == "--timeout" || arg == "--handshake-timeout" || arg == "--idle-timeout" ||
                   arg == "--drain-timeout") {
            auto text = value();
            if (!text) {
                return std::unexpected(text.error());
            }
            auto duration = parse_seconds(arg, *text);
            if (!duration) {
                return std::unexpected(duration.error());
            }
            if (arg == "-t" || arg == "--timeout") {
                if (*duration > Duration::zero()) {
                    cmd.config.connection_timeout = *duration;
                } else {
                    cmd.config.connection_timeout.reset();
                }
            } else if (arg == "--handshake-timeout") {
                cmd.config.handshake_timeout = *duration;
            } else if (arg == "--idle-timeout") {
                cmd.config.idle_timeout = *duration;
            } else {
                cmd.config.drain_timeout = *duration;
            }
        } else {
            return std::unexpected(std::format("unknown argument '{}'", arg));
        }
    }

    return cmd;
}

} // namespace http2socks
