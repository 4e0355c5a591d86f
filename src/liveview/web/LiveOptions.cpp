#include <liveview/web/LiveOptions.hpp>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace LV::Web {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::string normalize_path(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidLivePort(int port) {
    return port > 0 && port <= 65535;
}

bool IsValidLivePath(std::string_view path) {
    if (path.size() < 2 || path.front() != '/') {
        return false;
    }
    for (char ch : path) {
        if (ch == '?' || ch == '#' || ch == ' ') {
            return false;
        }
    }
    return true;
}

auto ValidateLiveOptions(LiveOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidLivePort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (options.websocket_port != 0 && !IsValidLivePort(options.websocket_port)) {
        return std::string{"--ws-port must be 0 or within 1-65535"};
    }
    if (options.websocket_port == options.port) {
        return std::string{"--ws-port must differ from --port"};
    }
    if (!IsValidLivePath(options.live_path)) {
        return std::string{"--live-path must be an absolute path without query or fragment"};
    }
    if (options.connect_timeout_seconds <= 0) {
        return std::string{"--connect-timeout must be > 0"};
    }
    if (options.keepalive_ms <= 0) {
        return std::string{"--keepalive-ms must be > 0"};
    }
    return std::nullopt;
}

bool ApplyLiveEnvOverrides(LiveOptions& options) {
    if (!apply_env("LIVEVIEW_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "LIVEVIEW_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("LIVEVIEW_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "LIVEVIEW_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("LIVEVIEW_WS_PORT", [&](std::string_view value) {
            int parsed = options.websocket_port;
            if (!parse_integer_in_range<int>(value, 0, 65535, parsed)) {
                std::cerr << "LIVEVIEW_WS_PORT must be within 0-65535\n";
                return false;
            }
            options.websocket_port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("LIVEVIEW_LIVE_PATH", [&](std::string_view value) {
            if (!IsValidLivePath(value)) {
                std::cerr << "LIVEVIEW_LIVE_PATH must be an absolute path without query or fragment\n";
                return false;
            }
            options.live_path = std::string{value};
            return true;
        })) {
        return false;
    }

    auto apply_positive_i64 = [&](char const* key, std::int64_t& target) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int64_t>::max(), parsed)) {
                std::cerr << key << " must be > 0\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    if (!apply_positive_i64("LIVEVIEW_CONNECT_TIMEOUT_SECONDS", options.connect_timeout_seconds)) {
        return false;
    }
    if (!apply_positive_i64("LIVEVIEW_KEEPALIVE_MS", options.keepalive_ms)) {
        return false;
    }
    return true;
}

void PrintLiveUsage() {
    std::cout << "Usage: liveview_server [options]\n"
              << "  --host <host>             Bind address (default 127.0.0.1)\n"
              << "  --port <port>             HTTP port for pages, event streams and callbacks (default 8080)\n"
              << "  --ws-port <port>          WebSocket port, 0 disables (default 8081)\n"
              << "  --live-path <path>        Live connection endpoint (default /__live)\n"
              << "  --connect-timeout <sec>   Seconds a rendered page may take to connect (default 30)\n"
              << "  --keepalive-ms <ms>       Event stream keep-alive interval (default 5000)\n"
              << "  --help                    Show this help\n";
}

std::optional<LiveOptions> ParseLiveArguments(int argc, char** argv) {
    LiveOptions options{};
    if (!ApplyLiveEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_positive = [&](int& index, std::string_view flag, std::int64_t& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, 1, std::numeric_limits<std::int64_t>::max(), parsed)) {
            std::cerr << flag << " must be > 0\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--ws-port") {
            if (auto value = require_value(i, "--ws-port")) {
                int parsed = options.websocket_port;
                if (!parse_integer_in_range<int>(*value, 0, 65535, parsed)) {
                    std::cerr << "--ws-port must be within 0-65535\n";
                    return std::nullopt;
                }
                options.websocket_port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--live-path") {
            if (auto value = require_value(i, "--live-path")) {
                if (!IsValidLivePath(*value)) {
                    std::cerr << "--live-path must be an absolute path without query or fragment\n";
                    return std::nullopt;
                }
                options.live_path = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--connect-timeout") {
            if (!parse_positive(i, "--connect-timeout", options.connect_timeout_seconds)) {
                return std::nullopt;
            }
        } else if (arg == "--keepalive-ms") {
            if (!parse_positive(i, "--keepalive-ms", options.keepalive_ms)) {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    options.live_path = normalize_path(options.live_path);

    if (auto error = ValidateLiveOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace LV::Web
