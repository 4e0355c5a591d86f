#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace LV::Web {

struct LiveOptions {
    std::string  host{"127.0.0.1"};
    int          port{8080};
    // 0 disables the WebSocket listener; clients then use event streams only.
    int          websocket_port{8081};
    std::string  live_path{"/__live"};
    std::int64_t connect_timeout_seconds{30};
    std::int64_t keepalive_ms{5000};
    bool         show_help{false};
};

auto ParseLiveArguments(int argc, char** argv) -> std::optional<LiveOptions>;

void PrintLiveUsage();

bool ApplyLiveEnvOverrides(LiveOptions& options);

auto ValidateLiveOptions(LiveOptions const& options) -> std::optional<std::string>;

bool IsValidLivePort(int port);
bool IsValidLivePath(std::string_view path);

} // namespace LV::Web
