#pragma once

#include <liveview/core/Error.hpp>
#include <liveview/web/LiveOptions.hpp>
#include <liveview/web/LivePage.hpp>

#include <atomic>
#include <functional>
#include <string_view>
#include <vector>

namespace LV::Web {

struct LiveLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

int RunLiveServer(std::vector<LivePage> pages, LiveOptions const& options);

int RunLiveServerWithStopFlag(std::vector<LivePage>               pages,
                              LiveOptions const&                  options,
                              std::atomic<bool>&                  should_stop,
                              LiveLogHooks const&                 log_hooks = {},
                              std::function<void(Expected<void>)> on_listen = {});

void RequestLiveServerStop();
void ResetLiveServerStopFlag();

} // namespace LV::Web
