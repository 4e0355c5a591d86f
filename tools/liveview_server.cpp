#include <csignal>
#include <cstdlib>

#include <liveview/web/DemoPages.hpp>
#include <liveview/web/LiveServer.hpp>

namespace {
void handle_signal(int) {
    LV::Web::RequestLiveServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = LV::Web::ParseLiveArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        LV::Web::PrintLiveUsage();
        return EXIT_SUCCESS;
    }

    LV::Web::Demo::DemoState demo;
    LV::Web::ResetLiveServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return LV::Web::RunLiveServer(demo.pages(), options);
}
