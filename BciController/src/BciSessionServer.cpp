#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "comms/BufferedMarkerChannel.hpp"
#include "comms/QueuedResponseChannel.hpp"
#include "shared/StateStore.hpp"
#include "spo/LoggedSpo.hpp"
#include "spo/SpoDirectory.hpp"
#include "stimulus/BciController.hpp"
#include "stimulus/HttpServer.hpp"
#include "stimulus/SessionBridge.hpp"
#include "utils/Logger.hpp"
#include "utils/Types.h"

/* BCI SESSION SERVER
- headless session host: one frame loop (main thread) owns the controller and ticks it ~60x/s,
  one http thread bridges a page / classifier process to it through the StateStore
- demo spos (LoggedSpo_C) stand in for stimulus objects, BCI_DEMO_SPOS of them (default 4)
- env: BCI_HTTP_PORT (default 7777), BCI_DEMO_SPOS, VERBOSE
- Ctrl+C stops the frame loop, cleans up the controller and closes the server
*/

constexpr int DEFAULT_HTTP_PORT = 7777;
constexpr int DEFAULT_DEMO_SPOS = 4;
constexpr auto FRAME_PERIOD = std::chrono::microseconds(16667);

// Global "please stop" flag set by Ctrl+C (SIGINT) to shut down cleanly
static std::atomic<bool> g_stop{false};

void handle_sigint(int) {
    g_stop.store(true, std::memory_order_relaxed);
}

static int env_int(const char* name, int fallback, int lo, int hi) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    char* end = nullptr;
    long val = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || val < lo || val > hi) {
        LOG_WARN("env " << name << "='" << raw << "' invalid, using " << fallback);
        return fallback;
    }
    return static_cast<int>(val);
}

void http_thread_fn(HttpServer_C& http){
    logger::tlabel = "http";
    try {
        LOG_ALWAYS("http: listen thread start");
        if (!http.http_listen_for_poll_requests()) {   // blocks here
            g_stop.store(true, std::memory_order_relaxed);
        }
        LOG_ALWAYS("http: listen thread exit");
    }
    catch (const std::exception& e) {
        LOG_ERR("http: FATAL unhandled exception: " << e.what());
        g_stop.store(true, std::memory_order_relaxed);
    }
}

void frame_loop_fn(BciController_C& controller, StateStore_s& stateStore){
    logger::tlabel = "frame";
    try {
        LOG_ALWAYS("frame: loop start");
        auto next = clock_T::now();
        while (!g_stop.load(std::memory_order_acquire)) {
            // queued http requests, config, one tick, publish
            bridge::pump_frame(controller, stateStore, clock_T::now());

            next += FRAME_PERIOD;
            std::this_thread::sleep_until(next);
        }
        LOG_ALWAYS("frame: loop exit");
    }
    catch (const std::exception& e) {
        LOG_ERR("frame: FATAL unhandled exception: " << e.what());
        g_stop.store(true, std::memory_order_relaxed);
    }
}

int main() {
    logger::init();
    LOG_ALWAYS("start (VERBOSE=" << logger::verbose() << ")");

    const int port = env_int("BCI_HTTP_PORT", DEFAULT_HTTP_PORT, 1, 65535);
    const int numSpos = env_int("BCI_DEMO_SPOS", DEFAULT_DEMO_SPOS, 0, 64);

    ControllerConfig_S config{};

    // demo objects registered under the group tag
    SpoDirectory_C directory;
    std::vector<std::unique_ptr<LoggedSpo_C>> spos;
    for (int i = 0; i < numSpos; ++i) {
        spos.push_back(std::make_unique<LoggedSpo_C>("spo" + std::to_string(i)));
        directory.register_spo(config.groupTag, spos.back().get());
    }
    LOG_ALWAYS("registered " << numSpos << " demo spos under tag '" << config.groupTag << "'");

    BufferedMarkerChannel_C markers;
    QueuedResponseChannel_C responses;
    StateStore_s stateStore;
    stateStore.set_active_config(config);

    BciController_C controller(directory, config, BciBehaviorType_SSVEP);
    controller.initialize(&markers, &responses);

    HttpServer_C server(stateStore, markers, responses, port);
    if (!server.http_start_server()) {
        LOG_ERR("could not start http server");
        return 1;
    }

    // interrupt caused by SIGINT -> 'handle_sigint' acts like ISR (callback handle)
    std::signal(SIGINT, handle_sigint);

    std::thread http(http_thread_fn, std::ref(server));
    frame_loop_fn(controller, stateStore); // main thread until Ctrl+C

    // on shutdown: controller first (no more markers), then the server
    controller.clean_up();
    server.http_close_server();
    http.join();
    LOG_ALWAYS("exit");
    return 0;
}
