#pragma once
#include "../utils/Types.h"
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
/* STATESTORE
--> single source of truth between the frame loop (owns the controller) and the http thread:
    1) published session snapshot (frame loop writes, http reads)
    2) control requests (http writes, frame loop drains once per frame)
    3) config override requests (http writes, frame loop applies while idle)
--> the controller itself is never touched from the http thread
*/

struct StateStore_s{

    // published by the frame loop after every tick
    std::atomic<int> g_seq{0}; // bumps on every publish that changed something
    std::atomic<bool> g_stimulus_running{false};
    std::atomic<TrainingType_E> g_training_type{TrainingType_None};
    std::atomic<int> g_train_target{TRAIN_TARGET_NONE};
    std::atomic<int> g_spo_count{0};
    std::atomic<std::uint64_t> g_ping_count{0};

    // strings must be mutex-protected
    mutable std::mutex last_selected_mtx;
    std::string g_last_selected = "";

    std::string get_last_selected() const {
        std::lock_guard<std::mutex> lock(last_selected_mtx);
        return g_last_selected;
    }

    void set_last_selected(const std::string& name) {
        std::lock_guard<std::mutex> lock(last_selected_mtx);
        g_last_selected = name;
    }

    // control requests from POST /event, applied in arrival order on the frame thread
    mutable std::mutex control_mtx;
    std::deque<ControlRequest_S> control_queue;

    void push_control(const ControlRequest_S& req) {
        std::lock_guard<std::mutex> lock(control_mtx);
        control_queue.push_back(req);
    }

    std::vector<ControlRequest_S> drain_controls() {
        std::lock_guard<std::mutex> lock(control_mtx);
        std::vector<ControlRequest_S> out(control_queue.begin(), control_queue.end());
        control_queue.clear();
        return out;
    }

    // config: frame loop publishes what is active, http queues a full replacement built on top of it
    mutable std::mutex config_mtx;
    ControllerConfig_S active_config{};
    std::optional<ControllerConfig_S> pending_config;

    ControllerConfig_S get_active_config() const {
        std::lock_guard<std::mutex> lock(config_mtx);
        return active_config;
    }

    void set_active_config(const ControllerConfig_S& cfg) {
        std::lock_guard<std::mutex> lock(config_mtx);
        active_config = cfg;
    }

    void request_config(const ControllerConfig_S& cfg) {
        std::lock_guard<std::mutex> lock(config_mtx);
        pending_config = cfg;
    }

    std::optional<ControllerConfig_S> take_pending_config() {
        std::lock_guard<std::mutex> lock(config_mtx);
        std::optional<ControllerConfig_S> out = pending_config;
        pending_config.reset();
        return out;
    }

};
