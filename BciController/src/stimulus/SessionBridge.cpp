#include "SessionBridge.hpp"
#include <vector>
#include "../utils/JsonUtils.hpp"
#include "../utils/Logger.hpp"

namespace bridge {

std::optional<ControlEvent_E> action_to_event(const std::string& action) {
    if (action == "start_run") return ControlEvent_StartRun;
    if (action == "start_run_no_markers") return ControlEvent_StartRunNoMarkers;
    if (action == "stop_run") return ControlEvent_StopRun;
    if (action == "toggle_run") return ControlEvent_ToggleRun;
    if (action == "start_training") return ControlEvent_StartTraining;
    if (action == "stop_training") return ControlEvent_StopTraining;
    if (action == "select") return ControlEvent_Select;
    if (action == "select_at_end") return ControlEvent_SelectAtEnd;
    return std::nullopt;
}

bool parse_control_request(const std::string& body, ControlRequest_S& out, std::string& error) {
    std::string action;
    if (!JSON::extract_json_string(body, "action", action)) {
        JSON::json_extract_fail("post_event", "action");
        error = "missing_action";
        return false;
    }
    std::optional<ControlEvent_E> ev = action_to_event(action);
    if (!ev.has_value()) {
        LOG_WARN("bridge: unknown action '" << action << "'");
        error = "unknown_action";
        return false;
    }

    ControlRequest_S request;
    request.event = ev.value();

    if (request.event == ControlEvent_StartTraining) {
        std::string training;
        if (!JSON::extract_json_string(body, "training", training)) {
            JSON::json_extract_fail("post_event", "training");
            error = "missing_training";
            return false;
        }
        std::optional<TrainingType_E> type = TrainingTypeFromString(training);
        if (!type.has_value()) {
            LOG_WARN("bridge: unknown training type '" << training << "'");
            error = "unknown_training";
            return false;
        }
        request.training = type.value();
    }

    if (request.event == ControlEvent_Select || request.event == ControlEvent_SelectAtEnd) {
        // range is checked by the controller (soft failure), only presence here
        if (!JSON::extract_json_int(body, "index", request.index)) {
            JSON::json_extract_fail("post_event", "index");
            error = "missing_index";
            return false;
        }
    }

    out = request;
    return true;
}

int apply_config_overrides(const std::string& body, ControllerConfig_S& cfg) {
    int fields = 0;
    fields += JSON::extract_json_float(body, "window_length", cfg.windowLength_s);
    fields += JSON::extract_json_float(body, "inter_window_interval", cfg.interWindowInterval_s);
    fields += JSON::extract_json_int(body, "num_training_selections", cfg.numTrainingSelections);
    fields += JSON::extract_json_int(body, "num_train_windows", cfg.numTrainWindows);
    fields += JSON::extract_json_float(body, "pause_before_training", cfg.pauseBeforeTraining_s);
    fields += JSON::extract_json_bool(body, "train_target_persistent", cfg.trainTargetPersistent);
    fields += JSON::extract_json_float(body, "train_target_presentation_time", cfg.trainTargetPresentationTime_s);
    fields += JSON::extract_json_float(body, "train_break", cfg.trainBreak_s);
    fields += JSON::extract_json_bool(body, "sham_feedback", cfg.shamFeedback);
    fields += JSON::extract_json_string(body, "group_tag", cfg.groupTag);
    return fields;
}

bool is_config_valid(const ControllerConfig_S& cfg) {
    return cfg.windowLength_s > 0.0f && cfg.interWindowInterval_s >= 0.0f && cfg.numTrainingSelections >= 0
        && cfg.numTrainWindows >= 0 && cfg.trainTargetPresentationTime_s >= 0.0f && cfg.trainBreak_s >= 0.0f
        && !cfg.groupTag.empty();
}

bool apply_control(BciController_C& controller, const ControlRequest_S& req) {
    switch (req.event) {
        case ControlEvent_StartRun:
            return controller.start_stimulus_run(true);
        case ControlEvent_StartRunNoMarkers:
            return controller.start_stimulus_run(false);
        case ControlEvent_StopRun:
            controller.stop_stimulus_run();
            return true;
        case ControlEvent_ToggleRun:
            return controller.start_stop_stimulus_run();
        case ControlEvent_StartTraining:
            return controller.start_training(req.training);
        case ControlEvent_StopTraining:
            controller.stop_training();
            return true;
        case ControlEvent_Select:
            return controller.select_by_index(req.index);
        case ControlEvent_SelectAtEnd:
            controller.select_at_end_of_run(req.index);
            return true;
        case ControlEvent_None:
        default:
            return false;
    }
}

bool publish_state(const BciController_C& controller, StateStore_s& stateStore) {
    bool changed = false;
    auto store_if = [&changed](auto& atom, auto value) {
        if (atom.load(std::memory_order_relaxed) != value) {
            atom.store(value, std::memory_order_release);
            changed = true;
        }
    };
    store_if(stateStore.g_stimulus_running, controller.is_stimulus_running());
    store_if(stateStore.g_training_type, controller.get_training_type());
    store_if(stateStore.g_train_target, controller.get_train_target());
    store_if(stateStore.g_spo_count, static_cast<int>(controller.get_spo_count()));
    store_if(stateStore.g_ping_count, controller.get_ping_count());

    const SelectableItem_I* last = controller.get_last_selected();
    std::string lastName = (last != nullptr) ? last->get_name() : "";
    if (lastName != stateStore.get_last_selected()) {
        stateStore.set_last_selected(lastName);
        changed = true;
    }

    if (changed) {
        stateStore.g_seq.fetch_add(1, std::memory_order_release);
    }
    return changed;
}

void pump_frame(BciController_C& controller, StateStore_s& stateStore, time_point_T now) {
    for (const ControlRequest_S& req : stateStore.drain_controls()) {
        apply_control(controller, req);
    }
    std::optional<ControllerConfig_S> cfg = stateStore.take_pending_config();
    if (cfg.has_value() && controller.set_config(cfg.value())) {
        stateStore.set_active_config(controller.get_config());
    }

    controller.tick(now);
    publish_state(controller, stateStore);
}

} // namespace bridge
