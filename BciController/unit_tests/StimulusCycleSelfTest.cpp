#include <vector>
#include "SelfTest.hpp"

/* TEST COMPONENTS:
- start/stop/restart marker sequences ("Trial Started", "marker", "Trial Ends")
- one live stimulus loop + one marker loop no matter how often a run is restarted
- marker payload rules, constant markers off, missing channels, clean_up
- paradigm hooks: per-cycle behavior keeps its cycle across ticks, completion runs once
*/

namespace {

class CountingEngine_C : public StimulusCycleEngine_C {
public:
    using StimulusCycleEngine_C::StimulusCycleEngine_C;

    TaskStatus_E on_stimulus_run_behavior(time_point_T) override {
        ++cycleSteps;
        if (cycleSteps % 3 == 0) {
            ++cycles;
            return TaskStatus_Done;
        }
        return TaskStatus_Running;
    }

    TaskStatus_E on_stimulus_run_complete(time_point_T) override {
        ++completes;
        ctx_.channels.markers->write("paradigm done");
        return TaskStatus_Done;
    }

    int cycleSteps = 0;
    int cycles = 0;
    int completes = 0;
};

void test_start_writes_trial_started_then_markers() {
    SessionRig_S rig(4);
    SELFTEST_CHECK(rig.controller.start_stimulus_run());
    SELFTEST_CHECK(rig.controller.is_stimulus_running());
    SELFTEST_CHECK(rig.controller.get_spo_count() == 4);
    SELFTEST_CHECK(rig.responses.is_connected());
    SELFTEST_CHECK(rig.responses.is_polling());

    std::vector<std::string> texts = rig.markers.get_texts();
    SELFTEST_CHECK(texts.size() == 2);
    SELFTEST_CHECK(texts[0] == "Trial Started");
    SELFTEST_CHECK(texts[1] == "marker"); // no train target -> no suffix

    // one marker per windowLength (1 s) while running
    rig.run_for(2.5f);
    SELFTEST_CHECK(rig.markers.count_of("marker") == 3);

    const ControllerContext_S& ctx = rig.controller.get_context();
    SELFTEST_CHECK(ctx.slots.is_occupied(LoopSlot_RunStimulus));
    SELFTEST_CHECK(ctx.slots.is_occupied(LoopSlot_SendMarkers));
    SELFTEST_CHECK(ctx.slots.is_occupied(LoopSlot_ReceiveMarkers));
}

void test_stop_ends_both_loops() {
    SessionRig_S rig(4);
    rig.controller.start_stimulus_run();
    rig.run_for(0.5f);
    rig.controller.stop_stimulus_run();
    SELFTEST_CHECK(!rig.controller.is_stimulus_running());
    SELFTEST_CHECK(rig.markers.get_texts().back() == "Trial Ends");

    rig.step();
    const ControllerContext_S& ctx = rig.controller.get_context();
    SELFTEST_CHECK(!ctx.slots.is_occupied(LoopSlot_RunStimulus));
    SELFTEST_CHECK(!ctx.slots.is_occupied(LoopSlot_SendMarkers));

    const std::size_t before = rig.markers.get_total_written();
    rig.run_for(3.0f);
    SELFTEST_CHECK(rig.markers.get_total_written() == before);
    SELFTEST_CHECK(rig.markers.count_of("marker") == 1);
}

void test_restart_is_a_full_stop() {
    SessionRig_S rig(4);
    for (int i = 0; i < 5; ++i) {
        SELFTEST_CHECK(rig.controller.start_stimulus_run());
        rig.step();
    }
    std::vector<std::string> texts = rig.markers.get_texts();
    // Trial Started, marker, then (Trial Ends, Trial Started, marker) per restart
    SELFTEST_CHECK(texts.size() == 2 + 4 * 3);
    for (std::size_t i = 2; i + 2 < texts.size(); i += 3) {
        SELFTEST_CHECK(texts[i] == "Trial Ends");
        SELFTEST_CHECK(texts[i + 1] == "Trial Started");
        SELFTEST_CHECK(texts[i + 2] == "marker");
    }

    // pump + stimulus loop + marker loop, nothing left over from earlier runs
    SELFTEST_CHECK(rig.controller.get_context().scheduler.live_count() == 3);
    rig.run_for(1.2f);
    SELFTEST_CHECK(rig.markers.count_of("marker") == 5 + 1);
}

void test_restart_without_markers_drops_marker_loop() {
    SessionRig_S rig(4);
    rig.controller.start_stimulus_run(true);
    SELFTEST_CHECK(rig.controller.start_stimulus_run(false));
    const ControllerContext_S& ctx = rig.controller.get_context();
    SELFTEST_CHECK(!ctx.slots.is_occupied(LoopSlot_SendMarkers));
    SELFTEST_CHECK(ctx.slots.is_occupied(LoopSlot_RunStimulus));

    rig.run_for(3.0f);
    SELFTEST_CHECK(rig.markers.count_of("marker") == 1); // only the one from the first run
    SELFTEST_CHECK(rig.markers.count_of("Trial Started") == 2);
    SELFTEST_CHECK(rig.markers.count_of("Trial Ends") == 1);
}

// stop + start(false) in one frame: the old marker loop never got a tick to notice the stop
void test_stop_then_start_without_markers_same_frame() {
    SessionRig_S rig(4);
    rig.controller.get_context().state.trainTarget = 2;
    rig.controller.start_stimulus_run(true);
    rig.step();
    rig.controller.stop_stimulus_run();
    SELFTEST_CHECK(rig.controller.start_stimulus_run(false));

    SELFTEST_CHECK(!rig.controller.get_context().slots.is_occupied(LoopSlot_SendMarkers));
    rig.run_for(3.0f);
    SELFTEST_CHECK(rig.markers.count_of("marker,2") == 1);
    SELFTEST_CHECK(!rig.controller.get_context().slots.is_occupied(LoopSlot_SendMarkers));
    SELFTEST_CHECK(rig.markers.get_texts().back() == "Trial Started");
}

void test_marker_payload() {
    SessionRig_S rig(4);
    rig.controller.start_stimulus_run();
    StimulusCycleEngine_C& engine = rig.controller.get_engine();
    SELFTEST_CHECK(engine.make_marker_string(0) == "marker,0");
    SELFTEST_CHECK(engine.make_marker_string(2) == "marker,2");
    SELFTEST_CHECK(engine.make_marker_string(4) == "marker,4"); // == count still gets the suffix
    SELFTEST_CHECK(engine.make_marker_string(5) == "marker");
    SELFTEST_CHECK(engine.make_marker_string(TRAIN_TARGET_NONE) == "marker");

    // payload is the train target captured when the run started
    rig.controller.get_context().state.trainTarget = 1;
    rig.controller.start_stimulus_run();
    SELFTEST_CHECK(rig.markers.get_texts().back() == "marker,1");
    rig.controller.get_context().state.trainTarget = 3;
    rig.run_for(1.1f);
    SELFTEST_CHECK(rig.markers.get_texts().back() == "marker,1");
}

void test_window_period_includes_inter_window_interval() {
    ControllerConfig_S cfg;
    cfg.windowLength_s = 0.5f;
    cfg.interWindowInterval_s = 0.5f;
    SessionRig_S rig(2, cfg);
    rig.controller.start_stimulus_run();
    rig.run_for(2.5f);
    SELFTEST_CHECK(rig.markers.count_of("marker") == 3);
}

void test_toggle() {
    SessionRig_S rig(3);
    SELFTEST_CHECK(rig.controller.start_stop_stimulus_run());
    SELFTEST_CHECK(rig.controller.is_stimulus_running());
    SELFTEST_CHECK(rig.controller.start_stop_stimulus_run());
    SELFTEST_CHECK(!rig.controller.is_stimulus_running());
    SELFTEST_CHECK(rig.markers.count_of("Trial Started") == 1);
    SELFTEST_CHECK(rig.markers.count_of("Trial Ends") == 1);
}

void test_missing_channels_refuse_start() {
    SpoDirectory_C directory;
    LoggedSpo_C spo("lonely");
    directory.register_spo("BCI", &spo);
    BciController_C controller(directory, ControllerConfig_S{});

    SELFTEST_CHECK(controller.get_behavior_type() == BciBehaviorType_Unset);
    SELFTEST_CHECK(!controller.is_initialized());
    SELFTEST_CHECK(!controller.start_stimulus_run());
    SELFTEST_CHECK(!controller.is_stimulus_running());
    SELFTEST_CHECK(controller.get_context().scheduler.live_count() == 0);
    SELFTEST_CHECK(!controller.start_training(TrainingType_Automated));
    SELFTEST_CHECK(!controller.is_training_running());

    BufferedMarkerChannel_C markers;
    controller.initialize(&markers, nullptr);
    SELFTEST_CHECK(!controller.start_stimulus_run());
    SELFTEST_CHECK(markers.get_total_written() == 0);

    // stop after the marker channel is unbound is silent
    controller.clean_up();
    controller.stop_stimulus_run();
    SELFTEST_CHECK(markers.get_total_written() == 0);
}

void test_clean_up() {
    SessionRig_S rig(4);
    rig.controller.start_stimulus_run();
    rig.controller.select_at_end_of_run(1);
    rig.run_for(0.3f);

    rig.controller.clean_up();
    SELFTEST_CHECK(!rig.controller.is_initialized());
    SELFTEST_CHECK(!rig.controller.is_stimulus_running());
    SELFTEST_CHECK(!rig.responses.is_connected());
    SELFTEST_CHECK(!rig.responses.is_polling());
    SELFTEST_CHECK(rig.controller.get_context().scheduler.live_count() == 0);

    const std::size_t before = rig.markers.get_total_written();
    rig.controller.stop_stimulus_run(); // late stop after teardown writes nothing
    rig.run_for(2.0f);
    SELFTEST_CHECK(rig.markers.get_total_written() == before);
    SELFTEST_CHECK(rig.spo(1).get_select_count() == 0); // deferred selection was cancelled
    SELFTEST_CHECK(!rig.controller.start_stimulus_run());
}

void test_paradigm_hooks() {
    SessionRig_S rig(4, ControllerConfig_S{},
        [](ControllerContext_S& ctx){ return std::make_unique<CountingEngine_C>(ctx); });
    auto& engine = static_cast<CountingEngine_C&>(rig.controller.get_engine());

    rig.controller.start_stimulus_run();
    SELFTEST_CHECK(engine.cycleSteps == 1);
    for (int i = 0; i < 6; ++i) {
        rig.step();
    }
    SELFTEST_CHECK(engine.cycleSteps == 7);
    SELFTEST_CHECK(engine.cycles == 2);

    // cycle in progress runs to its end before the completion hook
    rig.controller.stop_stimulus_run();
    rig.step();
    SELFTEST_CHECK(engine.cycleSteps == 8);
    SELFTEST_CHECK(engine.completes == 0);
    rig.step();
    SELFTEST_CHECK(engine.cycleSteps == 9);
    SELFTEST_CHECK(engine.cycles == 3);
    SELFTEST_CHECK(engine.completes == 0);
    rig.step();
    SELFTEST_CHECK(engine.completes == 1);
    SELFTEST_CHECK(rig.markers.get_texts().back() == "paradigm done");

    rig.run_for(1.0f);
    SELFTEST_CHECK(engine.completes == 1);
    SELFTEST_CHECK(engine.cycleSteps == 9);
    SELFTEST_CHECK(!rig.controller.get_context().slots.is_occupied(LoopSlot_RunStimulus));
}

} // namespace

int main() {
    logger::tlabel = "StimulusCycleSelfTest";
    LOG_ALWAYS("StimulusCycleSelfTest starting...");

    RUN_SELFTEST(test_start_writes_trial_started_then_markers);
    RUN_SELFTEST(test_stop_ends_both_loops);
    RUN_SELFTEST(test_restart_is_a_full_stop);
    RUN_SELFTEST(test_restart_without_markers_drops_marker_loop);
    RUN_SELFTEST(test_stop_then_start_without_markers_same_frame);
    RUN_SELFTEST(test_marker_payload);
    RUN_SELFTEST(test_window_period_includes_inter_window_interval);
    RUN_SELFTEST(test_toggle);
    RUN_SELFTEST(test_missing_channels_refuse_start);
    RUN_SELFTEST(test_clean_up);
    RUN_SELFTEST(test_paradigm_hooks);

    return selftest::finish("StimulusCycleSelfTest");
}
