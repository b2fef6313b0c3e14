#include "StimulusCycleEngine.hpp"
#include <memory>
#include "../utils/Logger.hpp"
#include "../utils/SWTimer.hpp"

namespace {

// runStimulus slot: cycles while the run flag is up, then runs the completion behavior and releases both slots
class StimulusLoopTask_C : public CoopTask_I {
public:
    StimulusLoopTask_C(StimulusCycleEngine_C& engine, ControllerContext_S& ctx) : engine_(engine), ctx_(ctx) {}

    TaskStatus_E step(time_point_T now) override {
        if (!completing_) {
            // a cycle in progress finishes even if the run stopped meanwhile
            if (inCycle_ || ctx_.state.stimulusRunning) {
                inCycle_ = (engine_.on_stimulus_run_behavior(now) == TaskStatus_Running);
                return TaskStatus_Running;
            }
            completing_ = true;
        }
        if (engine_.on_stimulus_run_complete(now) == TaskStatus_Running) {
            return TaskStatus_Running;
        }
        LOG_DBG("SCE: stimulus loop done, releasing runStimulus + sendMarkers");
        ctx_.slots.stop(LoopSlot_SendMarkers);
        ctx_.slots.stop(LoopSlot_RunStimulus);
        return TaskStatus_Done;
    }

    const char* name() const override { return "runStimulus"; }

private:
    StimulusCycleEngine_C& engine_;
    ControllerContext_S& ctx_;
    bool inCycle_ = false;
    bool completing_ = false;
};

// sendMarkers slot: one marker every windowLength + interWindowInterval while the run flag is up
class MarkerLoopTask_C : public CoopTask_I {
public:
    MarkerLoopTask_C(StimulusCycleEngine_C& engine, ControllerContext_S& ctx, int trainTarget)
        : engine_(engine), ctx_(ctx), trainTarget_(trainTarget) {}

    TaskStatus_E step(time_point_T now) override {
        if (windowTimer_.is_started() && !windowTimer_.check_timer_expired(now)) {
            return TaskStatus_Running;
        }
        if (!ctx_.state.stimulusRunning) {
            return TaskStatus_Done;
        }
        if (ctx_.channels.markers == nullptr) {
            LOG_ERR("SCE: marker channel unbound mid-run, stopping marker loop");
            return TaskStatus_Done;
        }
        ctx_.channels.markers->write(engine_.make_marker_string(trainTarget_));

        const float period_s = ctx_.config.windowLength_s + ctx_.config.interWindowInterval_s;
        windowTimer_.start_timer(now, SecondsToDuration(period_s));
        return TaskStatus_Running;
    }

    const char* name() const override { return "sendMarkers"; }

private:
    StimulusCycleEngine_C& engine_;
    ControllerContext_S& ctx_;
    int trainTarget_; // captured when the run starts
    SW_Timer_C windowTimer_;
};

} // namespace

bool StimulusCycleEngine_C::start_stimulus_run(bool sendConstantMarkers){
    if (!ctx_.channels.is_bound()) {
        LOG_ERR("SCE: cannot start stimulus run, marker/response channels not bound (initialize() first)");
        return false;
    }

    if (ctx_.state.stimulusRunning) {
        stop_stimulus_run();
    }
    // a previous run's marker loop may still be waiting out its window (stopped this frame);
    // a run started without constant markers must not inherit it
    ctx_.slots.stop(LoopSlot_SendMarkers);

    ctx_.state.stimulusRunning = true;
    ctx_.state.lastSelected = nullptr;

    ctx_.channels.markers->write("Trial Started");

    ctx_.receiver.start_receiving();
    ctx_.registry.populate(SpoPopulation_Tag);
    ctx_.slots.stop_start(LoopSlot_RunStimulus, std::make_unique<StimulusLoopTask_C>(*this, ctx_));

    if (sendConstantMarkers) {
        ctx_.slots.stop_start(LoopSlot_SendMarkers,
                              std::make_unique<MarkerLoopTask_C>(*this, ctx_, ctx_.state.trainTarget));
    }
    LOG_ALWAYS("SCE: stimulus run started (spos=" << ctx_.registry.count()
               << ", constant markers=" << (sendConstantMarkers ? "on" : "off")
               << ", train target=" << ctx_.state.trainTarget << ")");
    return true;
}

void StimulusCycleEngine_C::stop_stimulus_run(){
    ctx_.state.stimulusRunning = false;

    // unbound during teardown: nothing to tell
    if (ctx_.channels.markers != nullptr) {
        ctx_.channels.markers->write("Trial Ends");
    }
    LOG_ALWAYS("SCE: stimulus run stopped");
}

bool StimulusCycleEngine_C::start_stop_stimulus_run(){
    if (ctx_.state.stimulusRunning) {
        stop_stimulus_run();
        return true;
    }
    return start_stimulus_run();
}

std::string StimulusCycleEngine_C::make_marker_string(int trainTarget) const {
    std::string marker = "marker";
    // out-of-range (e.g. TRAIN_TARGET_NONE) means no active target
    if (trainTarget <= static_cast<int>(ctx_.registry.count())) {
        marker += "," + std::to_string(trainTarget);
    }
    return marker;
}

TaskStatus_E StimulusCycleEngine_C::on_stimulus_run_behavior(time_point_T now){
    (void)now;
    return TaskStatus_Done;
}

TaskStatus_E StimulusCycleEngine_C::on_stimulus_run_complete(time_point_T now){
    (void)now;
    return TaskStatus_Done;
}
