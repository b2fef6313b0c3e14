#include "TrainingSequencer.hpp"
#include <exception>
#include <utility>
#include "../utils/ArrayUtils.hpp"
#include "../utils/Logger.hpp"
#include "../utils/SWTimer.hpp"

namespace {

// training slot: owns the phase routine and closes the session when it ends
class TrainingSupervisorTask_C : public CoopTask_I {
public:
    TrainingSupervisorTask_C(TrainingSequencer_C& sequencer, TrainingType_E type, std::unique_ptr<CoopTask_I> routine)
        : sequencer_(sequencer), type_(type), routine_(std::move(routine)) {}

    TaskStatus_E step(time_point_T now) override {
        SessionState_S& state = sequencer_.get_context().state;
        if (!started_) {
            started_ = true;
            state.currentTrainingType = type_;
            LOG_ALWAYS("TS: " << TrainingTypeToString(type_) << " training started");
        }

        if (state.is_training_running()) {
            try {
                if (routine_->step(now) == TaskStatus_Running) {
                    return TaskStatus_Running;
                }
            }
            catch (const std::exception& e) {
                LOG_ERR("TS: " << TrainingTypeToString(type_) << " training failed: " << e.what());
            }
        }

        LOG_ALWAYS("TS: " << TrainingTypeToString(type_) << " training ended");
        sequencer_.stop_training();
        return TaskStatus_Done;
    }

    const char* name() const override { return "training"; }

private:
    TrainingSequencer_C& sequencer_;
    TrainingType_E type_;
    std::unique_ptr<CoopTask_I> routine_;
    bool started_ = false;
};

// automated training as a phase machine; each wait is one SW_Timer_C on the frame clock
class AutomatedTrainingTask_C : public CoopTask_I {
public:
    explicit AutomatedTrainingTask_C(TrainingSequencer_C& sequencer) : sequencer_(sequencer) {}

    TaskStatus_E step(time_point_T now) override {
        ControllerContext_S& ctx = sequencer_.get_context();
        const ControllerConfig_S& cfg = ctx.config;

        // advance through phases until one has to wait
        while (true) {
            if (waitTimer_.is_started()) {
                if (!waitTimer_.check_timer_expired(now)) {
                    return TaskStatus_Running;
                }
                waitTimer_.stop_timer(now);
            }

            switch (phase_) {
                case phase_Setup: {
                    ctx.registry.populate(SpoPopulation_Tag);
                    targets_ = sequencer_.draw_training_targets(cfg.numTrainingSelections);
                    LOG_ALWAYS("TS: training targets [" << bcictl::arrayutils::join_values(targets_) << "]");
                    wait(now, TRAIN_INITIAL_PAUSE_S, phase_BeginTarget);
                    break;
                }
                case phase_BeginTarget: {
                    if (selection_ >= targets_.size()) {
                        ctx.channels.markers->write("Training Complete");
                        LOG_ALWAYS("TS: automated training complete (" << targets_.size() << " selections)");
                        return TaskStatus_Done;
                    }
                    target_ = targets_[selection_];
                    ctx.state.trainTarget = target_;
                    LOG_ALWAYS("TS: running training selection " << selection_ << " on option " << target_);
                    ctx.registry.get(static_cast<std::size_t>(target_))->on_train_target();
                    wait(now, cfg.trainTargetPresentationTime_s, phase_Settle);
                    break;
                }
                case phase_Settle: {
                    if (!cfg.trainTargetPersistent) {
                        ctx.registry.get(static_cast<std::size_t>(target_))->off_train_target();
                    }
                    wait(now, TRAIN_SETTLE_S, phase_Stimulus);
                    break;
                }
                case phase_Stimulus: {
                    sequencer_.get_engine().start_stimulus_run();
                    const float window_s = cfg.windowLength_s + cfg.interWindowInterval_s;
                    wait(now, window_s * static_cast<float>(cfg.numTrainWindows), phase_EndTarget);
                    break;
                }
                case phase_EndTarget: {
                    sequencer_.get_engine().stop_stimulus_run();
                    SelectableItem_I* spo = ctx.registry.get(static_cast<std::size_t>(target_));
                    if (cfg.trainTargetPersistent) {
                        spo->off_train_target();
                    }
                    if (cfg.shamFeedback) {
                        spo->select();
                    }
                    ctx.state.trainTarget = TRAIN_TARGET_NONE;
                    ++selection_;
                    wait(now, cfg.trainBreak_s, phase_BeginTarget);
                    break;
                }
            }
        }
    }

    const char* name() const override { return "automatedTraining"; }

private:
    enum phase_E {
        phase_Setup,
        phase_BeginTarget,
        phase_Settle,
        phase_Stimulus,
        phase_EndTarget,
    };

    TrainingSequencer_C& sequencer_;
    phase_E phase_ = phase_Setup;
    std::vector<int> targets_;
    std::size_t selection_ = 0;
    int target_ = TRAIN_TARGET_NONE;
    SW_Timer_C waitTimer_;

    void wait(time_point_T now, float seconds, phase_E next) {
        waitTimer_.start_timer(now, SecondsToDuration(seconds));
        phase_ = next;
    }
};

// placeholder routine for paradigms without that training type
class LogOnlyTrainingTask_C : public CoopTask_I {
public:
    explicit LogOnlyTrainingTask_C(const char* message) : message_(message) {}

    TaskStatus_E step(time_point_T now) override {
        (void)now;
        LOG_ALWAYS("TS: " << message_);
        return TaskStatus_Done;
    }

    const char* name() const override { return "logOnlyTraining"; }

private:
    const char* message_;
};

} // namespace

TrainingSequencer_C::TrainingSequencer_C(ControllerContext_S& ctx, StimulusCycleEngine_C& engine)
    : ctx_(ctx), engine_(engine), rng_(std::random_device{}()) {}

bool TrainingSequencer_C::start_training(TrainingType_E type){
    if (type == TrainingType_None) {
        stop_training();
        return true;
    }
    if (!ctx_.channels.is_bound()) {
        LOG_ERR("TS: cannot start " << TrainingTypeToString(type) << " training, channels not bound (initialize() first)");
        return false;
    }

    if (ctx_.state.stimulusRunning) {
        engine_.stop_stimulus_run();
    }

    std::unique_ptr<CoopTask_I> routine;
    switch (type) {
        case TrainingType_Automated:
            ctx_.receiver.start_receiving();
            routine = make_automated_training();
            break;
        case TrainingType_Iterative:
            ctx_.receiver.start_receiving();
            routine = make_iterative_training();
            break;
        case TrainingType_User:
            routine = make_user_training();
            break;
        case TrainingType_None:
        default:
            break;
    }
    if (!routine) {
        LOG_WARN("TS: no " << TrainingTypeToString(type) << " training routine for this paradigm");
        stop_training();
        return false;
    }

    ctx_.slots.stop_start(LoopSlot_Training,
                          std::make_unique<TrainingSupervisorTask_C>(*this, type, std::move(routine)));
    return true;
}

void TrainingSequencer_C::stop_training(){
    ctx_.state.currentTrainingType = TrainingType_None;
    ctx_.state.trainTarget = TRAIN_TARGET_NONE;
    ctx_.slots.stop(LoopSlot_Training);
}

std::vector<int> TrainingSequencer_C::draw_training_targets(int count){
    lastTargets_ = bcictl::arrayutils::generate_rnra(count, 0, static_cast<int>(ctx_.registry.count()), rng_);
    return lastTargets_;
}

std::unique_ptr<CoopTask_I> TrainingSequencer_C::make_automated_training(){
    return std::make_unique<AutomatedTrainingTask_C>(*this);
}

std::unique_ptr<CoopTask_I> TrainingSequencer_C::make_iterative_training(){
    return std::make_unique<LogOnlyTrainingTask_C>("No iterative training available for this controller");
}

std::unique_ptr<CoopTask_I> TrainingSequencer_C::make_user_training(){
    return std::make_unique<LogOnlyTrainingTask_C>("No user training available for this paradigm");
}
