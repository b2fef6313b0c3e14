#include "BciController.hpp"
#include <utility>
#include "../utils/Logger.hpp"

namespace {

const char* BehaviorTypeToString(BciBehaviorType_E type) {
    switch (type) {
        case BciBehaviorType_SSVEP:
            return "SSVEP";
        case BciBehaviorType_P300:
            return "P300";
        case BciBehaviorType_MI:
            return "MI";
        case BciBehaviorType_Switch:
            return "Switch";
        case BciBehaviorType_Unset:
        default:
            return "Unset";
    }
}

} // namespace

BciController_C::BciController_C(const ISpoProvider_S& provider, ControllerConfig_S config,
                                 BciBehaviorType_E behaviorType,
                                 EngineFactory_T engineFactory,
                                 TrainingFactory_T trainingFactory)
    : ctx_(provider, std::move(config)), behaviorType_(behaviorType)
{
    logger::init();

    if (engineFactory) {
        engine_ = engineFactory(ctx_);
    }
    if (!engine_) {
        engine_ = std::make_unique<StimulusCycleEngine_C>(ctx_);
    }
    selection_ = std::make_unique<SelectionCoordinator_C>(ctx_, *engine_);
    if (trainingFactory) {
        training_ = trainingFactory(ctx_, *engine_);
    }
    if (!training_) {
        training_ = std::make_unique<TrainingSequencer_C>(ctx_, *engine_);
    }

    SelectionCoordinator_C* selection = selection_.get();
    ctx_.receiver.set_batch_handler([selection](const ResponseBatch_T& batch){
        selection->handle_incoming_responses(batch);
    });
    LOG_ALWAYS("BCI: controller created (paradigm=" << BehaviorTypeToString(behaviorType_)
               << ", group tag='" << ctx_.config.groupTag << "')");
}

BciController_C::~BciController_C(){
    // the response channel may outlive us; it must not keep a callback into this controller
    if (ctx_.channels.is_bound()) {
        clean_up();
    }
    ctx_.slots.stop_all();
    ctx_.scheduler.cancel_all();
}

void BciController_C::initialize(IMarkerChannel_S* markers, IResponseChannel_S* responses){
    if (markers == nullptr || responses == nullptr) {
        LOG_WARN("BCI: initialize() with a null channel, start calls will be refused");
    }
    ctx_.channels.markers = markers;
    ctx_.channels.responses = responses;
    LOG_ALWAYS("BCI: channels bound");
}

void BciController_C::clean_up(){
    if (ctx_.channels.responses != nullptr) {
        ctx_.channels.responses->disconnect();
    }
    ctx_.state.stimulusRunning = false;

    ctx_.slots.stop(LoopSlot_ReceiveMarkers);
    ctx_.slots.stop(LoopSlot_SendMarkers);
    ctx_.slots.stop(LoopSlot_RunStimulus);
    ctx_.slots.stop(LoopSlot_WaitToSelect);
    training_->stop_training();

    // unbound: a late stop_stimulus_run() writes nothing
    ctx_.channels.markers = nullptr;
    ctx_.channels.responses = nullptr;
    LOG_ALWAYS("BCI: cleaned up");
}

void BciController_C::tick(time_point_T now){
    ctx_.scheduler.tick(now);
}

void BciController_C::stop_receiving_responses(){
    ctx_.receiver.stop_receiving();
}

bool BciController_C::set_config(const ControllerConfig_S& config){
    if (ctx_.state.stimulusRunning || ctx_.state.is_training_running()) {
        LOG_WARN("BCI: config change refused while a run or training is active");
        return false;
    }
    ctx_.config = config;
    LOG_ALWAYS("BCI: config updated (windowLength=" << config.windowLength_s
               << "s, iwi=" << config.interWindowInterval_s
               << "s, trainingSelections=" << config.numTrainingSelections
               << ", trainWindows=" << config.numTrainWindows << ")");
    return true;
}
