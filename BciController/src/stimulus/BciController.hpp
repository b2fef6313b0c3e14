/*
==============================================================================
	File: BciController.hpp
	Desc: Session controller facade for one BCI paradigm.
	Owns the shared context (scheduler, loop slots, session state, registry,
	response receiver) plus the stimulus engine, selection coordinator and
	training sequencer, and forwards the public operations to them.
	* nothing runs on its own: the host calls tick(now) once per frame
	* channels are bound by initialize() and unbound by clean_up()
	* paradigms plug in through the engine / training factories
	* single threaded: call everything from the frame (scheduler) thread
==============================================================================
*/

#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include "SelectionCoordinator.hpp"
#include "StimulusCycleEngine.hpp"
#include "TrainingSequencer.hpp"
#include "../comms/IMarkerChannel.h"
#include "../comms/IResponseChannel.h"
#include "../shared/ControllerContext.hpp"
#include "../spo/ISpoProvider.h"
#include "../utils/Types.h"

using EngineFactory_T = std::function<std::unique_ptr<StimulusCycleEngine_C>(ControllerContext_S&)>;
using TrainingFactory_T = std::function<std::unique_ptr<TrainingSequencer_C>(ControllerContext_S&, StimulusCycleEngine_C&)>;

class BciController_C {
public:
	// empty factories fall back to the default (no-op behavior) engine / sequencer
	BciController_C(const ISpoProvider_S& provider, ControllerConfig_S config,
	                BciBehaviorType_E behaviorType = BciBehaviorType_Unset,
	                EngineFactory_T engineFactory = nullptr,
	                TrainingFactory_T trainingFactory = nullptr);
	~BciController_C();
	BciController_C(const BciController_C&) = delete;
	BciController_C& operator=(const BciController_C&) = delete;

	/* lifecycle */
	void initialize(IMarkerChannel_S* markers, IResponseChannel_S* responses);
	void clean_up();
	bool is_initialized() const { return ctx_.channels.is_bound(); };
	void tick(time_point_T now); // one frame of every live loop

	/* stimulus */
	bool start_stimulus_run(bool sendConstantMarkers = true) { return engine_->start_stimulus_run(sendConstantMarkers); };
	void stop_stimulus_run() { engine_->stop_stimulus_run(); };
	bool start_stop_stimulus_run() { return engine_->start_stop_stimulus_run(); };
	bool is_stimulus_running() const { return ctx_.state.stimulusRunning; };

	/* selection */
	bool select_by_index(int index, bool stopRun = false) { return selection_->select_by_index(index, stopRun); };
	void select_at_end_of_run(int index) { selection_->select_at_end_of_run(index); };
	void handle_incoming_responses(const ResponseBatch_T& tokens) { selection_->handle_incoming_responses(tokens); };
	SelectableItem_I* get_last_selected() const { return ctx_.state.lastSelected; };
	std::uint64_t get_ping_count() const { return selection_->get_ping_count(); };

	/* training */
	bool start_training(TrainingType_E type) { return training_->start_training(type); };
	void stop_training() { training_->stop_training(); };
	bool is_training_running() const { return ctx_.state.is_training_running(); };
	TrainingType_E get_training_type() const { return ctx_.state.currentTrainingType; };
	int get_train_target() const { return ctx_.state.trainTarget; };

	/* responses */
	bool start_receiving_responses() { return ctx_.receiver.start_receiving(); };
	void stop_receiving_responses();

	/* spos */
	bool populate_spos(SpoPopulation_E method = SpoPopulation_Tag) { return ctx_.registry.populate(method); };
	bool populate_spos(const std::string& methodName) { return ctx_.registry.populate(methodName); };
	std::size_t get_spo_count() const { return ctx_.registry.count(); };

	/* config */
	bool set_config(const ControllerConfig_S& config); // refused while a run or training is active
	const ControllerConfig_S& get_config() const { return ctx_.config; };

	BciBehaviorType_E get_behavior_type() const { return behaviorType_; };

	// direct access for paradigms and tests
	ControllerContext_S& get_context() { return ctx_; };
	StimulusCycleEngine_C& get_engine() { return *engine_; };
	SelectionCoordinator_C& get_selection() { return *selection_; };
	TrainingSequencer_C& get_training() { return *training_; };

private:
	ControllerContext_S ctx_;
	BciBehaviorType_E behaviorType_;
	std::unique_ptr<StimulusCycleEngine_C> engine_;
	std::unique_ptr<SelectionCoordinator_C> selection_;
	std::unique_ptr<TrainingSequencer_C> training_;
}; // BciController_C
