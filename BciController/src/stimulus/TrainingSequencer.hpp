/*
TRAINING SEQUENCER
- start_training(type): stops an active run, restarts response reception for Automated/Iterative,
  then parks a supervisor in the training slot; the supervisor sets the current training type,
  steps the phase routine to completion (or until training is stopped) and ends with stop_training()
- Automated routine: draw N distinct targets, then per target
  present -> settle -> stimulus run for numTrainWindows windows -> break, finally "Training Complete"
- Iterative/User are log-and-complete placeholders; paradigms override the make_*_training() factories
- a phase routine that throws (e.g. more selections than spos) is logged and training stops,
  no "Training Complete" is written
*/

#pragma once
#include <memory>
#include <random>
#include <vector>
#include "StimulusCycleEngine.hpp"
#include "../sched/CoopTask.hpp"
#include "../shared/ControllerContext.hpp"
#include "../utils/Types.h"

class TrainingSequencer_C {
public:
	TrainingSequencer_C(ControllerContext_S& ctx, StimulusCycleEngine_C& engine);
	virtual ~TrainingSequencer_C() = default;
	TrainingSequencer_C(const TrainingSequencer_C&) = delete;
	TrainingSequencer_C& operator=(const TrainingSequencer_C&) = delete;

	bool start_training(TrainingType_E type); // false if refused (logged); None == stop_training()
	void stop_training();

	bool is_training_running() const { return ctx_.state.is_training_running(); };
	TrainingType_E get_training_type() const { return ctx_.state.currentTrainingType; };

	// reproducible target draws (tests / replay)
	void seed_rng(unsigned int seed) { rng_.seed(seed); };

	// N distinct targets from [0, spo count); throws std::invalid_argument if N > count
	std::vector<int> draw_training_targets(int count);
	const std::vector<int>& get_last_training_targets() const { return lastTargets_; };

	StimulusCycleEngine_C& get_engine() { return engine_; };
	ControllerContext_S& get_context() { return ctx_; };

protected:
	virtual std::unique_ptr<CoopTask_I> make_automated_training();
	virtual std::unique_ptr<CoopTask_I> make_iterative_training();
	virtual std::unique_ptr<CoopTask_I> make_user_training();

	ControllerContext_S& ctx_;
	StimulusCycleEngine_C& engine_;

private:
	std::mt19937 rng_;
	std::vector<int> lastTargets_;
}; // TrainingSequencer_C
