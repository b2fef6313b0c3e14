/*
STIMULUS CYCLE ENGINE
- owns the "stimulus running" loop (runStimulus slot) and its paired periodic marker loop (sendMarkers slot)
- start: full stop of any previous run, "Trial Started", restart response reception, repopulate spos, start loops
- stop: flag off + "Trial Ends"; the loops notice on their next step and wind themselves down
- paradigms subclass and override on_stimulus_run_behavior / on_stimulus_run_complete (no-op by default)
*/

#pragma once
#include <string>
#include "../shared/ControllerContext.hpp"
#include "../utils/Types.h"

class StimulusCycleEngine_C {
public:
	explicit StimulusCycleEngine_C(ControllerContext_S& ctx) : ctx_(ctx) {};
	virtual ~StimulusCycleEngine_C() = default;
	StimulusCycleEngine_C(const StimulusCycleEngine_C&) = delete;
	StimulusCycleEngine_C& operator=(const StimulusCycleEngine_C&) = delete;

	// sendConstantMarkers=false for paradigms that write their own per-event markers (e.g. P300)
	virtual bool start_stimulus_run(bool sendConstantMarkers = true);
	virtual void stop_stimulus_run();
	bool start_stop_stimulus_run(); // stop if running, else start with constant markers

	bool is_running() const { return ctx_.state.stimulusRunning; };

	// "marker" or "marker,<trainTarget>" when trainTarget <= spo count
	std::string make_marker_string(int trainTarget) const;

	// one cycle of the run; TaskStatus_Running keeps the same cycle going next tick
	virtual TaskStatus_E on_stimulus_run_behavior(time_point_T now);
	// after the run flag drops; TaskStatus_Running to keep winding down next tick
	virtual TaskStatus_E on_stimulus_run_complete(time_point_T now);

protected:
	ControllerContext_S& ctx_;
}; // StimulusCycleEngine_C
