/*
==============================================================================
	File: SelectionCoordinator.hpp
	Desc: Turns selection requests into SPO selections.
	* select_by_index(): explicit selection, soft failure on bad input
	* select_at_end_of_run(): deferred selection parked in the waitToSelect slot
	* handle_incoming_responses(): response tokens from the classifier, wired in
	  as the ResponseReceiver_C batch handler by the controller
==============================================================================
*/

#pragma once
#include <cstdint>
#include <string>
#include "StimulusCycleEngine.hpp"
#include "../comms/IResponseChannel.h"
#include "../shared/ControllerContext.hpp"

class SelectionCoordinator_C {
public:
	SelectionCoordinator_C(ControllerContext_S& ctx, StimulusCycleEngine_C& engine) : ctx_(ctx), engine_(engine) {};

	bool select_by_index(int index, bool stopRun = false); // false = nothing selected (logged)
	void select_at_end_of_run(int index);
	void handle_incoming_responses(const ResponseBatch_T& tokens);

	std::uint64_t get_ping_count() const { return pingCount_; };

private:
	ControllerContext_S& ctx_;
	StimulusCycleEngine_C& engine_;
	std::uint64_t pingCount_ = 0;

	// full-string integer parse; false for empty/garbage/negative
	static bool parse_index(const std::string& token, int& out);
}; // SelectionCoordinator_C
