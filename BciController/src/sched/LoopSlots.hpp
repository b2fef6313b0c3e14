/*
==============================================================================
	File: LoopSlots.hpp
	Desc: Named loop slots (receiveMarkers, sendMarkers, runStimulus,
	waitToSelect, training). Each slot holds at most one live task:
	stop_start() cancels the current occupant before spawning the new one,
	so two loops never share a slot.
==============================================================================
*/

#pragma once
#include <array>
#include <memory>
#include "CoopScheduler.hpp"
#include "../utils/Types.h"

class LoopSlots_C {
public:
	explicit LoopSlots_C(CoopScheduler_C& scheduler) : scheduler_(scheduler) {};
	LoopSlots_C(const LoopSlots_C&) = delete;
	LoopSlots_C& operator=(const LoopSlots_C&) = delete;

	TaskId_T stop_start(LoopSlot_E slot, std::unique_ptr<CoopTask_I> task);
	void stop(LoopSlot_E slot);
	void stop_all();

	bool is_occupied(LoopSlot_E slot) const; // true only while the occupant is live
	TaskId_T get_task_id(LoopSlot_E slot) const { return slots_[slot]; };
	CoopScheduler_C& get_scheduler() { return scheduler_; };

private:
	CoopScheduler_C& scheduler_;
	std::array<TaskId_T, LoopSlot_Count> slots_{}; // TASK_ID_NONE when empty
}; // LoopSlots_C
