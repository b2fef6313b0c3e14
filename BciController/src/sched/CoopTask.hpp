/*
==============================================================================
	File: CoopTask.hpp
	Desc: Abstract interface for a cooperative loop. A task does a bounded
	amount of work per step() and returns TaskStatus_Running to be resumed
	on a later tick, or TaskStatus_Done when finished.
	Tasks never block: waits are expressed with SW_Timer_C against the
	"now" the scheduler passes in.
==============================================================================
*/

#pragma once
#include "../utils/Types.h"

class CoopTask_I {
public:
	virtual ~CoopTask_I() = default;
	virtual TaskStatus_E step(time_point_T now) = 0;
	virtual const char* name() const = 0; // for log lines
}; // CoopTask_I
