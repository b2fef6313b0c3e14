/*
COOPERATIVE SCHEDULER : single-threaded executor driven by an external per-frame tick
- spawn() runs the task's first step right away (like starting an engine coroutine), later steps run on tick()
- tick(now) resumes every live task once, in spawn order; tasks spawned during a tick wait for the next one
- cancel() only flags the task: it never resumes again, but a step already on the stack is never interrupted
- a step that throws is logged and the task is dropped
- everything here runs on the scheduler thread (no locks)
*/

#pragma once
#include <cstdint>
#include <memory>
#include <vector>
#include "CoopTask.hpp"
#include "../utils/Types.h"

using TaskId_T = std::uint64_t;
inline constexpr TaskId_T TASK_ID_NONE = 0;

class CoopScheduler_C {
public:
	CoopScheduler_C() = default;
	// tasks hold references into their owners; not copyable/movable
	CoopScheduler_C(const CoopScheduler_C&) = delete;
	CoopScheduler_C& operator=(const CoopScheduler_C&) = delete;

	TaskId_T spawn(std::unique_ptr<CoopTask_I> task);
	bool cancel(TaskId_T id); // false if id isn't live
	void cancel_all();
	bool is_live(TaskId_T id) const;
	std::size_t live_count() const;

	void tick(time_point_T now);
	time_point_T now() const { return now_; };
	std::uint64_t get_tick_count() const { return tickCount_; };

private:
	struct taskEntry_S {
		TaskId_T id = TASK_ID_NONE;
		std::unique_ptr<CoopTask_I> task;
		bool cancelled = false;
		bool finished = false;
		bool inStep = false; // a step of this task is on the call stack
	};

	std::vector<std::shared_ptr<taskEntry_S>> entries_;
	TaskId_T nextId_ = 1;
	time_point_T now_{};
	std::uint64_t tickCount_ = 0;

	void step_entry(taskEntry_S& entry);
	void sweep(); // drop cancelled/finished entries that aren't mid-step
	const taskEntry_S* find(TaskId_T id) const;
}; // CoopScheduler_C
